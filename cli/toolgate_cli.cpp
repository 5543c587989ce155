#include <asio.hpp>
#include <cstdlib>
#include <future>
#include <iostream>
#include <sstream>
#include <string>
#include <thread>

#include "toolgate/toolgate.hpp"

using namespace toolgate;
using namespace toolgate::gateway;

namespace {

void print_usage(const char *argv0) {
  std::cout << "Usage: " << argv0 << " [--config <path>] [--mode <name>] [--version]\n\n"
            << "Reads one tool call per line as JSON and prints the gateway decision:\n"
            << "  {\"tool\": \"bash\", \"args\": {\"command\": \"git push\"}, \"id\": \"call-1\"}\n\n"
            << "Commands:\n"
            << "  /mode           cycle to the next mode (Shift+Tab)\n"
            << "  /mode <name>    switch to plan, normal, auto, yolo or architect\n"
            << "  /status         show mode and configuration source\n"
            << "  /prompt         print the system prompt block for the current mode\n"
            << "  /quit           exit\n";
}

std::string describe_prompt(const ApprovalRequest &request) {
  std::ostringstream out;
  out << "\nApprove '" << request.tool_name << "' " << sanitize_args(request.args).dump() << "?\n";
  if (request.expiration_reason) {
    out << "  (previous grant ended: " << to_string(*request.expiration_reason) << ")\n";
  }
  out << "  [y]es  [n]o  [a]lways";
  if (request.permission_type == ToolPermission::AskTime) {
    out << "  [t]ime <seconds, default " << request.default_grant_seconds << ">";
  }
  if (request.permission_type == ToolPermission::AskIterations) {
    out << "  [i]terations <count, default " << request.default_grant_iterations << ">";
  }
  out << "  [c]ancel\n> ";
  return out.str();
}

ApprovalReply parse_answer(const std::string &line, const ApprovalRequest &request) {
  std::istringstream iss(line);
  std::string choice;
  iss >> choice;
  choice = to_lower(choice);

  int64_t amount = 0;
  bool has_amount = static_cast<bool>(iss >> amount);

  if (choice == "y" || choice == "yes") return ApproveOnce{};
  if (choice == "a" || choice == "always") return ApproveAlways{};
  if (choice == "t" || choice == "time") {
    return ApproveForDuration{has_amount ? amount : request.default_grant_seconds};
  }
  if (choice == "i" || choice == "iterations") {
    return ApproveForIterations{has_amount ? amount : request.default_grant_iterations};
  }
  if (choice == "c" || choice == "cancel") return Cancelled{};
  return Decline{};
}

// Console approval: answers synchronously on the calling thread
std::future<ApprovalReply> console_approval(const ApprovalRequest &request) {
  std::promise<ApprovalReply> promise;
  std::cout << describe_prompt(request) << std::flush;

  std::string line;
  if (!std::getline(std::cin, line)) {
    promise.set_value(Cancelled{});
  } else {
    promise.set_value(parse_answer(line, request));
  }
  return promise.get_future();
}

void print_decision(const ApprovalDecision &decision) {
  if (decision.executes()) {
    std::cout << "EXECUTE";
    if (decision.reason) std::cout << " (" << *decision.reason << ")";
    std::cout << "\n";
    return;
  }
  std::cout << "SKIP [" << to_string(decision.kind) << "]\n";
  if (decision.reason) std::cout << *decision.reason << "\n";
}

bool handle_command(const std::string &line, Runtime &runtime) {
  std::istringstream iss(line);
  std::string command;
  std::string arg;
  iss >> command >> arg;

  auto &modes = runtime.modes();
  if (command == "/quit" || command == "/exit") {
    return false;
  }
  if (command == "/mode") {
    if (arg.empty()) {
      auto [old_mode, new_mode] = modes.cycle_mode();
      std::cout << mode::ModeManager::transition_message(old_mode, new_mode) << "\n";
    } else if (auto parsed = mode::mode_from_string(arg)) {
      auto old_mode = modes.current_mode();
      modes.set_mode(*parsed);
      std::cout << mode::ModeManager::transition_message(old_mode, *parsed) << "\n";
    } else {
      std::cout << "Unknown mode: " << arg << "\n";
    }
  } else if (command == "/status") {
    std::cout << modes.mode_indicator() << " - " << modes.mode_description() << "\n";
    std::cout << modes.to_json().dump(2) << "\n";
    auto source = runtime.policy().backing_file();
    std::cout << "config: " << (source.empty() ? "(in memory)" : source.string()) << "\n";
  } else if (command == "/prompt") {
    std::cout << modes.get_system_prompt_modifier() << "\n";
  } else {
    print_usage("toolgate_cli");
  }
  return true;
}

}  // namespace

int main(int argc, char *argv[]) {
  std::string config_path;
  std::string mode_override;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if ((arg == "--config" || arg == "-c") && i + 1 < argc) {
      config_path = argv[++i];
    } else if ((arg == "--mode" || arg == "-m") && i + 1 < argc) {
      mode_override = argv[++i];
    } else if (arg == "--version" || arg == "-v") {
      std::cout << "toolgate " << version() << "\n";
      return 0;
    } else if (arg == "--help" || arg == "-h") {
      print_usage(argv[0]);
      return 0;
    } else {
      std::cerr << "Unknown argument: " << arg << "\n";
      print_usage(argv[0]);
      return 1;
    }
  }

  Config config = config_path.empty() ? Config::load_default() : Config::load(config_path);
  if (!mode_override.empty()) {
    if (!mode::mode_from_string(mode_override)) {
      std::cerr << "Unknown mode: " << mode_override << "\n";
      return 1;
    }
    config.default_mode = mode_override;
  }

  toolgate::init(config);
  Runtime runtime(config);
  runtime.gateway().set_approval_handler(console_approval);

  // ===== Background grant sweep =====
  asio::io_context io_ctx;
  permission::GrantSweeper sweeper(io_ctx, runtime.tracker(),
                                   std::chrono::seconds(config.approval.sweep_interval_seconds));
  sweeper.start();

  auto work = asio::make_work_guard(io_ctx);
  std::thread io_thread([&io_ctx]() { io_ctx.run(); });

  std::cout << "toolgate " << version() << "  " << runtime.modes().mode_indicator() << "\n";
  std::cout << "Type a JSON tool call, /mode, /status or /quit.\n";

  int call_counter = 0;
  std::string line;
  while (true) {
    std::cout << "\n" << runtime.modes().mode_indicator() << " $ " << std::flush;
    if (!std::getline(std::cin, line)) break;
    if (line.empty()) continue;
    if (line[0] == '/') {
      if (!handle_command(line, runtime)) break;
      continue;
    }

    json call;
    try {
      call = json::parse(line);
    } catch (const json::exception &e) {
      std::cout << "Invalid JSON: " << e.what() << "\n";
      continue;
    }
    auto parsed = ToolCallRequest::from_json(call, "call-" + std::to_string(++call_counter));
    if (!parsed.ok()) {
      std::cout << "Invalid tool call: " << parsed.error.value_or("unknown error") << "\n";
      continue;
    }
    const auto &request = *parsed.value;

    auto decision = runtime.gateway().decide(request);
    print_decision(decision);
    if (decision.executes()) {
      // Nothing is actually run here; report the call as completed
      runtime.gateway().report_outcome(decision, ExecutionOutcome::Completed);
    }
  }

  // io_context must stop before the sweeper is stopped from this thread
  work.reset();
  io_ctx.stop();
  io_thread.join();
  sweeper.stop();
  return 0;
}
