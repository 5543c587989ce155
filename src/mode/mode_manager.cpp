#include "mode/mode_manager.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <ctime>

#include "bus/bus.hpp"
#include "mode/write_detector.hpp"

namespace toolgate::mode {

namespace {

std::string format_time(const ModeManager::Clock::time_point &ts) {
  auto time_t = ModeManager::Clock::to_time_t(ts);
  std::tm tm{};
  localtime_r(&time_t, &tm);
  char buf[64];
  std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm);
  return buf;
}

}  // namespace

std::string display_name(Mode mode) {
  auto name = to_string(mode);
  std::transform(name.begin(), name.end(), name.begin(), [](unsigned char c) { return std::toupper(c); });
  return name;
}

ModeManager::ModeManager(Mode initial) {
  std::lock_guard lock(mutex_);
  enter_locked(initial);
}

void ModeManager::enter_locked(Mode mode) {
  current_ = mode;
  started_at_ = Clock::now();
  history_.emplace_back(mode, started_at_);
}

Mode ModeManager::current_mode() const {
  std::lock_guard lock(mutex_);
  return current_;
}

bool ModeManager::auto_approve() const {
  std::lock_guard lock(mutex_);
  return mode_config(current_).auto_approve;
}

bool ModeManager::read_only() const {
  std::lock_guard lock(mutex_);
  return mode_config(current_).read_only;
}

std::pair<Mode, Mode> ModeManager::cycle_mode() {
  Mode old_mode;
  Mode new_mode;
  {
    std::lock_guard lock(mutex_);
    old_mode = current_;
    new_mode = next_mode(old_mode);
    enter_locked(new_mode);
  }

  spdlog::info("[Mode] {} -> {}", display_name(old_mode), display_name(new_mode));
  Bus::instance().publish(events::ModeChanged{to_string(old_mode), to_string(new_mode)});
  return {old_mode, new_mode};
}

void ModeManager::set_mode(Mode mode) {
  Mode old_mode;
  {
    std::lock_guard lock(mutex_);
    old_mode = current_;
    enter_locked(mode);
  }

  spdlog::info("[Mode] {} -> {}", display_name(old_mode), display_name(mode));
  Bus::instance().publish(events::ModeChanged{to_string(old_mode), to_string(mode)});
}

std::vector<std::pair<Mode, ModeManager::Clock::time_point>> ModeManager::history() const {
  std::lock_guard lock(mutex_);
  return history_;
}

BlockCheck ModeManager::should_block_tool(const std::string &tool_name, const json &args) const {
  Mode active = current_mode();
  const auto &config = mode_config(active);

  if (!config.read_only) {
    return {};
  }
  if (!mode::is_write_operation(tool_name, args)) {
    return {};
  }

  auto name = display_name(active);
  std::string reason = "⛔ Tool '" + tool_name + "' blocked in " + config.emoji + " " + name +
                       " mode\n\n"
                       "This operation would modify files. Current mode is read-only for safety.\n\n"
                       "Options:\n"
                       "1. Press Shift+Tab to switch to NORMAL or AUTO mode\n"
                       "2. Reply \"approved\" or \"go ahead\" to leave " +
                       name + " mode and execute the plan\n"
                       "3. Add this step to the implementation plan instead";
  return {true, std::move(reason)};
}

bool ModeManager::should_approve_tool(const std::string &tool_name) const {
  const auto &config = mode_config(current_mode());
  if (config.auto_approve) {
    return true;
  }
  if (config.read_only) {
    return is_read_only_tool(tool_name);
  }
  return false;
}

bool ModeManager::is_write_operation(const std::string &tool_name, const json &args) const {
  return mode::is_write_operation(tool_name, args);
}

std::string ModeManager::get_system_prompt_modifier() const {
  return system_prompt_modifier(current_mode());
}

std::string ModeManager::mode_indicator() const {
  Mode mode = current_mode();
  return std::string(mode_config(mode).emoji) + " " + display_name(mode);
}

std::string ModeManager::mode_description() const {
  return mode_config(current_mode()).description;
}

std::string ModeManager::transition_message(Mode old_mode, Mode new_mode) {
  const auto &config = mode_config(new_mode);
  return "🔄 Mode: " + display_name(old_mode) + " → " + display_name(new_mode) + "\n" + config.emoji + " " +
         display_name(new_mode) + ": " + config.description;
}

json ModeManager::to_json() const {
  std::lock_guard lock(mutex_);
  const auto &config = mode_config(current_);
  return {
      {"mode", to_string(current_)},
      {"auto_approve", config.auto_approve},
      {"read_only", config.read_only},
      {"started_at", format_time(started_at_)},
      {"transitions", history_.size() - 1},
  };
}

}  // namespace toolgate::mode
