#include "gateway/gateway.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

#include "bus/bus.hpp"
#include "core/logging.hpp"

namespace toolgate::gateway {

namespace {

// Granularity of the abort-signal check while waiting for the user
constexpr auto kPollInterval = std::chrono::milliseconds(50);

// Longest time-based grant a reply can issue (ten years)
constexpr int64_t kMaxGrantSeconds = 10LL * 365 * 24 * 60 * 60;

bool aborted(const AbortSignal &abort) {
  return abort && abort->load();
}

template <class... Ts>
struct overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

}  // namespace

Result<ToolCallRequest> ToolCallRequest::from_json(const json &j, const std::string &fallback_id) {
  if (!j.is_object()) {
    return Result<ToolCallRequest>::failure("Expected a JSON object");
  }
  auto tool = j.find("tool");
  if (tool == j.end() || !tool->is_string()) {
    return Result<ToolCallRequest>::failure("\"tool\" must be a string");
  }

  ToolCallRequest request;
  request.tool_name = tool->get<std::string>();
  request.call_id = fallback_id;
  if (auto id = j.find("id"); id != j.end()) {
    if (id->is_string()) {
      request.call_id = id->get<std::string>();
    } else if (id->is_number_integer()) {
      request.call_id = id->dump();
    } else {
      return Result<ToolCallRequest>::failure("\"id\" must be a string or integer");
    }
  }
  if (auto args = j.find("args"); args != j.end() && !args->is_null()) {
    request.args = *args;
  }
  return Result<ToolCallRequest>::success(std::move(request));
}

GatewayOptions GatewayOptions::from_config(const Config &config) {
  GatewayOptions options;
  options.approval_timeout = std::chrono::seconds(std::max(config.approval.timeout_seconds, 0));
  options.default_grant_seconds = config.approval.default_grant_seconds;
  options.default_grant_iterations = config.approval.default_grant_iterations;
  options.refund_cancelled_reservations = config.approval.refund_cancelled_reservations;
  options.known_tools.insert(config.known_tools.begin(), config.known_tools.end());
  return options;
}

ApprovalGateway::ApprovalGateway(mode::ModeManager &modes, permission::PermissionTracker &tracker,
                                 permission::PermissionPolicy &policy, GatewayOptions options)
    : modes_(modes), tracker_(tracker), policy_(policy), options_(std::move(options)) {}

void ApprovalGateway::set_approval_handler(ApprovalHandler handler) {
  std::lock_guard lock(handler_mutex_);
  handler_ = std::move(handler);
}

// ============================================================
// Decision
// ============================================================

ApprovalDecision ApprovalGateway::decide(const ToolCallRequest &request, const AbortSignal &abort) {
  ApprovalDecision decision;
  try {
    decision = evaluate_steps(request, abort);
  } catch (const std::exception &e) {
    spdlog::error("[Gate] {} '{}': evaluation failed: {}", request.call_id, request.tool_name, e.what());
    decision = ApprovalDecision::skip(reasons::kApprovalCancelled, DenialKind::ApprovalCancelled);
  }

  try {
    publish(request, decision);
  } catch (const std::exception &e) {
    // The decision stands; only its notification was lost
    spdlog::error("[Gate] {} '{}': publishing decision failed: {}", request.call_id, request.tool_name, e.what());
  }
  return decision;
}

std::future<ApprovalDecision> ApprovalGateway::evaluate(ToolCallRequest request, AbortSignal abort) {
  return std::async(std::launch::async, [this, request = std::move(request), abort = std::move(abort)]() {
    return decide(request, abort);
  });
}

ApprovalDecision ApprovalGateway::evaluate_steps(const ToolCallRequest &request, const AbortSignal &abort) {
  const auto &tool = request.tool_name;

  // 0. Unknown tool
  if (tool.empty() || (!options_.known_tools.empty() && options_.known_tools.count(tool) == 0)) {
    return ApprovalDecision::skip(reasons::kUnknownTool, DenialKind::UnknownTool);
  }

  // 1. Mode veto, absolute
  auto block = modes_.should_block_tool(tool, request.args);
  if (block.blocked) {
    return ApprovalDecision::skip(block.reason.value_or("blocked by mode"), DenialKind::ModeVeto);
  }

  // 2. Temporary grant
  auto check = tracker_.check_and_reserve(tool);
  if (check.granted) {
    auto decision = ApprovalDecision::execute("temporary_grant");
    decision.reservation = check.ticket;
    return decision;
  }

  // 3-4. Static permission
  auto permission = policy_.resolve(tool, request.args);
  if (permission == ToolPermission::Always) {
    return ApprovalDecision::execute("always");
  }
  if (permission == ToolPermission::Never) {
    return ApprovalDecision::skip(reasons::kDenied, DenialKind::PermissionDenied);
  }

  // 4b. Auto-approving mode stands in for the prompt
  if (modes_.should_approve_tool(tool)) {
    return ApprovalDecision::execute("auto_approved");
  }

  // 5-7. Ask the user
  return ask_user(request, permission, check.expiration_reason, abort);
}

// ============================================================
// Approval
// ============================================================

ApprovalDecision ApprovalGateway::ask_user(const ToolCallRequest &request, ToolPermission permission,
                                           std::optional<ExpirationReason> expiration_reason,
                                           const AbortSignal &abort) {
  ApprovalHandler handler;
  {
    std::lock_guard lock(handler_mutex_);
    handler = handler_;
  }
  if (!handler) {
    spdlog::warn("[Gate] No approval handler installed; '{}' not approved", request.tool_name);
    return ApprovalDecision::skip(reasons::kApprovalCancelled, DenialKind::ApprovalCancelled);
  }
  if (aborted(abort)) {
    return ApprovalDecision::skip(reasons::kApprovalCancelled, DenialKind::ApprovalCancelled);
  }

  ApprovalRequest prompt;
  prompt.tool_name = request.tool_name;
  prompt.args = request.args;
  prompt.call_id = request.call_id;
  prompt.permission_type = permission;
  prompt.expiration_reason = expiration_reason;
  prompt.default_grant_seconds = options_.default_grant_seconds;
  prompt.default_grant_iterations = options_.default_grant_iterations;

  std::future<ApprovalReply> future;
  try {
    future = handler(prompt);
  } catch (const std::exception &e) {
    spdlog::error("[Gate] Approval handler failed for '{}': {}", request.tool_name, e.what());
    return ApprovalDecision::skip(reasons::kApprovalCancelled, DenialKind::ApprovalCancelled);
  }

  auto outcome = wait_for_reply(future, abort);
  if (expiration_reason) {
    tracker_.acknowledge_expiration(request.tool_name, *expiration_reason);
  }
  if (auto *failure = std::get_if<DenialKind>(&outcome)) {
    if (*failure == DenialKind::ApprovalTimeout) {
      spdlog::warn("[Gate] Approval for '{}' timed out", request.tool_name);
      return ApprovalDecision::skip(reasons::kApprovalTimeout, DenialKind::ApprovalTimeout);
    }
    return ApprovalDecision::skip(reasons::kApprovalCancelled, DenialKind::ApprovalCancelled);
  }

  return apply_reply(request, permission, std::get<ApprovalReply>(outcome));
}

std::variant<ApprovalReply, DenialKind> ApprovalGateway::wait_for_reply(std::future<ApprovalReply> &future,
                                                                        const AbortSignal &abort) {
  if (!future.valid()) {
    return DenialKind::ApprovalCancelled;
  }

  using SteadyClock = std::chrono::steady_clock;
  const bool bounded = options_.approval_timeout > std::chrono::milliseconds::zero();
  const auto deadline = SteadyClock::now() + options_.approval_timeout;

  while (true) {
    if (aborted(abort)) {
      return DenialKind::ApprovalCancelled;
    }

    auto slice = std::chrono::duration_cast<SteadyClock::duration>(kPollInterval);
    if (bounded) {
      auto left = deadline - SteadyClock::now();
      if (left <= SteadyClock::duration::zero()) {
        return DenialKind::ApprovalTimeout;
      }
      slice = std::min(slice, left);
    }

    auto status = future.wait_for(slice);
    if (status != std::future_status::timeout) {
      // ready, or deferred (get() runs it here)
      break;
    }
  }

  try {
    return future.get();
  } catch (const std::exception &e) {
    // Broken promise or an exception stored by the handler
    spdlog::warn("[Gate] Approval handler gave no answer: {}", e.what());
    return DenialKind::ApprovalCancelled;
  }
}

ApprovalDecision ApprovalGateway::apply_reply(const ToolCallRequest &request, ToolPermission permission,
                                              const ApprovalReply &reply) {
  const auto &tool = request.tool_name;
  const bool offers_grants = permission == ToolPermission::AskTime || permission == ToolPermission::AskIterations;

  return std::visit(
      overloaded{
          [](const ApproveOnce &) { return ApprovalDecision::execute("approved"); },
          [](const Decline &) { return ApprovalDecision::skip(reasons::kDeclined, DenialKind::ApprovalDeclined); },
          [this, &tool](const ApproveAlways &) {
            auto persisted = policy_.persist_always(tool);
            if (!persisted.ok()) {
              // The user approved this call; only the remembered rule is lost
              spdlog::error("[Gate] Could not remember 'always' for '{}': {}", tool,
                            persisted.error.value_or("unknown error"));
            }
            return ApprovalDecision::execute("approved_always");
          },
          [this, &tool, offers_grants](const ApproveForDuration &d) {
            if (!offers_grants) return ApprovalDecision::execute("approved");
            auto seconds = std::clamp<int64_t>(d.seconds, 0, kMaxGrantSeconds);
            tracker_.grant_time_based(tool, std::chrono::seconds(seconds));
            return ApprovalDecision::execute("approved_for_duration");
          },
          [this, &tool, offers_grants](const ApproveForIterations &i) {
            if (!offers_grants) return ApprovalDecision::execute("approved");
            tracker_.grant_iteration_based(tool, i.count);
            return ApprovalDecision::execute("approved_for_iterations");
          },
          [](const Cancelled &) {
            return ApprovalDecision::skip(reasons::kApprovalCancelled, DenialKind::ApprovalCancelled);
          },
      },
      reply);
}

// ============================================================
// Reporting
// ============================================================

void ApprovalGateway::publish(const ToolCallRequest &request, const ApprovalDecision &decision) {
  auto reason = decision.reason.value_or("");
  if (decision.executes()) {
    spdlog::info("[Gate] {} '{}' -> execute ({})", request.call_id, request.tool_name, reason);
  } else {
    // Mode veto reasons are multi-line; log the kind
    spdlog::info("[Gate] {} '{}' -> skip ({})", request.call_id, request.tool_name, to_string(decision.kind));
  }
  spdlog::debug("[Gate] {} args: {}", request.call_id,
                sanitize_args(request.args).dump(-1, ' ', false, json::error_handler_t::replace));

  Bus::instance().publish(
      events::DecisionMade{request.call_id, request.tool_name, decision.verdict, decision.kind, reason});
}

bool ApprovalGateway::report_outcome(const ApprovalDecision &decision, ExecutionOutcome outcome) {
  if (!decision.executes() || !decision.reservation) return false;
  if (outcome == ExecutionOutcome::Completed) return false;
  if (!options_.refund_cancelled_reservations) return false;

  bool refunded = tracker_.refund(*decision.reservation);
  if (refunded) {
    spdlog::info("[Gate] Refunded one use of '{}' after {} execution", decision.reservation->tool_name,
                 to_string(outcome));
  }
  return refunded;
}

}  // namespace toolgate::gateway
