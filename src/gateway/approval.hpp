#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <variant>

#include "core/types.hpp"
#include "permission/tracker.hpp"

namespace toolgate::gateway {

using json = nlohmann::json;

// One tool invocation proposed by the agent
struct ToolCallRequest {
  std::string tool_name;
  json args = json::object();
  std::string call_id;

  // From {"tool": ..., "args": {...}, "id": ...}. "id" falls back to fallback_id.
  static Result<ToolCallRequest> from_json(const json &j, const std::string &fallback_id);
};

// What the approval handler is asked
struct ApprovalRequest {
  std::string tool_name;
  json args;
  std::string call_id;
  ToolPermission permission_type = ToolPermission::Ask;  // Ask, AskTime or AskIterations
  std::optional<ExpirationReason> expiration_reason;     // Set when re-prompting after a grant ran out
  int64_t default_grant_seconds = 300;
  int64_t default_grant_iterations = 10;
};

// ============================================================
// Handler replies
// ============================================================

struct ApproveOnce {};
struct Decline {};
struct ApproveAlways {};
struct ApproveForDuration {
  int64_t seconds = 300;
};
struct ApproveForIterations {
  int64_t count = 10;
};
struct Cancelled {};

using ApprovalReply =
    std::variant<ApproveOnce, Decline, ApproveAlways, ApproveForDuration, ApproveForIterations, Cancelled>;

// Asks the user. May answer asynchronously; the gateway waits on the future
// (bounded by the approval timeout and the abort signal).
using ApprovalHandler = std::function<std::future<ApprovalReply>(const ApprovalRequest &)>;

// Set to true to cancel a pending approval
using AbortSignal = std::shared_ptr<std::atomic<bool>>;

// ============================================================
// Decision
// ============================================================

struct ApprovalDecision {
  Verdict verdict = Verdict::Skip;
  std::optional<std::string> reason;
  DenialKind kind = DenialKind::None;
  // The iteration-grant use this call consumed, for report_outcome
  std::optional<permission::GrantTicket> reservation;

  bool executes() const {
    return verdict == Verdict::Execute;
  }

  static ApprovalDecision execute(std::string reason = "") {
    ApprovalDecision d;
    d.verdict = Verdict::Execute;
    if (!reason.empty()) d.reason = std::move(reason);
    return d;
  }

  static ApprovalDecision skip(std::string reason, DenialKind kind) {
    ApprovalDecision d;
    d.verdict = Verdict::Skip;
    d.reason = std::move(reason);
    d.kind = kind;
    return d;
  }
};

}  // namespace toolgate::gateway
