#pragma once

#include <chrono>
#include <future>
#include <mutex>
#include <optional>
#include <set>
#include <string>

#include "core/config.hpp"
#include "gateway/approval.hpp"
#include "mode/mode_manager.hpp"
#include "permission/policy.hpp"
#include "permission/tracker.hpp"

namespace toolgate::gateway {

struct GatewayOptions {
  std::chrono::milliseconds approval_timeout{0};  // 0 = wait indefinitely
  int64_t default_grant_seconds = 300;
  int64_t default_grant_iterations = 10;
  bool refund_cancelled_reservations = false;
  std::set<std::string> known_tools;  // Empty = accept any tool name

  static GatewayOptions from_config(const Config &config);
};

// Decides whether a proposed tool call may run.
//
// Precedence, evaluated in this order for every call:
//   unknown tool -> mode veto -> temporary grant -> static permission (always / never)
//   -> auto-approving mode -> approval handler.
//
// decide() never throws. Any failure resolves to Skip.
class ApprovalGateway {
 public:
  ApprovalGateway(mode::ModeManager &modes, permission::PermissionTracker &tracker,
                  permission::PermissionPolicy &policy, GatewayOptions options = {});

  void set_approval_handler(ApprovalHandler handler);

  ApprovalDecision decide(const ToolCallRequest &request, const AbortSignal &abort = nullptr);

  // decide() on a worker thread
  std::future<ApprovalDecision> evaluate(ToolCallRequest request, AbortSignal abort = nullptr);

  // Called after an Execute decision ran. With refund_cancelled_reservations, a failed or
  // cancelled execution gives its reserved grant use back. Returns true if a use was refunded.
  bool report_outcome(const ApprovalDecision &decision, ExecutionOutcome outcome);

  const GatewayOptions &options() const {
    return options_;
  }

 private:
  ApprovalDecision evaluate_steps(const ToolCallRequest &request, const AbortSignal &abort);

  ApprovalDecision ask_user(const ToolCallRequest &request, ToolPermission permission,
                            std::optional<ExpirationReason> expiration_reason, const AbortSignal &abort);

  // Reply, or the denial kind (ApprovalCancelled / ApprovalTimeout) when none arrived
  std::variant<ApprovalReply, DenialKind> wait_for_reply(std::future<ApprovalReply> &future, const AbortSignal &abort);

  ApprovalDecision apply_reply(const ToolCallRequest &request, ToolPermission permission, const ApprovalReply &reply);

  void publish(const ToolCallRequest &request, const ApprovalDecision &decision);

  mode::ModeManager &modes_;
  permission::PermissionTracker &tracker_;
  permission::PermissionPolicy &policy_;
  GatewayOptions options_;

  mutable std::mutex handler_mutex_;  // Guards handler_ replacement only
  ApprovalHandler handler_;
};

// Reason strings carried by Skip decisions
namespace reasons {
inline constexpr const char *kDenied = "denied";
inline constexpr const char *kDeclined = "declined";
inline constexpr const char *kApprovalCancelled = "approval_cancelled";
inline constexpr const char *kApprovalTimeout = "approval_timeout";
inline constexpr const char *kUnknownTool = "unknown_tool";
}  // namespace reasons

}  // namespace toolgate::gateway
