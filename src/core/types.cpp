#include "core/types.hpp"

#include <algorithm>
#include <cctype>

namespace toolgate {

// ============================================================
// ToolPermission
// ============================================================

std::string to_string(ToolPermission permission) {
  switch (permission) {
    case ToolPermission::Always:
      return "always";
    case ToolPermission::Never:
      return "never";
    case ToolPermission::Ask:
      return "ask";
    case ToolPermission::AskTime:
      return "ask-time";
    case ToolPermission::AskIterations:
      return "ask-iterations";
  }
  return "ask";
}

std::optional<ToolPermission> permission_from_string(const std::string &str) {
  std::string normalized = to_lower(str);
  std::replace(normalized.begin(), normalized.end(), '_', '-');

  if (normalized == "always") return ToolPermission::Always;
  if (normalized == "never") return ToolPermission::Never;
  if (normalized == "ask") return ToolPermission::Ask;
  if (normalized == "ask-time") return ToolPermission::AskTime;
  if (normalized == "ask-iterations") return ToolPermission::AskIterations;
  return std::nullopt;
}

bool requires_approval(ToolPermission permission) {
  return permission == ToolPermission::Ask || permission == ToolPermission::AskTime || permission == ToolPermission::AskIterations;
}

// ============================================================
// Verdict / DenialKind
// ============================================================

std::string to_string(Verdict verdict) {
  return verdict == Verdict::Execute ? "execute" : "skip";
}

std::string to_string(DenialKind kind) {
  switch (kind) {
    case DenialKind::None:
      return "none";
    case DenialKind::ModeVeto:
      return "mode_veto";
    case DenialKind::PermissionDenied:
      return "permission_denied";
    case DenialKind::ApprovalDeclined:
      return "approval_declined";
    case DenialKind::ApprovalCancelled:
      return "approval_cancelled";
    case DenialKind::ApprovalTimeout:
      return "approval_timeout";
    case DenialKind::UnknownTool:
      return "unknown_tool";
  }
  return "none";
}

// ============================================================
// ExpirationReason / ExecutionOutcome
// ============================================================

std::string to_string(ExpirationReason reason) {
  switch (reason) {
    case ExpirationReason::TimeExpired:
      return "time_expired";
    case ExpirationReason::IterationsExhausted:
      return "iterations_exhausted";
  }
  return "time_expired";
}

std::string to_string(ExecutionOutcome outcome) {
  switch (outcome) {
    case ExecutionOutcome::Completed:
      return "completed";
    case ExecutionOutcome::Failed:
      return "failed";
    case ExecutionOutcome::Cancelled:
      return "cancelled";
  }
  return "completed";
}

std::string to_lower(std::string str) {
  std::transform(str.begin(), str.end(), str.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return str;
}

}  // namespace toolgate
