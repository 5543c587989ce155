#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace toolgate {

// Generic result type for fallible operations
template <typename T>
struct Result {
  std::optional<T> value;
  std::optional<std::string> error;

  bool ok() const {
    return value.has_value();
  }
  bool failed() const {
    return error.has_value();
  }

  static Result success(T v) {
    Result r;
    r.value = std::move(v);
    return r;
  }

  static Result failure(std::string e) {
    Result r;
    r.error = std::move(e);
    return r;
  }
};

// Static per-tool permission rule
enum class ToolPermission { Always, Never, Ask, AskTime, AskIterations };

std::string to_string(ToolPermission permission);

// Case-insensitive; '_' is accepted in place of '-'. Returns nullopt for unknown values.
std::optional<ToolPermission> permission_from_string(const std::string &str);

// True for the three permissions that require the interactive approval handler
bool requires_approval(ToolPermission permission);

// Gateway verdict for a single tool call
enum class Verdict { Execute, Skip };

std::string to_string(Verdict verdict);

// Why a call was skipped (None for Execute)
enum class DenialKind { None, ModeVeto, PermissionDenied, ApprovalDeclined, ApprovalCancelled, ApprovalTimeout, UnknownTool };

std::string to_string(DenialKind kind);

// Why a temporary grant stopped authorizing calls
enum class ExpirationReason { TimeExpired, IterationsExhausted };

std::string to_string(ExpirationReason reason);

// Outcome of a tool execution, reported back after an Execute verdict
enum class ExecutionOutcome { Completed, Failed, Cancelled };

std::string to_string(ExecutionOutcome outcome);

// Lower-case ASCII copy
std::string to_lower(std::string str);

}  // namespace toolgate
