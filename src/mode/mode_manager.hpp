#pragma once

#include <chrono>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "mode/mode.hpp"

namespace toolgate::mode {

using json = nlohmann::json;

// Result of the read-only veto check
struct BlockCheck {
  bool blocked = false;
  std::optional<std::string> reason;
};

// Owns the session's current mode. Thread-safe; all state is behind one mutex.
class ModeManager {
 public:
  using Clock = std::chrono::system_clock;

  explicit ModeManager(Mode initial = Mode::Normal);

  Mode current_mode() const;
  bool auto_approve() const;
  bool read_only() const;

  // Advance along kCycleOrder. Returns (old, new).
  std::pair<Mode, Mode> cycle_mode();

  void set_mode(Mode mode);

  // Every mode entered, including the initial one, with the time it was entered
  std::vector<std::pair<Mode, Clock::time_point>> history() const;

  // Absolute veto: read-only modes block every call classified as a write.
  // Pure in (mode, tool_name, args).
  BlockCheck should_block_tool(const std::string &tool_name, const json &args) const;

  // Auto modes approve everything, read-only modes only read-only tools, others nothing
  bool should_approve_tool(const std::string &tool_name) const;

  bool is_write_operation(const std::string &tool_name, const json &args) const;

  std::string get_system_prompt_modifier() const;

  // "📋 PLAN"
  std::string mode_indicator() const;
  std::string mode_description() const;

  static std::string transition_message(Mode old_mode, Mode new_mode);

  // State snapshot for status displays
  json to_json() const;

 private:
  // Caller holds mutex_
  void enter_locked(Mode mode);

  mutable std::mutex mutex_;
  Mode current_;
  Clock::time_point started_at_;
  std::vector<std::pair<Mode, Clock::time_point>> history_;
};

// "PLAN", "NORMAL", ...
std::string display_name(Mode mode);

}  // namespace toolgate::mode
