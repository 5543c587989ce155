#include "mode/mode.hpp"

#include "core/types.hpp"

namespace toolgate::mode {

// ============================================================
// Mode table
// ============================================================

const ModeConfig &mode_config(Mode mode) {
  static const ModeConfig kPlan{false, true, "📋", "Research & Planning - Read only until approved"};
  static const ModeConfig kNormal{false, false, "✋", "Ask confirmation before each tool execution"};
  static const ModeConfig kAuto{true, false, "⚡", "Auto-approve all tool executions"};
  static const ModeConfig kYolo{true, false, "🚀", "Maximum speed, minimal output, auto-approve all"};
  static const ModeConfig kArchitect{false, true, "🏛️", "High-level design focus - Read only"};

  switch (mode) {
    case Mode::Plan:
      return kPlan;
    case Mode::Normal:
      return kNormal;
    case Mode::Auto:
      return kAuto;
    case Mode::Yolo:
      return kYolo;
    case Mode::Architect:
      return kArchitect;
  }
  return kNormal;
}

Mode next_mode(Mode mode) {
  for (size_t i = 0; i < kCycleOrder.size(); ++i) {
    if (kCycleOrder[i] == mode) {
      return kCycleOrder[(i + 1) % kCycleOrder.size()];
    }
  }
  return kCycleOrder[0];
}

std::string to_string(Mode mode) {
  switch (mode) {
    case Mode::Plan:
      return "plan";
    case Mode::Normal:
      return "normal";
    case Mode::Auto:
      return "auto";
    case Mode::Yolo:
      return "yolo";
    case Mode::Architect:
      return "architect";
  }
  return "normal";
}

std::optional<Mode> mode_from_string(const std::string &str) {
  auto lower = to_lower(str);
  if (lower == "plan") return Mode::Plan;
  if (lower == "normal") return Mode::Normal;
  if (lower == "auto") return Mode::Auto;
  if (lower == "yolo") return Mode::Yolo;
  if (lower == "architect") return Mode::Architect;
  return std::nullopt;
}

// ============================================================
// System prompt injection
// ============================================================

std::string system_prompt_modifier(Mode mode) {
  switch (mode) {
    case Mode::Plan:
      return "<active_mode>📋 PLAN</active_mode>\n"
             "<rules>Read-only mode. Use: read_file, grep, bash (ls/cat/grep). NO writes/modifications. Create detailed plans. "
             "Wait for approval (\"approved\"/\"go ahead\") before execution.</rules>\n"
             "<style>Verbose, pedagogical. Ask questions. Validate assumptions.</style>";
    case Mode::Normal:
      return "<active_mode>✋ NORMAL</active_mode>\n"
             "<rules>Reads auto-approved. Writes need confirmation. Explain before acting.</rules>\n"
             "<style>Concise but complete. Confirm risky ops.</style>";
    case Mode::Auto:
      return "<active_mode>⚡ AUTO</active_mode>\n"
             "<rules>All tools auto-approved. Execute without waiting. Explain actions but don't ask permission.</rules>\n"
             "<style>Confident, efficient. Maintain momentum.</style>";
    case Mode::Yolo:
      return "<active_mode>🚀 YOLO</active_mode>\n"
             "<rules>Instant auto-approval. MINIMIZE output. Execute rapidly. Quality maintained.</rules>\n"
             "<style>ULTRA-CONCISE. \"✓ [action]\" or \"✗ [error]\". Verbose only on errors.</style>";
    case Mode::Architect:
      return "<active_mode>🏛️ ARCHITECT</active_mode>\n"
             "<rules>High-level design only. Read-only tools. NO modifications. Think systems/patterns. "
             "Present options with trade-offs.</rules>\n"
             "<style>Abstract, conceptual. Focus on what and why, not how.</style>";
  }
  return "";
}

}  // namespace toolgate::mode
