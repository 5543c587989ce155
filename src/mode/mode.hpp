#pragma once

#include <array>
#include <optional>
#include <string>

namespace toolgate::mode {

// Operating posture for the whole session
enum class Mode { Plan, Normal, Auto, Yolo, Architect };

// Static policy attached to each mode
struct ModeConfig {
  bool auto_approve;
  bool read_only;
  const char *emoji;
  const char *description;
};

const ModeConfig &mode_config(Mode mode);

// Shift+Tab order: Normal -> Auto -> Plan -> Yolo -> Architect -> Normal
constexpr std::array<Mode, 5> kCycleOrder = {Mode::Normal, Mode::Auto, Mode::Plan, Mode::Yolo, Mode::Architect};

Mode next_mode(Mode mode);

std::string to_string(Mode mode);

// Case-insensitive; nullopt for unknown names
std::optional<Mode> mode_from_string(const std::string &str);

// Mode instruction block prepended to the agent's system prompt
std::string system_prompt_modifier(Mode mode);

}  // namespace toolgate::mode
