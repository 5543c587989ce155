#pragma once

#include <nlohmann/json.hpp>
#include <string>

namespace toolgate::mode {

using json = nlohmann::json;

// Classification used by the read-only veto. Unknown tools and unknown shell
// commands are treated as writes.

bool is_read_only_tool(const std::string &tool_name);
bool is_write_tool(const std::string &tool_name);

// Tools that execute arbitrary command text (bash, shell, run_command, execute_command)
bool is_shell_tool(const std::string &tool_name);

// First non-empty of args "command", "cmd", "CommandLine", "commandLine"; empty if none
std::string extract_command(const json &args);

// True if the command text matches a write pattern or is not a known read-only command
bool is_write_shell_command(const std::string &command);

bool is_write_operation(const std::string &tool_name, const json &args);

}  // namespace toolgate::mode
