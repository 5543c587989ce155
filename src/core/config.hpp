#pragma once

#include <filesystem>
#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

#include "core/types.hpp"

namespace toolgate {

using json = nlohmann::json;

// Per-tool entry under "tools"
struct ToolConfig {
  std::optional<ToolPermission> permission;  // Falls back to Config::default_permission
  std::vector<std::string> allowlist;        // Globs that force "always" for a single call
  std::vector<std::string> denylist;         // Globs that force "never" for a single call
};

// Settings under "approval"
struct ApprovalSettings {
  int timeout_seconds = 0;  // 0 = wait for the user indefinitely
  int default_grant_seconds = 300;
  int default_grant_iterations = 10;
  bool refund_cancelled_reservations = false;
  int sweep_interval_seconds = 60;  // 0 disables the background sweep
};

struct Config {
  std::string log_level = "info";
  std::string default_mode = "normal";
  ToolPermission default_permission = ToolPermission::Ask;
  std::vector<std::string> known_tools;  // Empty = any tool name is accepted
  ApprovalSettings approval;
  std::map<std::string, ToolConfig> tools;

  // File this config was loaded from (empty for in-memory configs)
  std::filesystem::path source_path;

  std::optional<ToolConfig> get_tool(const std::string &name) const;

  // Parse a config file. Missing file yields defaults; malformed JSON is an error.
  static Result<Config> try_load(const std::filesystem::path &path);

  // Like try_load, but logs and falls back to defaults on error
  static Config load(const std::filesystem::path &path);

  // Project config (.toolgate/config.json up to the git root) or ~/.config/toolgate/config.json
  static Config load_default();

  // Write the whole config atomically (temp file + rename)
  Result<std::filesystem::path> save(const std::filesystem::path &path) const;

  // Set tools.<tool>.permission in an existing (or new) file, preserving every other key
  static Result<std::filesystem::path> update_tool_permission(const std::filesystem::path &path, const std::string &tool,
                                                              ToolPermission permission);

  static Config from_json(const json &j);
  json to_json() const;
};

namespace config_paths {

std::filesystem::path home_dir();

// ~/.config/toolgate
std::filesystem::path config_dir();

// ~/.config/toolgate/config.json
std::filesystem::path global_config_file();

std::optional<std::filesystem::path> find_git_root(const std::filesystem::path &start);

// Nearest .toolgate/config.json from start up to (and including) the git root
std::optional<std::filesystem::path> find_project_config(const std::filesystem::path &start);

}  // namespace config_paths

// Write content to path via a sibling temp file and rename, so readers never see a partial file
Result<std::filesystem::path> write_file_atomic(const std::filesystem::path &path, const std::string &content);

}  // namespace toolgate
