#include "core/config.hpp"

#include <spdlog/spdlog.h>

#include <cstdlib>
#include <fstream>
#include <system_error>

namespace toolgate {

namespace fs = std::filesystem;

// ============================================================
// JSON conversion
// ============================================================

static std::vector<std::string> string_list(const json &j, const char *key) {
  std::vector<std::string> out;
  if (!j.contains(key) || !j[key].is_array()) return out;
  for (const auto &item : j[key]) {
    if (item.is_string()) out.push_back(item.get<std::string>());
  }
  return out;
}

static ToolPermission parse_permission_value(const json &value, const std::string &owner) {
  if (!value.is_string()) {
    spdlog::warn("[Config] '{}': permission must be a string, using ask", owner);
    return ToolPermission::Ask;
  }
  auto raw = value.get<std::string>();
  auto perm = permission_from_string(raw);
  if (!perm) {
    spdlog::warn("[Config] '{}': invalid permission '{}' (expected always, never, ask, ask-time, ask-iterations), using ask", owner,
                 raw);
    return ToolPermission::Ask;
  }
  return *perm;
}

Config Config::from_json(const json &j) {
  Config config;
  if (!j.is_object()) return config;

  config.log_level = j.value("log_level", config.log_level);
  config.default_mode = j.value("default_mode", config.default_mode);
  if (j.contains("default_permission")) {
    config.default_permission = parse_permission_value(j["default_permission"], "default_permission");
  }
  config.known_tools = string_list(j, "known_tools");

  if (j.contains("approval") && j["approval"].is_object()) {
    const auto &a = j["approval"];
    config.approval.timeout_seconds = a.value("timeout_seconds", config.approval.timeout_seconds);
    config.approval.default_grant_seconds = a.value("default_grant_seconds", config.approval.default_grant_seconds);
    config.approval.default_grant_iterations = a.value("default_grant_iterations", config.approval.default_grant_iterations);
    config.approval.refund_cancelled_reservations =
        a.value("refund_cancelled_reservations", config.approval.refund_cancelled_reservations);
    config.approval.sweep_interval_seconds = a.value("sweep_interval_seconds", config.approval.sweep_interval_seconds);
  }

  if (j.contains("tools") && j["tools"].is_object()) {
    for (const auto &[name, entry] : j["tools"].items()) {
      if (!entry.is_object()) {
        spdlog::warn("[Config] tools.{} is not an object, ignored", name);
        continue;
      }
      ToolConfig tool;
      if (entry.contains("permission")) {
        tool.permission = parse_permission_value(entry["permission"], "tools." + name);
      }
      tool.allowlist = string_list(entry, "allowlist");
      tool.denylist = string_list(entry, "denylist");
      config.tools[name] = std::move(tool);
    }
  }

  return config;
}

json Config::to_json() const {
  json j;
  j["log_level"] = log_level;
  j["default_mode"] = default_mode;
  j["default_permission"] = to_string(default_permission);
  j["known_tools"] = known_tools;
  j["approval"] = {
      {"timeout_seconds", approval.timeout_seconds},
      {"default_grant_seconds", approval.default_grant_seconds},
      {"default_grant_iterations", approval.default_grant_iterations},
      {"refund_cancelled_reservations", approval.refund_cancelled_reservations},
      {"sweep_interval_seconds", approval.sweep_interval_seconds},
  };

  json tools_json = json::object();
  for (const auto &[name, tool] : tools) {
    json entry = json::object();
    if (tool.permission) entry["permission"] = to_string(*tool.permission);
    if (!tool.allowlist.empty()) entry["allowlist"] = tool.allowlist;
    if (!tool.denylist.empty()) entry["denylist"] = tool.denylist;
    tools_json[name] = entry;
  }
  j["tools"] = tools_json;
  return j;
}

std::optional<ToolConfig> Config::get_tool(const std::string &name) const {
  auto it = tools.find(name);
  if (it != tools.end()) {
    return it->second;
  }
  return std::nullopt;
}

// ============================================================
// Load / save
// ============================================================

static Result<json> read_json_file(const fs::path &path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    return Result<json>::failure("Failed to open config file: " + path.string());
  }
  try {
    json j;
    file >> j;
    return Result<json>::success(std::move(j));
  } catch (const json::exception &e) {
    return Result<json>::failure("Failed to parse " + path.string() + ": " + e.what());
  }
}

Result<Config> Config::try_load(const fs::path &path) {
  if (!fs::exists(path)) {
    Config config;
    config.source_path = path;
    return Result<Config>::success(std::move(config));
  }

  auto raw = read_json_file(path);
  if (!raw.ok()) {
    return Result<Config>::failure(*raw.error);
  }

  Config config;
  try {
    config = from_json(*raw.value);
  } catch (const json::exception &e) {
    // A value of the wrong type, e.g. "timeout_seconds": "30"
    return Result<Config>::failure("Invalid config " + path.string() + ": " + e.what());
  }
  config.source_path = path;
  return Result<Config>::success(std::move(config));
}

Config Config::load(const fs::path &path) {
  auto result = try_load(path);
  if (!result.ok()) {
    spdlog::error("[Config] {}; using defaults", result.error.value_or("unknown error"));
    Config config;
    config.source_path = path;
    return config;
  }
  return std::move(*result.value);
}

Config Config::load_default() {
  if (auto project = config_paths::find_project_config(fs::current_path())) {
    return load(*project);
  }
  return load(config_paths::global_config_file());
}

Result<fs::path> Config::save(const fs::path &path) const {
  return write_file_atomic(path, to_json().dump(2));
}

Result<fs::path> Config::update_tool_permission(const fs::path &path, const std::string &tool, ToolPermission permission) {
  json j = json::object();
  if (fs::exists(path)) {
    auto raw = read_json_file(path);
    if (!raw.ok()) {
      return Result<fs::path>::failure(*raw.error);
    }
    j = std::move(*raw.value);
    if (!j.is_object()) {
      return Result<fs::path>::failure("Config root is not an object: " + path.string());
    }
  }

  if (!j.contains("tools") || !j["tools"].is_object()) {
    j["tools"] = json::object();
  }
  if (!j["tools"].contains(tool) || !j["tools"][tool].is_object()) {
    j["tools"][tool] = json::object();
  }
  j["tools"][tool]["permission"] = to_string(permission);

  return write_file_atomic(path, j.dump(2));
}

Result<fs::path> write_file_atomic(const fs::path &path, const std::string &content) {
  std::error_code ec;
  auto parent = path.parent_path();
  if (!parent.empty() && !fs::exists(parent, ec)) {
    fs::create_directories(parent, ec);
    if (ec) {
      return Result<fs::path>::failure("Failed to create " + parent.string() + ": " + ec.message());
    }
  }

  fs::path tmp = path;
  tmp += ".tmp";

  {
    std::ofstream file(tmp, std::ios::trunc);
    if (!file.is_open()) {
      return Result<fs::path>::failure("Failed to open file for writing: " + tmp.string());
    }
    file << content;
    file.flush();
    if (!file) {
      file.close();
      fs::remove(tmp, ec);
      return Result<fs::path>::failure("Failed to write " + tmp.string());
    }
  }

  fs::rename(tmp, path, ec);
  if (ec) {
    std::error_code ignored;
    fs::remove(tmp, ignored);
    return Result<fs::path>::failure("Failed to replace " + path.string() + ": " + ec.message());
  }
  return Result<fs::path>::success(path);
}

// ============================================================
// config_paths
// ============================================================

namespace config_paths {

fs::path home_dir() {
  if (const char *home = std::getenv("HOME")) {
    return home;
  }
  return fs::temp_directory_path();
}

fs::path config_dir() {
  if (const char *xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg) {
    return fs::path(xdg) / "toolgate";
  }
  return home_dir() / ".config" / "toolgate";
}

fs::path global_config_file() {
  return config_dir() / "config.json";
}

std::optional<fs::path> find_git_root(const fs::path &start) {
  std::error_code ec;
  fs::path dir = fs::absolute(start, ec);
  if (ec) return std::nullopt;

  while (true) {
    if (fs::exists(dir / ".git", ec)) {
      return dir;
    }
    auto parent = dir.parent_path();
    if (parent == dir) break;
    dir = parent;
  }
  return std::nullopt;
}

std::optional<fs::path> find_project_config(const fs::path &start) {
  std::error_code ec;
  fs::path dir = fs::absolute(start, ec);
  if (ec) return std::nullopt;

  auto git_root = find_git_root(dir);
  while (true) {
    auto candidate = dir / ".toolgate" / "config.json";
    if (fs::exists(candidate, ec)) {
      return candidate;
    }
    if (git_root && dir == *git_root) break;
    auto parent = dir.parent_path();
    if (parent == dir) break;
    dir = parent;
  }
  return std::nullopt;
}

}  // namespace config_paths

}  // namespace toolgate
