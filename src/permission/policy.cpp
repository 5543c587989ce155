#include "permission/policy.hpp"

#include <spdlog/spdlog.h>

#include "bus/bus.hpp"
#include "core/glob.hpp"
#include "mode/write_detector.hpp"

namespace toolgate::permission {

namespace fs = std::filesystem;

ToolPermission PolicySnapshot::base_permission(const std::string &tool) const {
  auto it = tools.find(tool);
  if (it != tools.end() && it->second.permission) {
    return *it->second.permission;
  }
  return default_permission;
}

PermissionPolicy::PermissionPolicy(const Config &config) : PermissionPolicy(config, config.source_path) {}

PermissionPolicy::PermissionPolicy(const Config &config, fs::path backing_file)
    : backing_file_(std::move(backing_file)), snapshot_(make_snapshot(config, 1)) {}

std::shared_ptr<const PolicySnapshot> PermissionPolicy::make_snapshot(const Config &config, uint64_t version) {
  auto snap = std::make_shared<PolicySnapshot>();
  snap->default_permission = config.default_permission;
  snap->tools = config.tools;
  snap->version = version;
  return snap;
}

std::shared_ptr<const PolicySnapshot> PermissionPolicy::snapshot() const {
  std::lock_guard lock(snapshot_mutex_);
  return snapshot_;
}

void PermissionPolicy::store(std::shared_ptr<const PolicySnapshot> next) {
  std::lock_guard lock(snapshot_mutex_);
  snapshot_ = std::move(next);
}

// ============================================================
// Resolution
// ============================================================

std::string PermissionPolicy::match_subject(const json &args) {
  auto command = mode::extract_command(args);
  if (!command.empty()) return command;

  if (args.is_object()) {
    for (const char *key : {"path", "file_path", "filePath"}) {
      auto it = args.find(key);
      if (it != args.end() && it->is_string() && !it->get<std::string>().empty()) {
        return it->get<std::string>();
      }
    }
  }

  if (args.is_null()) return "";
  return args.dump(-1, ' ', false, json::error_handler_t::replace);
}

ToolPermission PermissionPolicy::resolve(const std::string &tool, const json &args) const {
  auto snap = snapshot();

  auto it = snap->tools.find(tool);
  if (it == snap->tools.end()) {
    return snap->default_permission;
  }

  const auto &entry = it->second;
  if (!entry.denylist.empty() || !entry.allowlist.empty()) {
    auto subject = match_subject(args);
    if (glob_match_any(entry.denylist, subject)) {
      spdlog::debug("[Policy] '{}' denylist matched: {}", tool, subject);
      return ToolPermission::Never;
    }
    if (glob_match_any(entry.allowlist, subject)) {
      spdlog::debug("[Policy] '{}' allowlist matched: {}", tool, subject);
      return ToolPermission::Always;
    }
  }

  return entry.permission.value_or(snap->default_permission);
}

ToolPermission PermissionPolicy::base_permission(const std::string &tool) const {
  return snapshot()->base_permission(tool);
}

// ============================================================
// Updates
// ============================================================

void PermissionPolicy::update_locked(const std::string &tool, ToolPermission permission) {
  auto current = snapshot();
  auto next = std::make_shared<PolicySnapshot>(*current);
  next->tools[tool].permission = permission;
  next->version = current->version + 1;
  store(std::move(next));
}

void PermissionPolicy::set_permission(const std::string &tool, ToolPermission permission) {
  std::lock_guard lock(write_mutex_);
  update_locked(tool, permission);
}

Result<fs::path> PermissionPolicy::persist_always(const std::string &tool) {
  std::lock_guard lock(write_mutex_);

  fs::path written;
  if (!backing_file_.empty()) {
    auto result = Config::update_tool_permission(backing_file_, tool, ToolPermission::Always);
    if (!result.ok()) {
      spdlog::error("[Policy] Failed to persist '{}' as always: {}", tool, result.error.value_or("unknown error"));
      return result;
    }
    written = *result.value;
  }

  update_locked(tool, ToolPermission::Always);

  if (written.empty()) {
    spdlog::info("[Policy] '{}' set to always (in memory)", tool);
  } else {
    spdlog::info("[Policy] '{}' set to always in {}", tool, written.string());
  }
  Bus::instance().publish(events::PolicyPersisted{tool, ToolPermission::Always, written.string()});
  return Result<fs::path>::success(written);
}

Result<fs::path> PermissionPolicy::reload() {
  std::lock_guard lock(write_mutex_);

  if (backing_file_.empty()) {
    return Result<fs::path>::failure("Policy has no backing file");
  }

  auto loaded = Config::try_load(backing_file_);
  if (!loaded.ok()) {
    spdlog::error("[Policy] Reload failed: {}", loaded.error.value_or("unknown error"));
    return Result<fs::path>::failure(loaded.error.value_or("unknown error"));
  }

  store(make_snapshot(*loaded.value, snapshot()->version + 1));
  spdlog::info("[Policy] Reloaded {}", backing_file_.string());
  return Result<fs::path>::success(backing_file_);
}

}  // namespace toolgate::permission
