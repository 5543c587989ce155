#pragma once

#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <string>

#include "core/config.hpp"
#include "core/types.hpp"

namespace toolgate::permission {

using json = nlohmann::json;

// Immutable view of the static rules. Readers hold a shared_ptr; writers publish a new one.
struct PolicySnapshot {
  ToolPermission default_permission = ToolPermission::Ask;
  std::map<std::string, ToolConfig> tools;
  uint64_t version = 0;

  // Configured permission for the tool, ignoring allow/deny globs
  ToolPermission base_permission(const std::string &tool) const;
};

// Static per-tool permissions with allow/deny glob overrides.
class PermissionPolicy {
 public:
  // Backed by config.source_path when set; otherwise in-memory only
  explicit PermissionPolicy(const Config &config);
  PermissionPolicy(const Config &config, std::filesystem::path backing_file);

  PermissionPolicy(const PermissionPolicy &) = delete;
  PermissionPolicy &operator=(const PermissionPolicy &) = delete;

  // Deny globs => Never, allow globs => Always (this call only);
  // else the tool's permission, else the default
  ToolPermission resolve(const std::string &tool, const json &args) const;

  // Set tools.<tool>.permission = "always" in the backing file, then publish a new snapshot.
  // On failure neither the file nor the snapshot changes.
  // Without a backing file only the snapshot changes and the returned path is empty.
  Result<std::filesystem::path> persist_always(const std::string &tool);

  // Re-read the backing file. On failure the current snapshot stays.
  Result<std::filesystem::path> reload();

  std::shared_ptr<const PolicySnapshot> snapshot() const;

  ToolPermission base_permission(const std::string &tool) const;

  // In-memory change, not written to disk
  void set_permission(const std::string &tool, ToolPermission permission);

  const std::filesystem::path &backing_file() const {
    return backing_file_;
  }

  // String the globs are matched against: the shell command text, else a path argument,
  // else the compact JSON of the args
  static std::string match_subject(const json &args);

 private:
  static std::shared_ptr<const PolicySnapshot> make_snapshot(const Config &config, uint64_t version);

  // Copy the current snapshot, apply a change, and swap it in. Caller holds write_mutex_.
  void update_locked(const std::string &tool, ToolPermission permission);

  void store(std::shared_ptr<const PolicySnapshot> next);

  std::filesystem::path backing_file_;

  mutable std::mutex snapshot_mutex_;  // Guards the pointer swap only
  std::shared_ptr<const PolicySnapshot> snapshot_;

  std::mutex write_mutex_;  // Serializes persist / reload / set_permission
};

}  // namespace toolgate::permission
