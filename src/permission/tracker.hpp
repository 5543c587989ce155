#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <shared_mutex>
#include <string>
#include <variant>

#include "core/types.hpp"

namespace toolgate::permission {

using Clock = std::chrono::steady_clock;

// Grant valid until a point in time
struct TimeScope {
  Clock::time_point expires_at;
};

// Grant valid for a number of executions
struct IterationScope {
  int64_t remaining_uses = 0;
};

struct TemporaryGrant {
  std::string tool_name;
  std::variant<TimeScope, IterationScope> scope;
  Clock::time_point granted_at;
  uint64_t generation = 0;  // Distinguishes successive grants for the same tool
};

// Identifies the grant a reserved use was taken from
struct GrantTicket {
  std::string tool_name;
  uint64_t generation = 0;
  uint64_t serial = 0;  // One per reserved use; a ticket is refundable once
};

// Result of check_and_reserve
struct GrantCheck {
  bool granted = false;
  // Set when no grant authorizes the call because one expired or ran out
  std::optional<ExpirationReason> expiration_reason;
  // Set when a use was taken from an iteration grant
  std::optional<GrantTicket> ticket;
};

// Display snapshot of an active grant
struct GrantInfo {
  enum class Kind { Time, Iterations };
  Kind kind = Kind::Time;
  int64_t remaining = 0;  // Seconds (rounded up) or uses
};

// Temporary per-tool authorizations ("yes for 5 minutes", "yes for 10 calls").
//
// Every read-modify-write of a tool's grant runs inside that tool's critical section.
// Slots are created once per tool name and never erased.
class PermissionTracker {
 public:
  PermissionTracker() = default;
  PermissionTracker(const PermissionTracker &) = delete;
  PermissionTracker &operator=(const PermissionTracker &) = delete;

  // Replace any grant for the tool. Non-positive durations are already expired;
  // durations past the clock's range saturate at its maximum.
  void grant_time_based(const std::string &tool, Clock::duration duration);

  // Replace any grant for the tool. Non-positive counts are already exhausted.
  void grant_iteration_based(const std::string &tool, int64_t count);

  // Atomically check the grant and, for iteration grants, take one use.
  // Once a grant has expired or run out, every failing check reports why until the
  // reason is acknowledged or a new grant is issued.
  GrantCheck check_and_reserve(const std::string &tool);

  // The user has been re-prompted with this reason; later checks no longer report it
  void acknowledge_expiration(const std::string &tool, ExpirationReason reason);

  // True if an iteration grant authorized this call (one use consumed).
  // Time grants are reported as well, without consuming anything.
  bool check_and_reserve_iteration(const std::string &tool);

  // Read-only: true if a grant would currently authorize a call
  bool is_granted(const std::string &tool) const;

  // Remove expired time grants. Returns the number removed.
  size_t cleanup_expired();

  std::optional<GrantInfo> remaining(const std::string &tool) const;

  bool has_grant(const std::string &tool) const;

  void revoke(const std::string &tool);

  void clear();

  // Give back the use a ticket reserved, at most once per ticket. Only valid for the grant
  // the ticket came from: the current one, or the one that the reservation just exhausted
  // (restored with one use).
  bool refund(const GrantTicket &ticket);

 private:
  struct Slot {
    std::mutex mutex;
    std::optional<TemporaryGrant> grant;
    std::optional<ExpirationReason> last_expiration;
    uint64_t exhausted_generation = 0;  // Generation removed at zero uses, 0 = none
    std::set<uint64_t> refundable;      // Serials reserved from the latest iteration grant
    uint64_t next_serial = 1;
  };

  // Lazily creates the slot; safe under concurrent first access
  Slot &slot_for(const std::string &tool);

  // nullptr if the tool has never been seen
  Slot *find_slot(const std::string &tool) const;

  void install(const std::string &tool, std::variant<TimeScope, IterationScope> scope);

  mutable std::shared_mutex slots_mutex_;
  std::map<std::string, std::unique_ptr<Slot>> slots_;
  std::atomic<uint64_t> next_generation_{1};
};

}  // namespace toolgate::permission
