#include "permission/tracker.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <vector>

#include "bus/bus.hpp"

namespace toolgate::permission {

// ============================================================
// Slot table
// ============================================================

PermissionTracker::Slot &PermissionTracker::slot_for(const std::string &tool) {
  {
    std::shared_lock lock(slots_mutex_);
    auto it = slots_.find(tool);
    if (it != slots_.end()) {
      return *it->second;
    }
  }

  std::unique_lock lock(slots_mutex_);
  auto [it, inserted] = slots_.try_emplace(tool);
  if (inserted) {
    it->second = std::make_unique<Slot>();
  }
  return *it->second;
}

PermissionTracker::Slot *PermissionTracker::find_slot(const std::string &tool) const {
  std::shared_lock lock(slots_mutex_);
  auto it = slots_.find(tool);
  return it == slots_.end() ? nullptr : it->second.get();
}

// ============================================================
// Granting
// ============================================================

void PermissionTracker::install(const std::string &tool, std::variant<TimeScope, IterationScope> scope) {
  auto &slot = slot_for(tool);
  std::lock_guard lock(slot.mutex);
  slot.grant = TemporaryGrant{tool, std::move(scope), Clock::now(), next_generation_++};
  slot.last_expiration.reset();
  slot.exhausted_generation = 0;
  slot.refundable.clear();
}

void PermissionTracker::grant_time_based(const std::string &tool, Clock::duration duration) {
  auto now = Clock::now();
  Clock::time_point expires_at = now;
  if (duration > Clock::duration::zero()) {
    expires_at = duration >= Clock::time_point::max() - now ? Clock::time_point::max() : now + duration;
  }
  install(tool, TimeScope{expires_at});

  auto seconds = std::chrono::duration_cast<std::chrono::seconds>(duration).count();
  spdlog::info("[Tracker] Granted '{}' for {}s", tool, seconds);
  Bus::instance().publish(events::GrantIssued{tool, "time", seconds});
}

void PermissionTracker::grant_iteration_based(const std::string &tool, int64_t count) {
  count = std::max<int64_t>(count, 0);
  install(tool, IterationScope{count});

  spdlog::info("[Tracker] Granted '{}' for {} uses", tool, count);
  Bus::instance().publish(events::GrantIssued{tool, "iterations", count});
}

// ============================================================
// Checking
// ============================================================

GrantCheck PermissionTracker::check_and_reserve(const std::string &tool) {
  auto &slot = slot_for(tool);
  GrantCheck result;
  bool expired_now = false;

  {
    std::lock_guard lock(slot.mutex);

    if (!slot.grant) {
      // Every caller that lost the grant sees why, including concurrent losers
      result.expiration_reason = slot.last_expiration;
      return result;
    }

    auto &grant = *slot.grant;
    if (auto *time = std::get_if<TimeScope>(&grant.scope)) {
      if (Clock::now() < time->expires_at) {
        result.granted = true;
      } else {
        slot.grant.reset();
        slot.last_expiration = ExpirationReason::TimeExpired;
        result.expiration_reason = ExpirationReason::TimeExpired;
        expired_now = true;
      }
    } else {
      auto &iterations = std::get<IterationScope>(grant.scope);
      if (iterations.remaining_uses > 0) {
        --iterations.remaining_uses;
        result.granted = true;
        result.ticket = GrantTicket{tool, grant.generation, slot.next_serial++};
        slot.refundable.insert(result.ticket->serial);
        if (iterations.remaining_uses == 0) {
          slot.exhausted_generation = grant.generation;
          slot.last_expiration = ExpirationReason::IterationsExhausted;
          slot.grant.reset();
          expired_now = true;
        }
      } else {
        slot.grant.reset();
        slot.last_expiration = ExpirationReason::IterationsExhausted;
        result.expiration_reason = ExpirationReason::IterationsExhausted;
        expired_now = true;
      }
    }
  }

  if (expired_now) {
    auto reason = result.expiration_reason.value_or(ExpirationReason::IterationsExhausted);
    spdlog::debug("[Tracker] Grant for '{}' ended: {}", tool, to_string(reason));
    Bus::instance().publish(events::GrantExpired{tool, reason});
  }
  return result;
}

void PermissionTracker::acknowledge_expiration(const std::string &tool, ExpirationReason reason) {
  auto *slot = find_slot(tool);
  if (!slot) return;

  std::lock_guard lock(slot->mutex);
  if (!slot->grant && slot->last_expiration == reason) {
    slot->last_expiration.reset();
  }
}

bool PermissionTracker::check_and_reserve_iteration(const std::string &tool) {
  return check_and_reserve(tool).granted;
}

bool PermissionTracker::is_granted(const std::string &tool) const {
  auto *slot = find_slot(tool);
  if (!slot) return false;

  std::lock_guard lock(slot->mutex);
  if (!slot->grant) return false;

  if (auto *time = std::get_if<TimeScope>(&slot->grant->scope)) {
    return Clock::now() < time->expires_at;
  }
  return std::get<IterationScope>(slot->grant->scope).remaining_uses > 0;
}

size_t PermissionTracker::cleanup_expired() {
  std::vector<std::pair<std::string, Slot *>> snapshot;
  {
    std::shared_lock lock(slots_mutex_);
    for (auto &[name, slot] : slots_) {
      snapshot.emplace_back(name, slot.get());
    }
  }

  std::vector<std::string> removed;
  auto now = Clock::now();
  for (auto &[name, slot] : snapshot) {
    std::lock_guard lock(slot->mutex);
    if (!slot->grant) continue;
    auto *time = std::get_if<TimeScope>(&slot->grant->scope);
    // Re-checked under the tool lock: a fresh grant may have replaced the stale one
    if (time && now >= time->expires_at) {
      slot->grant.reset();
      slot->last_expiration = ExpirationReason::TimeExpired;
      removed.push_back(name);
    }
  }

  for (const auto &name : removed) {
    Bus::instance().publish(events::GrantExpired{name, ExpirationReason::TimeExpired});
  }
  if (!removed.empty()) {
    spdlog::debug("[Tracker] Swept {} expired grant(s)", removed.size());
  }
  return removed.size();
}

// ============================================================
// Inspection and maintenance
// ============================================================

std::optional<GrantInfo> PermissionTracker::remaining(const std::string &tool) const {
  auto *slot = find_slot(tool);
  if (!slot) return std::nullopt;

  std::lock_guard lock(slot->mutex);
  if (!slot->grant) return std::nullopt;

  if (auto *time = std::get_if<TimeScope>(&slot->grant->scope)) {
    auto left = time->expires_at - Clock::now();
    if (left <= Clock::duration::zero()) return std::nullopt;
    auto seconds = std::chrono::ceil<std::chrono::seconds>(left).count();
    return GrantInfo{GrantInfo::Kind::Time, seconds};
  }

  auto uses = std::get<IterationScope>(slot->grant->scope).remaining_uses;
  if (uses <= 0) return std::nullopt;
  return GrantInfo{GrantInfo::Kind::Iterations, uses};
}

bool PermissionTracker::has_grant(const std::string &tool) const {
  auto *slot = find_slot(tool);
  if (!slot) return false;

  std::lock_guard lock(slot->mutex);
  return slot->grant.has_value();
}

void PermissionTracker::revoke(const std::string &tool) {
  auto *slot = find_slot(tool);
  if (!slot) return;

  std::lock_guard lock(slot->mutex);
  slot->grant.reset();
  slot->last_expiration.reset();
  slot->exhausted_generation = 0;
  slot->refundable.clear();
}

void PermissionTracker::clear() {
  std::shared_lock lock(slots_mutex_);
  for (auto &[name, slot] : slots_) {
    std::lock_guard slot_lock(slot->mutex);
    slot->grant.reset();
    slot->last_expiration.reset();
    slot->exhausted_generation = 0;
    slot->refundable.clear();
  }
}

bool PermissionTracker::refund(const GrantTicket &ticket) {
  auto *slot = find_slot(ticket.tool_name);
  if (!slot) return false;

  std::lock_guard lock(slot->mutex);
  if (slot->grant) {
    if (slot->grant->generation != ticket.generation) return false;
    auto *iterations = std::get_if<IterationScope>(&slot->grant->scope);
    if (!iterations || slot->refundable.erase(ticket.serial) == 0) return false;
    ++iterations->remaining_uses;
    return true;
  }

  if (slot->exhausted_generation != 0 && slot->exhausted_generation == ticket.generation &&
      slot->refundable.erase(ticket.serial) > 0) {
    slot->grant = TemporaryGrant{ticket.tool_name, IterationScope{1}, Clock::now(), ticket.generation};
    slot->last_expiration.reset();
    slot->exhausted_generation = 0;
    return true;
  }
  return false;
}

}  // namespace toolgate::permission
