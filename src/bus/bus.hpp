#pragma once

#include <any>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <typeindex>
#include <vector>

#include "core/types.hpp"

namespace toolgate {

namespace events {

// A gateway decision for one tool call
struct DecisionMade {
  std::string call_id;
  std::string tool_name;
  Verdict verdict = Verdict::Skip;
  DenialKind kind = DenialKind::None;
  std::string reason;
};

// Mode names are the lower-case textual forms ("plan", "normal", ...)
struct ModeChanged {
  std::string old_mode;
  std::string new_mode;
};

struct GrantIssued {
  std::string tool_name;
  std::string kind;  // "time" or "iterations"
  int64_t amount = 0;  // seconds or uses
};

struct GrantExpired {
  std::string tool_name;
  ExpirationReason reason = ExpirationReason::TimeExpired;
};

struct PolicyPersisted {
  std::string tool_name;
  ToolPermission permission = ToolPermission::Always;
  std::string path;
};

}  // namespace events

// Typed in-process event bus. Handlers are invoked synchronously on the publishing thread,
// outside the bus lock, so a handler may subscribe or unsubscribe.
class Bus {
 public:
  using SubscriptionId = uint64_t;

  static Bus &instance() {
    static Bus bus;
    return bus;
  }

  template <typename Event>
  SubscriptionId subscribe(std::function<void(const Event &)> handler) {
    std::lock_guard lock(mutex_);
    auto id = next_id_++;
    handlers_[std::type_index(typeid(Event))].push_back(Entry{id, [handler = std::move(handler)](const std::any &payload) {
                                                                   handler(std::any_cast<const Event &>(payload));
                                                                 }});
    return id;
  }

  void unsubscribe(SubscriptionId id) {
    std::lock_guard lock(mutex_);
    for (auto &[type, entries] : handlers_) {
      for (auto it = entries.begin(); it != entries.end(); ++it) {
        if (it->id == id) {
          entries.erase(it);
          return;
        }
      }
    }
  }

  template <typename Event>
  void publish(const Event &event) {
    std::vector<std::function<void(const std::any &)>> targets;
    {
      std::lock_guard lock(mutex_);
      auto it = handlers_.find(std::type_index(typeid(Event)));
      if (it == handlers_.end()) return;
      for (const auto &entry : it->second) {
        targets.push_back(entry.fn);
      }
    }

    std::any payload = event;
    for (const auto &fn : targets) {
      fn(payload);
    }
  }

 private:
  Bus() = default;

  struct Entry {
    SubscriptionId id;
    std::function<void(const std::any &)> fn;
  };

  std::mutex mutex_;
  std::map<std::type_index, std::vector<Entry>> handlers_;
  SubscriptionId next_id_ = 1;
};

}  // namespace toolgate
