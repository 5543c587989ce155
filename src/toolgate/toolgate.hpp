#pragma once

// Core types
#include "core/config.hpp"
#include "core/glob.hpp"
#include "core/logging.hpp"
#include "core/types.hpp"
#include "core/version.hpp"

// Event bus
#include "bus/bus.hpp"

// Modes
#include "mode/mode.hpp"
#include "mode/mode_manager.hpp"
#include "mode/write_detector.hpp"

// Permissions
#include "permission/policy.hpp"
#include "permission/sweeper.hpp"
#include "permission/tracker.hpp"

// Gateway
#include "gateway/approval.hpp"
#include "gateway/gateway.hpp"

namespace toolgate {

// Apply process-wide settings (log level)
void init(const Config &config);

// Get version string
std::string version();

// One mode manager, tracker, policy and gateway wired together from a config
class Runtime {
 public:
  explicit Runtime(Config config);

  Runtime(const Runtime &) = delete;
  Runtime &operator=(const Runtime &) = delete;

  const Config &config() const {
    return config_;
  }
  mode::ModeManager &modes() {
    return modes_;
  }
  permission::PermissionTracker &tracker() {
    return tracker_;
  }
  permission::PermissionPolicy &policy() {
    return policy_;
  }
  gateway::ApprovalGateway &gateway() {
    return gateway_;
  }

 private:
  Config config_;
  mode::ModeManager modes_;
  permission::PermissionTracker tracker_;
  permission::PermissionPolicy policy_;
  gateway::ApprovalGateway gateway_;
};

// default_mode from the config; unknown names fall back to Normal with a warning
mode::Mode initial_mode(const Config &config);

}  // namespace toolgate
