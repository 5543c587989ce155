#include "toolgate/toolgate.hpp"

#include <spdlog/spdlog.h>

namespace toolgate {

void init(const Config &config) {
  init_logging(config.log_level);
  spdlog::debug("toolgate {} initialized", version());
}

std::string version() {
  return TOOLGATE_VERSION_STRING;
}

mode::Mode initial_mode(const Config &config) {
  auto parsed = mode::mode_from_string(config.default_mode);
  if (!parsed) {
    spdlog::warn("[Config] Unknown default_mode '{}', using normal", config.default_mode);
    return mode::Mode::Normal;
  }
  return *parsed;
}

Runtime::Runtime(Config config)
    : config_(std::move(config)),
      modes_(initial_mode(config_)),
      policy_(config_),
      gateway_(modes_, tracker_, policy_, gateway::GatewayOptions::from_config(config_)) {}

}  // namespace toolgate
