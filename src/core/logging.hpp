#pragma once

#include <cstddef>
#include <nlohmann/json.hpp>
#include <string>

namespace toolgate {

using json = nlohmann::json;

// Values longer than this are replaced by "<N chars>" in log lines
constexpr size_t kLogArgMaxLength = 100;

// Apply a textual log level ("trace", "debug", "info", "warn", "error", "off") to spdlog.
// Unknown levels fall back to "info".
void init_logging(const std::string &level);

// Copy of tool arguments safe to put in a log line (long strings elided)
json sanitize_args(const json &args);

}  // namespace toolgate
