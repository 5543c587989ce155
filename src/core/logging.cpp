#include "core/logging.hpp"

#include <spdlog/spdlog.h>

#include "core/types.hpp"

namespace toolgate {

void init_logging(const std::string &level) {
  auto lvl = spdlog::level::from_str(to_lower(level));
  // from_str returns "off" for unrecognized names; only honour it when asked for explicitly
  if (lvl == spdlog::level::off && to_lower(level) != "off") {
    spdlog::warn("Unknown log level '{}', using info", level);
    lvl = spdlog::level::info;
  }
  spdlog::set_level(lvl);
}

json sanitize_args(const json &args) {
  if (!args.is_object()) {
    return args;
  }

  json safe = json::object();
  for (const auto &[key, value] : args.items()) {
    if (value.is_string() && value.get_ref<const std::string &>().size() > kLogArgMaxLength) {
      safe[key] = "<" + std::to_string(value.get_ref<const std::string &>().size()) + " chars>";
    } else {
      safe[key] = value;
    }
  }
  return safe;
}

}  // namespace toolgate
