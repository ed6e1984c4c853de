#include "tether/logging.hpp"

#include <algorithm>
#include <cctype>

#include <spdlog/spdlog.h>

#include "tether/errors.hpp"

namespace tether {

void configure_logging(const std::string& level) {
  std::string normalized = level;
  std::transform(normalized.begin(), normalized.end(), normalized.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  if (normalized == "warning") {
    normalized = "warn";
  } else if (normalized == "fatal") {
    normalized = "critical";
  }

  const spdlog::level::level_enum parsed = spdlog::level::from_str(normalized);
  // from_str maps unknown names to off; only accept off when it was asked for.
  if (parsed == spdlog::level::off && normalized != "off") {
    throw ConfigurationError("unknown log level: '" + level + "'");
  }

  spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] tether - %v");
  spdlog::set_level(parsed);
}

}  // namespace tether
