#pragma once

#include <string>

namespace tether {

// Installs the process-wide log pattern and level. Unknown level names throw ConfigurationError.
void configure_logging(const std::string& level);

}  // namespace tether
