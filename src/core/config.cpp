#include "tether/config.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <stdexcept>
#include <string>

#include "tether/errors.hpp"

namespace tether {
namespace {

std::string trim(const std::string& value) {
  const auto start = value.find_first_not_of(" \t\r\n");
  if (start == std::string::npos) {
    return "";
  }
  const auto end = value.find_last_not_of(" \t\r\n");
  return value.substr(start, end - start + 1);
}

std::string to_lower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return value;
}

long parse_integer(const std::string& key, const std::string& value) {
  try {
    std::size_t consumed = 0;
    const long parsed = std::stol(value, &consumed);
    if (consumed != value.size()) {
      throw std::invalid_argument(value);
    }
    return parsed;
  } catch (const std::logic_error&) {
    throw ConfigurationError("invalid integer for " + key + ": '" + value + "'");
  }
}

std::size_t parse_count(const std::string& key, const std::string& value) {
  const long parsed = parse_integer(key, value);
  if (parsed <= 0) {
    throw ConfigurationError(key + " must be positive, got " + value);
  }
  return static_cast<std::size_t>(parsed);
}

const char* env_value(const std::string& name) {
  const char* value = std::getenv(name.c_str());
  if (value == nullptr || *value == '\0') {
    return nullptr;
  }
  return value;
}

}  // namespace

bool parse_bool(const std::string& key, const std::string& value) {
  const std::string normalized = to_lower(trim(value));
  if (normalized == "1" || normalized == "true" || normalized == "yes" || normalized == "on") {
    return true;
  }
  if (normalized == "0" || normalized == "false" || normalized == "no" || normalized == "off") {
    return false;
  }
  throw ConfigurationError("invalid boolean for " + key + ": '" + value + "'");
}

double parse_expiration_seconds(const std::string& value) {
  double seconds = 0.0;
  try {
    std::size_t consumed = 0;
    seconds = std::stod(trim(value), &consumed);
    if (consumed != trim(value).size()) {
      throw std::invalid_argument(value);
    }
  } catch (const std::logic_error&) {
    throw ConfigurationError("invalid sessions expiration: '" + value + "'");
  }
  if (!std::isfinite(seconds) || seconds <= 0.0) {
    throw ConfigurationError("sessions expiration must be a positive number of seconds, got '" + value + "'");
  }
  return seconds;
}

AppConfig AppConfig::load_from_file(const std::string& path) {
  AppConfig config;

  std::ifstream in(path);
  if (!in.is_open()) {
    return config;
  }

  std::string line;
  while (std::getline(in, line)) {
    line = trim(line);
    if (line.empty() || line[0] == '#') {
      continue;
    }

    const auto eq = line.find('=');
    if (eq == std::string::npos) {
      continue;
    }

    const std::string key = trim(line.substr(0, eq));
    const std::string value = trim(line.substr(eq + 1));

    if (key == "enable_stateful_sessions") {
      config.sessions.enabled = parse_bool(key, value);
    } else if (key == "sessions_path") {
      config.sessions.sessions_path = value;
    } else if (key == "sessions_expiration") {
      config.sessions.expiration_seconds = parse_expiration_seconds(value);
    } else if (key == "sessions_ephemeral_root") {
      config.sessions.ephemeral_root = value;
    } else if (key == "sessions_temp_root") {
      config.sessions.temp_root = value;
    } else if (key == "session_id_body_path") {
      config.session_id_body_path = value;
    } else if (key == "runtime_preference") {
      config.runtime_preference = value;
    } else if (key == "model_path") {
      config.model_path = value;
    } else if (key == "system_prompt") {
      config.system_prompt = value;
    } else if (key == "max_tokens") {
      config.max_tokens = parse_count(key, value);
    } else if (key == "llama_n_threads") {
      config.llama_n_threads = static_cast<int>(parse_integer(key, value));
    } else if (key == "llama_n_threads_batch") {
      config.llama_n_threads_batch = static_cast<int>(parse_integer(key, value));
    } else if (key == "llama_n_batch") {
      config.llama_n_batch = static_cast<int>(parse_integer(key, value));
    } else if (key == "llama_offload_kqv") {
      config.llama_offload_kqv = parse_bool(key, value);
    } else if (key == "llama_op_offload") {
      config.llama_op_offload = parse_bool(key, value);
    } else if (key == "profile") {
      config.profile = value;
    } else if (key == "log_level") {
      config.log_level = value;
    }
  }

  return config;
}

void AppConfig::apply_env_overrides() {
  for (const std::string prefix : {"OPTION_", "SAGEMAKER_"}) {
    if (const char* value = env_value(prefix + "ENABLE_STATEFUL_SESSIONS")) {
      sessions.enabled = parse_bool(prefix + "ENABLE_STATEFUL_SESSIONS", value);
    }
    if (const char* value = env_value(prefix + "SESSIONS_PATH")) {
      sessions.sessions_path = value;
    }
    if (const char* value = env_value(prefix + "SESSIONS_EXPIRATION")) {
      sessions.expiration_seconds = parse_expiration_seconds(value);
    }
  }

  if (const char* value = env_value("SAGEMAKER_CONTAINER_LOG_LEVEL")) {
    log_level = value;
  } else if (const char* fallback = env_value("LOG_LEVEL")) {
    log_level = fallback;
  }
}

}  // namespace tether
