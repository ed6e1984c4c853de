#include "tether/session.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <stdexcept>

#include "tether/errors.hpp"

namespace tether {

double now_epoch_seconds() {
  const auto now = std::chrono::system_clock::now();
  return std::chrono::duration_cast<std::chrono::duration<double>>(now.time_since_epoch()).count();
}

Session::Session(std::string session_id, const std::string& storage_root, std::optional<double> expiration_ts)
    : session_id_(std::move(session_id)),
      files_path_((std::filesystem::path(storage_root) / session_id_).string()) {
  expiration_ts_ = expiration_ts.has_value() ? *expiration_ts : load_expiration(files_path_);
}

void Session::put(const std::string& key, const json& value) const {
  const std::string path = path_for(key);
  // Serialize first so a value that cannot be dumped leaves the stored one intact.
  const std::string payload = value.dump();
  std::ofstream out(path, std::ios::trunc);
  if (!out.is_open()) {
    throw std::runtime_error("failed to open session value for write: " + path);
  }
  out << payload;
  if (!out.good()) {
    throw std::runtime_error("failed writing session value: " + path);
  }
}

json Session::get(const std::string& key, const json& default_value) const {
  const std::string path = path_for(key);
  std::ifstream in(path);
  if (!in.is_open()) {
    return default_value;
  }
  return json::parse(in);
}

void Session::persist_expiration() const {
  const std::string path = (std::filesystem::path(files_path_) / kExpirationMarker).string();
  const std::string payload = json(expiration_ts_).dump();
  std::ofstream out(path, std::ios::trunc);
  if (!out.is_open()) {
    throw std::runtime_error("failed to open expiration marker for write: " + path);
  }
  out << payload;
  if (!out.good()) {
    throw std::runtime_error("failed writing expiration marker: " + path);
  }
}

void Session::remove() const {
  if (!std::filesystem::exists(files_path_)) {
    throw InvalidSessionState("session directory does not exist: " + files_path_);
  }
  std::filesystem::remove_all(files_path_);
}

std::string Session::path_for(const std::string& key) const {
  if (key.find("..") != std::string::npos) {
    throw InvalidSessionKey("invalid key '" + key + "': '..' not allowed");
  }
  if (!key.empty() && (key[0] == '/' || key[0] == '\\' || std::filesystem::path(key).is_absolute())) {
    throw InvalidSessionKey("invalid key '" + key + "': absolute paths not allowed");
  }
  if (key.empty() || key == ".") {
    throw InvalidSessionKey("invalid key '" + key + "': key must name a file");
  }

  std::string name = key;
  for (char& c : name) {
    if (c == '/' || c == '\\') {
      c = '-';
    }
  }
  if (name == kExpirationMarker) {
    throw InvalidSessionKey("invalid key '" + key + "': reserved name");
  }
  return (std::filesystem::path(files_path_) / name).string();
}

double Session::load_expiration(const std::string& files_path) {
  const std::string path = (std::filesystem::path(files_path) / kExpirationMarker).string();
  std::ifstream in(path);
  if (!in.is_open()) {
    throw std::runtime_error("missing expiration marker: " + path);
  }
  const json value = json::parse(in);
  if (!value.is_number()) {
    throw std::runtime_error("expiration marker is not a number: " + path);
  }
  return value.get<double>();
}

}  // namespace tether
