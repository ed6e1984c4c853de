#pragma once

#include <filesystem>
#include <functional>
#include <random>
#include <stdexcept>
#include <string>

#include "tether/config.hpp"

namespace tether_test {

namespace fs = std::filesystem;

inline void assert_true(bool condition, const std::string& message) {
  if (!condition) {
    throw std::runtime_error(message);
  }
}

template <typename E>
void assert_throws(const std::function<void()>& fn, const std::string& expected_fragment, const std::string& message) {
  try {
    fn();
  } catch (const E& ex) {
    if (!expected_fragment.empty() && std::string(ex.what()).find(expected_fragment) == std::string::npos) {
      throw std::runtime_error(message + " (unexpected message: " + ex.what() + ")");
    }
    return;
  }
  throw std::runtime_error(message + " (nothing thrown)");
}

inline std::string make_temp_dir(const std::string& prefix) {
  static std::mt19937 rng(std::random_device{}());
  const std::string dir = (fs::temp_directory_path() / (prefix + std::to_string(rng()))).string();
  fs::create_directories(dir);
  return dir;
}

class TempDir {
 public:
  explicit TempDir(const std::string& prefix) : path_(make_temp_dir(prefix)) {}
  ~TempDir() {
    std::error_code ec;
    fs::remove_all(path_, ec);
  }
  TempDir(const TempDir&) = delete;
  TempDir& operator=(const TempDir&) = delete;

  const std::string& path() const { return path_; }

 private:
  std::string path_;
};

inline tether::SessionConfig session_config_for(const std::string& root, double expiration_seconds = 600.0) {
  tether::SessionConfig config;
  config.enabled = true;
  config.sessions_path = root;
  config.expiration_seconds = expiration_seconds;
  config.ephemeral_root = "";
  config.temp_root = root;
  return config;
}

void session_tests();
void session_manager_tests();
void session_protocol_tests();
void session_interceptor_tests();
void invocation_tests();

}  // namespace tether_test
