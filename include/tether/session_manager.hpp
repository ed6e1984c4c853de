#pragma once

#include <cstddef>
#include <memory>
#include <mutex>
#include <random>
#include <string>
#include <unordered_map>
#include <vector>

#include "tether/config.hpp"
#include "tether/session.hpp"

namespace tether {

inline constexpr const char* kSessionsDirName = "sagemaker_sessions";

// Owns every live Session. All registry transitions happen under one mutex; expired sessions are
// reclaimed lazily on create_session and get_session, never by a timer.
class SessionManager {
 public:
  explicit SessionManager(const SessionConfig& config);

  SessionManager(const SessionManager&) = delete;
  SessionManager& operator=(const SessionManager&) = delete;

  std::shared_ptr<Session> create_session();

  // nullptr for "" and the NEW_SESSION sentinel, and for a session that just expired.
  // Throws SessionNotFound for any other unknown id.
  std::shared_ptr<Session> get_session(const std::string& session_id);

  void close_session(const std::string& session_id);

  std::size_t clean_expired_sessions();

  const std::string& storage_root() const { return storage_root_; }
  double expiration_seconds() const { return expiration_seconds_; }
  bool contains(const std::string& session_id) const;
  std::size_t size() const;
  std::vector<std::string> session_ids() const;

  static std::string select_storage_root(const SessionConfig& config);

 private:
  std::string storage_root_;
  double expiration_seconds_;
  mutable std::mutex mutex_;
  std::unordered_map<std::string, std::shared_ptr<Session>> sessions_;
  std::mt19937_64 rng_;

  void load_existing_sessions();
  std::size_t clean_expired_locked(double now);
  void remove_locked(const std::string& session_id);
  std::string generate_session_id();
};

}  // namespace tether
