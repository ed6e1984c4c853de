#include "tether/session_manager.hpp"

#include <unistd.h>

#include <algorithm>
#include <cstdint>
#include <filesystem>
#include <iomanip>
#include <sstream>
#include <system_error>

#include <spdlog/spdlog.h>

#include "tether/errors.hpp"
#include "tether/session_protocol.hpp"

namespace tether {
namespace {

namespace fs = std::filesystem;

bool is_writable_directory(const std::string& path) {
  std::error_code ec;
  return fs::is_directory(path, ec) && ::access(path.c_str(), W_OK | X_OK) == 0;
}

std::string host_temp_dir() {
  std::error_code ec;
  const fs::path tmp = fs::temp_directory_path(ec);
  if (ec) {
    return "/tmp";
  }
  return tmp.string();
}

std::string to_hex(std::uint64_t value) {
  std::ostringstream out;
  out << std::hex << std::setw(16) << std::setfill('0') << value;
  return out.str();
}

}  // namespace

SessionManager::SessionManager(const SessionConfig& config)
    : storage_root_(), expiration_seconds_(config.expiration_seconds) {
  if (!(expiration_seconds_ > 0.0)) {
    throw ConfigurationError("sessions expiration must be a positive number of seconds, got " +
                             std::to_string(expiration_seconds_));
  }

  std::random_device rd;
  std::seed_seq seed{rd(), rd(), rd(), rd()};
  rng_.seed(seed);

  storage_root_ = select_storage_root(config);
  load_existing_sessions();
  spdlog::info("session manager ready: root={} expiration={}s sessions={}", storage_root_,
               expiration_seconds_, sessions_.size());
}

std::string SessionManager::select_storage_root(const SessionConfig& config) {
  std::vector<std::string> candidates;
  if (!config.sessions_path.empty()) {
    candidates.push_back(config.sessions_path);
  }
  if (!config.ephemeral_root.empty()) {
    if (is_writable_directory(config.ephemeral_root)) {
      candidates.push_back((fs::path(config.ephemeral_root) / kSessionsDirName).string());
    } else {
      spdlog::debug("{} is missing or not writable; skipping", config.ephemeral_root);
    }
  }
  const std::string temp_root = config.temp_root.empty() ? host_temp_dir() : config.temp_root;
  candidates.push_back((fs::path(temp_root) / kSessionsDirName).string());

  for (const std::string& candidate : candidates) {
    std::error_code ec;
    fs::create_directories(candidate, ec);
    if (ec) {
      spdlog::warn("cannot use session storage {}: {}", candidate, ec.message());
      continue;
    }
    if (!is_writable_directory(candidate)) {
      spdlog::warn("cannot use session storage {}: not a writable directory", candidate);
      continue;
    }
    return candidate;
  }

  std::string tried;
  for (const std::string& candidate : candidates) {
    tried += (tried.empty() ? "" : ", ") + candidate;
  }
  throw ConfigurationError("no writable session storage location (tried: " + tried + ")");
}

std::shared_ptr<Session> SessionManager::create_session() {
  std::lock_guard<std::mutex> lock(mutex_);
  const double now = now_epoch_seconds();
  clean_expired_locked(now);

  std::string session_id = generate_session_id();
  while (sessions_.count(session_id) > 0 || fs::exists(fs::path(storage_root_) / session_id)) {
    session_id = generate_session_id();
  }

  auto session = std::make_shared<Session>(session_id, storage_root_, now + expiration_seconds_);
  fs::create_directories(session->files_path());
  try {
    session->persist_expiration();
  } catch (const std::exception&) {
    std::error_code ec;
    fs::remove_all(session->files_path(), ec);
    throw;
  }

  sessions_.emplace(session_id, session);
  spdlog::info("created session {} expiring at {:.3f}", session_id, session->expiration_ts());
  return session;
}

std::shared_ptr<Session> SessionManager::get_session(const std::string& session_id) {
  if (session_id.empty() || session_id == kNewSessionSentinel) {
    return nullptr;
  }

  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = sessions_.find(session_id);
  if (it == sessions_.end()) {
    throw SessionNotFound("session not found: " + session_id);
  }
  if (it->second->is_expired(now_epoch_seconds())) {
    spdlog::info("session {} expired; removing", session_id);
    try {
      remove_locked(session_id);
    } catch (const InvalidSessionState& ex) {
      spdlog::warn("expired session {} had no directory: {}", session_id, ex.what());
    }
    return nullptr;
  }
  return it->second;
}

void SessionManager::close_session(const std::string& session_id) {
  if (session_id.empty()) {
    throw InvalidArgument("invalid session_id: must not be empty");
  }

  std::lock_guard<std::mutex> lock(mutex_);
  if (sessions_.count(session_id) == 0) {
    throw SessionNotFound("session not found: " + session_id);
  }
  remove_locked(session_id);
  spdlog::info("closed session {}", session_id);
}

std::size_t SessionManager::clean_expired_sessions() {
  std::lock_guard<std::mutex> lock(mutex_);
  return clean_expired_locked(now_epoch_seconds());
}

bool SessionManager::contains(const std::string& session_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return sessions_.count(session_id) > 0;
}

std::size_t SessionManager::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return sessions_.size();
}

std::vector<std::string> SessionManager::session_ids() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::string> ids;
  ids.reserve(sessions_.size());
  for (const auto& entry : sessions_) {
    ids.push_back(entry.first);
  }
  std::sort(ids.begin(), ids.end());
  return ids;
}

void SessionManager::load_existing_sessions() {
  for (const auto& entry : fs::directory_iterator(storage_root_)) {
    if (!entry.is_directory()) {
      continue;
    }
    const std::string session_id = entry.path().filename().string();
    try {
      auto session = std::make_shared<Session>(session_id, storage_root_, std::nullopt);
      sessions_.emplace(session_id, std::move(session));
    } catch (const std::exception& ex) {
      spdlog::warn("skipping session directory {}: {}", entry.path().string(), ex.what());
    }
  }
}

std::size_t SessionManager::clean_expired_locked(double now) {
  std::vector<std::string> expired;
  for (const auto& entry : sessions_) {
    if (entry.second->is_expired(now)) {
      expired.push_back(entry.first);
    }
  }

  for (const std::string& session_id : expired) {
    try {
      remove_locked(session_id);
    } catch (const InvalidSessionState& ex) {
      spdlog::warn("expired session {} had no directory: {}", session_id, ex.what());
    }
  }
  if (!expired.empty()) {
    spdlog::debug("swept {} expired session(s)", expired.size());
  }
  return expired.size();
}

void SessionManager::remove_locked(const std::string& session_id) {
  const auto it = sessions_.find(session_id);
  if (it == sessions_.end()) {
    return;
  }
  const std::shared_ptr<Session> session = it->second;
  sessions_.erase(it);
  session->remove();
}

std::string SessionManager::generate_session_id() {
  std::uniform_int_distribution<std::uint64_t> dist;
  std::uint64_t high = dist(rng_);
  std::uint64_t low = dist(rng_);
  high = (high & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
  low = (low & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

  const std::string h = to_hex(high);
  const std::string l = to_hex(low);
  return h.substr(0, 8) + "-" + h.substr(8, 4) + "-" + h.substr(12, 4) + "-" + l.substr(0, 4) + "-" +
         l.substr(4, 12);
}

}  // namespace tether
