#pragma once

#include <optional>
#include <string>

#include "tether/types.hpp"

namespace tether {

inline constexpr const char* kExpirationMarker = ".expiration_ts";

class Session {
 public:
  // Without an expiration, the persisted marker under storage_root/session_id is read.
  Session(std::string session_id, const std::string& storage_root, std::optional<double> expiration_ts);

  const std::string& session_id() const { return session_id_; }
  const std::string& files_path() const { return files_path_; }
  double expiration_ts() const { return expiration_ts_; }
  bool is_expired(double now) const { return expiration_ts_ <= now; }

  void put(const std::string& key, const json& value) const;
  json get(const std::string& key, const json& default_value = nullptr) const;

  void persist_expiration() const;
  void remove() const;

  // Every key-derived path goes through here.
  std::string path_for(const std::string& key) const;

 private:
  std::string session_id_;
  std::string files_path_;
  double expiration_ts_{0.0};

  static double load_expiration(const std::string& files_path);
};

double now_epoch_seconds();

}  // namespace tether
