#pragma once

#include <optional>
#include <string>

#include "tether/types.hpp"

namespace tether {

inline constexpr const char* kSessionIdHeader = "X-Amzn-SageMaker-Session-Id";
inline constexpr const char* kNewSessionIdHeader = "X-Amzn-SageMaker-New-Session-Id";
inline constexpr const char* kClosedSessionIdHeader = "X-Amzn-SageMaker-Closed-Session-Id";
inline constexpr const char* kRequestTypeField = "requestType";
inline constexpr const char* kNewSessionSentinel = "NEW_SESSION";

enum class SessionRequestType {
  NewSession,
  Close,
};

std::string request_type_to_string(SessionRequestType type);

// std::nullopt for an ordinary request. Throws MalformedSessionRequest when requestType is present
// but not exactly one of the two verbs, or shares the body with any other field.
std::optional<SessionRequestType> parse_session_request(const json& body);

struct NewSessionHeader {
  std::string session_id;
  long long expires_epoch{0};
};

// "<uuid>; Expires=<unix-seconds>"
std::string format_new_session_header(const std::string& session_id, double expiration_ts);
std::optional<NewSessionHeader> parse_new_session_header(const std::string& value);

std::optional<std::string> session_id_from_headers(const HttpHeaders& headers);

}  // namespace tether
