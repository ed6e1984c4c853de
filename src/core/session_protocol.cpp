#include "tether/session_protocol.hpp"

#include <cmath>
#include <stdexcept>

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

}  // namespace

std::string request_type_to_string(SessionRequestType type) {
  switch (type) {
    case SessionRequestType::NewSession:
      return "NEW_SESSION";
    case SessionRequestType::Close:
      return "CLOSE";
  }
  return "NEW_SESSION";
}

std::optional<SessionRequestType> parse_session_request(const json& body) {
  if (!body.is_object() || !body.contains(kRequestTypeField)) {
    return std::nullopt;
  }

  if (body.size() != 1) {
    std::string extra;
    for (const auto& item : body.items()) {
      if (item.key() != kRequestTypeField) {
        extra += (extra.empty() ? "" : ", ") + item.key();
      }
    }
    throw MalformedSessionRequest("session request must only contain '" + std::string(kRequestTypeField) +
                                  "'; unexpected field(s): " + extra);
  }

  const json& value = body.at(kRequestTypeField);
  if (value.is_string()) {
    const std::string verb = value.get<std::string>();
    if (verb == "NEW_SESSION") {
      return SessionRequestType::NewSession;
    }
    if (verb == "CLOSE") {
      return SessionRequestType::Close;
    }
  }
  throw MalformedSessionRequest("invalid " + std::string(kRequestTypeField) + " " + value.dump() +
                                "; expected \"NEW_SESSION\" or \"CLOSE\"");
}

std::string format_new_session_header(const std::string& session_id, double expiration_ts) {
  const long long expires = static_cast<long long>(std::floor(expiration_ts));
  return session_id + "; Expires=" + std::to_string(expires);
}

std::optional<NewSessionHeader> parse_new_session_header(const std::string& value) {
  const auto semi = value.find(';');
  if (semi == std::string::npos) {
    return std::nullopt;
  }

  NewSessionHeader header;
  header.session_id = trim(value.substr(0, semi));
  const std::string attribute = trim(value.substr(semi + 1));
  const std::string prefix = "Expires=";
  if (header.session_id.empty() || attribute.compare(0, prefix.size(), prefix) != 0) {
    return std::nullopt;
  }

  const std::string digits = attribute.substr(prefix.size());
  if (digits.empty() || digits.find_first_not_of("0123456789") != std::string::npos) {
    return std::nullopt;
  }
  try {
    header.expires_epoch = std::stoll(digits);
  } catch (const std::out_of_range&) {
    return std::nullopt;
  }
  return header;
}

std::optional<std::string> session_id_from_headers(const HttpHeaders& headers) {
  const auto it = headers.find(kSessionIdHeader);
  if (it == headers.end()) {
    return std::nullopt;
  }
  return it->second;
}

}  // namespace tether
