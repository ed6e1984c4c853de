#include "tether/session_interceptor.hpp"

#include <filesystem>
#include <sstream>
#include <vector>

#include <spdlog/spdlog.h>

#include "tether/errors.hpp"

namespace tether {
namespace {

std::vector<std::string> split_path(const std::string& path) {
  std::vector<std::string> parts;
  std::string part;
  std::istringstream in(path);
  while (std::getline(in, part, '.')) {
    if (!part.empty()) {
      parts.push_back(part);
    }
  }
  return parts;
}

}  // namespace

SessionInterceptor::SessionInterceptor(SessionManager* manager, InterceptorOptions options)
    : manager_(manager), options_(std::move(options)) {}

std::optional<InvocationResponse> SessionInterceptor::intercept(InvocationRequest& request) const {
  const std::optional<std::string> session_id = session_id_from_headers(request.m_headers);

  if (!enabled()) {
    if (request.m_body.is_object() && request.m_body.contains(kRequestTypeField)) {
      spdlog::error("session request received while stateful sessions are disabled");
      throw SessionsDisabled("stateful sessions are disabled; '" + std::string(kRequestTypeField) +
                             "' requests cannot be served");
    }
    if (session_id.has_value()) {
      spdlog::error("session header received while stateful sessions are disabled");
      throw SessionsDisabled("stateful sessions are disabled; remove the " + std::string(kSessionIdHeader) +
                             " header");
    }
    return std::nullopt;
  }

  const std::optional<SessionRequestType> type = parse_session_request(request.m_body);
  std::shared_ptr<Session> session;
  if (session_id.has_value()) {
    session = validate_session_header(*session_id);
  }

  if (!type.has_value()) {
    if (session && !options_.session_id_body_path.empty()) {
      inject_session_id(request.m_body, session->session_id());
    }
    request.m_session = std::move(session);
    return std::nullopt;
  }

  spdlog::debug("intercepted {} request", request_type_to_string(*type));
  if (*type == SessionRequestType::NewSession) {
    return create_session();
  }
  return close_session(session_id, session);
}

InvocationResponse SessionInterceptor::handle(InvocationRequest request, const InvocationHandler& next) const {
  if (std::optional<InvocationResponse> response = intercept(request); response.has_value()) {
    return std::move(*response);
  }
  return next(request);
}

std::shared_ptr<Session> SessionInterceptor::validate_session_header(const std::string& session_id) const {
  if (session_id.empty() || session_id == kNewSessionSentinel) {
    return nullptr;
  }
  std::shared_ptr<Session> session = manager_->get_session(session_id);
  if (!session) {
    throw SessionNotFound("session not found: " + session_id + " (expired)");
  }
  return session;
}

InvocationResponse SessionInterceptor::create_session() const {
  std::shared_ptr<Session> session;
  try {
    session = manager_->create_session();
  } catch (const std::filesystem::filesystem_error& ex) {
    spdlog::error("failed to create session: {}", ex.what());
    throw SessionStorageError(std::string("Failed to create session: ") + ex.what());
  }

  InvocationResponse response;
  response.m_statusCode = 200;
  response.m_headers[kNewSessionIdHeader] = format_new_session_header(session->session_id(), session->expiration_ts());
  response.m_body = "Successfully created session: " + session->session_id();
  return response;
}

InvocationResponse SessionInterceptor::close_session(const std::optional<std::string>& session_id,
                                                     const std::shared_ptr<Session>& session) const {
  if (!session_id.has_value() || session_id->empty()) {
    throw InvalidArgument("Session ID is required in request headers to close a session");
  }
  if (!session) {
    throw SessionNotFound("session not found: " + *session_id);
  }

  try {
    manager_->close_session(*session_id);
  } catch (const std::filesystem::filesystem_error& ex) {
    spdlog::error("failed to close session {}: {}", *session_id, ex.what());
    throw SessionStorageError(std::string("Failed to close session: ") + ex.what());
  }

  InvocationResponse response;
  response.m_statusCode = 200;
  response.m_headers[kClosedSessionIdHeader] = *session_id;
  response.m_body = "Successfully closed session: " + *session_id;
  return response;
}

void SessionInterceptor::inject_session_id(json& body, const std::string& session_id) const {
  const std::vector<std::string> parts = split_path(options_.session_id_body_path);
  if (parts.empty()) {
    return;
  }
  if (!body.is_object() && !body.is_null()) {
    throw InvalidRequest("cannot set session id at '" + options_.session_id_body_path +
                         "': request body is not an object");
  }

  json* node = &body;
  for (std::size_t i = 0; i + 1 < parts.size(); ++i) {
    json& child = (*node)[parts[i]];
    if (child.is_null()) {
      child = json::object();
    } else if (!child.is_object()) {
      throw InvalidRequest("cannot set session id at '" + options_.session_id_body_path + "': '" + parts[i] +
                           "' is not an object");
    }
    node = &child;
  }
  (*node)[parts.back()] = session_id;
  spdlog::debug("injected session id into body at {}", options_.session_id_body_path);
}

}  // namespace tether
