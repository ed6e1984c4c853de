#pragma once

#include <optional>
#include <string>

#include "tether/session_manager.hpp"
#include "tether/session_protocol.hpp"
#include "tether/types.hpp"

namespace tether {

struct InterceptorOptions {
  // Dotted body path that receives the validated session id on ordinary requests; empty disables.
  std::string session_id_body_path;
};

// Routes NEW_SESSION / CLOSE control messages to the SessionManager and validates the session
// header of every other request. A null manager means stateful sessions are disabled.
class SessionInterceptor {
 public:
  explicit SessionInterceptor(SessionManager* manager, InterceptorOptions options = {});

  bool enabled() const { return manager_ != nullptr; }

  // Returns the response for a session-management request, or std::nullopt when the request should
  // continue to the inference handler. On pass-through, request.m_session holds the validated session.
  std::optional<InvocationResponse> intercept(InvocationRequest& request) const;

  InvocationResponse handle(InvocationRequest request, const InvocationHandler& next) const;

 private:
  SessionManager* manager_;
  InterceptorOptions options_;

  std::shared_ptr<Session> validate_session_header(const std::string& session_id) const;
  InvocationResponse create_session() const;
  InvocationResponse close_session(const std::optional<std::string>& session_id,
                                   const std::shared_ptr<Session>& session) const;
  void inject_session_id(json& body, const std::string& session_id) const;
};

}  // namespace tether
