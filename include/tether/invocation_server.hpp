#pragma once

#include <exception>
#include <string>

#include "tether/session_interceptor.hpp"
#include "tether/types.hpp"

namespace tether {

// Stand-in for the web layer: turns raw bodies into requests, runs the session interceptor ahead
// of the inference handler, and is the only place errors become status codes.
class InvocationServer {
 public:
  InvocationServer(const SessionInterceptor& interceptor, InvocationHandler handler);

  InvocationResponse handle(const std::string& raw_body, HttpHeaders headers) const;

  // {"headers": {...}, "body": <json or string>} in, {"status_code", "headers", "body"} out.
  std::string handle_envelope(const std::string& line) const;

 private:
  const SessionInterceptor& interceptor_;
  InvocationHandler handler_;
};

int status_for_exception(const std::exception& ex);
InvocationResponse make_error_response(const std::exception& ex);

}  // namespace tether
