#include "tether/invocation_server.hpp"

#include <spdlog/spdlog.h>

#include "tether/errors.hpp"

namespace tether {
namespace {

std::string error_type_for(int status) {
  switch (status) {
    case 400:
      return "invalid_request_error";
    case 424:
      return "failed_dependency_error";
    default:
      return "server_error";
  }
}

json headers_to_json(const HttpHeaders& headers) {
  json out = json::object();
  for (const auto& header : headers) {
    out[header.first] = header.second;
  }
  return out;
}

}  // namespace

int status_for_exception(const std::exception& ex) {
  if (dynamic_cast<const InvalidArgument*>(&ex) != nullptr || dynamic_cast<const SessionNotFound*>(&ex) != nullptr ||
      dynamic_cast<const MalformedSessionRequest*>(&ex) != nullptr ||
      dynamic_cast<const SessionsDisabled*>(&ex) != nullptr || dynamic_cast<const InvalidSessionKey*>(&ex) != nullptr ||
      dynamic_cast<const InvalidRequest*>(&ex) != nullptr) {
    return 400;
  }
  if (dynamic_cast<const SessionStorageError*>(&ex) != nullptr) {
    return 424;
  }
  return 500;
}

InvocationResponse make_error_response(const std::exception& ex) {
  const int status = status_for_exception(ex);
  const json body = {
      {"error", {{"message", ex.what()}, {"type", error_type_for(status)}, {"code", status}}},
  };

  InvocationResponse response;
  response.m_statusCode = status;
  response.m_headers["Content-Type"] = "application/json";
  response.m_body = body.dump();
  return response;
}

InvocationServer::InvocationServer(const SessionInterceptor& interceptor, InvocationHandler handler)
    : interceptor_(interceptor), handler_(std::move(handler)) {}

InvocationResponse InvocationServer::handle(const std::string& raw_body, HttpHeaders headers) const {
  try {
    InvocationRequest request;
    try {
      request.m_body = json::parse(raw_body);
    } catch (const json::parse_error& ex) {
      throw InvalidRequest(std::string("JSON decode error: ") + ex.what());
    }
    request.m_headers = std::move(headers);
    return interceptor_.handle(std::move(request), handler_);
  } catch (const std::exception& ex) {
    const int status = status_for_exception(ex);
    if (status >= 500) {
      spdlog::error("invocation failed: {}", ex.what());
    } else {
      spdlog::warn("invocation rejected ({}): {}", status, ex.what());
    }
    return make_error_response(ex);
  }
}

std::string InvocationServer::handle_envelope(const std::string& line) const {
  InvocationResponse response;
  try {
    const json envelope = json::parse(line);
    if (!envelope.is_object()) {
      throw InvalidRequest("envelope must be a JSON object");
    }

    HttpHeaders headers;
    if (envelope.contains("headers")) {
      const json& raw_headers = envelope.at("headers");
      if (!raw_headers.is_object()) {
        throw InvalidRequest("envelope 'headers' must be an object");
      }
      for (const auto& item : raw_headers.items()) {
        headers[item.key()] = item.value().is_string() ? item.value().get<std::string>() : item.value().dump();
      }
    }

    std::string raw_body;
    if (envelope.contains("body")) {
      const json& body = envelope.at("body");
      raw_body = body.is_string() ? body.get<std::string>() : body.dump();
    }
    response = handle(raw_body, std::move(headers));
  } catch (const json::parse_error& ex) {
    response = make_error_response(InvalidRequest(std::string("envelope is not valid JSON: ") + ex.what()));
  } catch (const InvalidRequest& ex) {
    response = make_error_response(ex);
  }

  const json out = {
      {"status_code", response.m_statusCode},
      {"headers", headers_to_json(response.m_headers)},
      {"body", response.m_body},
  };
  return out.dump();
}

}  // namespace tether
