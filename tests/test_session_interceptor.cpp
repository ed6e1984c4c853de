#include <chrono>
#include <filesystem>
#include <string>
#include <thread>

#include "tether/errors.hpp"
#include "tether/session.hpp"
#include "tether/session_interceptor.hpp"
#include "tether/session_manager.hpp"
#include "tether/session_protocol.hpp"
#include "test_support.hpp"

namespace tether_test {
namespace {

using tether::json;

tether::InvocationRequest make_request(json body, const std::string& session_id = "", bool with_header = false) {
  tether::InvocationRequest request;
  request.m_body = std::move(body);
  if (with_header) {
    request.m_headers[tether::kSessionIdHeader] = session_id;
  }
  return request;
}

std::string create_via_interceptor(const tether::SessionInterceptor& interceptor) {
  tether::InvocationRequest request = make_request(json{{"requestType", "NEW_SESSION"}});
  const auto response = interceptor.intercept(request);
  assert_true(response.has_value(), "NEW_SESSION should be answered by the interceptor");
  const auto parsed = tether::parse_new_session_header(response->m_headers.at(tether::kNewSessionIdHeader));
  assert_true(parsed.has_value(), "new session header should parse");
  return parsed->session_id;
}

void test_create_session_response() {
  TempDir dir("tether-interceptor-");
  tether::SessionManager manager(session_config_for(dir.path(), 600.0));
  const tether::SessionInterceptor interceptor(&manager);

  tether::InvocationRequest request = make_request(json{{"requestType", "NEW_SESSION"}});
  const double before = tether::now_epoch_seconds();
  const auto response = interceptor.intercept(request);
  assert_true(response.has_value(), "create should produce a response");
  assert_true(response->m_statusCode == 200, "create should succeed");

  const auto it = response->m_headers.find("x-amzn-sagemaker-new-session-id");
  assert_true(it != response->m_headers.end(), "new session header should be set");
  const auto parsed = tether::parse_new_session_header(it->second);
  assert_true(parsed.has_value(), "new session header should be '<id>; Expires=<ts>'");
  assert_true(parsed->session_id.size() == 36, "session id should be a UUID");
  assert_true(parsed->expires_epoch >= static_cast<long long>(before) + 599, "expires should be about now + ttl");
  assert_true(response->m_body == "Successfully created session: " + parsed->session_id, "create body should name id");
  assert_true(manager.contains(parsed->session_id), "session should be registered");
}

void test_malformed_session_requests() {
  TempDir dir("tether-interceptor-");
  tether::SessionManager manager(session_config_for(dir.path()));
  const tether::SessionInterceptor interceptor(&manager);

  tether::InvocationRequest extra = make_request(json{{"requestType", "NEW_SESSION"}, {"extra", 1}});
  assert_throws<tether::MalformedSessionRequest>([&]() { interceptor.intercept(extra); }, "extra",
                                                 "extra fields should be rejected");
  tether::InvocationRequest bad = make_request(json{{"requestType", "INVALID_TYPE"}});
  assert_throws<tether::MalformedSessionRequest>([&]() { interceptor.intercept(bad); }, "invalid requestType",
                                                 "unknown verb should be rejected");
  assert_true(manager.size() == 0, "malformed requests should not create sessions");
}

void test_ordinary_request_passes_through() {
  TempDir dir("tether-interceptor-");
  tether::SessionManager manager(session_config_for(dir.path()));
  const tether::SessionInterceptor interceptor(&manager);

  tether::InvocationRequest request = make_request(json{{"prompt", "hi"}});
  assert_true(!interceptor.intercept(request).has_value(), "ordinary request should pass through");
  assert_true(request.m_body == json{{"prompt", "hi"}}, "ordinary body should be unchanged");
  assert_true(request.m_session == nullptr, "no session should be attached without a header");

  tether::InvocationRequest sentinel = make_request(json{{"prompt", "hi"}}, "NEW_SESSION", true);
  assert_true(!interceptor.intercept(sentinel).has_value(), "sentinel header should pass through");
  assert_true(sentinel.m_session == nullptr, "sentinel header should not attach a session");

  tether::InvocationRequest empty = make_request(json{{"prompt", "hi"}}, "", true);
  assert_true(!interceptor.intercept(empty).has_value(), "empty header should pass through");
}

void test_valid_session_header_attaches_session() {
  TempDir dir("tether-interceptor-");
  tether::SessionManager manager(session_config_for(dir.path()));
  const tether::SessionInterceptor interceptor(&manager);
  const std::string session_id = create_via_interceptor(interceptor);

  tether::InvocationRequest request = make_request(json{{"prompt", "hi"}}, session_id, true);
  assert_true(!interceptor.intercept(request).has_value(), "request with valid session should pass through");
  assert_true(request.m_session != nullptr, "validated session should be attached");
  assert_true(request.m_session->session_id() == session_id, "attached session should match the header");
  assert_true(request.m_body == json{{"prompt", "hi"}}, "body should be unchanged without an injection path");
}

void test_unknown_session_header_rejected() {
  TempDir dir("tether-interceptor-");
  tether::SessionManager manager(session_config_for(dir.path()));
  const tether::SessionInterceptor interceptor(&manager);

  tether::InvocationRequest ordinary = make_request(json{{"prompt", "hi"}}, "invalid-session-id", true);
  assert_throws<tether::SessionNotFound>([&]() { interceptor.intercept(ordinary); }, "session not found",
                                         "unknown session on an ordinary request should be rejected");

  tether::InvocationRequest create = make_request(json{{"requestType", "NEW_SESSION"}}, "invalid-session-id", true);
  assert_throws<tether::SessionNotFound>([&]() { interceptor.intercept(create); }, "session not found",
                                         "unknown session on a create request should be rejected");
  assert_true(manager.size() == 0, "rejected create should not make a session");
}

void test_close_session_flow() {
  TempDir dir("tether-interceptor-");
  tether::SessionManager manager(session_config_for(dir.path()));
  const tether::SessionInterceptor interceptor(&manager);
  const std::string session_id = create_via_interceptor(interceptor);

  tether::InvocationRequest request = make_request(json{{"requestType", "CLOSE"}}, session_id, true);
  const auto response = interceptor.intercept(request);
  assert_true(response.has_value() && response->m_statusCode == 200, "close should succeed");
  assert_true(response->m_headers.at(tether::kClosedSessionIdHeader) == session_id, "closed header should carry id");
  assert_true(response->m_body == "Successfully closed session: " + session_id, "close body should name id");
  assert_true(!manager.contains(session_id), "closed session should be gone");
  assert_true(!fs::exists(fs::path(manager.storage_root()) / session_id), "closed directory should be gone");

  tether::InvocationRequest again = make_request(json{{"prompt", "hi"}}, session_id, true);
  assert_throws<tether::SessionNotFound>([&]() { interceptor.intercept(again); }, "session not found",
                                         "closed session should no longer validate");
}

void test_close_requires_session_header() {
  TempDir dir("tether-interceptor-");
  tether::SessionManager manager(session_config_for(dir.path()));
  const tether::SessionInterceptor interceptor(&manager);

  tether::InvocationRequest missing = make_request(json{{"requestType", "CLOSE"}});
  assert_throws<tether::InvalidArgument>([&]() { interceptor.intercept(missing); }, "Session ID is required",
                                         "close without a header should be rejected");
  tether::InvocationRequest empty = make_request(json{{"requestType", "CLOSE"}}, "", true);
  assert_throws<tether::InvalidArgument>([&]() { interceptor.intercept(empty); }, "Session ID is required",
                                         "close with an empty header should be rejected");
  tether::InvocationRequest sentinel = make_request(json{{"requestType", "CLOSE"}}, "NEW_SESSION", true);
  assert_throws<tether::SessionNotFound>([&]() { interceptor.intercept(sentinel); }, "session not found",
                                         "closing the sentinel should be rejected");
}

void test_expired_session_rejected() {
  TempDir dir("tether-interceptor-");
  tether::SessionManager manager(session_config_for(dir.path(), 0.1));
  const tether::SessionInterceptor interceptor(&manager);
  const std::string first = create_via_interceptor(interceptor);
  const std::string second = create_via_interceptor(interceptor);

  std::this_thread::sleep_for(std::chrono::milliseconds(200));

  tether::InvocationRequest ordinary = make_request(json{{"prompt", "hi"}}, first, true);
  assert_throws<tether::SessionNotFound>([&]() { interceptor.intercept(ordinary); }, "expired",
                                         "expired session should be rejected on ordinary requests");
  tether::InvocationRequest close = make_request(json{{"requestType", "CLOSE"}}, second, true);
  assert_throws<tether::SessionNotFound>([&]() { interceptor.intercept(close); }, "expired",
                                         "expired session should be rejected on close");
  assert_true(manager.size() == 0, "expired sessions should be reclaimed");
}

void test_disabled_mode() {
  const tether::SessionInterceptor interceptor(nullptr);
  assert_true(!interceptor.enabled(), "null manager should disable sessions");

  tether::InvocationRequest create = make_request(json{{"requestType", "NEW_SESSION"}});
  assert_throws<tether::SessionsDisabled>([&]() { interceptor.intercept(create); }, "disabled",
                                          "session requests should be rejected when disabled");
  tether::InvocationRequest malformed = make_request(json{{"requestType", "BOGUS"}, {"x", 1}});
  assert_throws<tether::SessionsDisabled>([&]() { interceptor.intercept(malformed); }, "disabled",
                                          "disabled check should come before request parsing");
  tether::InvocationRequest header = make_request(json{{"prompt", "hi"}}, "some-id", true);
  assert_throws<tether::SessionsDisabled>([&]() { interceptor.intercept(header); }, tether::kSessionIdHeader,
                                          "session header should be rejected when disabled");

  tether::InvocationRequest ordinary = make_request(json{{"prompt", "hi"}});
  assert_true(!interceptor.intercept(ordinary).has_value(), "ordinary request should pass when disabled");
}

void test_session_id_injected_into_body() {
  TempDir dir("tether-interceptor-");
  tether::SessionManager manager(session_config_for(dir.path()));
  const tether::SessionInterceptor interceptor(&manager, tether::InterceptorOptions{"metadata.session_id"});
  const std::string session_id = create_via_interceptor(interceptor);

  tether::InvocationRequest request = make_request(json{{"prompt", "hi"}}, session_id, true);
  assert_true(!interceptor.intercept(request).has_value(), "request should pass through");
  assert_true(request.m_body["metadata"]["session_id"] == json(session_id), "session id should be injected");
  assert_true(request.m_body["prompt"] == json("hi"), "other fields should be untouched");

  tether::InvocationRequest existing =
      make_request(json{{"prompt", "hi"}, {"metadata", {{"user", "u1"}}}}, session_id, true);
  interceptor.intercept(existing);
  assert_true(existing.m_body["metadata"]["user"] == json("u1"), "existing object should be extended");
  assert_true(existing.m_body["metadata"]["session_id"] == json(session_id), "session id should be added");

  tether::InvocationRequest blocked = make_request(json{{"prompt", "hi"}, {"metadata", 5}}, session_id, true);
  assert_throws<tether::InvalidRequest>([&]() { interceptor.intercept(blocked); }, "metadata",
                                        "non-object intermediate should be rejected");

  tether::InvocationRequest anonymous = make_request(json{{"prompt", "hi"}});
  interceptor.intercept(anonymous);
  assert_true(!anonymous.m_body.contains("metadata"), "nothing should be injected without a session");
}

void test_handle_calls_next_only_for_ordinary_requests() {
  TempDir dir("tether-interceptor-");
  tether::SessionManager manager(session_config_for(dir.path()));
  const tether::SessionInterceptor interceptor(&manager);

  int calls = 0;
  std::string seen_session;
  const tether::InvocationHandler next = [&](const tether::InvocationRequest& request) {
    ++calls;
    seen_session = request.m_session ? request.m_session->session_id() : "";
    tether::InvocationResponse response;
    response.m_body = "inference";
    return response;
  };

  const tether::InvocationResponse created = interceptor.handle(make_request(json{{"requestType", "NEW_SESSION"}}), next);
  assert_true(calls == 0, "create should not reach the handler");
  const std::string session_id =
      tether::parse_new_session_header(created.m_headers.at(tether::kNewSessionIdHeader))->session_id;

  const tether::InvocationResponse ordinary = interceptor.handle(make_request(json{{"prompt", "hi"}}, session_id, true), next);
  assert_true(calls == 1, "ordinary request should reach the handler");
  assert_true(ordinary.m_body == "inference", "handler response should be returned");
  assert_true(seen_session == session_id, "handler should see the validated session");

  interceptor.handle(make_request(json{{"requestType", "CLOSE"}}, session_id, true), next);
  assert_true(calls == 1, "close should not reach the handler");
}

}  // namespace

void session_interceptor_tests() {
  test_create_session_response();
  test_malformed_session_requests();
  test_ordinary_request_passes_through();
  test_valid_session_header_attaches_session();
  test_unknown_session_header_rejected();
  test_close_session_flow();
  test_close_requires_session_header();
  test_expired_session_rejected();
  test_disabled_mode();
  test_session_id_injected_into_body();
  test_handle_calls_next_only_for_ordinary_requests();
}

}  // namespace tether_test
