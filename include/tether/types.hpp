#pragma once

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace tether {

using json = nlohmann::ordered_json;

class Session;

enum class Role {
  System,
  User,
  Assistant,
};

std::string role_to_string(Role role);
Role role_from_string(const std::string& value);

struct Message {
  Role m_role;
  std::string m_content;
};

struct GenerationRequest {
  std::vector<Message> m_messages;
  std::string m_modelPath;
  std::size_t m_maxTokens{256};
};

struct GenerationResult {
  std::string m_text;
  double m_firstTokenMs{0.0};
  double m_totalMs{0.0};
  std::size_t m_generatedTokens{0};
  double m_tokensPerSecond{0.0};
};

// Header names compare case-insensitively, as they do on the wire.
struct CaseInsensitiveLess {
  bool operator()(const std::string& a, const std::string& b) const {
    return std::lexicographical_compare(a.begin(), a.end(), b.begin(), b.end(), [](char c1, char c2) {
      return std::tolower(static_cast<unsigned char>(c1)) < std::tolower(static_cast<unsigned char>(c2));
    });
  }
};

using HttpHeaders = std::map<std::string, std::string, CaseInsensitiveLess>;

struct InvocationRequest {
  json m_body;
  HttpHeaders m_headers;
  // Set by the session interceptor once the session header has been validated.
  std::shared_ptr<Session> m_session;
};

struct InvocationResponse {
  int m_statusCode{200};
  HttpHeaders m_headers;
  std::string m_body;
};

using InvocationHandler = std::function<InvocationResponse(const InvocationRequest&)>;

}  // namespace tether
