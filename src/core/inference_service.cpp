#include "tether/inference_service.hpp"

#include <stdexcept>

#include <spdlog/spdlog.h>

#include "tether/errors.hpp"
#include "tether/session.hpp"
#include "tether/session_protocol.hpp"

namespace tether {

std::string role_to_string(Role role) {
  switch (role) {
    case Role::System:
      return "system";
    case Role::User:
      return "user";
    case Role::Assistant:
      return "assistant";
  }
  return "user";
}

Role role_from_string(const std::string& value) {
  if (value == "system") {
    return Role::System;
  }
  if (value == "assistant") {
    return Role::Assistant;
  }
  return Role::User;
}

std::vector<Message> messages_from_body(const json& body) {
  if (!body.is_object()) {
    throw InvalidRequest("request body must be a JSON object with 'prompt' or 'messages'");
  }

  if (body.contains("prompt")) {
    const json& prompt = body.at("prompt");
    if (!prompt.is_string()) {
      throw InvalidRequest("'prompt' must be a string");
    }
    return {{Role::User, prompt.get<std::string>()}};
  }

  if (body.contains("messages")) {
    const json& messages = body.at("messages");
    if (!messages.is_array() || messages.empty()) {
      throw InvalidRequest("'messages' must be a non-empty array");
    }
    std::vector<Message> out;
    out.reserve(messages.size());
    for (const json& item : messages) {
      if (!item.is_object() || !item.contains("role") || !item.contains("content") || !item.at("role").is_string() ||
          !item.at("content").is_string()) {
        throw InvalidRequest("each message needs string 'role' and 'content'");
      }
      const std::string role = item.at("role").get<std::string>();
      if (role != "system" && role != "user" && role != "assistant") {
        throw InvalidRequest("unknown message role: " + role);
      }
      out.push_back({role_from_string(role), item.at("content").get<std::string>()});
    }
    return out;
  }

  throw InvalidRequest("request body must contain 'prompt' or 'messages'");
}

json messages_to_json(const std::vector<Message>& messages) {
  json out = json::array();
  for (const Message& message : messages) {
    out.push_back({{"role", role_to_string(message.m_role)}, {"content", message.m_content}});
  }
  return out;
}

std::vector<Message> messages_from_json(const json& value) {
  std::vector<Message> out;
  if (!value.is_array()) {
    return out;
  }
  for (const json& item : value) {
    if (item.is_object()) {
      out.push_back({role_from_string(item.value("role", "user")), item.value("content", "")});
    }
  }
  return out;
}

InferenceService::InferenceService(AppConfig config, std::vector<std::unique_ptr<IModelRuntime>> runtimes)
    : config_(std::move(config)),
      runtimes_(std::move(runtimes)),
      runtime_selection_note_(),
      active_runtime_index_(pick_runtime_index(runtime_selection_note_)) {}

std::string InferenceService::active_runtime_name() const {
  if (!active_runtime_index_.has_value() || *active_runtime_index_ >= runtimes_.size()) {
    return "none";
  }
  return runtimes_[*active_runtime_index_]->name();
}

std::string InferenceService::runtime_selection_note() const { return runtime_selection_note_; }

InvocationResponse InferenceService::invoke(const InvocationRequest& request) {
  if (!active_runtime_index_.has_value() || *active_runtime_index_ >= runtimes_.size()) {
    throw std::runtime_error("no available runtime");
  }

  const std::vector<Message> turn = messages_from_body(request.m_body);
  std::vector<Message> history;
  if (request.m_session) {
    history = messages_from_json(request.m_session->get(kHistoryKey, json::array()));
  }

  GenerationRequest generation;
  generation.m_modelPath = config_.model_path;
  generation.m_maxTokens = config_.max_tokens;
  const bool has_system = !history.empty() && history.front().m_role == Role::System;
  if (!has_system && !config_.system_prompt.empty() && (turn.empty() || turn.front().m_role != Role::System)) {
    generation.m_messages.push_back({Role::System, config_.system_prompt});
  }
  generation.m_messages.insert(generation.m_messages.end(), history.begin(), history.end());
  generation.m_messages.insert(generation.m_messages.end(), turn.begin(), turn.end());

  const GenerationResult result = runtimes_[*active_runtime_index_]->generate(generation, nullptr);
  spdlog::debug("generated {} token(s) in {:.1f} ms", result.m_generatedTokens, result.m_totalMs);

  InvocationResponse response;
  response.m_statusCode = 200;
  response.m_headers["Content-Type"] = "application/json";
  if (request.m_session) {
    history.insert(history.end(), turn.begin(), turn.end());
    history.push_back({Role::Assistant, result.m_text});
    request.m_session->put(kHistoryKey, messages_to_json(history));
    response.m_headers[kSessionIdHeader] = request.m_session->session_id();
  }

  const json body = {
      {"text", result.m_text},
      {"usage",
       {{"generated_tokens", result.m_generatedTokens},
        {"first_token_ms", result.m_firstTokenMs},
        {"total_ms", result.m_totalMs},
        {"tokens_per_second", result.m_tokensPerSecond}}},
  };
  response.m_body = body.dump();
  return response;
}

std::optional<std::size_t> InferenceService::pick_runtime_index(std::string& note) const {
  if (runtimes_.empty()) {
    note = "no runtimes configured";
    return std::nullopt;
  }

  for (std::size_t i = 0; i < runtimes_.size(); ++i) {
    if (runtimes_[i]->name() == config_.runtime_preference && runtimes_[i]->is_available()) {
      note.clear();
      return i;
    }
  }

  for (std::size_t i = 0; i < runtimes_.size(); ++i) {
    if (runtimes_[i]->is_available()) {
      note = "runtime '" + config_.runtime_preference + "' unavailable; using '" + runtimes_[i]->name() + "'";
      return i;
    }
  }

  note = "no runtime is available";
  return std::nullopt;
}

}  // namespace tether
