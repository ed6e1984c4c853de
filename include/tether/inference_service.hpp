#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "tether/config.hpp"
#include "tether/runtime.hpp"
#include "tether/types.hpp"

namespace tether {

inline constexpr const char* kHistoryKey = "history";

// The ordinary inference handler. When the request belongs to a session, prior turns are read
// from and written back to that session under kHistoryKey.
class InferenceService {
 public:
  InferenceService(AppConfig config, std::vector<std::unique_ptr<IModelRuntime>> runtimes);

  std::string active_runtime_name() const;
  std::string runtime_selection_note() const;

  InvocationResponse invoke(const InvocationRequest& request);

 private:
  AppConfig config_;
  std::vector<std::unique_ptr<IModelRuntime>> runtimes_;
  std::string runtime_selection_note_;
  std::optional<std::size_t> active_runtime_index_;

  std::optional<std::size_t> pick_runtime_index(std::string& note) const;
};

std::vector<Message> messages_from_body(const json& body);
json messages_to_json(const std::vector<Message>& messages);
std::vector<Message> messages_from_json(const json& value);

}  // namespace tether
