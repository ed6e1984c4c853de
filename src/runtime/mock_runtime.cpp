#include "tether/runtime.hpp"

#include <chrono>
#include <cstddef>
#include <memory>
#include <sstream>

namespace tether {
namespace {

// Deterministic echo runtime; reports how many user turns it has seen so session history is observable.
class MockRuntime final : public IModelRuntime {
 public:
  std::string name() const override { return "mock"; }

  bool is_available() const override { return true; }

  GenerationResult generate(const GenerationRequest& request, StreamCallback on_token) override {
    const auto start = std::chrono::steady_clock::now();
    std::string last_user;
    std::size_t user_turns = 0;
    for (const Message& message : request.m_messages) {
      if (message.m_role == Role::User) {
        last_user = message.m_content;
        ++user_turns;
      }
    }

    std::ostringstream response;
    response << "[mock turn " << user_turns << "] " << last_user;
    const std::string text = response.str();
    if (on_token) {
      on_token(text);
    }

    const auto end = std::chrono::steady_clock::now();
    const double total_ms = std::chrono::duration<double, std::milli>(end - start).count();
    return {.m_text = text,
            .m_firstTokenMs = total_ms,
            .m_totalMs = total_ms,
            .m_generatedTokens = text.empty() ? std::size_t{0} : std::size_t{1},
            .m_tokensPerSecond = total_ms > 0.0 ? (1000.0 / total_ms) : 0.0};
  }
};

}  // namespace

std::unique_ptr<IModelRuntime> make_mock_runtime() {
  return std::make_unique<MockRuntime>();
}

}  // namespace tether
