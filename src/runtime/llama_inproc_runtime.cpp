#include "tether/runtime.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

#if defined(TETHER_HAS_LLAMA_CPP)
#include <llama.h>
#endif

namespace tether {
namespace {

std::string normalize_profile(std::string profile) {
  std::transform(profile.begin(), profile.end(), profile.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  if (profile != "fast" && profile != "quality") {
    return "balanced";
  }
  return profile;
}

#if defined(TETHER_HAS_LLAMA_CPP)
void llama_log_to_spdlog(enum ggml_log_level level, const char* text, void*) {
  if (level == GGML_LOG_LEVEL_ERROR) {
    spdlog::error("llama: {}", text);
  } else if (level == GGML_LOG_LEVEL_WARN) {
    spdlog::warn("llama: {}", text);
  } else {
    spdlog::trace("llama: {}", text);
  }
}

struct ModelDeleter {
  void operator()(llama_model* model) const {
    if (model != nullptr) {
      llama_model_free(model);
    }
  }
};

struct ContextDeleter {
  void operator()(llama_context* ctx) const {
    if (ctx != nullptr) {
      llama_free(ctx);
    }
  }
};

struct SamplerDeleter {
  void operator()(llama_sampler* sampler) const {
    if (sampler != nullptr) {
      llama_sampler_free(sampler);
    }
  }
};

using SamplerPtr = std::unique_ptr<llama_sampler, SamplerDeleter>;

struct SamplingParams {
  int top_k;
  float top_p;
  float temperature;
};

SamplingParams sampling_for(const std::string& profile) {
  if (profile == "fast") {
    return {20, 0.95f, 0.6f};
  }
  if (profile == "quality") {
    return {60, 0.98f, 0.8f};
  }
  return {40, 0.95f, 0.7f};
}

class LlamaInprocRuntime final : public IModelRuntime {
 public:
  explicit LlamaInprocRuntime(LlamaRuntimeOptions options) : options_(std::move(options)) {
    options_.profile = normalize_profile(options_.profile);
  }

  std::string name() const override { return "llama-inproc"; }

  bool is_available() const override { return true; }

  GenerationResult generate(const GenerationRequest& request, StreamCallback on_token) override {
    if (request.m_modelPath.empty()) {
      throw std::runtime_error("llama-inproc requires a non-empty model_path");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    init_backend_once();
    load_model(request.m_modelPath);
    ensure_context();

    const llama_vocab* vocab = llama_model_get_vocab(model_.get());
    if (vocab == nullptr) {
      throw std::runtime_error("llama-inproc failed to get model vocab");
    }

    const std::vector<llama_token> prompt_tokens = tokenize(vocab, render_prompt(request));
    if (prompt_tokens.empty()) {
      throw std::runtime_error("llama-inproc tokenization produced zero tokens");
    }

    const auto start = std::chrono::steady_clock::now();
    decode_prompt(prompt_tokens);
    SamplerPtr sampler = make_sampler();

    GenerationResult result;
    result.m_text.reserve(request.m_maxTokens * 4);
    for (std::size_t i = 0; i < request.m_maxTokens; ++i) {
      llama_token token = llama_sampler_sample(sampler.get(), context_.get(), -1);
      if (token == LLAMA_TOKEN_NULL || llama_vocab_is_eog(vocab, token)) {
        break;
      }
      llama_sampler_accept(sampler.get(), token);
      ++result.m_generatedTokens;

      const std::string piece = token_to_text(vocab, token);
      if (!piece.empty()) {
        if (result.m_firstTokenMs == 0.0) {
          result.m_firstTokenMs = elapsed_ms(start);
        }
        result.m_text += piece;
        if (on_token) {
          on_token(piece);
        }
      }

      const int rc = llama_decode(context_.get(), llama_batch_get_one(&token, 1));
      if (rc != 0) {
        throw std::runtime_error("llama-inproc token decode failed: code " + std::to_string(rc));
      }
      cached_tokens_.push_back(token);
    }

    result.m_totalMs = elapsed_ms(start);
    result.m_tokensPerSecond =
        result.m_totalMs > 0.0 ? (static_cast<double>(result.m_generatedTokens) * 1000.0 / result.m_totalMs) : 0.0;
    return result;
  }

 private:
  static double elapsed_ms(std::chrono::steady_clock::time_point start) {
    return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();
  }

  static void init_backend_once() {
    static std::once_flag once;
    std::call_once(once, []() {
      ggml_backend_load_all();
      llama_backend_init();
      llama_log_set(llama_log_to_spdlog, nullptr);
    });
  }

  // Uses the model's own chat template; falls back to "role: content" lines without one.
  std::string render_prompt(const GenerationRequest& request) const {
    std::vector<std::string> roles;
    std::vector<llama_chat_message> chat;
    roles.reserve(request.m_messages.size());
    chat.reserve(request.m_messages.size());
    for (const Message& message : request.m_messages) {
      roles.push_back(role_to_string(message.m_role));
    }
    for (std::size_t i = 0; i < request.m_messages.size(); ++i) {
      chat.push_back({roles[i].c_str(), request.m_messages[i].m_content.c_str()});
    }

    const char* tmpl = llama_model_chat_template(model_.get(), nullptr);
    if (tmpl != nullptr) {
      std::vector<char> buffer(4096);
      int32_t n = llama_chat_apply_template(tmpl, chat.data(), chat.size(), true, buffer.data(),
                                            static_cast<int32_t>(buffer.size()));
      if (n > static_cast<int32_t>(buffer.size())) {
        buffer.resize(static_cast<std::size_t>(n));
        n = llama_chat_apply_template(tmpl, chat.data(), chat.size(), true, buffer.data(),
                                      static_cast<int32_t>(buffer.size()));
      }
      if (n >= 0) {
        return std::string(buffer.data(), static_cast<std::size_t>(n));
      }
      spdlog::warn("llama-inproc chat template failed; using plain prompt");
    }

    std::ostringstream prompt;
    for (const Message& message : request.m_messages) {
      prompt << role_to_string(message.m_role) << ": " << message.m_content << "\n";
    }
    prompt << "assistant: ";
    return prompt.str();
  }

  void load_model(const std::string& model_path) {
    if (model_ && loaded_model_path_ == model_path) {
      return;
    }

    llama_model_params params = llama_model_default_params();
    params.use_mmap = true;
    params.use_mlock = false;
    params.n_gpu_layers = 0;

    std::unique_ptr<llama_model, ModelDeleter> next(llama_model_load_from_file(model_path.c_str(), params));
    if (!next) {
      throw std::runtime_error("llama-inproc failed to load model file: " + model_path);
    }
    spdlog::info("llama-inproc loaded model {}", model_path);

    context_.reset();
    model_ = std::move(next);
    loaded_model_path_ = model_path;
    cached_tokens_.clear();
  }

  void ensure_context() {
    if (context_) {
      return;
    }

    llama_context_params params = llama_context_default_params();
    const auto batch = static_cast<uint32_t>(options_.n_batch > 0 ? options_.n_batch : 512);
    params.n_ctx = 0;
    params.n_batch = batch;
    params.n_ubatch = batch;
    params.offload_kqv = options_.offload_kqv;
    params.op_offload = options_.op_offload;

    context_.reset(llama_init_from_model(model_.get(), params));
    if (!context_) {
      throw std::runtime_error("llama-inproc failed to create context");
    }

    if (options_.n_threads > 0 || options_.n_threads_batch > 0) {
      const int threads = options_.n_threads > 0 ? options_.n_threads : llama_n_threads(context_.get());
      const int threads_batch =
          options_.n_threads_batch > 0 ? options_.n_threads_batch : llama_n_threads_batch(context_.get());
      llama_set_n_threads(context_.get(), threads, threads_batch);
    }
  }

  // Reuses the KV cache when the new prompt extends the previous one, which is the common case
  // for a session whose history only grows.
  void decode_prompt(const std::vector<llama_token>& prompt_tokens) {
    std::size_t prefix = 0;
    const std::size_t limit = std::min(cached_tokens_.size(), prompt_tokens.size());
    while (prefix < limit && cached_tokens_[prefix] == prompt_tokens[prefix]) {
      ++prefix;
    }
    if (prefix != cached_tokens_.size() || prefix == prompt_tokens.size()) {
      llama_memory_clear(llama_get_memory(context_.get()), true);
      cached_tokens_.clear();
      prefix = 0;
    }

    std::vector<llama_token> suffix(prompt_tokens.begin() + static_cast<std::ptrdiff_t>(prefix), prompt_tokens.end());
    const int rc = llama_decode(context_.get(), llama_batch_get_one(suffix.data(), static_cast<int32_t>(suffix.size())));
    if (rc != 0) {
      throw std::runtime_error("llama-inproc prompt decode failed: code " + std::to_string(rc));
    }
    cached_tokens_ = prompt_tokens;
  }

  SamplerPtr make_sampler() const {
    SamplerPtr sampler(llama_sampler_chain_init(llama_sampler_chain_default_params()));
    if (!sampler) {
      throw std::runtime_error("llama-inproc failed to initialize sampler chain");
    }
    const SamplingParams sampling = sampling_for(options_.profile);
    llama_sampler_chain_add(sampler.get(), llama_sampler_init_top_k(sampling.top_k));
    llama_sampler_chain_add(sampler.get(), llama_sampler_init_top_p(sampling.top_p, 1));
    llama_sampler_chain_add(sampler.get(), llama_sampler_init_temp(sampling.temperature));
    llama_sampler_chain_add(sampler.get(), llama_sampler_init_dist(LLAMA_DEFAULT_SEED));
    return sampler;
  }

  static std::vector<llama_token> tokenize(const llama_vocab* vocab, const std::string& text) {
    std::vector<llama_token> tokens(text.size() + 16);
    int32_t n = llama_tokenize(vocab, text.c_str(), static_cast<int32_t>(text.size()), tokens.data(),
                               static_cast<int32_t>(tokens.size()), true, true);
    if (n < 0) {
      tokens.assign(static_cast<std::size_t>(-n), 0);
      n = llama_tokenize(vocab, text.c_str(), static_cast<int32_t>(text.size()), tokens.data(),
                         static_cast<int32_t>(tokens.size()), true, true);
    }
    if (n < 0) {
      throw std::runtime_error("llama-inproc tokenization failed");
    }
    tokens.resize(static_cast<std::size_t>(n));
    return tokens;
  }

  static std::string token_to_text(const llama_vocab* vocab, llama_token token) {
    std::vector<char> buffer(32);
    int32_t n = llama_token_to_piece(vocab, token, buffer.data(), static_cast<int32_t>(buffer.size()), 0, true);
    if (n < 0) {
      buffer.assign(static_cast<std::size_t>(-n), 0);
      n = llama_token_to_piece(vocab, token, buffer.data(), static_cast<int32_t>(buffer.size()), 0, true);
    }
    if (n <= 0) {
      return "";
    }
    return std::string(buffer.data(), static_cast<std::size_t>(n));
  }

  std::mutex mutex_;
  LlamaRuntimeOptions options_;
  std::unique_ptr<llama_model, ModelDeleter> model_{nullptr};
  std::unique_ptr<llama_context, ContextDeleter> context_{nullptr};
  std::string loaded_model_path_;
  std::vector<llama_token> cached_tokens_;
};

#else
class LlamaInprocRuntime final : public IModelRuntime {
 public:
  explicit LlamaInprocRuntime(LlamaRuntimeOptions options) : profile_(normalize_profile(options.profile)) {}
  std::string name() const override { return "llama-inproc"; }
  bool is_available() const override { return false; }
  GenerationResult generate(const GenerationRequest&, StreamCallback) override {
    throw std::runtime_error("llama-inproc runtime unavailable: built without llama.cpp (profile " + profile_ + ")");
  }

 private:
  std::string profile_;
};
#endif

}  // namespace

std::unique_ptr<IModelRuntime> make_llama_inproc_runtime(const LlamaRuntimeOptions& options) {
  return std::make_unique<LlamaInprocRuntime>(options);
}

}  // namespace tether
