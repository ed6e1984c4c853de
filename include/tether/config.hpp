#pragma once

#include <cstddef>
#include <string>

namespace tether {

struct SessionConfig {
  bool enabled{false};
  std::string sessions_path{""};
  double expiration_seconds{1200.0};
  std::string ephemeral_root{"/dev/shm"};
  std::string temp_root{""};
};

struct AppConfig {
  SessionConfig sessions;
  std::string session_id_body_path{""};
  std::string runtime_preference{"llama-inproc"};
  std::string model_path{""};
  std::string system_prompt{"You are a helpful assistant."};
  std::size_t max_tokens{256};
  int llama_n_threads{0};
  int llama_n_threads_batch{0};
  int llama_n_batch{512};
  bool llama_offload_kqv{false};
  bool llama_op_offload{false};
  std::string profile{"balanced"};
  std::string log_level{"error"};

  static AppConfig load_from_file(const std::string& path);

  // OPTION_* first, then SAGEMAKER_*; the later source wins.
  void apply_env_overrides();
};

bool parse_bool(const std::string& key, const std::string& value);
double parse_expiration_seconds(const std::string& value);

}  // namespace tether
