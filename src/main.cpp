#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

#include "tether/config.hpp"
#include "tether/inference_service.hpp"
#include "tether/invocation_server.hpp"
#include "tether/logging.hpp"
#include "tether/runtime.hpp"
#include "tether/session_interceptor.hpp"
#include "tether/session_manager.hpp"

int main(int argc, char** argv) {
  try {
    std::string config_path = "tether.conf";

    for (int i = 1; i < argc; ++i) {
      const std::string arg = argv[i];
      if (arg == "--config" && i + 1 < argc) {
        config_path = argv[++i];
      } else if (arg == "--help" || arg == "-h") {
        std::cout << "usage: tether-serve [--config path]\n"
                  << "reads one JSON envelope per line on stdin: {\"headers\": {...}, \"body\": ...}\n";
        return 0;
      }
    }

    tether::AppConfig config = tether::AppConfig::load_from_file(config_path);
    config.apply_env_overrides();
    tether::configure_logging(config.log_level);

    std::unique_ptr<tether::SessionManager> session_manager;
    if (config.sessions.enabled) {
      session_manager = std::make_unique<tether::SessionManager>(config.sessions);
    } else {
      spdlog::info("stateful sessions disabled");
    }

    std::vector<std::unique_ptr<tether::IModelRuntime>> runtimes;
    tether::LlamaRuntimeOptions llama_options;
    llama_options.n_threads = config.llama_n_threads;
    llama_options.n_threads_batch = config.llama_n_threads_batch;
    llama_options.n_batch = config.llama_n_batch;
    llama_options.offload_kqv = config.llama_offload_kqv;
    llama_options.op_offload = config.llama_op_offload;
    llama_options.profile = config.profile;
    runtimes.push_back(tether::make_llama_inproc_runtime(llama_options));
    runtimes.push_back(tether::make_mock_runtime());

    const tether::SessionInterceptor interceptor(session_manager.get(),
                                                 tether::InterceptorOptions{config.session_id_body_path});
    tether::InferenceService inference(config, std::move(runtimes));
    spdlog::info("runtime: {}", inference.active_runtime_name());
    if (!inference.runtime_selection_note().empty()) {
      spdlog::warn("{}", inference.runtime_selection_note());
    }

    const tether::InvocationServer server(
        interceptor, [&inference](const tether::InvocationRequest& request) { return inference.invoke(request); });

    std::string line;
    while (std::getline(std::cin, line)) {
      if (line.empty()) {
        continue;
      }
      std::cout << server.handle_envelope(line) << "\n" << std::flush;
    }
    return 0;
  } catch (const std::exception& ex) {
    std::cerr << "fatal: " << ex.what() << "\n";
    return 1;
  }
}
