#include <httplib.h>
#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

#include <CLI/CLI.hpp>
#include <atomic>
#include <iostream>
#include <memory>
#include <string>

#include "controller.hpp"
#include "errors.hpp"
#include "http_api.hpp"
#include "model_registry.hpp"
#include "router.hpp"
#include "util.hpp"

int main(int argc, char** argv) {
  CLI::App cli_app{"CanaryKeeper: canary rollout controller for served prediction models"};

  std::string cfg_path = "configs/config.yaml";
  cli_app.add_option("-c,--config", cfg_path, "Configuration file path")->check(CLI::ExistingFile);

  int port_override = 0;
  cli_app.add_option("-p,--port", port_override, "HTTP port (overrides config)")
      ->check(CLI::Range(1, 65535));

  std::string stable_override;
  cli_app.add_option("--stable-model", stable_override, "Stable model artifact (overrides config)");

  bool show_version = false;
  cli_app.add_flag("-v,--version", show_version, "Show version information");

  try {
    cli_app.parse(argc, argv);
  } catch (const CLI::ParseError& e) {
    return cli_app.exit(e);
  }

  if (show_version) {
    std::cout << "CanaryKeeper v1.0.0" << std::endl;
    std::cout << "Canary deployments with Welch t-test latency gating" << std::endl;
    return 0;
  }

  spdlog::set_pattern("[%H:%M:%S.%e] %^[%l]%$ %v");
  spdlog::info("CanaryKeeper starting (config: {})", cfg_path);

  AppConfig app;
  try {
    app = load_config(cfg_path);
  } catch (const YAML::Exception& e) {
    spdlog::error("Failed to read config {}: {}", cfg_path, e.what());
    return 1;
  } catch (const std::invalid_argument& e) {
    spdlog::error("Invalid config {}: {}", cfg_path, e.what());
    return 1;
  }
  if (port_override > 0) app.server.port = port_override;
  if (!stable_override.empty()) app.stable_model_path = stable_override;
  configure_logging(app.logging);

  std::unique_ptr<RandomSource> rng;
  if (app.router_seed != 0) {
    spdlog::info("Router using fixed seed {}", app.router_seed);
    rng = std::make_unique<SeededRandomSource>(app.router_seed);
  } else {
    rng = std::make_unique<ThreadLocalRandomSource>();
  }

  ModelRegistry registry;
  std::unique_ptr<CanaryController> ctl;
  try {
    ctl = std::make_unique<CanaryController>(registry, *rng, app.stable_model_path,
                                             PipelineClock::system(),
                                             app.logging.verbose_requests);
  } catch (const ModelLoadError& e) {
    spdlog::error("{}. Exiting.", e.what());
    return 1;
  }

  std::atomic<bool> ready{false};
  httplib::Server svr;
  const int workers = app.server.worker_threads;
  svr.new_task_queue = [workers] { return new httplib::ThreadPool(workers); };
  register_routes(svr, *ctl, ready);

  ready = true;
  spdlog::info("HTTP server listening on {}:{} ({} workers)", app.server.host, app.server.port,
               workers);
  if (!svr.listen(app.server.host, app.server.port)) {
    spdlog::error("Failed to bind {}:{}", app.server.host, app.server.port);
    return 1;
  }

  spdlog::info("Shutdown complete.");
  return 0;
}
