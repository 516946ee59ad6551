#pragma once
#include <cstdint>
#include <string>

#include "types.hpp"

struct ServerConfig {
  std::string host{"0.0.0.0"};
  int port{8000};
  int worker_threads{8};
};

struct LoggingConfig {
  std::string level{"info"};
  bool verbose_requests{false};
};

struct AppConfig {
  ServerConfig server;
  LoggingConfig logging;
  std::string stable_model_path{"models/model_v1.yaml"};
  uint64_t router_seed{0};  // 0 = per-thread random engines
};

// Throws YAML::Exception on unreadable files and std::invalid_argument on bad values.
AppConfig load_config(const std::string& path);

// Applies pattern and level to the global spdlog logger.
void configure_logging(const LoggingConfig& cfg);

// UTC, e.g. 2024-05-01T12:30:45.123Z
std::string format_iso8601(WallTime t);
