#include "util.hpp"

#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>

const char* variant_name(Variant v) { return v == Variant::Canary ? "canary" : "stable"; }

AppConfig load_config(const std::string& path) {
  YAML::Node y = YAML::LoadFile(path);
  AppConfig c{};

  if (y["server"]) {
    auto n = y["server"];
    if (n["host"]) c.server.host = n["host"].as<std::string>();
    if (n["port"]) c.server.port = n["port"].as<int>();
    if (n["worker_threads"]) c.server.worker_threads = n["worker_threads"].as<int>();
  }
  if (y["models"] && y["models"]["stable_model_path"])
    c.stable_model_path = y["models"]["stable_model_path"].as<std::string>();
  if (y["router"] && y["router"]["seed"]) c.router_seed = y["router"]["seed"].as<uint64_t>();
  if (y["logging"]) {
    auto n = y["logging"];
    if (n["level"]) c.logging.level = n["level"].as<std::string>();
    if (n["verbose_requests"]) c.logging.verbose_requests = n["verbose_requests"].as<bool>();
  }

  if (c.server.port <= 0 || c.server.port > 65535)
    throw std::invalid_argument("server.port out of range: " + std::to_string(c.server.port));
  if (c.server.worker_threads < 1)
    throw std::invalid_argument("server.worker_threads must be at least 1");
  if (c.stable_model_path.empty())
    throw std::invalid_argument("models.stable_model_path must not be empty");

  return c;
}

void configure_logging(const LoggingConfig& cfg) {
  spdlog::set_pattern("[%H:%M:%S.%e] %^[%l]%$ %v");
  if (cfg.level == "trace") {
    spdlog::set_level(spdlog::level::trace);
  } else if (cfg.level == "debug") {
    spdlog::set_level(spdlog::level::debug);
  } else if (cfg.level == "info") {
    spdlog::set_level(spdlog::level::info);
  } else if (cfg.level == "warn") {
    spdlog::set_level(spdlog::level::warn);
  } else if (cfg.level == "error") {
    spdlog::set_level(spdlog::level::err);
  } else {
    spdlog::set_level(spdlog::level::info);
    spdlog::warn("Unknown log level '{}', using info", cfg.level);
  }
}

std::string format_iso8601(WallTime t) {
  const auto ms =
      std::chrono::duration_cast<std::chrono::milliseconds>(t.time_since_epoch()).count() % 1000;
  const std::time_t tt = WallClock::to_time_t(t);
  std::tm tm{};
  gmtime_r(&tt, &tm);
  std::ostringstream os;
  os << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0') << ms
     << 'Z';
  return os.str();
}
