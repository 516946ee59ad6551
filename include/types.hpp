#pragma once
#include <chrono>
#include <cstddef>
#include <string>
#include <vector>

using Clock = std::chrono::steady_clock;
using TimePoint = std::chrono::time_point<Clock>;
using WallClock = std::chrono::system_clock;
using WallTime = std::chrono::time_point<WallClock>;

using FeatureVector = std::vector<double>;

enum class Variant { Stable, Canary };

// Fixed rollout policy.
constexpr double kCanaryTrafficFraction = 0.10;
constexpr std::chrono::milliseconds kSimulatedSlowdown{10};
constexpr size_t kMinHealthSamples = 20;
constexpr double kSignificanceAlpha = 0.05;
// Power-analysis target per group (10 ms shift, 15 ms sd, power 0.8). Advisory only.
constexpr size_t kRecommendedHealthSamples = 36;

const char* variant_name(Variant v);

struct PredictionResult {
  double probability{0};
  Variant variant{Variant::Stable};
  double latency_ms{0};
};

struct DeployResult {
  std::string model_path;
  WallTime start_time{};
};

struct PromoteResult {
  std::string previous_stable_path;
  std::string new_stable_path;
};

struct HealthCheckResult {
  bool alert{false};
  bool sufficient_data{false};
  double p_value{1.0};
  double t_statistic{0};
  double degrees_of_freedom{0};
  double stable_mean_ms{0};
  double canary_mean_ms{0};
  size_t stable_count{0};
  size_t canary_count{0};
  std::string message;
};

struct DeploymentStatus {
  std::string stable_path;
  std::string stable_version;
  bool canary_active{false};
  std::string canary_path;
  std::string canary_version;
  WallTime canary_start_time{};
  bool simulate_slowdown{false};
  size_t stable_samples{0};
  size_t canary_samples{0};
};
