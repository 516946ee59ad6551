#pragma once
#include <cstdint>
#include <mutex>
#include <string>

#include "metrics.hpp"
#include "model_registry.hpp"
#include "types.hpp"

enum class DeploymentPhase { NoCanary, CanaryActive };

const char* phase_name(DeploymentPhase p);

// Copy of the deployment state taken under the state lock. Model handles are
// shared, so a snapshot stays usable after the lock is released.
struct DeploymentSnapshot {
  ModelHandle stable;
  std::string stable_path;
  ModelHandle canary;  // null when no canary is running
  std::string canary_path;
  WallTime canary_start_time{};
  bool simulate_slowdown{false};
  uint64_t episode{0};  // latency log episode the snapshot belongs to

  bool canary_active() const { return canary != nullptr; }
};

// Stable/canary lifecycle. Every transition runs under one exclusive lock, so
// observers never see a half-applied change. Lock order is state -> metrics;
// the prediction path takes them one at a time.
class DeploymentStateMachine {
public:
  // Loads the mandatory stable model; throws ModelLoadError.
  DeploymentStateMachine(ModelLoader& loader, LatencyRecorder& recorder,
                         const std::string& stable_path);

  DeploymentSnapshot snapshot() const;
  DeploymentPhase phase() const;

  DeployResult deploy_canary(const std::string& path);
  void rollback_canary();
  PromoteResult promote_canary();
  bool toggle_slowdown();

private:
  ModelLoader& loader_;
  LatencyRecorder& recorder_;

  mutable std::mutex mu_;
  DeploymentSnapshot state_;
};
