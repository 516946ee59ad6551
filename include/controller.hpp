#pragma once
#include <string>

#include "deployment_state.hpp"
#include "metrics.hpp"
#include "model_registry.hpp"
#include "pipeline.hpp"
#include "router.hpp"
#include "types.hpp"

// Operational surface of the canary rollout. Owns the latency log, the
// deployment state and the prediction pipeline; the loader and random source
// are borrowed and must outlive the controller.
class CanaryController {
public:
  CanaryController(ModelLoader& loader, RandomSource& rng, const std::string& stable_path,
                   PipelineClock clock = PipelineClock::system(), bool verbose_requests = false);

  PredictionResult predict(const FeatureVector& features);

  DeployResult deploy_canary(const std::string& path);
  void rollback_canary();
  PromoteResult promote_canary();
  bool toggle_slowdown();

  // Never throws; insufficient data is a normal outcome.
  HealthCheckResult check_canary_health() const;

  DeploymentStatus status() const;
  DeploymentPhase phase() const { return state_.phase(); }
  const LatencyRecorder& latencies() const { return recorder_; }

private:
  LatencyRecorder recorder_;
  DeploymentStateMachine state_;
  PredictionPipeline pipeline_;
};
