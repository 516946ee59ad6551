#pragma once
#include <chrono>
#include <functional>

#include "deployment_state.hpp"
#include "metrics.hpp"
#include "router.hpp"
#include "types.hpp"

// Time hooks for the timed region. Tests swap in a manual clock.
struct PipelineClock {
  std::function<TimePoint()> now;
  std::function<void(std::chrono::milliseconds)> sleep;

  static PipelineClock system();
};

class PredictionPipeline {
public:
  PredictionPipeline(DeploymentStateMachine& state, LatencyRecorder& recorder, RandomSource& rng,
                     PipelineClock clock = PipelineClock::system(), bool verbose = false);

  // Snapshot state, route, time the model call and record the sample.
  // Throws InvalidInputError for malformed features.
  PredictionResult predict(const FeatureVector& features);

private:
  DeploymentStateMachine& state_;
  LatencyRecorder& recorder_;
  TrafficRouter router_;
  PipelineClock clock_;
  bool verbose_;
};
