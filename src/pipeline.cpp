#include "pipeline.hpp"

#include <spdlog/spdlog.h>

#include <cmath>
#include <thread>

#include "errors.hpp"

using namespace std::chrono;

PipelineClock PipelineClock::system() {
  PipelineClock c;
  c.now = [] { return Clock::now(); };
  c.sleep = [](milliseconds d) { std::this_thread::sleep_for(d); };
  return c;
}

PredictionPipeline::PredictionPipeline(DeploymentStateMachine& state, LatencyRecorder& recorder,
                                       RandomSource& rng, PipelineClock clock, bool verbose)
    : state_(state), recorder_(recorder), router_(rng), clock_(std::move(clock)),
      verbose_(verbose) {}

PredictionResult PredictionPipeline::predict(const FeatureVector& features) {
  if (features.empty()) throw InvalidInputError("Feature vector is empty");
  for (size_t i = 0; i < features.size(); ++i) {
    if (!std::isfinite(features[i])) {
      throw InvalidInputError("Feature " + std::to_string(i) + " is not a finite number");
    }
  }

  // State lock is held only inside snapshot(); inference runs lock-free.
  const DeploymentSnapshot snap = state_.snapshot();
  const Variant variant = router_.route(snap.canary_active());
  const Model& model = variant == Variant::Canary ? *snap.canary : *snap.stable;

  if (features.size() != model.n_features()) {
    throw InvalidInputError("Expected " + std::to_string(model.n_features()) +
                            " features, got " + std::to_string(features.size()));
  }

  const auto t0 = clock_.now();
  if (variant == Variant::Canary && snap.simulate_slowdown) {
    clock_.sleep(kSimulatedSlowdown);
  }
  const double probability = model.predict(features);
  const auto t1 = clock_.now();

  const double latency_ms = duration<double, std::milli>(t1 - t0).count();
  if (!recorder_.record(snap.episode, variant, latency_ms)) {
    spdlog::debug("Dropped {} sample from episode {}: a newer canary was deployed mid-request",
                  variant_name(variant), snap.episode);
  }

  if (verbose_) {
    spdlog::info("predict model={} version={} latency_ms={:.3f} p={:.4f}", variant_name(variant),
                 model.version(), latency_ms, probability);
  } else {
    spdlog::debug("predict model={} version={} latency_ms={:.3f} p={:.4f}", variant_name(variant),
                  model.version(), latency_ms, probability);
  }

  return {probability, variant, latency_ms};
}
