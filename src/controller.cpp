#include "controller.hpp"

#include "health.hpp"

CanaryController::CanaryController(ModelLoader& loader, RandomSource& rng,
                                   const std::string& stable_path, PipelineClock clock,
                                   bool verbose_requests)
    : state_(loader, recorder_, stable_path),
      pipeline_(state_, recorder_, rng, std::move(clock), verbose_requests) {}

PredictionResult CanaryController::predict(const FeatureVector& features) {
  return pipeline_.predict(features);
}

DeployResult CanaryController::deploy_canary(const std::string& path) {
  return state_.deploy_canary(path);
}

void CanaryController::rollback_canary() { state_.rollback_canary(); }

PromoteResult CanaryController::promote_canary() { return state_.promote_canary(); }

bool CanaryController::toggle_slowdown() { return state_.toggle_slowdown(); }

HealthCheckResult CanaryController::check_canary_health() const {
  // Copies are taken under the metrics lock; the test itself runs unlocked.
  const auto samples = recorder_.snapshot_all();
  return HealthEvaluator::evaluate(samples.stable, samples.canary);
}

DeploymentStatus CanaryController::status() const {
  const DeploymentSnapshot snap = state_.snapshot();
  DeploymentStatus s;
  s.stable_path = snap.stable_path;
  s.stable_version = snap.stable->version();
  s.canary_active = snap.canary_active();
  if (snap.canary) {
    s.canary_path = snap.canary_path;
    s.canary_version = snap.canary->version();
    s.canary_start_time = snap.canary_start_time;
  }
  s.simulate_slowdown = snap.simulate_slowdown;
  s.stable_samples = recorder_.count(Variant::Stable);
  s.canary_samples = recorder_.count(Variant::Canary);
  return s;
}
