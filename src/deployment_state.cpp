#include "deployment_state.hpp"

#include <spdlog/spdlog.h>

#include "errors.hpp"
#include "util.hpp"

const char* phase_name(DeploymentPhase p) {
  return p == DeploymentPhase::CanaryActive ? "CANARY_ACTIVE" : "NO_CANARY";
}

DeploymentStateMachine::DeploymentStateMachine(ModelLoader& loader, LatencyRecorder& recorder,
                                               const std::string& stable_path)
    : loader_(loader), recorder_(recorder) {
  state_.stable = loader_.load(stable_path);
  state_.stable_path = stable_path;
  state_.episode = recorder_.episode();
  spdlog::info("Stable model {} installed from {}", state_.stable->version(), stable_path);
}

DeploymentSnapshot DeploymentStateMachine::snapshot() const {
  std::lock_guard<std::mutex> g(mu_);
  return state_;
}

DeploymentPhase DeploymentStateMachine::phase() const {
  std::lock_guard<std::mutex> g(mu_);
  return state_.canary ? DeploymentPhase::CanaryActive : DeploymentPhase::NoCanary;
}

DeployResult DeploymentStateMachine::deploy_canary(const std::string& path) {
  std::lock_guard<std::mutex> g(mu_);
  if (state_.canary) {
    spdlog::warn("Rejected canary deploy of {}: canary {} already active", path,
                 state_.canary_path);
    throw InvalidStateError("A canary is already active (" + state_.canary_path +
                            "); roll it back or promote it first");
  }

  // Nothing below mutates state until the load has succeeded.
  ModelHandle model = loader_.load(path);

  state_.canary = std::move(model);
  state_.canary_path = path;
  state_.canary_start_time = WallClock::now();
  state_.episode = recorder_.reset_all();

  spdlog::info("Canary {} deployed from {} at {}", state_.canary->version(), path,
               format_iso8601(state_.canary_start_time));
  return {path, state_.canary_start_time};
}

void DeploymentStateMachine::rollback_canary() {
  std::lock_guard<std::mutex> g(mu_);
  if (!state_.canary) {
    spdlog::warn("Rejected rollback: no active canary");
    throw InvalidStateError("No active canary to rollback");
  }
  spdlog::info("Canary {} rolled back", state_.canary_path);
  state_.canary.reset();
  state_.canary_path.clear();
  state_.canary_start_time = WallTime{};
}

PromoteResult DeploymentStateMachine::promote_canary() {
  std::lock_guard<std::mutex> g(mu_);
  if (!state_.canary) {
    spdlog::warn("Rejected promotion: no active canary");
    throw InvalidStateError("No active canary to promote");
  }
  PromoteResult r{state_.stable_path, state_.canary_path};
  state_.stable = std::move(state_.canary);
  state_.stable_path = std::move(state_.canary_path);
  state_.canary.reset();
  state_.canary_path.clear();
  state_.canary_start_time = WallTime{};

  spdlog::info("Canary promoted to stable: {} -> {}", r.previous_stable_path, r.new_stable_path);
  return r;
}

bool DeploymentStateMachine::toggle_slowdown() {
  std::lock_guard<std::mutex> g(mu_);
  state_.simulate_slowdown = !state_.simulate_slowdown;
  spdlog::info("Slowdown simulation {}", state_.simulate_slowdown ? "enabled" : "disabled");
  return state_.simulate_slowdown;
}
