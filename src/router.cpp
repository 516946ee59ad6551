#include "router.hpp"

double ThreadLocalRandomSource::uniform() {
  thread_local std::mt19937_64 engine{std::random_device{}()};
  thread_local std::uniform_real_distribution<double> dist{0.0, 1.0};
  return dist(engine);
}

double SeededRandomSource::uniform() {
  std::lock_guard<std::mutex> g(mu_);
  return dist_(engine_);
}

Variant select_variant(bool canary_active, double u) {
  return (canary_active && u < kCanaryTrafficFraction) ? Variant::Canary : Variant::Stable;
}

Variant TrafficRouter::route(bool canary_active) {
  if (!canary_active) return Variant::Stable;
  return select_variant(true, rng_.uniform());
}
