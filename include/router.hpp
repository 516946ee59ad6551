#pragma once
#include <cstdint>
#include <mutex>
#include <random>

#include "types.hpp"

// Source of uniform draws in [0, 1).
class RandomSource {
public:
  virtual ~RandomSource() = default;
  virtual double uniform() = 0;
};

// One mt19937_64 per thread; concurrent requests draw without locking.
class ThreadLocalRandomSource : public RandomSource {
public:
  double uniform() override;
};

// Reproducible sequence from a fixed seed.
class SeededRandomSource : public RandomSource {
public:
  explicit SeededRandomSource(uint64_t seed) : engine_(seed) {}
  double uniform() override;

private:
  std::mutex mu_;
  std::mt19937_64 engine_;
  std::uniform_real_distribution<double> dist_{0.0, 1.0};
};

// Canary iff one is active and u falls in the canary share.
Variant select_variant(bool canary_active, double u);

class TrafficRouter {
public:
  explicit TrafficRouter(RandomSource& rng) : rng_(rng) {}
  // Draws only when a canary is active.
  Variant route(bool canary_active);

private:
  RandomSource& rng_;
};
