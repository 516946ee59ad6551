#pragma once
#include <cstdint>
#include <deque>
#include <mutex>
#include <string>
#include <vector>

#include "types.hpp"

// Percentile p in [0,100] with linear interpolation. Sorts its argument.
double percentile(std::vector<double> v, double p);
double mean_of(const std::vector<double>& v);

// Append-only per-variant latency log for the current canary episode.
// Guarded by its own mutex, independent of the deployment state lock.
// Every reset starts a new episode; samples tagged with an older episode are
// dropped, so a request that straddles a deploy cannot pollute the new log.
class LatencyRecorder {
public:
  // Quantiles on /metrics cover at most this many recent samples per variant.
  static constexpr size_t kQuantileWindow = 1024;

  // Appends to the current episode.
  void record(Variant v, double latency_ms);
  // Appends only if `episode` is still current. Returns false when dropped.
  bool record(uint64_t episode, Variant v, double latency_ms);

  // Consistent copy of one variant's samples.
  std::vector<double> snapshot(Variant v) const;

  struct Pair {
    std::vector<double> stable;
    std::vector<double> canary;
  };
  // Both variants copied in one critical section, so a concurrent reset
  // cannot split them across canary episodes.
  Pair snapshot_all() const;

  // Clears both variants in one critical section and returns the new episode.
  uint64_t reset_all();
  uint64_t episode() const;

  size_t count(Variant v) const;

  // Quantiles over the recent window; mean and count over the whole episode.
  // Cost is bounded by kQuantileWindow, not by the length of the log.
  std::string prometheus_text() const;

private:
  struct Series {
    std::vector<double> log;
    std::deque<double> recent;
    double sum{0.0};

    void add(double x);
    void clear();
  };

  Series& series(Variant v) { return v == Variant::Canary ? canary_ : stable_; }
  const Series& series(Variant v) const { return v == Variant::Canary ? canary_ : stable_; }

  mutable std::mutex mu_;
  uint64_t episode_{0};
  Series stable_;
  Series canary_;
};
