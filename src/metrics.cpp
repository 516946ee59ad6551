#include "metrics.hpp"

#include <algorithm>
#include <numeric>
#include <sstream>

double percentile(std::vector<double> v, double p) {
  if (v.empty()) return 0.0;
  std::sort(v.begin(), v.end());
  double rank = (p / 100.0) * static_cast<double>(v.size() - 1);
  size_t lo = static_cast<size_t>(rank);
  size_t hi = std::min(v.size() - 1, lo + 1);
  double frac = rank - static_cast<double>(lo);
  return v[lo] + (v[hi] - v[lo]) * frac;
}

double mean_of(const std::vector<double>& v) {
  if (v.empty()) return 0.0;
  return std::accumulate(v.begin(), v.end(), 0.0) / static_cast<double>(v.size());
}

void LatencyRecorder::Series::add(double x) {
  log.push_back(x);
  if (recent.size() == kQuantileWindow) recent.pop_front();
  recent.push_back(x);
  sum += x;
}

void LatencyRecorder::Series::clear() {
  log.clear();
  recent.clear();
  sum = 0.0;
}

void LatencyRecorder::record(Variant v, double latency_ms) {
  std::lock_guard<std::mutex> g(mu_);
  series(v).add(latency_ms);
}

bool LatencyRecorder::record(uint64_t episode, Variant v, double latency_ms) {
  std::lock_guard<std::mutex> g(mu_);
  if (episode != episode_) return false;
  series(v).add(latency_ms);
  return true;
}

std::vector<double> LatencyRecorder::snapshot(Variant v) const {
  std::lock_guard<std::mutex> g(mu_);
  return series(v).log;
}

LatencyRecorder::Pair LatencyRecorder::snapshot_all() const {
  std::lock_guard<std::mutex> g(mu_);
  return {stable_.log, canary_.log};
}

uint64_t LatencyRecorder::reset_all() {
  std::lock_guard<std::mutex> g(mu_);
  stable_.clear();
  canary_.clear();
  return ++episode_;
}

uint64_t LatencyRecorder::episode() const {
  std::lock_guard<std::mutex> g(mu_);
  return episode_;
}

size_t LatencyRecorder::count(Variant v) const {
  std::lock_guard<std::mutex> g(mu_);
  return series(v).log.size();
}

std::string LatencyRecorder::prometheus_text() const {
  struct Summary {
    std::vector<double> recent;
    double mean;
    size_t count;
  };
  Summary summaries[2];
  {
    std::lock_guard<std::mutex> g(mu_);
    for (Variant v : {Variant::Stable, Variant::Canary}) {
      const Series& s = series(v);
      Summary& out = summaries[v == Variant::Canary ? 1 : 0];
      out.recent.assign(s.recent.begin(), s.recent.end());
      out.count = s.log.size();
      out.mean = out.count ? s.sum / static_cast<double>(out.count) : 0.0;
    }
  }

  std::ostringstream os;
  for (Variant v : {Variant::Stable, Variant::Canary}) {
    const Summary& s = summaries[v == Variant::Canary ? 1 : 0];
    const char* name = variant_name(v);
    os << "canarykeeper_latency_ms{variant=\"" << name << "\",quantile=\"0.5\"} "
       << percentile(s.recent, 50) << "\n";
    os << "canarykeeper_latency_ms{variant=\"" << name << "\",quantile=\"0.95\"} "
       << percentile(s.recent, 95) << "\n";
    os << "canarykeeper_latency_ms{variant=\"" << name << "\",quantile=\"0.99\"} "
       << percentile(s.recent, 99) << "\n";
    os << "canarykeeper_latency_mean_ms{variant=\"" << name << "\"} " << s.mean << "\n";
    os << "canarykeeper_latency_samples_total{variant=\"" << name << "\"} " << s.count << "\n";
  }
  return os.str();
}
