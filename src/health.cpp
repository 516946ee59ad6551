#include "health.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cmath>
#include <limits>

#include "metrics.hpp"

namespace {

double clamp01(double v) { return std::min(1.0, std::max(0.0, v)); }

int iteration_limit(double a, double b) {
  return std::clamp<int>(400 + static_cast<int>(std::ceil((a + b) * 0.75)), 400, 5000);
}

constexpr const char* kInsufficientMessage =
    "Insufficient data for statistical analysis. Need at least 20 samples for both models.";
constexpr const char* kAcceptableMessage = "Canary performance is acceptable.";
constexpr const char* kAlertMessage = "ALERT: Canary latency is significantly higher than stable.";

}  // namespace

std::pair<double, bool> beta_continued_fraction(double a, double b, double x, int max_iter) {
  constexpr double eps = 3e-14;
  constexpr double fpmin = 1e-300;

  const double qab = a + b;
  const double qap = a + 1.0;
  const double qam = a - 1.0;

  double c = 1.0;
  double d = 1.0 - qab * x / qap;
  if (std::abs(d) < fpmin) d = fpmin;
  d = 1.0 / d;
  double h = d;

  for (int m = 1; m <= max_iter; ++m) {
    const int m2 = 2 * m;

    double aa = m * (b - m) * x / ((qam + m2) * (a + m2));
    d = 1.0 + aa * d;
    if (std::abs(d) < fpmin) d = fpmin;
    c = 1.0 + aa / c;
    if (std::abs(c) < fpmin) c = fpmin;
    d = 1.0 / d;
    h *= d * c;

    aa = -(a + m) * (qab + m) * x / ((a + m2) * (qap + m2));
    d = 1.0 + aa * d;
    if (std::abs(d) < fpmin) d = fpmin;
    c = 1.0 + aa / c;
    if (std::abs(c) < fpmin) c = fpmin;
    d = 1.0 / d;
    const double del = d * c;
    h *= del;

    if (std::abs(del - 1.0) <= eps) return {h, true};
  }
  return {h, false};
}

double incomplete_beta(double a, double b, double x) {
  if (!(a > 0.0) || !(b > 0.0) || std::isnan(x)) return std::numeric_limits<double>::quiet_NaN();
  if (x <= 0.0) return 0.0;
  if (x >= 1.0) return 1.0;

  const double ln_beta = std::lgamma(a) + std::lgamma(b) - std::lgamma(a + b);
  const double bt = std::exp(a * std::log(x) + b * std::log(1.0 - x) - ln_beta);

  const bool direct = x < (a + 1.0) / (a + b + 2.0);
  const auto cf = direct ? beta_continued_fraction(a, b, x, iteration_limit(a, b))
                         : beta_continued_fraction(b, a, 1.0 - x, iteration_limit(a, b));
  if (!cf.second) {
    spdlog::warn("Incomplete beta did not converge (a={}, b={}, x={})", a, b, x);
    return std::numeric_limits<double>::quiet_NaN();
  }
  return direct ? clamp01(bt * cf.first / a) : clamp01(1.0 - bt * cf.first / b);
}

double two_tailed_p_value(double t, double df) {
  if (std::isnan(t) || !(df > 0.0)) return 1.0;
  if (std::isinf(t)) return 0.0;
  const double x = df / (df + t * t);
  const double p = incomplete_beta(df / 2.0, 0.5, x);
  return std::isnan(p) ? 1.0 : p;
}

double sample_variance(const std::vector<double>& v, double mean) {
  if (v.size() < 2) return 0.0;
  double ss = 0.0;
  for (double x : v) ss += (x - mean) * (x - mean);
  return ss / static_cast<double>(v.size() - 1);
}

WelchTest welch_t_test(const std::vector<double>& a, const std::vector<double>& b) {
  WelchTest w{};
  const double na = static_cast<double>(a.size());
  const double nb = static_cast<double>(b.size());
  if (a.size() < 2 || b.size() < 2) return w;

  const double mean_a = mean_of(a);
  const double mean_b = mean_of(b);
  const double sa = sample_variance(a, mean_a) / na;
  const double sb = sample_variance(b, mean_b) / nb;
  const double se2 = sa + sb;

  if (se2 <= 0.0) {
    // Both groups constant: no spread to test against.
    if (mean_a == mean_b) return w;
    w.t = mean_b > mean_a ? std::numeric_limits<double>::infinity()
                          : -std::numeric_limits<double>::infinity();
    w.df = na + nb - 2.0;
    w.p_value = 0.0;
    return w;
  }

  w.t = (mean_b - mean_a) / std::sqrt(se2);
  w.df = (se2 * se2) / ((sa * sa) / (na - 1.0) + (sb * sb) / (nb - 1.0));
  w.p_value = two_tailed_p_value(w.t, w.df);
  return w;
}

HealthCheckResult HealthEvaluator::evaluate(const std::vector<double>& stable,
                                            const std::vector<double>& canary) {
  HealthCheckResult r{};
  r.stable_count = stable.size();
  r.canary_count = canary.size();

  if (stable.size() < kMinHealthSamples || canary.size() < kMinHealthSamples) {
    r.message = kInsufficientMessage;
    spdlog::info("Health check skipped: stable={} canary={} samples (need {})", r.stable_count,
                 r.canary_count, kMinHealthSamples);
    return r;
  }

  r.sufficient_data = true;
  r.stable_mean_ms = mean_of(stable);
  r.canary_mean_ms = mean_of(canary);

  WelchTest w = welch_t_test(stable, canary);
  r.t_statistic = w.t;
  r.degrees_of_freedom = w.df;
  r.p_value = w.p_value;

  // Two-tailed significance, one-directional trigger.
  r.alert = r.p_value < kSignificanceAlpha && r.canary_mean_ms > r.stable_mean_ms;
  r.message = r.alert ? kAlertMessage : kAcceptableMessage;

  if (r.alert) {
    spdlog::warn("Canary latency alert: canary={:.3f}ms stable={:.3f}ms p={:.4g} (t={:.3f}, df={:.1f})",
                 r.canary_mean_ms, r.stable_mean_ms, r.p_value, r.t_statistic,
                 r.degrees_of_freedom);
  } else {
    spdlog::info("Canary healthy: canary={:.3f}ms stable={:.3f}ms p={:.4g}", r.canary_mean_ms,
                 r.stable_mean_ms, r.p_value);
  }
  return r;
}
