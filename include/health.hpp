#pragma once
#include <utility>
#include <vector>

#include "types.hpp"

struct WelchTest {
  double t{0};
  double df{0};
  double p_value{1.0};
};

// Lentz evaluation of the continued fraction for I_x(a, b). The flag is false
// when max_iter ran out before the terms settled.
std::pair<double, bool> beta_continued_fraction(double a, double b, double x, int max_iter);

// Regularized incomplete beta I_x(a, b). NaN if the continued fraction does
// not converge.
double incomplete_beta(double a, double b, double x);

// Two-tailed p-value of Student's t with (possibly fractional) df. Falls back
// to 1 when the p-value cannot be computed.
double two_tailed_p_value(double t, double df);

// Sample variance with Bessel's correction. Needs at least two samples.
double sample_variance(const std::vector<double>& v, double mean);

// Welch's unequal-variance t-test of b against a: t = (mean_b - mean_a) / se.
WelchTest welch_t_test(const std::vector<double>& a, const std::vector<double>& b);

// Stateless canary verdict over copied latency snapshots.
class HealthEvaluator {
public:
  static HealthCheckResult evaluate(const std::vector<double>& stable,
                                    const std::vector<double>& canary);
};
