#pragma once

#include <cmath>
#include <cstddef>
#include <vector>

namespace neurosync {

// Small descriptive-statistics helpers shared by the artifact detector and the
// feature extractor.
//
// Conventions:
// - variance is the population variance (divide by n)
// - skewness is the biased sample skewness m3 / m2^1.5
// - kurtosis is the (non-excess) biased kurtosis m4 / m2^2
// - skewness and kurtosis are 0 when the variance is ~0 (<= 1e-24)
// - stddev_sample() divides by (n-1) and is 0 for n < 2

struct Moments {
  size_t n{0};
  double mean{0.0};
  double variance{0.0};
  double skewness{0.0};
  double kurtosis{0.0};
};

template <typename T>
inline double mean_of(const T* x, size_t n) {
  if (!x || n == 0) return 0.0;
  double s = 0.0;
  for (size_t i = 0; i < n; ++i) s += static_cast<double>(x[i]);
  return s / static_cast<double>(n);
}

template <typename T>
inline double variance_population(const T* x, size_t n) {
  if (!x || n == 0) return 0.0;
  const double m = mean_of(x, n);
  double acc = 0.0;
  for (size_t i = 0; i < n; ++i) {
    const double d = static_cast<double>(x[i]) - m;
    acc += d * d;
  }
  return acc / static_cast<double>(n);
}

inline double variance_population(const std::vector<double>& x) {
  return variance_population(x.data(), x.size());
}

template <typename T>
inline double stddev_sample(const T* x, size_t n) {
  if (!x || n < 2) return 0.0;
  const double m = mean_of(x, n);
  double acc = 0.0;
  for (size_t i = 0; i < n; ++i) {
    const double d = static_cast<double>(x[i]) - m;
    acc += d * d;
  }
  return std::sqrt(acc / static_cast<double>(n - 1));
}

template <typename T>
inline Moments compute_moments(const T* x, size_t n) {
  Moments out;
  out.n = n;
  if (!x || n == 0) return out;

  out.mean = mean_of(x, n);
  double m2 = 0.0;
  double m3 = 0.0;
  double m4 = 0.0;
  for (size_t i = 0; i < n; ++i) {
    const double d = static_cast<double>(x[i]) - out.mean;
    const double d2 = d * d;
    m2 += d2;
    m3 += d2 * d;
    m4 += d2 * d2;
  }
  const double dn = static_cast<double>(n);
  m2 /= dn;
  m3 /= dn;
  m4 /= dn;

  out.variance = m2;
  if (m2 > 1e-24) {
    out.skewness = m3 / std::pow(m2, 1.5);
    out.kurtosis = m4 / (m2 * m2);
  }
  return out;
}

} // namespace neurosync
