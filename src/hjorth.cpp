#include "neurosync/hjorth.hpp"

#include "neurosync/errors.hpp"
#include "neurosync/moments.hpp"

#include <cmath>

namespace neurosync {

HjorthParameters hjorth_parameters(const float* x, size_t n) {
  if (!x || n < 2) {
    throw InsufficientDataError("hjorth_parameters: need at least 2 samples");
  }

  std::vector<double> d1(n - 1);
  for (size_t i = 0; i + 1 < n; ++i) {
    d1[i] = static_cast<double>(x[i + 1]) - static_cast<double>(x[i]);
  }
  std::vector<double> d2(n >= 3 ? n - 2 : 0);
  for (size_t i = 0; i + 1 < d1.size(); ++i) d2[i] = d1[i + 1] - d1[i];

  HjorthParameters h;
  h.activity = variance_population(x, n);
  const double v1 = variance_population(d1);
  const double v2 = variance_population(d2);

  if (h.activity > 0.0) h.mobility = std::sqrt(v1 / h.activity);
  if (h.mobility > 0.0 && v1 > 0.0) h.complexity = std::sqrt(v2 / v1) / h.mobility;
  return h;
}

HjorthParameters hjorth_parameters(const std::vector<float>& x) {
  return hjorth_parameters(x.data(), x.size());
}

} // namespace neurosync
