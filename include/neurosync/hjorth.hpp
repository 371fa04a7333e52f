#pragma once

#include <cstddef>
#include <vector>

namespace neurosync {

// Hjorth descriptors of a 1-D segment x:
//
//   activity   = var(x)
//   mobility   = sqrt(var(x') / var(x))
//   complexity = mobility(x') / mobility(x) = sqrt(var(x'') / var(x')) / mobility
//
// x' and x'' are first and second differences; var is the population variance.
// Degenerate cases (zero activity, zero mobility) yield 0 rather than NaN.
struct HjorthParameters {
  double activity{0.0};
  double mobility{0.0};
  double complexity{0.0};
};

// Throws InsufficientDataError if n < 2.
HjorthParameters hjorth_parameters(const float* x, size_t n);
HjorthParameters hjorth_parameters(const std::vector<float>& x);

} // namespace neurosync
