#pragma once

#include "neurosync/fft.hpp"
#include "neurosync/types.hpp"

#include <cstddef>
#include <vector>

namespace neurosync {

struct WelchOptions {
  // Segment length in samples. 0 => caller decides (the feature extractor
  // uses one second of samples).
  size_t nperseg{256};
  double overlap_fraction{0.5}; // 0..<1

  // Subtract each segment's mean before windowing.
  bool detrend_constant{true};
};

// Welch PSD estimator with a fixed segment layout.
//
// Hann window, one-sided density scaling:
//   Pxx[k] = c_k * |X_k|^2 / (fs * sum(w^2)), c_k = 2 except DC/Nyquist.
// FFT size is the next power of two >= nperseg.
//
// Construct once per run and reuse: every input then shares the same
// frequency grid.
class WelchEstimator {
public:
  WelchEstimator(double fs_hz, const WelchOptions& opt);

  double fs_hz() const { return fs_hz_; }
  size_t nperseg() const { return nperseg_; }
  size_t nfft() const { return plan_.size(); }
  const std::vector<double>& freqs_hz() const { return freqs_; }

  // Estimate the PSD of x[0..n). Requires n >= nperseg().
  PsdResult compute(const float* x, size_t n) const;
  PsdResult compute(const std::vector<float>& x) const { return compute(x.data(), x.size()); }

private:
  double fs_hz_{0.0};
  size_t nperseg_{0};
  size_t hop_{1};
  bool detrend_{true};
  std::vector<double> window_;
  double window_power_{0.0};
  FftPlan plan_;
  std::vector<double> freqs_;
};

// One-shot helper. nperseg is clamped to [8, x.size()].
PsdResult welch_psd(const std::vector<float>& x, double fs_hz, const WelchOptions& opt);

} // namespace neurosync
