#pragma once

#include "neurosync/types.hpp"
#include "neurosync/welch_psd.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace neurosync {

// Windowed per-channel feature extraction.
//
// Each window/channel pair yields 15 values, in this order:
//   Mean, Variance, Skewness, Kurtosis,
//   HjorthActivity, HjorthMobility, HjorthComplexity,
//   TotalPower, Delta, Theta, Alpha, Beta, Gamma, SEF95, MeanFreq
//
// Row layout of the feature matrix: [ch0 features..., ch1 features..., ...].

constexpr size_t kFeaturesPerChannel = 15;

struct FeatureExtractionOptions {
  double window_seconds{2.0};
  double overlap_seconds{1.0};

  // PSD estimator settings, held fixed for every window and channel of a run.
  // nperseg == 0 => one second of samples (clamped to the window length).
  WelchOptions welch{0, 0.5, true};
};

// Window geometry and Welch settings derived from the options for one
// sampling rate.
struct FeatureWindowLayout {
  size_t window_samples{0};
  size_t step_samples{0};
  WelchOptions welch;
};

// Throws ConfigurationError if fs_hz <= 0, the window is empty or the step is
// not positive.
FeatureWindowLayout make_feature_window_layout(double fs_hz, const FeatureExtractionOptions& opt);

// The 15 base names, in feature order.
const std::vector<std::string>& feature_base_names();

// "Ch01_Mean", "Ch01_Variance", ..., "Ch02_Mean", ... (1-based channel index).
std::vector<std::string> make_feature_names(size_t n_channels);

// Start indices 0, step, 2*step, ... while start + window <= n_samples.
std::vector<size_t> feature_window_starts(size_t n_samples, size_t window_samples, size_t step_samples);

// The 15 features of one channel segment x[0..n).
//
// The estimator must be shared by all calls of a run so every window uses the
// same frequency grid. Requires n >= max(2, psd.nperseg()).
std::vector<double> extract_channel_features(const float* x, size_t n, const WelchEstimator& psd);

struct FeatureSet {
  // matrix[window][channel * 15 + feature]
  std::vector<std::vector<double>> matrix;
  std::vector<std::string> names;

  std::vector<size_t> window_starts;
  size_t window_samples{0};
  size_t step_samples{0};

  size_t n_windows() const { return matrix.size(); }
  size_t n_features() const { return names.size(); }
};

// Extract the feature matrix of a cleaned signal.
//
// Throws InsufficientDataError if the signal is shorter than one window
// (including zero length) and ConfigurationError for an invalid sampling rate.
FeatureSet extract_features(const Signal& sig,
                            const SamplingConfig& cfg,
                            const FeatureExtractionOptions& opt = {});

} // namespace neurosync
