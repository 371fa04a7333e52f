#pragma once

#include "neurosync/types.hpp"

#include <cstddef>
#include <vector>

namespace neurosync {

// Per-sample artifact detection for a referenced (CAR) signal.
//
// Three independent detectors:
// - amplitude: a sample is bad if any channel's |value| exceeds a threshold
// - muscle: high-frequency (30-100 Hz) moving-RMS outliers on the first few
//   channels (typically frontal/temporal sites, where EMG dominates)
// - dead channel: a channel whose standard deviation over the whole recording
//   is below a floor (disconnected electrode / flatline)
//
// The thresholds are empirical defaults; expose them so they can be
// recalibrated per dataset.
struct ArtifactDetectionOptions {
  // Amplitude threshold in signal units (typically microvolts).
  double amplitude_threshold{100.0};

  // Muscle band and Butterworth bandpass order (total order, even).
  // If muscle_high_hz is at or above Nyquist, a highpass at muscle_low_hz is
  // used instead.
  double muscle_low_hz{30.0};
  double muscle_high_hz{100.0};
  int muscle_filter_order{8};

  // Number of leading channels examined for muscle activity.
  size_t muscle_max_channels{4};

  // Moving RMS window length and outlier factor: a sample is flagged when
  // rms > muscle_rms_std_factor * stddev(rms trace of that channel).
  double muscle_rms_window_seconds{1.0};
  double muscle_rms_std_factor{3.0};

  // Dead channel threshold on the full-signal standard deviation.
  double dead_channel_std{0.1};
};

struct ArtifactReport {
  // Per-sample masks, size = n_samples.
  std::vector<bool> amplitude_mask;
  std::vector<bool> muscle_mask;
  std::vector<bool> combined_mask;  // amplitude OR muscle

  // Per-channel flags, size = n_channels.
  std::vector<bool> dead_channels;

  // 100 * count(combined_mask) / n_samples
  double artifact_percentage{0.0};

  size_t n_artifact_samples() const;
  size_t n_dead_channels() const;
  std::vector<size_t> dead_channel_indices() const;
};

// Centered moving RMS with a window of `window` samples.
//
// Window placement follows the usual centered convention: for odd windows
// (window-1)/2 samples on each side, for even windows window/2 before and
// window/2-1 after. The window shrinks at the edges (mean over the available
// samples).
std::vector<double> moving_rms(const std::vector<float>& x, size_t window);

// Detect artifacts. Throws DegenerateSignalError for an empty signal and
// ConfigurationError for invalid options or sampling parameters.
ArtifactReport detect_artifacts(const Signal& sig,
                                const SamplingConfig& cfg,
                                const ArtifactDetectionOptions& opt = {});

} // namespace neurosync
