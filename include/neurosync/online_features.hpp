#pragma once

#include "neurosync/features.hpp"
#include "neurosync/welch_psd.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace neurosync {

struct OnlineFeatureFrame {
  // Time (seconds) at the end of the analysis window (relative to start of stream).
  double t_end_sec{0.0};

  // Index of the first sample of the analysis window.
  size_t window_start{0};

  // Same layout as one row of FeatureSet::matrix.
  std::vector<double> values;
};

// Sliding-window feature extractor for streamed samples:
// - maintains a fixed-size ring buffer per channel
// - emits one frame every step once the first full window is available
//
// Frames use the same window geometry and PSD estimator as extract_features(),
// so the frame starting at sample s equals the batch row for start s.
class OnlineFeatureExtractor {
public:
  OnlineFeatureExtractor(std::vector<std::string> channel_names,
                         double fs_hz,
                         const FeatureExtractionOptions& opt = {});

  size_t n_channels() const { return channel_names_.size(); }
  double fs_hz() const { return fs_hz_; }
  size_t window_samples() const { return layout_.window_samples; }
  size_t step_samples() const { return layout_.step_samples; }
  const std::vector<std::string>& feature_names() const { return names_; }

  // Push a block of samples for all channels.
  // block[ch][i] is sample i of channel ch. All channels must have the same length.
  // Returns 0 or more computed frames.
  std::vector<OnlineFeatureFrame> push_block(const std::vector<std::vector<float>>& block);

  // Forget all buffered samples.
  void reset();

private:
  struct Ring {
    std::vector<float> buf;
    size_t head{0};
    size_t count{0};
    explicit Ring(size_t cap);
    void push(float x);
    void clear();
    void extract(std::vector<float>* out) const; // oldest->newest
  };

  OnlineFeatureFrame compute_frame() const;

  std::vector<std::string> channel_names_;
  double fs_hz_{0.0};
  FeatureWindowLayout layout_;
  WelchEstimator psd_;
  std::vector<std::string> names_;

  std::vector<Ring> rings_;
  size_t total_samples_{0};
};

} // namespace neurosync
