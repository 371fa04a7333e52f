#include "neurosync/online_features.hpp"

#include "neurosync/errors.hpp"

#include <stdexcept>
#include <utility>

namespace neurosync {

OnlineFeatureExtractor::Ring::Ring(size_t cap) : buf(cap, 0.0f) {
  if (cap == 0) throw std::runtime_error("OnlineFeatureExtractor: ring capacity must be > 0");
}

void OnlineFeatureExtractor::Ring::push(float x) {
  buf[head] = x;
  head = (head + 1) % buf.size();
  if (count < buf.size()) {
    ++count;
  }
}

void OnlineFeatureExtractor::Ring::clear() {
  head = 0;
  count = 0;
}

void OnlineFeatureExtractor::Ring::extract(std::vector<float>* out) const {
  if (!out) return;
  out->resize(count);
  if (count == 0) return;
  // Oldest element is head when full, otherwise at 0.
  const size_t cap = buf.size();
  const size_t start = (count == cap) ? head : 0;
  for (size_t i = 0; i < count; ++i) {
    (*out)[i] = buf[(start + i) % cap];
  }
}

OnlineFeatureExtractor::OnlineFeatureExtractor(std::vector<std::string> channel_names,
                                               double fs_hz,
                                               const FeatureExtractionOptions& opt)
    : channel_names_(std::move(channel_names)),
      fs_hz_(fs_hz),
      layout_(make_feature_window_layout(fs_hz, opt)),
      psd_(fs_hz, layout_.welch) {
  if (channel_names_.empty()) throw ConfigurationError("OnlineFeatureExtractor: need at least 1 channel");
  names_ = make_feature_names(channel_names_.size());
  rings_.reserve(channel_names_.size());
  for (size_t c = 0; c < channel_names_.size(); ++c) {
    rings_.emplace_back(layout_.window_samples);
  }
}

void OnlineFeatureExtractor::reset() {
  for (auto& r : rings_) r.clear();
  total_samples_ = 0;
}

OnlineFeatureFrame OnlineFeatureExtractor::compute_frame() const {
  OnlineFeatureFrame fr;
  fr.t_end_sec = static_cast<double>(total_samples_) / fs_hz_;
  fr.window_start = total_samples_ - layout_.window_samples;
  fr.values.reserve(channel_names_.size() * kFeaturesPerChannel);

  std::vector<float> window;
  window.reserve(layout_.window_samples);
  for (size_t c = 0; c < channel_names_.size(); ++c) {
    rings_[c].extract(&window);
    const std::vector<double> f = extract_channel_features(window.data(), window.size(), psd_);
    fr.values.insert(fr.values.end(), f.begin(), f.end());
  }
  return fr;
}

std::vector<OnlineFeatureFrame> OnlineFeatureExtractor::push_block(const std::vector<std::vector<float>>& block) {
  if (block.empty()) return {};
  if (block.size() != channel_names_.size()) {
    throw std::runtime_error("OnlineFeatureExtractor::push_block: channel count mismatch");
  }
  const size_t n = block[0].size();
  for (size_t c = 1; c < block.size(); ++c) {
    if (block[c].size() != n) {
      throw std::runtime_error("OnlineFeatureExtractor::push_block: all channels must have same #samples");
    }
  }

  std::vector<OnlineFeatureFrame> frames;
  const size_t win = layout_.window_samples;
  const size_t step = layout_.step_samples;

  for (size_t i = 0; i < n; ++i) {
    for (size_t c = 0; c < block.size(); ++c) {
      rings_[c].push(block[c][i]);
    }
    ++total_samples_;

    // Same start indices as feature_window_starts(): 0, step, 2*step, ...
    if (total_samples_ >= win && (total_samples_ - win) % step == 0) {
      frames.push_back(compute_frame());
    }
  }
  return frames;
}

} // namespace neurosync
