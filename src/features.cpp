#include "neurosync/features.hpp"

#include "neurosync/config.hpp"
#include "neurosync/errors.hpp"
#include "neurosync/hjorth.hpp"
#include "neurosync/moments.hpp"
#include "neurosync/spectral_features.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <string>
#include <utility>

namespace neurosync {

static size_t sec_to_samples(double sec, double fs_hz) {
  if (fs_hz <= 0.0 || sec <= 0.0) return 0;
  return static_cast<size_t>(std::llround(sec * fs_hz));
}

FeatureWindowLayout make_feature_window_layout(double fs_hz, const FeatureExtractionOptions& opt) {
  if (!(fs_hz > 0.0) || !std::isfinite(fs_hz)) {
    throw ConfigurationError("extract_features: sampling rate must be > 0");
  }
  FeatureWindowLayout lay;
  lay.window_samples = sec_to_samples(opt.window_seconds, fs_hz);
  if (lay.window_samples < 2) {
    throw ConfigurationError("extract_features: window must span at least 2 samples");
  }
  const size_t overlap = sec_to_samples(opt.overlap_seconds, fs_hz);
  if (overlap >= lay.window_samples) {
    throw ConfigurationError("extract_features: overlap must be shorter than the window");
  }
  lay.step_samples = lay.window_samples - overlap;

  lay.welch = opt.welch;
  if (lay.welch.nperseg == 0) lay.welch.nperseg = std::max<size_t>(2, sec_to_samples(1.0, fs_hz));
  lay.welch.nperseg = std::min(lay.welch.nperseg, lay.window_samples);
  return lay;
}

const std::vector<std::string>& feature_base_names() {
  static const std::vector<std::string> names = {
      "Mean",           "Variance",       "Skewness",         "Kurtosis",   "HjorthActivity",
      "HjorthMobility", "HjorthComplexity", "TotalPower",     "Delta",      "Theta",
      "Alpha",          "Beta",           "Gamma",            "SEF95",      "MeanFreq",
  };
  return names;
}

std::vector<std::string> make_feature_names(size_t n_channels) {
  const auto& base = feature_base_names();
  std::vector<std::string> out;
  out.reserve(n_channels * base.size());
  for (size_t c = 0; c < n_channels; ++c) {
    char prefix[32];
    std::snprintf(prefix, sizeof(prefix), "Ch%02zu_", c + 1);
    for (const auto& b : base) out.push_back(std::string(prefix) + b);
  }
  return out;
}

std::vector<size_t> feature_window_starts(size_t n_samples, size_t window_samples, size_t step_samples) {
  std::vector<size_t> starts;
  if (window_samples == 0 || step_samples == 0) return starts;
  for (size_t s = 0; s + window_samples <= n_samples; s += step_samples) starts.push_back(s);
  return starts;
}

std::vector<double> extract_channel_features(const float* x, size_t n, const WelchEstimator& psd) {
  const Moments m = compute_moments(x, n);
  const HjorthParameters h = hjorth_parameters(x, n);
  const PsdResult p = psd.compute(x, n);

  std::vector<double> f;
  f.reserve(kFeaturesPerChannel);
  f.push_back(m.mean);
  f.push_back(m.variance);
  f.push_back(m.skewness);
  f.push_back(m.kurtosis);
  f.push_back(h.activity);
  f.push_back(h.mobility);
  f.push_back(h.complexity);
  f.push_back(spectral_total_power(p));
  for (const auto& b : default_eeg_bands()) f.push_back(spectral_band_power(p, b.fmin_hz, b.fmax_hz));
  f.push_back(spectral_edge_frequency(p, 0.95));
  f.push_back(spectral_mean_frequency(p));
  return f;
}

FeatureSet extract_features(const Signal& sig,
                            const SamplingConfig& cfg,
                            const FeatureExtractionOptions& opt) {
  validate_signal_shape(sig, "extract_features");
  validate_sampling_config(cfg);
  const double fs = cfg.sampling_rate_hz;

  const FeatureWindowLayout lay = make_feature_window_layout(fs, opt);
  const size_t n_ch = sig.n_channels();
  const size_t n = sig.n_samples();
  if (n_ch == 0 || n < lay.window_samples) {
    throw InsufficientDataError("extract_features: signal has " + std::to_string(n) +
                                " samples, need at least one window of " +
                                std::to_string(lay.window_samples));
  }

  const WelchEstimator psd(fs, lay.welch);

  FeatureSet fs_out;
  fs_out.window_samples = lay.window_samples;
  fs_out.step_samples = lay.step_samples;
  fs_out.window_starts = feature_window_starts(n, lay.window_samples, lay.step_samples);
  fs_out.names = make_feature_names(n_ch);
  fs_out.matrix.reserve(fs_out.window_starts.size());

  for (size_t start : fs_out.window_starts) {
    std::vector<double> row;
    row.reserve(n_ch * kFeaturesPerChannel);
    for (size_t c = 0; c < n_ch; ++c) {
      const std::vector<double> f = extract_channel_features(sig.data[c].data() + start, lay.window_samples, psd);
      row.insert(row.end(), f.begin(), f.end());
    }
    fs_out.matrix.push_back(std::move(row));
  }
  return fs_out;
}

} // namespace neurosync
