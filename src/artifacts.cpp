#include "neurosync/artifacts.hpp"

#include "neurosync/biquad.hpp"
#include "neurosync/config.hpp"
#include "neurosync/errors.hpp"
#include "neurosync/moments.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <vector>

namespace neurosync {

size_t ArtifactReport::n_artifact_samples() const {
  return static_cast<size_t>(std::count(combined_mask.begin(), combined_mask.end(), true));
}

size_t ArtifactReport::n_dead_channels() const {
  return static_cast<size_t>(std::count(dead_channels.begin(), dead_channels.end(), true));
}

std::vector<size_t> ArtifactReport::dead_channel_indices() const {
  std::vector<size_t> out;
  for (size_t c = 0; c < dead_channels.size(); ++c) {
    if (dead_channels[c]) out.push_back(c);
  }
  return out;
}

std::vector<double> moving_rms(const std::vector<float>& x, size_t window) {
  const size_t n = x.size();
  std::vector<double> out(n, 0.0);
  if (n == 0) return out;
  if (window < 1) window = 1;

  // Prefix sums of squares.
  std::vector<double> cs(n + 1, 0.0);
  for (size_t i = 0; i < n; ++i) {
    const double v = static_cast<double>(x[i]);
    cs[i + 1] = cs[i] + v * v;
  }

  const size_t before = window / 2;
  const size_t after = (window % 2 == 1) ? before : (before > 0 ? before - 1 : 0);

  for (size_t i = 0; i < n; ++i) {
    const size_t lo = (i >= before) ? i - before : 0;
    const size_t hi = std::min(n - 1, i + after);
    const double ms = (cs[hi + 1] - cs[lo]) / static_cast<double>(hi - lo + 1);
    out[i] = std::sqrt(std::max(0.0, ms));
  }
  return out;
}

namespace {

void validate_options(const ArtifactDetectionOptions& opt) {
  if (!(opt.amplitude_threshold > 0.0)) {
    throw ConfigurationError("detect_artifacts: amplitude_threshold must be > 0");
  }
  if (!(opt.muscle_rms_window_seconds > 0.0)) {
    throw ConfigurationError("detect_artifacts: muscle_rms_window_seconds must be > 0");
  }
  if (!(opt.muscle_rms_std_factor > 0.0)) {
    throw ConfigurationError("detect_artifacts: muscle_rms_std_factor must be > 0");
  }
  if (opt.dead_channel_std < 0.0) {
    throw ConfigurationError("detect_artifacts: dead_channel_std must be >= 0");
  }
}

std::vector<BiquadCoeffs> make_muscle_stages(double fs_hz, const ArtifactDetectionOptions& opt) {
  const double nyq = 0.5 * fs_hz;
  if (!(opt.muscle_low_hz > 0.0) || !(opt.muscle_low_hz < nyq)) {
    throw ConfigurationError("detect_artifacts: muscle_low_hz must be in (0, fs/2)");
  }
  if (opt.muscle_high_hz >= nyq) {
    return design_butterworth_highpass(fs_hz, opt.muscle_low_hz, std::max(1, opt.muscle_filter_order / 2));
  }
  return design_butterworth_bandpass(fs_hz, opt.muscle_low_hz, opt.muscle_high_hz, opt.muscle_filter_order);
}

} // namespace

ArtifactReport detect_artifacts(const Signal& sig,
                                const SamplingConfig& cfg,
                                const ArtifactDetectionOptions& opt) {
  validate_signal_shape(sig, "detect_artifacts");
  require_nonempty(sig, "detect_artifacts");
  const SamplingConfig rc = resolve_sampling_config(cfg, sig);
  validate_options(opt);

  const size_t n_ch = sig.n_channels();
  const size_t n = sig.n_samples();
  const double fs = rc.sampling_rate_hz;

  ArtifactReport rep;
  rep.amplitude_mask.assign(n, false);
  rep.muscle_mask.assign(n, false);
  rep.combined_mask.assign(n, false);
  rep.dead_channels.assign(n_ch, false);

  // 1) Amplitude: OR across channels.
  for (size_t c = 0; c < n_ch; ++c) {
    const auto& x = sig.data[c];
    for (size_t i = 0; i < n; ++i) {
      if (std::fabs(static_cast<double>(x[i])) > opt.amplitude_threshold) rep.amplitude_mask[i] = true;
    }
  }

  // 2) Muscle: moving RMS of the high-frequency band on the leading channels.
  const size_t n_muscle = std::min(opt.muscle_max_channels, n_ch);
  if (n_muscle > 0) {
    const auto stages = make_muscle_stages(fs, opt);
    const size_t rms_win =
        std::max<size_t>(1, static_cast<size_t>(std::llround(opt.muscle_rms_window_seconds * fs)));

    for (size_t c = 0; c < n_muscle; ++c) {
      std::vector<float> hf = sig.data[c];
      filtfilt_inplace(&hf, stages);
      const std::vector<double> rms = moving_rms(hf, rms_win);
      const double thr = opt.muscle_rms_std_factor * stddev_sample(rms.data(), rms.size());
      for (size_t i = 0; i < n; ++i) {
        if (rms[i] > thr) rep.muscle_mask[i] = true;
      }
    }
  }

  // 3) Dead channels.
  for (size_t c = 0; c < n_ch; ++c) {
    const double sd = stddev_sample(sig.data[c].data(), n);
    rep.dead_channels[c] = sd < opt.dead_channel_std;
  }

  size_t n_bad = 0;
  for (size_t i = 0; i < n; ++i) {
    const bool bad = rep.amplitude_mask[i] || rep.muscle_mask[i];
    rep.combined_mask[i] = bad;
    if (bad) ++n_bad;
  }
  rep.artifact_percentage = 100.0 * static_cast<double>(n_bad) / static_cast<double>(n);
  return rep;
}

} // namespace neurosync
