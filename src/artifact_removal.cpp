#include "neurosync/artifact_removal.hpp"

#include "neurosync/errors.hpp"

#include <cmath>
#include <stdexcept>
#include <string>
#include <utility>

namespace neurosync {

bool SampleRunScanner::next(SampleRun* out) {
  const std::vector<bool>& m = *mask_;
  const size_t n = m.size();
  while (pos_ < n && !m[pos_]) ++pos_;
  if (pos_ >= n) return false;

  const size_t start = pos_;
  while (pos_ < n && m[pos_]) ++pos_;
  if (out) {
    out->start = start;
    out->end = pos_;
  }
  return true;
}

std::vector<SampleRun> contiguous_runs(const std::vector<bool>& mask) {
  std::vector<SampleRun> runs;
  SampleRunScanner scan(mask);
  SampleRun r;
  while (scan.next(&r)) runs.push_back(r);
  return runs;
}

std::vector<double> tukey_window(size_t n, double r) {
  std::vector<double> w(n, 1.0);
  if (n <= 1) return w;
  if (r <= 0.0) return w;

  const double pi = std::acos(-1.0);
  const double denom = static_cast<double>(n - 1);

  if (r >= 1.0) {
    for (size_t i = 0; i < n; ++i) {
      w[i] = 0.5 - 0.5 * std::cos(2.0 * pi * static_cast<double>(i) / denom);
    }
    return w;
  }

  const double per = r / 2.0;
  // 1-based boundaries of the flat section: samples tl+1 .. th-1 are 1.0.
  const size_t tl = static_cast<size_t>(std::floor(per * denom)) + 1;
  const size_t th = n - tl + 1;
  for (size_t i = 0; i < n; ++i) {
    const size_t k = i + 1;
    const double t = static_cast<double>(i) / denom;
    if (k <= tl) {
      w[i] = 0.5 * (1.0 + std::cos(pi / per * (t - per)));
    } else if (k >= th) {
      w[i] = 0.5 * (1.0 + std::cos(pi / per * (t - 1.0 + per)));
    }
  }
  return w;
}

std::vector<double> run_attenuation_gain(size_t n, const ArtifactRemovalOptions& opt) {
  std::vector<double> g = tukey_window(n, opt.taper_fraction);
  const double fl = opt.attenuation_floor;
  for (double& v : g) v = fl + (1.0 - fl) * v;
  return g;
}

Signal remove_artifacts(const Signal& sig,
                        const ArtifactReport& report,
                        const ArtifactRemovalOptions& opt) {
  validate_signal_shape(sig, "remove_artifacts");
  require_nonempty(sig, "remove_artifacts");

  const size_t n_ch = sig.n_channels();
  const size_t n = sig.n_samples();
  if (report.combined_mask.size() != n) {
    throw std::runtime_error("remove_artifacts: artifact mask has " +
                             std::to_string(report.combined_mask.size()) +
                             " samples, signal has " + std::to_string(n));
  }
  if (report.dead_channels.size() != n_ch) {
    throw std::runtime_error("remove_artifacts: dead channel mask has " +
                             std::to_string(report.dead_channels.size()) +
                             " entries, signal has " + std::to_string(n_ch) + " channels");
  }
  if (!(opt.attenuation_floor >= 0.0) || opt.attenuation_floor > 1.0) {
    throw ConfigurationError("remove_artifacts: attenuation_floor must be in [0,1]");
  }

  Signal work = sig;

  SampleRunScanner scan(report.combined_mask);
  SampleRun r;
  while (scan.next(&r)) {
    const size_t len = r.length();
    if (len <= opt.min_run_samples) continue;
    const std::vector<double> g = run_attenuation_gain(len, opt);
    for (size_t c = 0; c < n_ch; ++c) {
      auto& x = work.data[c];
      for (size_t k = 0; k < len; ++k) {
        x[r.start + k] = static_cast<float>(static_cast<double>(x[r.start + k]) * g[k]);
      }
    }
  }

  if (!opt.drop_dead_channels || report.n_dead_channels() == 0) return work;

  Signal out;
  out.fs_hz = work.fs_hz;
  const bool has_names = !work.channel_names.empty();
  for (size_t c = 0; c < n_ch; ++c) {
    if (report.dead_channels[c]) continue;
    out.data.push_back(std::move(work.data[c]));
    if (has_names) out.channel_names.push_back(work.channel_names[c]);
  }
  return out;
}

} // namespace neurosync
