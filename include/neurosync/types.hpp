#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace neurosync {

// Multi-channel time series.
//
// Notes:
// - data[ch][sample], all rows share the same length.
// - channel_names is optional: it is either empty or has one entry per row.
// - fs_hz is informational for stages that take a SamplingConfig; when both are
//   set they must agree.
struct Signal {
  std::vector<std::string> channel_names;
  double fs_hz{0.0};
  std::vector<std::vector<float>> data;

  size_t n_channels() const { return data.size(); }
  size_t n_samples() const { return data.empty() ? 0 : data[0].size(); }
};

// Sampling parameters shared by every stage of one pipeline run.
struct SamplingConfig {
  double sampling_rate_hz{0.0};
  double powerline_hz{50.0};

  // 0 => derive from the signal (see resolve_sampling_config).
  size_t channel_count{0};
};

struct PsdResult {
  std::vector<double> freqs_hz;  // length = n_freq_bins
  std::vector<double> psd;       // same length, units ~ (signal_unit^2 / Hz)
};

struct BandDefinition {
  std::string name;
  double fmin_hz{0.0};
  double fmax_hz{0.0};
};

// Allocate a zero-filled signal.
Signal make_signal(size_t n_channels, size_t n_samples, double fs_hz);

// Throws std::runtime_error if rows have different lengths or channel_names
// has the wrong size. `what` prefixes the message.
void validate_signal_shape(const Signal& sig, const char* what);

// Throws DegenerateSignalError if the signal has no channels or no samples.
void require_nonempty(const Signal& sig, const char* what);

} // namespace neurosync
