#include "neurosync/filter_cascade.hpp"

#include "neurosync/config.hpp"
#include "neurosync/errors.hpp"

#include <string>

namespace neurosync {

void validate_filter_config(const SamplingConfig& cfg, const FilterCascadeOptions& opt) {
  validate_sampling_config(cfg);
  const double fs = cfg.sampling_rate_hz;

  if (!(opt.bandpass_low_hz > 0.0) || !(opt.bandpass_low_hz < opt.bandpass_high_hz)) {
    throw ConfigurationError("filter_cascade: requires 0 < bandpass_low_hz < bandpass_high_hz");
  }
  if (!(fs > 2.0 * opt.bandpass_high_hz)) {
    throw ConfigurationError("filter_cascade: sampling rate " + std::to_string(fs) +
                             " Hz is too low for a " + std::to_string(opt.bandpass_high_hz) +
                             " Hz bandpass corner");
  }
  if (opt.notch) {
    if (!(opt.notch_q > 0.0)) throw ConfigurationError("filter_cascade: notch_q must be > 0");
    if (!(fs > 2.0 * cfg.powerline_hz)) {
      throw ConfigurationError("filter_cascade: sampling rate " + std::to_string(fs) +
                               " Hz is too low for a " + std::to_string(cfg.powerline_hz) +
                               " Hz notch");
    }
  }
}

std::vector<BiquadCoeffs> make_bandpass_stages(const SamplingConfig& cfg, const FilterCascadeOptions& opt) {
  return design_butterworth_bandpass(cfg.sampling_rate_hz, opt.bandpass_low_hz, opt.bandpass_high_hz,
                                     opt.bandpass_order);
}

std::vector<BiquadCoeffs> make_notch_stages(const SamplingConfig& cfg, const FilterCascadeOptions& opt) {
  std::vector<BiquadCoeffs> stages;
  if (opt.notch) stages.push_back(design_notch(cfg.sampling_rate_hz, cfg.powerline_hz, opt.notch_q));
  return stages;
}

void remove_dc_offset_inplace(Signal& sig) {
  for (auto& ch : sig.data) {
    if (ch.empty()) continue;
    double m = 0.0;
    for (float v : ch) m += static_cast<double>(v);
    m /= static_cast<double>(ch.size());
    for (float& v : ch) v = static_cast<float>(static_cast<double>(v) - m);
  }
}

Signal remove_dc_offset(const Signal& sig) {
  Signal out = sig;
  remove_dc_offset_inplace(out);
  return out;
}

Signal filter_cascade(const Signal& raw, const SamplingConfig& cfg, const FilterCascadeOptions& opt) {
  validate_signal_shape(raw, "filter_cascade");
  require_nonempty(raw, "filter_cascade");
  const SamplingConfig rc = resolve_sampling_config(cfg, raw);
  validate_filter_config(rc, opt);

  const auto bandpass = make_bandpass_stages(rc, opt);
  const auto notch = make_notch_stages(rc, opt);

  Signal out = raw;
  out.fs_hz = rc.sampling_rate_hz;
  if (opt.remove_dc) remove_dc_offset_inplace(out);

  // Two separate forward-backward passes: the notch sees the bandpassed signal.
  for (auto& ch : out.data) {
    filtfilt_inplace(&ch, bandpass);
    if (!notch.empty()) filtfilt_inplace(&ch, notch);
  }
  return out;
}

} // namespace neurosync
