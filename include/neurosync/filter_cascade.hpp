#pragma once

#include "neurosync/biquad.hpp"
#include "neurosync/types.hpp"

#include <vector>

namespace neurosync {

// Offline filtering cascade applied to a raw recording.
//
// Steps (each per channel):
// 1) DC offset removal (subtract the channel mean)
// 2) Butterworth bandpass, zero-phase
// 3) powerline notch, zero-phase
//
// Zero-phase filtering keeps sample indices aligned with the raw recording, so
// artifact masks computed later refer to the same instants.
struct FilterCascadeOptions {
  bool remove_dc{true};

  // Bandpass corners in Hz and total filter order (even; each edge gets order/2).
  double bandpass_low_hz{1.0};
  double bandpass_high_hz{45.0};
  int bandpass_order{4};

  // Notch quality factor; the notch frequency is SamplingConfig::powerline_hz.
  bool notch{true};
  double notch_q{35.0};
};

// Throws ConfigurationError if the sampling rate cannot support the cascade:
// fs must exceed 2x the bandpass upper corner and 2x the notch frequency.
void validate_filter_config(const SamplingConfig& cfg, const FilterCascadeOptions& opt);

std::vector<BiquadCoeffs> make_bandpass_stages(const SamplingConfig& cfg, const FilterCascadeOptions& opt);
std::vector<BiquadCoeffs> make_notch_stages(const SamplingConfig& cfg, const FilterCascadeOptions& opt);

// Subtract each channel's mean over all samples (in-place).
void remove_dc_offset_inplace(Signal& sig);

Signal remove_dc_offset(const Signal& sig);

// Run the full cascade and return a new signal of identical shape.
Signal filter_cascade(const Signal& raw, const SamplingConfig& cfg, const FilterCascadeOptions& opt = {});

} // namespace neurosync
