#pragma once

#include "neurosync/types.hpp"

#include <vector>

namespace neurosync {

// Spectral summary features on a one-sided PSD, computed as bin sums over the
// sampled grid (no trapezoidal integration). Every feature falls back to 0
// when the total power is 0, so an all-zero window never raises.

// Sum of PSD over all bins.
double spectral_total_power(const PsdResult& psd);

// Sum of PSD over bins with fmin_hz <= f <= fmax_hz (both edges inclusive).
double spectral_band_power(const PsdResult& psd, double fmin_hz, double fmax_hz);

// Frequency of the first bin at which the cumulative power reaches
// edge * total. Returns 0 when the total power is <= 0.
double spectral_edge_frequency(const PsdResult& psd, double edge = 0.95);

// sum(f * PSD) / sum(PSD). Returns 0 when the total power is 0.
double spectral_mean_frequency(const PsdResult& psd);

// Delta [1,4], theta [4,8], alpha [8,13], beta [13,30], gamma [30,45] Hz.
const std::vector<BandDefinition>& default_eeg_bands();

} // namespace neurosync
