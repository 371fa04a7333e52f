#include "neurosync/spectral_features.hpp"

#include <cstddef>
#include <stdexcept>
#include <string>

namespace neurosync {

namespace {

void check_psd(const PsdResult& psd, const char* what) {
  if (psd.freqs_hz.size() != psd.psd.size()) {
    throw std::runtime_error(std::string(what) + ": freqs/psd size mismatch");
  }
}

} // namespace

double spectral_total_power(const PsdResult& psd) {
  check_psd(psd, "spectral_total_power");
  double s = 0.0;
  for (double p : psd.psd) s += p;
  return s;
}

double spectral_band_power(const PsdResult& psd, double fmin_hz, double fmax_hz) {
  check_psd(psd, "spectral_band_power");
  double s = 0.0;
  for (size_t k = 0; k < psd.psd.size(); ++k) {
    const double f = psd.freqs_hz[k];
    if (f >= fmin_hz && f <= fmax_hz) s += psd.psd[k];
  }
  return s;
}

double spectral_edge_frequency(const PsdResult& psd, double edge) {
  if (!(edge > 0.0) || edge > 1.0) {
    throw std::runtime_error("spectral_edge_frequency: edge must be in (0,1]");
  }
  const double total = spectral_total_power(psd);
  if (!(total > 0.0)) return 0.0;

  const double target = edge * total;
  double cum = 0.0;
  for (size_t k = 0; k < psd.psd.size(); ++k) {
    cum += psd.psd[k];
    if (cum >= target) return psd.freqs_hz[k];
  }
  // Rounding can leave cum a hair below target.
  return psd.freqs_hz.empty() ? 0.0 : psd.freqs_hz.back();
}

double spectral_mean_frequency(const PsdResult& psd) {
  const double total = spectral_total_power(psd);
  if (total == 0.0) return 0.0;
  double s = 0.0;
  for (size_t k = 0; k < psd.psd.size(); ++k) s += psd.freqs_hz[k] * psd.psd[k];
  return s / total;
}

const std::vector<BandDefinition>& default_eeg_bands() {
  static const std::vector<BandDefinition> bands = {
      {"Delta", 1.0, 4.0},
      {"Theta", 4.0, 8.0},
      {"Alpha", 8.0, 13.0},
      {"Beta", 13.0, 30.0},
      {"Gamma", 30.0, 45.0},
  };
  return bands;
}

} // namespace neurosync
