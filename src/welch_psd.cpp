#include "neurosync/welch_psd.hpp"

#include "neurosync/errors.hpp"

#include <cmath>
#include <complex>
#include <stdexcept>
#include <string>
#include <utility>

namespace neurosync {

static std::vector<double> hann_window(size_t n) {
  std::vector<double> w(n, 1.0);
  if (n <= 1) return w;
  const double pi = std::acos(-1.0);
  for (size_t i = 0; i < n; ++i) {
    w[i] = 0.5 - 0.5 * std::cos(2.0 * pi * static_cast<double>(i) / static_cast<double>(n - 1));
  }
  return w;
}

static size_t checked_nperseg(double fs_hz, const WelchOptions& opt) {
  if (!(fs_hz > 0.0)) throw ConfigurationError("WelchEstimator: fs_hz must be > 0");
  if (opt.overlap_fraction < 0.0 || opt.overlap_fraction >= 1.0) {
    throw ConfigurationError("WelchEstimator: overlap_fraction must be in [0,1)");
  }
  if (opt.nperseg < 2) throw ConfigurationError("WelchEstimator: nperseg must be >= 2");
  return opt.nperseg;
}

WelchEstimator::WelchEstimator(double fs_hz, const WelchOptions& opt)
    : fs_hz_(fs_hz),
      nperseg_(checked_nperseg(fs_hz, opt)),
      detrend_(opt.detrend_constant),
      window_(hann_window(nperseg_)),
      plan_(next_power_of_two(nperseg_)) {
  const size_t noverlap = static_cast<size_t>(std::floor(static_cast<double>(nperseg_) * opt.overlap_fraction));
  hop_ = (nperseg_ > noverlap) ? (nperseg_ - noverlap) : 1;

  for (double wi : window_) window_power_ += wi * wi;
  if (window_power_ <= 0.0) throw std::runtime_error("WelchEstimator: invalid window normalization");

  const size_t nfft = plan_.size();
  const size_t nfreq = nfft / 2 + 1;
  freqs_.resize(nfreq);
  for (size_t k = 0; k < nfreq; ++k) {
    freqs_[k] = static_cast<double>(k) * fs_hz_ / static_cast<double>(nfft);
  }
}

PsdResult WelchEstimator::compute(const float* x, size_t n) const {
  if (!x || n < nperseg_) {
    throw InsufficientDataError("WelchEstimator::compute: need at least " + std::to_string(nperseg_) +
                                " samples, got " + std::to_string(n));
  }

  const size_t nfft = plan_.size();
  const size_t nfreq = freqs_.size();
  const double scale = 1.0 / (fs_hz_ * window_power_);

  std::vector<double> pxx_acc(nfreq, 0.0);
  std::vector<std::complex<double>> buf(nfft);
  size_t nsegments = 0;

  for (size_t start = 0; start + nperseg_ <= n; start += hop_) {
    double m = 0.0;
    if (detrend_) {
      for (size_t i = 0; i < nperseg_; ++i) m += static_cast<double>(x[start + i]);
      m /= static_cast<double>(nperseg_);
    }

    for (size_t i = 0; i < nperseg_; ++i) {
      buf[i] = std::complex<double>((static_cast<double>(x[start + i]) - m) * window_[i], 0.0);
    }
    for (size_t i = nperseg_; i < nfft; ++i) buf[i] = std::complex<double>(0.0, 0.0);

    plan_.execute(buf, /*inverse=*/false);

    for (size_t k = 0; k < nfreq; ++k) {
      double p = std::norm(buf[k]) * scale;
      // One-sided PSD (double non-DC/non-Nyquist)
      if (k != 0 && k != nfft / 2) p *= 2.0;
      pxx_acc[k] += p;
    }

    ++nsegments;
  }

  for (double& v : pxx_acc) v /= static_cast<double>(nsegments);

  PsdResult out;
  out.freqs_hz = freqs_;
  out.psd = std::move(pxx_acc);
  return out;
}

PsdResult welch_psd(const std::vector<float>& x, double fs_hz, const WelchOptions& opt) {
  if (x.size() < 2) throw InsufficientDataError("welch_psd: need at least 2 samples");

  WelchOptions o = opt;
  if (o.nperseg < 8) o.nperseg = 8;
  if (o.nperseg > x.size()) o.nperseg = x.size();

  const WelchEstimator est(fs_hz, o);
  return est.compute(x);
}

} // namespace neurosync
