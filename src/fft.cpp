#include "neurosync/fft.hpp"

#include <cmath>
#include <stdexcept>

namespace neurosync {

bool is_power_of_two(size_t n) {
  return n != 0 && (n & (n - 1)) == 0;
}

size_t next_power_of_two(size_t n) {
  if (n == 0) throw std::runtime_error("next_power_of_two: n must be > 0");
  size_t p = 1;
  while (p < n) p <<= 1;
  return p;
}

FftPlan::FftPlan(size_t n) : n_(n) {
  if (!is_power_of_two(n)) {
    throw std::runtime_error("FftPlan: size must be a power of two");
  }

  unsigned bits = 0;
  while ((static_cast<size_t>(1) << bits) < n) ++bits;

  bitrev_.resize(n);
  for (size_t i = 0; i < n; ++i) {
    size_t x = i;
    size_t y = 0;
    for (unsigned b = 0; b < bits; ++b) {
      y = (y << 1) | (x & 1);
      x >>= 1;
    }
    bitrev_[i] = y;
  }

  const double pi = std::acos(-1.0);
  twiddle_.resize(n / 2);
  for (size_t k = 0; k < n / 2; ++k) {
    const double ang = -2.0 * pi * static_cast<double>(k) / static_cast<double>(n);
    twiddle_[k] = std::complex<double>(std::cos(ang), std::sin(ang));
  }
}

void FftPlan::execute(std::vector<std::complex<double>>& a, bool inverse) const {
  if (a.size() != n_) {
    throw std::runtime_error("FftPlan::execute: input size does not match plan size");
  }

  for (size_t i = 0; i < n_; ++i) {
    const size_t j = bitrev_[i];
    if (j > i) std::swap(a[i], a[j]);
  }

  for (size_t len = 2; len <= n_; len <<= 1) {
    const size_t half = len / 2;
    const size_t stride = n_ / len;
    for (size_t i = 0; i < n_; i += len) {
      for (size_t j = 0; j < half; ++j) {
        std::complex<double> w = twiddle_[j * stride];
        if (inverse) w = std::conj(w);
        const std::complex<double> u = a[i + j];
        const std::complex<double> v = a[i + j + half] * w;
        a[i + j] = u + v;
        a[i + j + half] = u - v;
      }
    }
  }

  if (inverse) {
    for (auto& x : a) x /= static_cast<double>(n_);
  }
}

void fft_inplace(std::vector<std::complex<double>>& a, bool inverse) {
  const FftPlan plan(a.size());
  plan.execute(a, inverse);
}

} // namespace neurosync
