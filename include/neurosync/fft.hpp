#pragma once

#include <complex>
#include <cstddef>
#include <vector>

namespace neurosync {

// Returns true if n is a power of two (and n > 0).
bool is_power_of_two(size_t n);

// Returns the smallest power of two >= n (n must be > 0).
size_t next_power_of_two(size_t n);

// Precomputed radix-2 FFT of a fixed size.
//
// The bit-reversal permutation and twiddle factors are computed once, so the
// same plan can be reused for every segment of every feature window.
class FftPlan {
public:
  // n must be a power of two.
  explicit FftPlan(size_t n);

  size_t size() const { return n_; }

  // In-place transform. a.size() must equal size().
  // If inverse=true, computes the inverse FFT (and divides by N).
  void execute(std::vector<std::complex<double>>& a, bool inverse) const;

private:
  size_t n_{0};
  std::vector<size_t> bitrev_;
  std::vector<std::complex<double>> twiddle_;  // exp(-2 pi i k / n), k < n/2
};

// Convenience: one-shot transform with a temporary plan.
void fft_inplace(std::vector<std::complex<double>>& a, bool inverse);

} // namespace neurosync
