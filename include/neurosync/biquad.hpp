#pragma once

#include <cstddef>
#include <vector>

namespace neurosync {

// Normalized biquad coefficients for Direct Form II Transposed:
//
//   y[n] = b0*x[n] + b1*x[n-1] + b2*x[n-2] - a1*y[n-1] - a2*y[n-2]
//
// with a0 assumed to be 1.0 (i.e., b* and a* already divided by a0).
// First-order sections are stored with b2 = a2 = 0.
struct BiquadCoeffs {
  double b0{1.0};
  double b1{0.0};
  double b2{0.0};
  double a1{0.0};
  double a2{0.0};
};

class Biquad {
public:
  Biquad() = default;
  explicit Biquad(const BiquadCoeffs& c);

  const BiquadCoeffs& coeffs() const { return c_; }

  void reset();

  // Set the internal state to the steady state reached after an infinitely
  // long constant input x0. Returns the steady-state output (DC gain * x0).
  // Falls back to reset() (and returns 0) when the section has a pole at DC.
  double reset_to_steady_state(double x0);

  double process(double x);

private:
  BiquadCoeffs c_{};
  double z1_{0.0};
  double z2_{0.0};
};

// A small cascade of biquad filters.
class BiquadChain {
public:
  BiquadChain() = default;
  explicit BiquadChain(const std::vector<BiquadCoeffs>& stages);

  void add_stage(const BiquadCoeffs& c);
  void reset();

  // Steady-state initialization of every stage for a constant input x0
  // (the cascade equivalent of scipy's sosfilt_zi * x0).
  void reset_to_steady_state(double x0);

  size_t n_stages() const { return stages_.size(); }
  bool empty() const { return stages_.empty(); }

  double process(double x);
  void process_inplace(std::vector<double>* x);

private:
  std::vector<Biquad> stages_;
};

// Design helpers (RBJ-style biquad cookbook forms).
BiquadCoeffs design_lowpass(double fs_hz, double f0_hz, double Q);
BiquadCoeffs design_highpass(double fs_hz, double f0_hz, double Q);
BiquadCoeffs design_notch(double fs_hz, double f0_hz, double Q);

// First-order bilinear sections (used for odd Butterworth orders).
BiquadCoeffs design_first_order_lowpass(double fs_hz, double f0_hz);
BiquadCoeffs design_first_order_highpass(double fs_hz, double f0_hz);

// Butterworth filters of arbitrary order as a cascade of second-order
// sections (plus one first-order section when order is odd).
//
// Section k uses Q_k = 1 / (2 cos((2k+1) pi / (2 order))).
std::vector<BiquadCoeffs> design_butterworth_lowpass(double fs_hz, double f0_hz, int order);
std::vector<BiquadCoeffs> design_butterworth_highpass(double fs_hz, double f0_hz, int order);

// Butterworth bandpass of total order `order` (must be even): a highpass at
// lo_hz and a lowpass at hi_hz, each of order/2.
//
// Throws ConfigurationError for invalid corners (<= 0, >= Nyquist, lo >= hi)
// or an invalid order.
std::vector<BiquadCoeffs> design_butterworth_bandpass(double fs_hz, double lo_hz, double hi_hz, int order);

// Forward-backward filtering ("filtfilt"-style) using a cascade of biquads.
//
// - Extends the signal at both ends by odd reflection (2*x[0] - x[k]).
// - Initializes the cascade to its steady state for the first padded sample,
//   applies it forward, then reverses and applies it again.
// - Produces zero phase distortion (no group delay).
//
// padlen:
// - If 0, a conservative default based on #stages is used.
void filtfilt_inplace(std::vector<float>* x,
                      const std::vector<BiquadCoeffs>& stages,
                      size_t padlen = 0);

} // namespace neurosync
