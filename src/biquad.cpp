#include "neurosync/biquad.hpp"

#include "neurosync/errors.hpp"

#include <algorithm>
#include <cmath>
#include <string>

namespace neurosync {

static constexpr double kPi = 3.141592653589793238462643383279502884;

Biquad::Biquad(const BiquadCoeffs& c) : c_(c) {}

void Biquad::reset() {
  z1_ = 0.0;
  z2_ = 0.0;
}

double Biquad::reset_to_steady_state(double x0) {
  const double den = 1.0 + c_.a1 + c_.a2;
  if (std::fabs(den) < 1e-300) {
    reset();
    return 0.0;
  }
  const double y0 = x0 * (c_.b0 + c_.b1 + c_.b2) / den;
  z2_ = c_.b2 * x0 - c_.a2 * y0;
  z1_ = c_.b1 * x0 - c_.a1 * y0 + z2_;
  return y0;
}

double Biquad::process(double x) {
  const double y = c_.b0 * x + z1_;
  z1_ = c_.b1 * x - c_.a1 * y + z2_;
  z2_ = c_.b2 * x - c_.a2 * y;
  return y;
}

BiquadChain::BiquadChain(const std::vector<BiquadCoeffs>& stages) {
  for (const auto& c : stages) add_stage(c);
}

void BiquadChain::add_stage(const BiquadCoeffs& c) {
  stages_.emplace_back(c);
}

void BiquadChain::reset() {
  for (auto& s : stages_) s.reset();
}

void BiquadChain::reset_to_steady_state(double x0) {
  double in = x0;
  for (auto& s : stages_) {
    in = s.reset_to_steady_state(in);
  }
}

double BiquadChain::process(double x) {
  double y = x;
  for (auto& s : stages_) {
    y = s.process(y);
  }
  return y;
}

void BiquadChain::process_inplace(std::vector<double>* x) {
  if (!x) return;
  if (stages_.empty()) return;
  for (double& v : *x) {
    v = process(v);
  }
}

static void validate_design_inputs(double fs_hz, double f0_hz, double Q, const char* what) {
  if (!(fs_hz > 0.0)) throw ConfigurationError(std::string(what) + ": fs_hz must be > 0");
  if (!(f0_hz > 0.0)) throw ConfigurationError(std::string(what) + ": f0_hz must be > 0");
  if (!(f0_hz < 0.5 * fs_hz)) {
    throw ConfigurationError(std::string(what) + ": f0_hz must be < fs/2");
  }
  if (!(Q > 0.0)) throw ConfigurationError(std::string(what) + ": Q must be > 0");
}

static BiquadCoeffs normalize(double b0, double b1, double b2, double a0, double a1, double a2) {
  if (a0 == 0.0) throw std::runtime_error("biquad normalize: a0 is zero");
  BiquadCoeffs c;
  c.b0 = b0 / a0;
  c.b1 = b1 / a0;
  c.b2 = b2 / a0;
  c.a1 = a1 / a0;
  c.a2 = a2 / a0;
  return c;
}

BiquadCoeffs design_lowpass(double fs_hz, double f0_hz, double Q) {
  validate_design_inputs(fs_hz, f0_hz, Q, "design_lowpass");

  const double w0 = 2.0 * kPi * (f0_hz / fs_hz);
  const double cosw0 = std::cos(w0);
  const double alpha = std::sin(w0) / (2.0 * Q);

  return normalize((1.0 - cosw0) / 2.0, 1.0 - cosw0, (1.0 - cosw0) / 2.0,
                   1.0 + alpha, -2.0 * cosw0, 1.0 - alpha);
}

BiquadCoeffs design_highpass(double fs_hz, double f0_hz, double Q) {
  validate_design_inputs(fs_hz, f0_hz, Q, "design_highpass");

  const double w0 = 2.0 * kPi * (f0_hz / fs_hz);
  const double cosw0 = std::cos(w0);
  const double alpha = std::sin(w0) / (2.0 * Q);

  return normalize((1.0 + cosw0) / 2.0, -(1.0 + cosw0), (1.0 + cosw0) / 2.0,
                   1.0 + alpha, -2.0 * cosw0, 1.0 - alpha);
}

BiquadCoeffs design_notch(double fs_hz, double f0_hz, double Q) {
  validate_design_inputs(fs_hz, f0_hz, Q, "design_notch");

  const double w0 = 2.0 * kPi * (f0_hz / fs_hz);
  const double cosw0 = std::cos(w0);
  const double alpha = std::sin(w0) / (2.0 * Q);

  return normalize(1.0, -2.0 * cosw0, 1.0,
                   1.0 + alpha, -2.0 * cosw0, 1.0 - alpha);
}

BiquadCoeffs design_first_order_lowpass(double fs_hz, double f0_hz) {
  validate_design_inputs(fs_hz, f0_hz, 1.0, "design_first_order_lowpass");
  const double k = std::tan(kPi * f0_hz / fs_hz);
  return normalize(k, k, 0.0, 1.0 + k, k - 1.0, 0.0);
}

BiquadCoeffs design_first_order_highpass(double fs_hz, double f0_hz) {
  validate_design_inputs(fs_hz, f0_hz, 1.0, "design_first_order_highpass");
  const double k = std::tan(kPi * f0_hz / fs_hz);
  return normalize(1.0, -1.0, 0.0, 1.0 + k, k - 1.0, 0.0);
}

static double butterworth_section_q(int order, int k) {
  const double theta = static_cast<double>(2 * k + 1) * kPi / (2.0 * static_cast<double>(order));
  return 1.0 / (2.0 * std::cos(theta));
}

std::vector<BiquadCoeffs> design_butterworth_lowpass(double fs_hz, double f0_hz, int order) {
  if (order < 1) throw ConfigurationError("design_butterworth_lowpass: order must be >= 1");
  std::vector<BiquadCoeffs> stages;
  stages.reserve(static_cast<size_t>(order / 2 + 1));
  for (int k = 0; k < order / 2; ++k) {
    stages.push_back(design_lowpass(fs_hz, f0_hz, butterworth_section_q(order, k)));
  }
  if (order % 2 == 1) stages.push_back(design_first_order_lowpass(fs_hz, f0_hz));
  return stages;
}

std::vector<BiquadCoeffs> design_butterworth_highpass(double fs_hz, double f0_hz, int order) {
  if (order < 1) throw ConfigurationError("design_butterworth_highpass: order must be >= 1");
  std::vector<BiquadCoeffs> stages;
  stages.reserve(static_cast<size_t>(order / 2 + 1));
  for (int k = 0; k < order / 2; ++k) {
    stages.push_back(design_highpass(fs_hz, f0_hz, butterworth_section_q(order, k)));
  }
  if (order % 2 == 1) stages.push_back(design_first_order_highpass(fs_hz, f0_hz));
  return stages;
}

std::vector<BiquadCoeffs> design_butterworth_bandpass(double fs_hz, double lo_hz, double hi_hz, int order) {
  if (order < 2 || order % 2 != 0) {
    throw ConfigurationError("design_butterworth_bandpass: order must be even and >= 2");
  }
  if (!(lo_hz < hi_hz)) {
    throw ConfigurationError("design_butterworth_bandpass: requires lo_hz < hi_hz");
  }
  std::vector<BiquadCoeffs> stages = design_butterworth_highpass(fs_hz, lo_hz, order / 2);
  const std::vector<BiquadCoeffs> lp = design_butterworth_lowpass(fs_hz, hi_hz, order / 2);
  stages.insert(stages.end(), lp.begin(), lp.end());
  return stages;
}

static void odd_reflect_pad(const std::vector<float>& x, size_t padlen, std::vector<double>* out) {
  out->clear();
  const size_t n = x.size();
  out->reserve(n + 2 * padlen);

  const double first = static_cast<double>(x.front());
  const double last = static_cast<double>(x.back());

  // Left pad: 2*x[0] - x[padlen], ..., 2*x[0] - x[1]
  for (size_t i = 0; i < padlen; ++i) {
    out->push_back(2.0 * first - static_cast<double>(x[padlen - i]));
  }

  for (float v : x) out->push_back(static_cast<double>(v));

  // Right pad: 2*x[n-1] - x[n-2], ..., 2*x[n-1] - x[n-1-padlen]
  for (size_t i = 0; i < padlen; ++i) {
    out->push_back(2.0 * last - static_cast<double>(x[n - 2 - i]));
  }
}

void filtfilt_inplace(std::vector<float>* x,
                      const std::vector<BiquadCoeffs>& stages,
                      size_t padlen) {
  if (!x) return;
  const size_t n = x->size();
  if (n < 2) return;
  if (stages.empty()) return;

  const size_t max_pad = n - 1;
  const size_t default_pad = 6 * stages.size();
  if (padlen == 0) {
    padlen = std::min(default_pad, max_pad);
  } else {
    padlen = std::min(padlen, max_pad);
  }

  std::vector<double> xp;
  odd_reflect_pad(*x, padlen, &xp);

  // Forward
  BiquadChain chain(stages);
  chain.reset_to_steady_state(xp.front());
  chain.process_inplace(&xp);

  // Backward
  std::reverse(xp.begin(), xp.end());
  chain.reset_to_steady_state(xp.front());
  chain.process_inplace(&xp);
  std::reverse(xp.begin(), xp.end());

  // Unpad
  for (size_t i = 0; i < n; ++i) {
    (*x)[i] = static_cast<float>(xp[i + padlen]);
  }
}

} // namespace neurosync
