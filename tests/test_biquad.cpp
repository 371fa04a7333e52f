#include "neurosync/biquad.hpp"
#include "neurosync/errors.hpp"

#include "test_support.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <iostream>
#include <vector>

static double rms(const std::vector<float>& x, size_t start = 0, size_t end = 0) {
  if (end == 0 || end > x.size()) end = x.size();
  start = std::min(start, end);
  double s2 = 0.0;
  size_t n = 0;
  for (size_t i = start; i < end; ++i) {
    const double v = static_cast<double>(x[i]);
    s2 += v * v;
    ++n;
  }
  return (n > 0) ? std::sqrt(s2 / static_cast<double>(n)) : 0.0;
}

static std::vector<float> sine(double fs_hz, double f_hz, double seconds, double amp = 1.0) {
  const size_t N = static_cast<size_t>(std::llround(seconds * fs_hz));
  std::vector<float> x;
  x.reserve(N);
  const double w = 2.0 * 3.141592653589793238462643383279502884 * f_hz;
  for (size_t n = 0; n < N; ++n) {
    const double t = static_cast<double>(n) / fs_hz;
    x.push_back(static_cast<float>(amp * std::sin(w * t)));
  }
  return x;
}

int main() {
  using namespace neurosync;
  const double fs = 250.0;

  // Causal notch: strong attenuation at 50 Hz, little at 10 Hz.
  {
    auto y50 = sine(fs, 50.0, 4.0);
    auto y10 = sine(fs, 10.0, 4.0);

    BiquadChain chain({design_notch(fs, 50.0, 30.0)});
    std::vector<double> d50(y50.begin(), y50.end());
    std::vector<double> d10(y10.begin(), y10.end());
    chain.reset();
    chain.process_inplace(&d50);
    chain.reset();
    chain.process_inplace(&d10);
    std::copy(d50.begin(), d50.end(), y50.begin());
    std::copy(d10.begin(), d10.end(), y10.begin());

    const size_t discard = static_cast<size_t>(fs * 1.0);
    const double r50 = rms(y50, discard);
    const double r10 = rms(y10, discard);
    if (!(r50 < 0.35)) {
      std::cerr << "Notch filter insufficient attenuation at 50 Hz: rms=" << r50 << "\n";
      return 1;
    }
    if (!(r10 > 0.60)) {
      std::cerr << "Notch filter overly attenuated 10 Hz: rms=" << r10 << "\n";
      return 1;
    }
  }

  // Butterworth section layout.
  {
    TEST_CHECK(design_butterworth_lowpass(fs, 40.0, 4).size() == 2);
    TEST_CHECK(design_butterworth_lowpass(fs, 40.0, 5).size() == 3);
    TEST_CHECK(design_butterworth_highpass(fs, 1.0, 1).size() == 1);
    TEST_CHECK(design_butterworth_bandpass(fs, 1.0, 45.0, 4).size() == 2);
    TEST_CHECK(design_butterworth_bandpass(fs, 30.0, 100.0, 8).size() == 4);
  }

  // Unity DC gain of a lowpass cascade: steady-state init makes a constant
  // input pass through unchanged from the first sample.
  {
    BiquadChain chain(design_butterworth_lowpass(fs, 20.0, 5));
    TEST_CHECK(chain.n_stages() == 3);
    chain.reset_to_steady_state(3.0);
    for (int i = 0; i < 10; ++i) {
      const double y = chain.process(3.0);
      TEST_CHECK(std::fabs(y - 3.0) < 1e-9);
    }
  }

  // Zero-phase bandpass: an in-band sine comes out aligned with the input.
  {
    const auto x = sine(fs, 10.0, 8.0, 5.0);
    auto y = x;
    filtfilt_inplace(&y, design_butterworth_bandpass(fs, 1.0, 45.0, 4));
    TEST_CHECK(y.size() == x.size());

    double max_err = 0.0;
    for (size_t i = 500; i + 500 < x.size(); ++i) {
      max_err = std::max(max_err, std::fabs(static_cast<double>(y[i]) - static_cast<double>(x[i])));
    }
    if (!(max_err < 0.1)) {
      std::cerr << "filtfilt phase/gain error too large: " << max_err << "\n";
      return 1;
    }

    // Out-of-band 100 Hz component is removed.
    auto z = sine(fs, 100.0, 8.0, 5.0);
    filtfilt_inplace(&z, design_butterworth_bandpass(fs, 1.0, 45.0, 4));
    TEST_CHECK(rms(z, 500, z.size() - 500) < 0.2);
  }

  // filtfilt leaves a constant untouched by a lowpass and tiny inputs alone.
  {
    std::vector<float> c(300, 2.5f);
    filtfilt_inplace(&c, design_butterworth_lowpass(fs, 30.0, 4));
    for (float v : c) TEST_CHECK(std::fabs(v - 2.5f) < 1e-4f);

    std::vector<float> one = {1.0f};
    filtfilt_inplace(&one, design_butterworth_lowpass(fs, 30.0, 4));
    TEST_CHECK(one[0] == 1.0f);
  }

  // Invalid designs are configuration errors.
  TEST_CHECK(neurosync_test::throws_as<ConfigurationError>([&] { (void)design_lowpass(fs, 125.0, 0.7); }));
  TEST_CHECK(neurosync_test::throws_as<ConfigurationError>([&] { (void)design_notch(fs, 0.0, 30.0); }));
  TEST_CHECK(neurosync_test::throws_as<ConfigurationError>([&] { (void)design_highpass(0.0, 1.0, 0.7); }));
  TEST_CHECK(neurosync_test::throws_as<ConfigurationError>(
      [&] { (void)design_butterworth_bandpass(fs, 1.0, 45.0, 3); }));
  TEST_CHECK(neurosync_test::throws_as<ConfigurationError>(
      [&] { (void)design_butterworth_bandpass(fs, 45.0, 1.0, 4); }));
  TEST_CHECK(neurosync_test::throws_as<ConfigurationError>(
      [&] { (void)design_butterworth_lowpass(fs, 10.0, 0); }));

  std::cout << "OK\n";
  return 0;
}
