#include "neurosync/errors.hpp"
#include "neurosync/features.hpp"
#include "neurosync/online_features.hpp"

#include "test_support.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

static bool approx(double a, double b, double eps) {
  return std::fabs(a - b) <= eps * std::max(1.0, std::fabs(b));
}

int main() {
  using namespace neurosync;
  const double fs = 250.0;
  const double pi = 3.141592653589793238462643383279502884;

  const size_t n = 2500;
  Signal sig = make_signal(2, n, fs);
  sig.channel_names = {"C3", "C4"};
  for (size_t i = 0; i < n; ++i) {
    const double t = static_cast<double>(i) / fs;
    sig.data[0][i] = static_cast<float>(8.0 * std::sin(2.0 * pi * 10.0 * t) + 2.0 * std::sin(2.0 * pi * 3.0 * t));
    sig.data[1][i] = static_cast<float>(4.0 * std::sin(2.0 * pi * 22.0 * t + 0.4));
  }

  SamplingConfig cfg;
  cfg.sampling_rate_hz = fs;
  const FeatureSet batch = extract_features(sig, cfg);
  TEST_CHECK(batch.n_windows() == 9);

  OnlineFeatureExtractor ex(sig.channel_names, fs);
  TEST_CHECK(ex.n_channels() == 2);
  TEST_CHECK(ex.window_samples() == 500);
  TEST_CHECK(ex.step_samples() == 250);
  TEST_CHECK(ex.feature_names() == batch.names);

  auto feed = [&](std::vector<OnlineFeatureFrame>* frames) {
    const size_t block = 37;
    for (size_t pos = 0; pos < n; pos += block) {
      const size_t len = std::min(block, n - pos);
      std::vector<std::vector<float>> b(2, std::vector<float>(len));
      for (size_t c = 0; c < 2; ++c) {
        for (size_t i = 0; i < len; ++i) b[c][i] = sig.data[c][pos + i];
      }
      const auto out = ex.push_block(b);
      frames->insert(frames->end(), out.begin(), out.end());
    }
  };

  std::vector<OnlineFeatureFrame> frames;
  feed(&frames);
  TEST_CHECK(frames.size() == batch.n_windows());
  for (size_t w = 0; w < frames.size(); ++w) {
    const OnlineFeatureFrame& fr = frames[w];
    TEST_CHECK(fr.window_start == batch.window_starts[w]);
    TEST_CHECK(approx(fr.t_end_sec, static_cast<double>(fr.window_start + 500) / fs, 1e-12));
    TEST_CHECK(fr.values.size() == batch.matrix[w].size());
    for (size_t k = 0; k < fr.values.size(); ++k) {
      TEST_CHECK(approx(fr.values[k], batch.matrix[w][k], 1e-9));
    }
  }

  // An empty block produces nothing.
  TEST_CHECK(ex.push_block({}).empty());

  // After reset the stream starts over.
  ex.reset();
  std::vector<OnlineFeatureFrame> again;
  feed(&again);
  TEST_CHECK(again.size() == frames.size());
  TEST_CHECK(again.front().window_start == 0);
  TEST_CHECK(again.front().values == frames.front().values);

  // Channel count mismatch.
  TEST_CHECK(neurosync_test::throws_as<std::runtime_error>(
      [&] { (void)ex.push_block(std::vector<std::vector<float>>(3, std::vector<float>(4, 0.0f))); }));
  // Ragged block.
  TEST_CHECK(neurosync_test::throws_as<std::runtime_error>([&] {
    std::vector<std::vector<float>> b(2);
    b[0].assign(4, 0.0f);
    b[1].assign(3, 0.0f);
    (void)ex.push_block(b);
  }));

  TEST_CHECK(neurosync_test::throws_as<ConfigurationError>(
      [&] { OnlineFeatureExtractor bad(std::vector<std::string>{}, fs); }));
  TEST_CHECK(neurosync_test::throws_as<ConfigurationError>(
      [&] { OnlineFeatureExtractor bad(sig.channel_names, 0.0); }));

  std::cout << "OK\n";
  return 0;
}
