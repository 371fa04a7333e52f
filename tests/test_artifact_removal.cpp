#include "neurosync/artifact_removal.hpp"
#include "neurosync/errors.hpp"

#include "test_support.hpp"

#include <cmath>
#include <cstddef>
#include <iostream>
#include <stdexcept>
#include <vector>

static bool approx(double a, double b, double eps) {
  return std::fabs(a - b) <= eps;
}

static neurosync::ArtifactReport make_report(size_t n_samples, size_t n_channels) {
  neurosync::ArtifactReport rep;
  rep.amplitude_mask.assign(n_samples, false);
  rep.muscle_mask.assign(n_samples, false);
  rep.combined_mask.assign(n_samples, false);
  rep.dead_channels.assign(n_channels, false);
  return rep;
}

int main() {
  using namespace neurosync;

  // Run grouping.
  {
    const std::vector<bool> mask = {false, true, true, false, false, true, false, true, true, true};
    const auto runs = contiguous_runs(mask);
    TEST_CHECK(runs.size() == 3);
    TEST_CHECK(runs[0].start == 1 && runs[0].end == 3);
    TEST_CHECK(runs[1].start == 5 && runs[1].end == 6 && runs[1].length() == 1);
    TEST_CHECK(runs[2].start == 7 && runs[2].end == 10);

    TEST_CHECK(contiguous_runs(std::vector<bool>(5, false)).empty());
    TEST_CHECK(contiguous_runs(std::vector<bool>()).empty());

    const std::vector<bool> all(4, true);
    SampleRunScanner scan(all);
    SampleRun r;
    TEST_CHECK(scan.next(&r));
    TEST_CHECK(r.start == 0 && r.end == 4);
    TEST_CHECK(!scan.next(&r));
  }

  // Tukey window.
  {
    TEST_CHECK(tukey_window(0, 0.3).empty());
    TEST_CHECK(tukey_window(1, 0.3).size() == 1 && tukey_window(1, 0.3)[0] == 1.0);

    for (double v : tukey_window(16, 0.0)) TEST_CHECK(v == 1.0);

    const auto hann = tukey_window(11, 1.0);
    TEST_CHECK(approx(hann[0], 0.0, 1e-12));
    TEST_CHECK(approx(hann[5], 1.0, 1e-12));
    TEST_CHECK(approx(hann[10], 0.0, 1e-12));

    const auto w = tukey_window(101, 0.3);
    TEST_CHECK(approx(w[0], 0.0, 1e-12));
    TEST_CHECK(approx(w[100], 0.0, 1e-12));
    TEST_CHECK(approx(w[50], 1.0, 1e-12));
    TEST_CHECK(approx(w[15], 1.0, 1e-12));
    TEST_CHECK(w[5] > 0.0 && w[5] < 1.0);
    for (size_t i = 0; i < w.size(); ++i) TEST_CHECK(approx(w[i], w[100 - i], 1e-9));
  }

  // Gain: floor at the run edges, full amplitude over the flat centre.
  {
    ArtifactRemovalOptions opt;
    const auto g = run_attenuation_gain(101, opt);
    TEST_CHECK(approx(g[0], 0.3, 1e-12));
    TEST_CHECK(approx(g[100], 0.3, 1e-12));
    TEST_CHECK(approx(g[50], 1.0, 1e-12));
    for (double v : g) TEST_CHECK(v >= 0.3 - 1e-12 && v <= 1.0 + 1e-12);

    // Gain is 0.3 + 0.7 * tukey, sample for sample.
    const auto w = tukey_window(101, 0.3);
    for (size_t i = 0; i < g.size(); ++i) TEST_CHECK(approx(g[i], 0.3 + 0.7 * w[i], 1e-12));
    // Rises from the edge into the centre.
    TEST_CHECK(g[5] > g[0] && g[10] > g[5]);
  }

  // Attenuation of long runs only.
  {
    Signal sig = make_signal(2, 200, 250.0);
    for (auto& ch : sig.data) ch.assign(200, 10.0f);
    ArtifactReport rep = make_report(200, 2);
    for (size_t i = 50; i < 100; ++i) rep.combined_mask[i] = true;   // 50 samples
    for (size_t i = 150; i < 156; ++i) rep.combined_mask[i] = true;  // 6 samples
    for (size_t i = 170; i < 180; ++i) rep.combined_mask[i] = true;  // exactly 10
    for (size_t i = 185; i < 196; ++i) rep.combined_mask[i] = true;  // 11

    const Signal out = remove_artifacts(sig, rep);
    TEST_CHECK(out.n_channels() == 2);
    TEST_CHECK(out.n_samples() == 200);
    for (size_t c = 0; c < 2; ++c) {
      TEST_CHECK(out.data[c][49] == 10.0f);
      TEST_CHECK(approx(out.data[c][50], 3.0, 1e-5));
      TEST_CHECK(approx(out.data[c][75], 10.0, 1e-5));
      TEST_CHECK(approx(out.data[c][99], 3.0, 1e-5));
      TEST_CHECK(out.data[c][100] == 10.0f);
      for (size_t i = 150; i < 180; ++i) TEST_CHECK(out.data[c][i] == 10.0f);
      TEST_CHECK(approx(out.data[c][185], 3.0, 1e-5));
      TEST_CHECK(approx(out.data[c][190], 10.0, 1e-5));
    }

    // A custom floor and run threshold.
    ArtifactRemovalOptions opt;
    opt.attenuation_floor = 0.5;
    opt.min_run_samples = 100;
    const Signal out2 = remove_artifacts(sig, rep, opt);
    TEST_CHECK(out2.data == sig.data);

    opt.min_run_samples = 10;
    const Signal out3 = remove_artifacts(sig, rep, opt);
    TEST_CHECK(approx(out3.data[0][50], 5.0, 1e-5));
    TEST_CHECK(approx(out3.data[0][75], 10.0, 1e-5));
  }

  // Dead channels are dropped, order and names of survivors preserved.
  {
    Signal sig = make_signal(4, 30, 100.0);
    sig.channel_names = {"A", "B", "C", "D"};
    for (size_t c = 0; c < 4; ++c) sig.data[c].assign(30, static_cast<float>(c + 1));
    ArtifactReport rep = make_report(30, 4);
    rep.dead_channels[1] = true;
    rep.dead_channels[3] = true;

    const Signal out = remove_artifacts(sig, rep);
    TEST_CHECK(out.n_channels() == 2);
    TEST_CHECK(out.n_samples() == 30);
    TEST_CHECK(out.channel_names.size() == 2);
    TEST_CHECK(out.channel_names[0] == "A" && out.channel_names[1] == "C");
    TEST_CHECK(out.data[0][0] == 1.0f && out.data[1][0] == 3.0f);
    TEST_CHECK(out.fs_hz == 100.0);

    ArtifactRemovalOptions keep;
    keep.drop_dead_channels = false;
    TEST_CHECK(remove_artifacts(sig, rep, keep).n_channels() == 4);
  }

  // Shape mismatches and empty input.
  {
    Signal sig = make_signal(2, 10, 100.0);
    TEST_CHECK(neurosync_test::throws_as<std::runtime_error>([&] { (void)remove_artifacts(sig, make_report(9, 2)); }));
    TEST_CHECK(neurosync_test::throws_as<std::runtime_error>([&] { (void)remove_artifacts(sig, make_report(10, 3)); }));
    Signal empty = make_signal(2, 0, 100.0);
    TEST_CHECK(neurosync_test::throws_as<DegenerateSignalError>(
        [&] { (void)remove_artifacts(empty, make_report(0, 2)); }));
  }

  std::cout << "OK\n";
  return 0;
}
