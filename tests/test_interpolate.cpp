#include "neurosync/errors.hpp"
#include "neurosync/interpolate.hpp"

#include "test_support.hpp"

#include <cstddef>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

int main() {
  using namespace neurosync;

  // Nearest surviving index, ties to the lower index.
  {
    const std::vector<bool> mask = {false, true, false};
    TEST_CHECK(nearest_surviving_channel(mask, 1) == 0);
    TEST_CHECK(nearest_surviving_channel(mask, 2) == 2);

    const std::vector<bool> front_dead = {true, true, false, false};
    TEST_CHECK(nearest_surviving_channel(front_dead, 0) == 2);
    TEST_CHECK(nearest_surviving_channel(front_dead, 1) == 2);

    TEST_CHECK(neurosync_test::throws_as<InsufficientDataError>(
        [] { (void)nearest_surviving_channel(std::vector<bool>(3, true), 0); }));
  }

  // Interpolation applies only when fewer than half the channels are dead.
  TEST_CHECK(!should_interpolate(0, 8));
  TEST_CHECK(should_interpolate(1, 8));
  TEST_CHECK(should_interpolate(3, 8));
  TEST_CHECK(!should_interpolate(4, 8));
  TEST_CHECK(!should_interpolate(1, 2));
  TEST_CHECK(should_interpolate(1, 3));

  const std::vector<bool> dead = {false, true, false, false, true};
  const std::vector<std::string> names = {"Fp1", "Fp2", "C3", "C4", "Pz"};

  // Reduced layout: one row per survivor.
  {
    Signal reduced = make_signal(3, 8, 250.0);
    reduced.data[0].assign(8, 0.0f);
    reduced.data[1].assign(8, 2.0f);
    reduced.data[2].assign(8, 3.0f);
    reduced.data[2][4] = 7.5f;

    InterpolateReport rep;
    const Signal out = interpolate_dead_channels(reduced, dead, names, &rep);
    TEST_CHECK(out.n_channels() == 5);
    TEST_CHECK(out.n_samples() == 8);
    TEST_CHECK(out.channel_names == names);
    TEST_CHECK(out.fs_hz == 250.0);

    TEST_CHECK(out.data[0] == reduced.data[0]);
    TEST_CHECK(out.data[2] == reduced.data[1]);
    TEST_CHECK(out.data[3] == reduced.data[2]);
    TEST_CHECK(out.data[1] == out.data[0]);  // tie between 0 and 2 -> 0
    TEST_CHECK(out.data[4] == out.data[3]);  // verbatim copy, including the 7.5 sample

    TEST_CHECK(rep.interpolated.size() == 2);
    TEST_CHECK(rep.interpolated[0] == 1 && rep.sources[0] == 0);
    TEST_CHECK(rep.interpolated[1] == 4 && rep.sources[1] == 3);
  }

  // Full layout: dead rows are overwritten, names kept.
  {
    Signal full = make_signal(5, 4, 100.0);
    full.channel_names = names;
    for (size_t c = 0; c < 5; ++c) full.data[c].assign(4, static_cast<float>(10 * c));
    const Signal out = interpolate_dead_channels(full, dead);
    TEST_CHECK(out.channel_names == names);
    TEST_CHECK(out.data[1][0] == 0.0f);
    TEST_CHECK(out.data[4][0] == 30.0f);
    TEST_CHECK(out.data[2][0] == 20.0f);
  }

  // No dead channels: unchanged.
  {
    Signal s = make_signal(2, 3, 100.0);
    s.data[1].assign(3, 1.0f);
    const Signal out = interpolate_dead_channels(s, std::vector<bool>(2, false));
    TEST_CHECK(out.data == s.data);
  }

  TEST_CHECK(neurosync_test::throws_as<InsufficientDataError>([] {
    Signal s = make_signal(0, 0, 100.0);
    (void)interpolate_dead_channels(s, std::vector<bool>(3, true));
  }));
  TEST_CHECK(neurosync_test::throws_as<std::runtime_error>([&] {
    Signal s = make_signal(4, 3, 100.0);
    (void)interpolate_dead_channels(s, dead);
  }));

  std::cout << "OK\n";
  return 0;
}
