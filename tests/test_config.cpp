#include "neurosync/config.hpp"
#include "neurosync/errors.hpp"
#include "neurosync/types.hpp"

#include "test_support.hpp"

#include <iostream>
#include <map>
#include <string>

int main() {
  using namespace neurosync;

  // key=value pairs
  {
    const auto kv = parse_config_pairs(" samplingRate = 250 , powerlineFrequency=60,,");
    TEST_CHECK(kv.size() == 2);
    TEST_CHECK(kv.at("samplingRate") == "250");
    TEST_CHECK(kv.at("powerlineFrequency") == "60");

    const SamplingConfig cfg = sampling_config_from_map(kv);
    TEST_CHECK(cfg.sampling_rate_hz == 250.0);
    TEST_CHECK(cfg.powerline_hz == 60.0);
    TEST_CHECK(cfg.channel_count == 0);
  }

  // Defaults and snake_case aliases.
  {
    std::map<std::string, std::string> kv;
    kv["sampling_rate"] = "512";
    kv["channels"] = "8";
    const SamplingConfig cfg = sampling_config_from_map(kv);
    TEST_CHECK(cfg.sampling_rate_hz == 512.0);
    TEST_CHECK(cfg.powerline_hz == 50.0);
    TEST_CHECK(cfg.channel_count == 8);
  }

  // JSON object, numbers or quoted numbers.
  {
    const SamplingConfig cfg = sampling_config_from_json(
        "{ \"samplingRate\": 250, \"powerlineFrequency\": \"60\", \"channelCount\": 4 }");
    TEST_CHECK(cfg.sampling_rate_hz == 250.0);
    TEST_CHECK(cfg.powerline_hz == 60.0);
    TEST_CHECK(cfg.channel_count == 4);
  }

  // Invalid configurations.
  TEST_CHECK(neurosync_test::throws_as<ConfigurationError>(
      [] { (void)sampling_config_from_map(parse_config_pairs("powerlineFrequency=50")); }));
  TEST_CHECK(neurosync_test::throws_as<ConfigurationError>(
      [] { (void)sampling_config_from_map(parse_config_pairs("samplingRate=250,powerlineFrequency=55")); }));
  TEST_CHECK(neurosync_test::throws_as<ConfigurationError>(
      [] { (void)sampling_config_from_map(parse_config_pairs("samplingRate=0")); }));
  TEST_CHECK(neurosync_test::throws_as<ConfigurationError>(
      [] { (void)sampling_config_from_map(parse_config_pairs("samplingRate=abc")); }));
  TEST_CHECK(neurosync_test::throws_as<ConfigurationError>(
      [] { (void)sampling_config_from_map(parse_config_pairs("samplingRate=250,gain=3")); }));
  TEST_CHECK(neurosync_test::throws_as<ConfigurationError>(
      [] { (void)sampling_config_from_map(parse_config_pairs("samplingRate=250,channelCount=2.5")); }));
  TEST_CHECK(neurosync_test::throws_as<ConfigurationError>(
      [] { (void)sampling_config_from_map(parse_config_pairs("samplingRate=250.5")); }));
  TEST_CHECK(neurosync_test::throws_as<ConfigurationError>(
      [] { (void)sampling_config_from_json("{\"samplingRate\": 127.9}"); }));
  TEST_CHECK(sampling_config_from_map(parse_config_pairs("samplingRate=250.0")).sampling_rate_hz == 250.0);
  TEST_CHECK(neurosync_test::throws_as<ConfigurationError>([] { (void)parse_config_pairs("samplingRate"); }));

  // Binding to a signal.
  {
    Signal sig = make_signal(3, 10, 250.0);
    SamplingConfig cfg;
    cfg.sampling_rate_hz = 250.0;

    const SamplingConfig rc = resolve_sampling_config(cfg, sig);
    TEST_CHECK(rc.channel_count == 3);

    SamplingConfig wrong_count = cfg;
    wrong_count.channel_count = 4;
    TEST_CHECK(neurosync_test::throws_as<ConfigurationError>([&] { (void)resolve_sampling_config(wrong_count, sig); }));

    SamplingConfig wrong_rate = cfg;
    wrong_rate.sampling_rate_hz = 500.0;
    TEST_CHECK(neurosync_test::throws_as<ConfigurationError>([&] { (void)resolve_sampling_config(wrong_rate, sig); }));

    // A signal without a rate accepts any configured rate.
    sig.fs_hz = 0.0;
    TEST_CHECK(resolve_sampling_config(wrong_rate, sig).sampling_rate_hz == 500.0);
  }

  std::cout << "OK\n";
  return 0;
}
