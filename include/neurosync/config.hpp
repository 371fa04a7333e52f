#pragma once

#include "neurosync/types.hpp"

#include <map>
#include <string>

namespace neurosync {

// Sampling configuration parsing.
//
// Recognized keys (case-sensitive):
//   samplingRate        (required, integer Hz) alias: sampling_rate
//   powerlineFrequency  (50 or 60, default 50) alias: powerline_freq
//   channelCount        (>= 1, optional)       alias: channels
//
// Unknown keys and invalid values raise ConfigurationError.

// Throws ConfigurationError unless sampling_rate_hz > 0 and powerline_hz is 50 or 60.
void validate_sampling_config(const SamplingConfig& cfg);

SamplingConfig sampling_config_from_map(const std::map<std::string, std::string>& kv);

// Parse "samplingRate=250,powerlineFrequency=60" into a key/value map.
// Whitespace around keys and values is ignored. Empty items are skipped.
std::map<std::string, std::string> parse_config_pairs(const std::string& text);

// Parse a flat JSON object, e.g. {"samplingRate": 250, "powerlineFrequency": 60}.
// Values may be numbers or quoted numbers.
SamplingConfig sampling_config_from_json(const std::string& json);

// Bind a configuration to a concrete signal:
// - fills channel_count from the signal when it is 0
// - rejects a channel_count that differs from the signal
// - rejects a signal whose fs_hz is set and differs from sampling_rate_hz
SamplingConfig resolve_sampling_config(const SamplingConfig& cfg, const Signal& sig);

} // namespace neurosync
