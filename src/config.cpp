#include "neurosync/config.hpp"

#include "neurosync/errors.hpp"
#include "neurosync/utils.hpp"

#include <cmath>
#include <exception>
#include <string>

namespace neurosync {

namespace {

enum class ConfigKey { kSamplingRate, kPowerline, kChannelCount, kUnknown };

ConfigKey classify_key(const std::string& key) {
  if (key == "samplingRate" || key == "sampling_rate") return ConfigKey::kSamplingRate;
  if (key == "powerlineFrequency" || key == "powerline_freq") return ConfigKey::kPowerline;
  if (key == "channelCount" || key == "channels") return ConfigKey::kChannelCount;
  return ConfigKey::kUnknown;
}

double parse_number(const std::string& key, const std::string& value) {
  try {
    return to_double(value);
  } catch (const std::exception& e) {
    throw ConfigurationError("config: invalid value for '" + key + "': " + e.what());
  }
}

void apply_key(SamplingConfig* cfg, bool* have_rate, const std::string& key, const std::string& value) {
  switch (classify_key(key)) {
    case ConfigKey::kSamplingRate: {
      const double fs = parse_number(key, value);
      if (!(fs >= 1.0) || !std::isfinite(fs) || fs != std::floor(fs)) {
        throw ConfigurationError("config: samplingRate must be a positive integer");
      }
      cfg->sampling_rate_hz = fs;
      *have_rate = true;
      break;
    }
    case ConfigKey::kPowerline:
      cfg->powerline_hz = parse_number(key, value);
      break;
    case ConfigKey::kChannelCount: {
      const double n = parse_number(key, value);
      if (!(n >= 1.0) || n != std::floor(n)) {
        throw ConfigurationError("config: channelCount must be a positive integer");
      }
      cfg->channel_count = static_cast<size_t>(n);
      break;
    }
    case ConfigKey::kUnknown:
      throw ConfigurationError("config: unknown key '" + key + "'");
  }
}

} // namespace

void validate_sampling_config(const SamplingConfig& cfg) {
  if (!(cfg.sampling_rate_hz > 0.0) || !std::isfinite(cfg.sampling_rate_hz)) {
    throw ConfigurationError("config: samplingRate must be > 0");
  }
  if (cfg.powerline_hz != 50.0 && cfg.powerline_hz != 60.0) {
    throw ConfigurationError("config: powerlineFrequency must be 50 or 60");
  }
}

SamplingConfig sampling_config_from_map(const std::map<std::string, std::string>& kv) {
  SamplingConfig cfg;
  bool have_rate = false;
  for (const auto& it : kv) {
    apply_key(&cfg, &have_rate, trim(it.first), it.second);
  }
  if (!have_rate) throw ConfigurationError("config: samplingRate is required");
  validate_sampling_config(cfg);
  return cfg;
}

std::map<std::string, std::string> parse_config_pairs(const std::string& text) {
  std::map<std::string, std::string> kv;
  for (const std::string& item : split(text, ',')) {
    const std::string t = trim(item);
    if (t.empty()) continue;
    const size_t eq = t.find('=');
    if (eq == std::string::npos || eq == 0) {
      throw ConfigurationError("config: expected key=value, got '" + t + "'");
    }
    kv[trim(t.substr(0, eq))] = trim(t.substr(eq + 1));
  }
  return kv;
}

SamplingConfig sampling_config_from_json(const std::string& json) {
  std::map<std::string, std::string> kv;
  for (const std::string& key : json_top_level_keys(json)) {
    std::string raw;
    if (!json_find_raw_value(json, key, &raw)) {
      throw ConfigurationError("config: malformed JSON value for '" + key + "'");
    }
    kv[key] = raw;
  }
  return sampling_config_from_map(kv);
}

SamplingConfig resolve_sampling_config(const SamplingConfig& cfg, const Signal& sig) {
  validate_sampling_config(cfg);
  SamplingConfig out = cfg;
  if (out.channel_count == 0) {
    out.channel_count = sig.n_channels();
  } else if (out.channel_count != sig.n_channels()) {
    throw ConfigurationError("config: channelCount (" + std::to_string(out.channel_count) +
                             ") does not match signal (" + std::to_string(sig.n_channels()) + ")");
  }
  if (sig.fs_hz > 0.0 && std::fabs(sig.fs_hz - out.sampling_rate_hz) > 1e-9 * out.sampling_rate_hz) {
    throw ConfigurationError("config: samplingRate does not match the signal's sampling rate");
  }
  return out;
}

} // namespace neurosync
