#pragma once

#include <stdexcept>
#include <string>

namespace neurosync {

// Error taxonomy of the processing core.
//
// All errors derive from std::runtime_error so that tools can keep a single
// catch (const std::exception&) at the top level.

// Invalid or incompatible sampling/filter parameters (e.g. a corner frequency
// at or above Nyquist).
class ConfigurationError : public std::runtime_error {
public:
  explicit ConfigurationError(const std::string& msg) : std::runtime_error(msg) {}
};

// The signal is too short for the requested operation (shorter than one
// feature window, fewer than 2 samples for a variance, ...).
class InsufficientDataError : public std::runtime_error {
public:
  explicit InsufficientDataError(const std::string& msg) : std::runtime_error(msg) {}
};

// Zero-length input handed to a stage.
//
// Zero spectral power is NOT reported with this error; the feature extractor
// uses documented 0 fallbacks for that case.
class DegenerateSignalError : public std::runtime_error {
public:
  explicit DegenerateSignalError(const std::string& msg) : std::runtime_error(msg) {}
};

} // namespace neurosync
