#include "neurosync/types.hpp"

#include "neurosync/errors.hpp"

#include <stdexcept>
#include <string>

namespace neurosync {

Signal make_signal(size_t n_channels, size_t n_samples, double fs_hz) {
  Signal sig;
  sig.fs_hz = fs_hz;
  sig.data.assign(n_channels, std::vector<float>(n_samples, 0.0f));
  return sig;
}

void validate_signal_shape(const Signal& sig, const char* what) {
  const size_t n = sig.n_samples();
  for (const auto& row : sig.data) {
    if (row.size() != n) {
      throw std::runtime_error(std::string(what) + ": all channels must have the same #samples");
    }
  }
  if (!sig.channel_names.empty() && sig.channel_names.size() != sig.n_channels()) {
    throw std::runtime_error(std::string(what) + ": channel_names size does not match #channels");
  }
}

void require_nonempty(const Signal& sig, const char* what) {
  if (sig.n_channels() == 0 || sig.n_samples() == 0) {
    throw DegenerateSignalError(std::string(what) + ": signal has zero length");
  }
}

} // namespace neurosync
