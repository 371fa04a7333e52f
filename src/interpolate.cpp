#include "neurosync/interpolate.hpp"

#include "neurosync/errors.hpp"

#include <stdexcept>
#include <string>

namespace neurosync {

size_t nearest_surviving_channel(const std::vector<bool>& dead_mask, size_t ch) {
  const size_t n = dead_mask.size();
  bool found = false;
  size_t best = 0;
  size_t best_dist = 0;
  for (size_t i = 0; i < n; ++i) {
    if (dead_mask[i]) continue;
    const size_t d = (i > ch) ? (i - ch) : (ch - i);
    // Strict comparison: scanning upward keeps the lower index on ties.
    if (!found || d < best_dist) {
      found = true;
      best = i;
      best_dist = d;
    }
  }
  if (!found) {
    throw InsufficientDataError("nearest_surviving_channel: no surviving channel");
  }
  return best;
}

bool should_interpolate(size_t n_dead, size_t n_total) {
  return n_dead > 0 && 2 * n_dead < n_total;
}

Signal interpolate_dead_channels(const Signal& sig,
                                 const std::vector<bool>& dead_mask,
                                 const std::vector<std::string>& original_names,
                                 InterpolateReport* report) {
  validate_signal_shape(sig, "interpolate_dead_channels");

  const size_t n_total = dead_mask.size();
  size_t n_alive = 0;
  for (bool d : dead_mask) {
    if (!d) ++n_alive;
  }
  if (n_alive == 0) {
    throw InsufficientDataError("interpolate_dead_channels: all channels are dead");
  }
  if (!original_names.empty() && original_names.size() != n_total) {
    throw std::runtime_error("interpolate_dead_channels: original_names has " +
                             std::to_string(original_names.size()) + " entries, expected " +
                             std::to_string(n_total));
  }

  const bool reduced = (sig.n_channels() == n_alive);
  if (!reduced && sig.n_channels() != n_total) {
    throw std::runtime_error("interpolate_dead_channels: signal has " +
                             std::to_string(sig.n_channels()) + " channels, expected " +
                             std::to_string(n_alive) + " (reduced) or " + std::to_string(n_total) +
                             " (full)");
  }

  // Map original index -> row in `sig`.
  std::vector<size_t> row_of(n_total, 0);
  {
    size_t r = 0;
    for (size_t c = 0; c < n_total; ++c) {
      if (reduced) {
        if (!dead_mask[c]) row_of[c] = r++;
      } else {
        row_of[c] = c;
      }
    }
  }

  Signal out;
  out.fs_hz = sig.fs_hz;
  out.data.resize(n_total);

  if (report) {
    report->interpolated.clear();
    report->sources.clear();
  }

  for (size_t c = 0; c < n_total; ++c) {
    if (!dead_mask[c]) {
      out.data[c] = sig.data[row_of[c]];
      continue;
    }
    const size_t src = nearest_surviving_channel(dead_mask, c);
    out.data[c] = sig.data[row_of[src]];
    if (report) {
      report->interpolated.push_back(c);
      report->sources.push_back(src);
    }
  }

  if (!original_names.empty()) {
    out.channel_names = original_names;
  } else if (!reduced) {
    out.channel_names = sig.channel_names;
  }
  return out;
}

} // namespace neurosync
