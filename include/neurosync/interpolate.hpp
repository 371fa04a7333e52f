#pragma once

#include "neurosync/types.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace neurosync {

// Dead channel reconstruction by nearest-index substitution.
//
// Each dead channel receives a verbatim copy of the surviving channel whose
// original index is closest (ties favour the lower index). This is a
// placeholder reconstruction: it ignores electrode geometry and duplicates
// data, so downstream statistics over channels are biased. Use it only when a
// fixed channel layout is required.

struct InterpolateReport {
  // Original indices of the channels that were filled in.
  std::vector<size_t> interpolated;

  // sources[i] is the original index copied into interpolated[i].
  std::vector<size_t> sources;
};

// Index of the surviving channel nearest to `ch` (by |index difference|).
// Throws InsufficientDataError if no channel survives.
size_t nearest_surviving_channel(const std::vector<bool>& dead_mask, size_t ch);

// True when 0 < n_dead and n_dead < n_total / 2 (strictly).
bool should_interpolate(size_t n_dead, size_t n_total);

// Rebuild the full channel layout described by dead_mask.
//
// `sig` may be either:
// - the reduced signal (one row per surviving channel, in original order), or
// - a full-layout signal (one row per entry of dead_mask); dead rows are then
//   overwritten.
//
// original_names, when non-empty, must have dead_mask.size() entries and
// becomes the channel_names of the result.
//
// Throws InsufficientDataError if every channel is dead, std::runtime_error if
// the row count matches neither layout.
Signal interpolate_dead_channels(const Signal& sig,
                                 const std::vector<bool>& dead_mask,
                                 const std::vector<std::string>& original_names = {},
                                 InterpolateReport* report = nullptr);

} // namespace neurosync
