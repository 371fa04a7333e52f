#pragma once

#include "neurosync/types.hpp"

namespace neurosync {

// Apply common average reference in-place: at each sample index, subtract the
// mean across channels from every channel.
void apply_average_reference_inplace(Signal& sig);

// Pure variant of apply_average_reference_inplace().
Signal common_average_reference(const Signal& sig);

} // namespace neurosync
