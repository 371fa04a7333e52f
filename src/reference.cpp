#include "neurosync/reference.hpp"

namespace neurosync {

void apply_average_reference_inplace(Signal& sig) {
  const size_t C = sig.n_channels();
  const size_t N = sig.n_samples();
  if (C == 0 || N == 0) return;

  for (size_t i = 0; i < N; ++i) {
    double m = 0.0;
    for (size_t c = 0; c < C; ++c) m += sig.data[c][i];
    m /= static_cast<double>(C);
    for (size_t c = 0; c < C; ++c) sig.data[c][i] = static_cast<float>(sig.data[c][i] - m);
  }
}

Signal common_average_reference(const Signal& sig) {
  validate_signal_shape(sig, "common_average_reference");
  require_nonempty(sig, "common_average_reference");
  Signal out = sig;
  apply_average_reference_inplace(out);
  return out;
}

} // namespace neurosync
