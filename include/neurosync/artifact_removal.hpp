#pragma once

#include "neurosync/artifacts.hpp"
#include "neurosync/types.hpp"

#include <cstddef>
#include <vector>

namespace neurosync {

// Half-open sample range [start, end).
struct SampleRun {
  size_t start{0};
  size_t end{0};

  size_t length() const { return end - start; }
};

// Linear scan over a boolean mask yielding maximal runs of true values.
//
//   SampleRunScanner scan(mask);
//   SampleRun r;
//   while (scan.next(&r)) { ... }
//
// The mask must outlive the scanner.
class SampleRunScanner {
public:
  explicit SampleRunScanner(const std::vector<bool>& mask) : mask_(&mask) {}

  // Advance to the next run. Returns false when the mask is exhausted.
  bool next(SampleRun* out);

private:
  const std::vector<bool>* mask_;
  size_t pos_{0};
};

// Materialized variant of SampleRunScanner.
std::vector<SampleRun> contiguous_runs(const std::vector<bool>& mask);

// Tukey (tapered cosine) window of length n.
//
// r is the fraction of the window inside the cosine tapers:
// r <= 0 gives a rectangular window, r >= 1 a Hann window.
std::vector<double> tukey_window(size_t n, double r);

struct ArtifactRemovalOptions {
  // Runs of length <= min_run_samples are left untouched.
  size_t min_run_samples{10};

  // Taper fraction of the Tukey window.
  double taper_fraction{0.3};

  // Gain at the edges of a long run. Gain over a run is
  //   floor + (1 - floor) * tukey(len, taper_fraction)
  // i.e. `floor` at both run edges, rising to 1.0 over the flat centre.
  double attenuation_floor{0.3};

  bool drop_dead_channels{true};
};

// Per-sample gain applied to a run of length n (see ArtifactRemovalOptions).
std::vector<double> run_attenuation_gain(size_t n, const ArtifactRemovalOptions& opt);

// Attenuate long artifact runs on every channel, then drop dead channels.
//
// The sample count never changes. The output has
// n_channels - report.n_dead_channels() rows (when drop_dead_channels is set),
// in the original relative order, with channel names carried along.
//
// Throws DegenerateSignalError for an empty signal and std::runtime_error if
// the report does not match the signal shape.
Signal remove_artifacts(const Signal& sig,
                        const ArtifactReport& report,
                        const ArtifactRemovalOptions& opt = {});

} // namespace neurosync
