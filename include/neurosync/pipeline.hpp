#pragma once

#include "neurosync/artifact_removal.hpp"
#include "neurosync/artifacts.hpp"
#include "neurosync/features.hpp"
#include "neurosync/filter_cascade.hpp"
#include "neurosync/interpolate.hpp"
#include "neurosync/types.hpp"

#include <cstddef>
#include <vector>

namespace neurosync {

// Batch preprocessing:
//   raw -> filter_cascade -> common_average_reference -> detect_artifacts
//       -> remove_artifacts -> (conditionally) interpolate_dead_channels
//
// Each stage is a pure function of its inputs; the options below only
// forward per-stage settings.
struct PipelineOptions {
  FilterCascadeOptions filter;
  ArtifactDetectionOptions detect;
  ArtifactRemovalOptions removal;
  FeatureExtractionOptions features;

  // Rebuild dead channels when 0 < n_dead < n_channels / 2.
  bool interpolate{true};
};

// Summary of one preprocessing run, for callers that log or display it.
struct PreprocessInfo {
  size_t original_channels{0};
  size_t original_samples{0};
  size_t clean_channels{0};
  size_t clean_samples{0};

  double artifact_percentage{0.0};
  size_t artifact_samples{0};
  std::vector<size_t> dead_channels;

  // True when dead channels were rebuilt.
  bool interpolated{false};
  // True when dead channels exist but interpolation was not applied (too many
  // dead channels, or disabled).
  bool interpolation_skipped{false};
  InterpolateReport interpolation;
};

struct PreprocessResult {
  Signal clean;
  ArtifactReport artifacts;
  PreprocessInfo info;
};

PreprocessResult preprocess_signal(const Signal& raw,
                                   const SamplingConfig& cfg,
                                   const PipelineOptions& opt = {});

struct PipelineResult {
  PreprocessResult preprocess;
  FeatureSet features;
};

// preprocess_signal() followed by extract_features() on the cleaned signal.
PipelineResult run_pipeline(const Signal& raw,
                            const SamplingConfig& cfg,
                            const PipelineOptions& opt = {});

} // namespace neurosync
