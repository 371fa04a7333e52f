#include "neurosync/pipeline.hpp"

#include "neurosync/config.hpp"
#include "neurosync/reference.hpp"

#include <utility>

namespace neurosync {

PreprocessResult preprocess_signal(const Signal& raw,
                                   const SamplingConfig& cfg,
                                   const PipelineOptions& opt) {
  validate_signal_shape(raw, "preprocess_signal");
  require_nonempty(raw, "preprocess_signal");
  const SamplingConfig rc = resolve_sampling_config(cfg, raw);

  PreprocessResult res;
  res.info.original_channels = raw.n_channels();
  res.info.original_samples = raw.n_samples();

  const Signal filtered = filter_cascade(raw, rc, opt.filter);
  const Signal referenced = common_average_reference(filtered);
  res.artifacts = detect_artifacts(referenced, rc, opt.detect);

  Signal clean = remove_artifacts(referenced, res.artifacts, opt.removal);

  res.info.artifact_percentage = res.artifacts.artifact_percentage;
  res.info.artifact_samples = res.artifacts.n_artifact_samples();
  res.info.dead_channels = res.artifacts.dead_channel_indices();

  const size_t n_dead = res.info.dead_channels.size();
  if (n_dead > 0 && opt.removal.drop_dead_channels) {
    if (opt.interpolate && should_interpolate(n_dead, raw.n_channels())) {
      clean = interpolate_dead_channels(clean, res.artifacts.dead_channels, raw.channel_names,
                                        &res.info.interpolation);
      res.info.interpolated = true;
    } else {
      res.info.interpolation_skipped = true;
    }
  }

  clean.fs_hz = rc.sampling_rate_hz;
  res.info.clean_channels = clean.n_channels();
  res.info.clean_samples = clean.n_samples();
  res.clean = std::move(clean);
  return res;
}

PipelineResult run_pipeline(const Signal& raw,
                            const SamplingConfig& cfg,
                            const PipelineOptions& opt) {
  PipelineResult out;
  out.preprocess = preprocess_signal(raw, cfg, opt);

  // The cleaned signal may have fewer channels than the configuration names.
  SamplingConfig fcfg = cfg;
  fcfg.channel_count = out.preprocess.clean.n_channels();
  out.features = extract_features(out.preprocess.clean, fcfg, opt.features);
  return out;
}

} // namespace neurosync
