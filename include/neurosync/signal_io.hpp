#pragma once

#include "neurosync/artifacts.hpp"
#include "neurosync/features.hpp"
#include "neurosync/pipeline.hpp"
#include "neurosync/types.hpp"

#include <string>

namespace neurosync {

// Plain CSV exchange for the command-line tool.

// Read a channel-per-column CSV.
//
// Expected format:
//   time,Fp1,Fp2,...      (header; the time column is optional)
//   0.000,12.1,9.8,...
//
// - Delimiter is auto-detected among ',', ';' and tab.
// - Lines starting with '#' and empty lines are ignored.
// - If every cell of the first line parses as a number (including 1e-5, nan,
//   inf), it is treated as data and channels are named Ch1..ChN.
// - fs_hz > 0 sets the sampling rate. Otherwise it is inferred from the time
//   column (median sample interval); without a time column that is an error.
Signal read_signal_csv(const std::string& path, double fs_hz = 0.0);

// Quote a CSV field if needed.
std::string csv_escape(const std::string& s);

// Write a signal with a leading time column (seconds).
void write_signal_csv(const std::string& path, const Signal& sig);

// Header = window_start_sample, then one column per feature name.
void write_feature_matrix_csv(const std::string& path, const FeatureSet& features);

// One row per sample: sample, amplitude, muscle, combined (0/1).
void write_artifact_report_csv(const std::string& path, const ArtifactReport& report, double fs_hz);

// key,value summary of a preprocessing run.
void write_preprocess_info_csv(const std::string& path, const PreprocessInfo& info);

} // namespace neurosync
