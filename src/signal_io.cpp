#include "neurosync/signal_io.hpp"

#include "neurosync/utils.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <fstream>
#include <iomanip>
#include <locale>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace neurosync {

namespace {

size_t count_delim_outside_quotes(const std::string& s, char delim) {
  bool in_quotes = false;
  size_t n = 0;
  for (size_t i = 0; i < s.size(); ++i) {
    const char c = s[i];
    if (c == '"') {
      if (in_quotes && (i + 1) < s.size() && s[i + 1] == '"') {
        ++i;
        continue;
      }
      in_quotes = !in_quotes;
      continue;
    }
    if (!in_quotes && c == delim) ++n;
  }
  return n;
}

char detect_delim(const std::string& header_line) {
  const size_t n_comma = count_delim_outside_quotes(header_line, ',');
  const size_t n_semi = count_delim_outside_quotes(header_line, ';');
  const size_t n_tab = count_delim_outside_quotes(header_line, '\t');

  char best = ',';
  size_t best_n = n_comma;
  if (n_semi > best_n) {
    best = ';';
    best_n = n_semi;
  }
  if (n_tab > best_n) best = '\t';
  return best;
}

bool is_numeric_cell(const std::string& s) {
  try {
    (void)to_double(s);
    return true;
  } catch (const std::exception&) {
    return false;
  }
}

// A header needs at least one label that is not a number, so a first sample
// row holding 1.5e-05, nan or inf is still read as data.
bool looks_like_header_row(const std::vector<std::string>& cols) {
  for (const auto& c : cols) {
    bool alpha = false;
    for (unsigned char ch : c) {
      if (std::isalpha(ch) != 0) {
        alpha = true;
        break;
      }
    }
    if (alpha && !is_numeric_cell(c)) return true;
  }
  return false;
}

bool is_time_col_name(const std::string& s) {
  const std::string t = to_lower(trim(s));
  return t == "time" || t == "t" || t == "time_s" || t == "timestamp";
}

double median_interval(const std::vector<double>& t) {
  std::vector<double> d;
  d.reserve(t.size());
  for (size_t i = 1; i < t.size(); ++i) d.push_back(t[i] - t[i - 1]);
  if (d.empty()) return 0.0;
  std::sort(d.begin(), d.end());
  const size_t mid = d.size() / 2;
  if (d.size() % 2 == 1) return d[mid];
  return 0.5 * (d[mid - 1] + d[mid]);
}

std::ofstream open_for_write(const std::string& path, const char* what) {
  std::ofstream f(path);
  if (!f) throw std::runtime_error(std::string(what) + ": failed to open for write: " + path);
  f.imbue(std::locale::classic());
  return f;
}

} // namespace

Signal read_signal_csv(const std::string& path, double fs_hz) {
  std::ifstream f(path);
  if (!f) throw std::runtime_error("read_signal_csv: failed to open: " + path);

  std::vector<std::string> lines;
  std::string line;
  bool first = true;
  while (std::getline(f, line)) {
    if (first) {
      line = strip_utf8_bom(line);
      first = false;
    }
    const std::string t = trim(line);
    if (t.empty() || starts_with(t, "#")) continue;
    lines.push_back(line);
  }
  if (lines.empty()) throw std::runtime_error("read_signal_csv: empty file: " + path);

  const char delim = detect_delim(lines[0]);
  std::vector<std::string> header = split_csv_row(lines[0], delim);
  const bool has_header = looks_like_header_row(header);

  const bool has_time = has_header && !header.empty() && is_time_col_name(header[0]);
  const size_t n_cols = header.size();
  const size_t first_ch = has_time ? 1 : 0;
  if (n_cols <= first_ch) throw std::runtime_error("read_signal_csv: no channel columns in " + path);

  Signal sig;
  for (size_t c = first_ch; c < n_cols; ++c) {
    sig.channel_names.push_back(has_header ? trim(header[c]) : ("Ch" + std::to_string(c - first_ch + 1)));
  }
  sig.data.assign(n_cols - first_ch, {});

  std::vector<double> times;
  for (size_t li = has_header ? 1 : 0; li < lines.size(); ++li) {
    const std::vector<std::string> cells = split_csv_row(lines[li], delim);
    if (cells.size() != n_cols) {
      throw std::runtime_error("read_signal_csv: row " + std::to_string(li + 1) + " has " +
                               std::to_string(cells.size()) + " columns, expected " + std::to_string(n_cols));
    }
    if (has_time) times.push_back(to_double(cells[0]));
    for (size_t c = first_ch; c < n_cols; ++c) {
      sig.data[c - first_ch].push_back(static_cast<float>(to_double(cells[c])));
    }
  }

  if (fs_hz > 0.0) {
    sig.fs_hz = fs_hz;
  } else if (has_time) {
    const double dt = median_interval(times);
    if (!(dt > 0.0)) throw std::runtime_error("read_signal_csv: cannot infer sampling rate from time column");
    sig.fs_hz = 1.0 / dt;
  } else {
    throw std::runtime_error("read_signal_csv: sampling rate unknown (no time column): " + path);
  }
  return sig;
}

std::string csv_escape(const std::string& s) {
  bool need = false;
  for (char c : s) {
    if (c == ',' || c == '"' || c == '\n' || c == '\r') {
      need = true;
      break;
    }
  }
  if (!need) return s;
  std::string out = "\"";
  for (char c : s) {
    if (c == '"') out += "\"\"";
    else out.push_back(c);
  }
  out += "\"";
  return out;
}

void write_signal_csv(const std::string& path, const Signal& sig) {
  validate_signal_shape(sig, "write_signal_csv");
  if (!(sig.fs_hz > 0.0)) throw std::runtime_error("write_signal_csv: fs_hz must be > 0");
  std::ofstream f = open_for_write(path, "write_signal_csv");

  f << "time";
  for (size_t c = 0; c < sig.n_channels(); ++c) {
    const std::string name = (c < sig.channel_names.size()) ? sig.channel_names[c] : ("Ch" + std::to_string(c + 1));
    f << "," << csv_escape(name);
  }
  f << "\n";

  f << std::fixed << std::setprecision(6);
  for (size_t i = 0; i < sig.n_samples(); ++i) {
    f << (static_cast<double>(i) / sig.fs_hz);
    for (size_t c = 0; c < sig.n_channels(); ++c) f << "," << sig.data[c][i];
    f << "\n";
  }
}

void write_feature_matrix_csv(const std::string& path, const FeatureSet& features) {
  std::ofstream f = open_for_write(path, "write_feature_matrix_csv");
  f << "window_start_sample";
  for (const auto& n : features.names) f << "," << csv_escape(n);
  f << "\n";

  f << std::setprecision(10);
  for (size_t w = 0; w < features.matrix.size(); ++w) {
    const size_t start = (w < features.window_starts.size()) ? features.window_starts[w] : 0;
    f << start;
    for (double v : features.matrix[w]) f << "," << v;
    f << "\n";
  }
}

void write_artifact_report_csv(const std::string& path, const ArtifactReport& report, double fs_hz) {
  const size_t n = report.combined_mask.size();
  if (report.amplitude_mask.size() != n || report.muscle_mask.size() != n) {
    throw std::runtime_error("write_artifact_report_csv: mask sizes differ");
  }
  std::ofstream f = open_for_write(path, "write_artifact_report_csv");
  f << "sample,time,amplitude,muscle,combined\n";
  f << std::fixed << std::setprecision(6);
  for (size_t i = 0; i < n; ++i) {
    const double t = (fs_hz > 0.0) ? static_cast<double>(i) / fs_hz : 0.0;
    f << i << "," << t << "," << (report.amplitude_mask[i] ? 1 : 0) << "," << (report.muscle_mask[i] ? 1 : 0)
      << "," << (report.combined_mask[i] ? 1 : 0) << "\n";
  }
}

void write_preprocess_info_csv(const std::string& path, const PreprocessInfo& info) {
  std::ofstream f = open_for_write(path, "write_preprocess_info_csv");
  f << "key,value\n";
  f << "original_channels," << info.original_channels << "\n";
  f << "original_samples," << info.original_samples << "\n";
  f << "clean_channels," << info.clean_channels << "\n";
  f << "clean_samples," << info.clean_samples << "\n";
  f << "artifact_samples," << info.artifact_samples << "\n";
  f << "artifact_percentage," << std::setprecision(6) << info.artifact_percentage << "\n";

  std::ostringstream dead;
  for (size_t i = 0; i < info.dead_channels.size(); ++i) {
    if (i) dead << ' ';
    dead << info.dead_channels[i];
  }
  f << "dead_channels," << csv_escape(dead.str()) << "\n";
  f << "interpolated," << (info.interpolated ? 1 : 0) << "\n";
  f << "interpolation_skipped," << (info.interpolation_skipped ? 1 : 0) << "\n";
}

} // namespace neurosync
