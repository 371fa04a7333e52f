#include "neurosync/config.hpp"
#include "neurosync/errors.hpp"
#include "neurosync/pipeline.hpp"
#include "neurosync/signal_io.hpp"
#include "neurosync/types.hpp"
#include "neurosync/utils.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>

using namespace neurosync;

namespace {

struct Args {
  std::string input_path;
  std::string outdir{"out_neurosync"};

  // Sampling configuration. --config / --config-json take precedence over
  // --fs / --powerline.
  double fs{0.0};
  double powerline_hz{50.0};
  std::string config_pairs;
  std::string config_json_path;

  bool interpolate{true};
  bool features{true};

  // Detector / remover overrides (negative = keep default).
  double amplitude_threshold{-1.0};
  double dead_std{-1.0};
  double muscle_factor{-1.0};
  double taper_floor{-1.0};
};

static void print_help() {
  std::cout
      << "neurosync_pipeline_cli\n\n"
      << "Clean a multi-channel recording and extract windowed features:\n"
      << "  DC removal + bandpass 1-45 Hz + powerline notch (zero-phase)\n"
      << "  common average reference\n"
      << "  amplitude / muscle / dead-channel artifact detection\n"
      << "  tapered attenuation of long artifact runs, dead channel removal\n"
      << "  nearest-channel substitution of dead channels (when fewer than half are dead)\n"
      << "  2 s windows, 1 s step, 15 features per channel\n\n"
      << "Usage:\n"
      << "  neurosync_pipeline_cli --input <signal.csv> --fs <Hz> [options]\n\n"
      << "Input:\n"
      << "  --input <file.csv>           Channel-per-column CSV (optional leading time column).\n"
      << "  --fs <Hz>                    Sampling rate (0 = infer from the time column).\n"
      << "  --powerline <50|60>          Powerline frequency (default 50).\n"
      << "  --config <k=v,...>           Sampling config pairs, e.g. samplingRate=250,powerlineFrequency=60\n"
      << "  --config-json <file.json>    Sampling config as a flat JSON object.\n\n"
      << "Processing:\n"
      << "  --no-interpolate             Keep dead channels dropped.\n"
      << "  --no-features                Stop after preprocessing.\n"
      << "  --amplitude-threshold <X>    Amplitude artifact threshold (default 100).\n"
      << "  --dead-std <X>               Dead channel std threshold (default 0.1).\n"
      << "  --muscle-factor <X>          Muscle RMS outlier factor (default 3).\n"
      << "  --taper-floor <X>            Gain at the edges of long artifact runs (default 0.3).\n\n"
      << "Output:\n"
      << "  --outdir <dir>               Output directory (default out_neurosync).\n"
      << "  -h, --help                   Show help.\n";
}

static bool is_flag(const std::string& a, const char* s1, const char* s2 = nullptr) {
  if (a == s1) return true;
  if (s2 && a == s2) return true;
  return false;
}

static std::string require_value(int& i, int argc, char** argv, const std::string& flag) {
  if (i + 1 >= argc) throw std::runtime_error("Missing value for " + flag);
  return std::string(argv[++i]);
}

static std::string read_text_file(const std::string& path) {
  std::ifstream f(path);
  if (!f) throw std::runtime_error("Failed to open: " + path);
  std::ostringstream oss;
  oss << f.rdbuf();
  return oss.str();
}

// Explicit configuration from --config-json or --config, if any.
static bool load_explicit_config(const Args& args, SamplingConfig* cfg) {
  if (!args.config_json_path.empty()) {
    *cfg = sampling_config_from_json(read_text_file(args.config_json_path));
    return true;
  }
  if (!args.config_pairs.empty()) {
    *cfg = sampling_config_from_map(parse_config_pairs(args.config_pairs));
    return true;
  }
  return false;
}

} // namespace

int main(int argc, char** argv) {
  try {
    Args args;

    if (argc <= 1) {
      print_help();
      return 1;
    }

    for (int i = 1; i < argc; ++i) {
      const std::string a = argv[i];

      if (is_flag(a, "-h", "--help")) {
        print_help();
        return 0;
      } else if (is_flag(a, "--input", "-i")) {
        args.input_path = require_value(i, argc, argv, a);
      } else if (is_flag(a, "--outdir", "-o")) {
        args.outdir = require_value(i, argc, argv, a);
      } else if (a == "--fs") {
        args.fs = to_double(require_value(i, argc, argv, a));
      } else if (a == "--powerline") {
        args.powerline_hz = to_double(require_value(i, argc, argv, a));
      } else if (a == "--config") {
        args.config_pairs = require_value(i, argc, argv, a);
      } else if (a == "--config-json") {
        args.config_json_path = require_value(i, argc, argv, a);
      } else if (a == "--no-interpolate") {
        args.interpolate = false;
      } else if (a == "--no-features") {
        args.features = false;
      } else if (a == "--amplitude-threshold") {
        args.amplitude_threshold = to_double(require_value(i, argc, argv, a));
      } else if (a == "--dead-std") {
        args.dead_std = to_double(require_value(i, argc, argv, a));
      } else if (a == "--muscle-factor") {
        args.muscle_factor = to_double(require_value(i, argc, argv, a));
      } else if (a == "--taper-floor") {
        args.taper_floor = to_double(require_value(i, argc, argv, a));
      } else {
        throw std::runtime_error("Unknown argument: " + a);
      }
    }

    if (args.input_path.empty()) {
      throw std::runtime_error("Missing required argument --input");
    }

    SamplingConfig cfg;
    const bool explicit_cfg = load_explicit_config(args, &cfg);
    const Signal raw = read_signal_csv(args.input_path, explicit_cfg ? cfg.sampling_rate_hz : args.fs);
    if (!explicit_cfg) {
      cfg.sampling_rate_hz = raw.fs_hz;
      cfg.powerline_hz = args.powerline_hz;
      validate_sampling_config(cfg);
    }

    std::cout << "Loaded " << raw.n_channels() << " channels x " << raw.n_samples() << " samples @ "
              << cfg.sampling_rate_hz << " Hz (powerline " << cfg.powerline_hz << " Hz)\n";

    PipelineOptions opt;
    opt.interpolate = args.interpolate;
    if (args.amplitude_threshold >= 0.0) opt.detect.amplitude_threshold = args.amplitude_threshold;
    if (args.dead_std >= 0.0) opt.detect.dead_channel_std = args.dead_std;
    if (args.muscle_factor >= 0.0) opt.detect.muscle_rms_std_factor = args.muscle_factor;
    if (args.taper_floor >= 0.0) opt.removal.attenuation_floor = args.taper_floor;

    const PreprocessResult pre = preprocess_signal(raw, cfg, opt);
    const PreprocessInfo& info = pre.info;

    std::cout << "Artifacts: " << info.artifact_samples << " samples (" << info.artifact_percentage << "%)\n";
    if (!info.dead_channels.empty()) {
      std::cout << "Dead channels:";
      for (size_t c : info.dead_channels) {
        std::cout << " " << ((c < raw.channel_names.size()) ? raw.channel_names[c] : std::to_string(c + 1));
      }
      std::cout << "\n";
    }
    if (info.interpolated) {
      std::cout << "Interpolated " << info.interpolation.interpolated.size()
                << " dead channel(s) by nearest-channel substitution (approximate)\n";
    } else if (info.interpolation_skipped) {
      std::cerr << "Note: dead channels were dropped without interpolation ("
                << info.dead_channels.size() << " of " << info.original_channels << ")\n";
    }
    std::cout << "Clean signal: " << info.clean_channels << " channels x " << info.clean_samples << " samples\n";

    std::filesystem::create_directories(std::filesystem::u8path(args.outdir));
    const std::string clean_csv = args.outdir + "/clean_signal.csv";
    const std::string artifacts_csv = args.outdir + "/artifacts.csv";
    const std::string info_csv = args.outdir + "/preprocess_info.csv";
    write_signal_csv(clean_csv, pre.clean);
    write_artifact_report_csv(artifacts_csv, pre.artifacts, cfg.sampling_rate_hz);
    write_preprocess_info_csv(info_csv, info);
    std::cout << "Wrote " << clean_csv << "\n";
    std::cout << "Wrote " << artifacts_csv << "\n";
    std::cout << "Wrote " << info_csv << "\n";

    if (args.features) {
      SamplingConfig fcfg = cfg;
      fcfg.channel_count = pre.clean.n_channels();
      const FeatureSet fs = extract_features(pre.clean, fcfg, opt.features);
      const std::string features_csv = args.outdir + "/features.csv";
      write_feature_matrix_csv(features_csv, fs);
      std::cout << "Features: " << fs.n_windows() << " windows x " << fs.n_features() << " features\n";
      std::cout << "Wrote " << features_csv << "\n";
    }

    return 0;
  } catch (const ConfigurationError& e) {
    std::cerr << "Configuration error: " << e.what() << "\n";
    return 2;
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 1;
  }
}
