#include "eegpad/prep_cli.hpp"

#include "eegpad/version.hpp"

#include <ostream>
#include <stdexcept>

namespace eegpad {

namespace {

bool is_flag(const std::string& a, const char* s1, const char* s2 = nullptr) {
  if (a == s1) return true;
  if (s2 && a == s2) return true;
  return false;
}

std::string require_value(size_t& i, const std::vector<std::string>& args, const std::string& flag) {
  if (i + 1 >= args.size()) throw std::runtime_error("Missing value for " + flag);
  return args[++i];
}

} // namespace

void print_prep_cli_help(std::ostream& os) {
  os << "eegpad_prep_cli\n\n"
     << "Convert per-trial EEG CSV files into zero-padded 3D arrays\n"
     << "(trials x max timepoints x channels), one .npy per band/intensity group.\n\n"
     << "Usage:\n"
     << "  eegpad_prep_cli [options]\n\n"
     << "Options:\n"
     << "  --base <dir>      Input root (default 'data/fatigueset'). Expected layout:\n"
     << "                    <dir>/<Band> EEG samples/<Level> Intensity/*.csv\n"
     << "  --outdir <dir>    Output directory (default 'processed_data').\n"
     << "  --no-summary      Do not write eegpad_prep_run_meta.json.\n"
     << "  --version         Print version and exit.\n"
     << "  -h, --help        Show this help.\n\n"
     << "Notes:\n"
     << "  - Groups whose folder is missing or holds no readable CSV are skipped.\n"
     << "  - Outputs are named array_3D_<band>_<level>.npy, e.g. array_3D_raw_low.npy.\n";
}

PrepCliArgs parse_prep_cli_args(const std::vector<std::string>& args) {
  PrepCliArgs r;
  for (size_t i = 0; i < args.size(); ++i) {
    const std::string& a = args[i];

    if (is_flag(a, "-h", "--help")) {
      r.show_help = true;
    } else if (a == "--version") {
      r.show_version = true;
    } else if (a == "--base") {
      r.config.base_path = require_value(i, args, a);
    } else if (is_flag(a, "--outdir", "-o")) {
      r.config.output_path = require_value(i, args, a);
    } else if (a == "--no-summary") {
      r.config.write_summary = false;
    } else {
      throw std::runtime_error("Unknown argument: " + a);
    }
  }
  return r;
}

int run_prep_cli(const std::vector<std::string>& args, std::ostream& out, std::ostream& err) {
  PrepCliArgs parsed;
  try {
    parsed = parse_prep_cli_args(args);
  } catch (const std::exception& e) {
    err << "Error: " << e.what() << "\n";
    return 2;
  }

  if (parsed.show_help) {
    print_prep_cli_help(out);
    return 0;
  }
  if (parsed.show_version) {
    out << "eegpad " << version_string() << " (" << build_type_string() << ")\n";
    return 0;
  }

  Preprocessor prep(parsed.config);
  prep.run();
  return 0;
}

} // namespace eegpad
