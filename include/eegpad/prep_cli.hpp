#pragma once

#include "eegpad/pipeline.hpp"

#include <iosfwd>
#include <string>
#include <vector>

namespace eegpad {

struct PrepCliArgs {
  PipelineConfig config;
  bool show_help{false};
  bool show_version{false};
};

// Parse eegpad_prep_cli arguments (without argv[0]).
// Throws std::runtime_error on an unknown flag or a missing flag value.
PrepCliArgs parse_prep_cli_args(const std::vector<std::string>& args);

void print_prep_cli_help(std::ostream& os);

// Whole CLI: parse, then print help/version or run the pipeline.
// Returns 0 on success and 2 on an argument error (reported on err).
int run_prep_cli(const std::vector<std::string>& args, std::ostream& out, std::ostream& err);

} // namespace eegpad
