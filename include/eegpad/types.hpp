#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace eegpad {

// One trial: a timepoints x channels matrix stored row-major.
//
// data[r * n_cols + c] is channel c at timepoint r.
struct TrialTable {
  std::vector<std::string> channel_names;  // size = n_cols
  size_t n_rows{0};
  size_t n_cols{0};
  std::vector<double> data;

  double at(size_t r, size_t c) const { return data[r * n_cols + c]; }
  double& at(size_t r, size_t c) { return data[r * n_cols + c]; }
};

// All trials of one group, padded to a common length and stacked along a
// leading trial axis.
//
// data[(t * n_rows + r) * n_cols + c] is channel c at timepoint r of trial t.
struct DatasetBlock {
  size_t n_trials{0};
  size_t n_rows{0};
  size_t n_cols{0};
  std::vector<double> data;

  double at(size_t t, size_t r, size_t c) const {
    return data[(t * n_rows + r) * n_cols + c];
  }
};

// Why a file or a group produced no output.
enum class SkipReason {
  None,
  FileParseError,     // one file could not be read or parsed
  NotFound,           // group source directory does not exist
  EmptyOrAllInvalid,  // directory exists but yielded no valid tables
  ShapeMismatch,      // tables within one group disagree in shape
  WriteFailed,        // the output array could not be written
};

inline std::string skip_reason_name(SkipReason r) {
  switch (r) {
    case SkipReason::None:
      return "none";
    case SkipReason::FileParseError:
      return "file_parse_error";
    case SkipReason::NotFound:
      return "not_found";
    case SkipReason::EmptyOrAllInvalid:
      return "empty_or_all_invalid";
    case SkipReason::ShapeMismatch:
      return "shape_mismatch";
    case SkipReason::WriteFailed:
      return "write_failed";
    default:
      return "unknown";
  }
}

} // namespace eegpad
