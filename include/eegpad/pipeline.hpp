#pragma once

#include "eegpad/catalog.hpp"
#include "eegpad/trial_scan.hpp"
#include "eegpad/types.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace eegpad {

struct PipelineConfig {
  // Root of the input layout ("<band> samples/<intensity>" below it).
  std::string base_path{"data/fatigueset"};

  // Destination for array_3D_*.npy files; created if absent.
  std::string output_path{"processed_data"};

  // Trial file extension (case-insensitive).
  std::string extension{".csv"};

  // Write eegpad_prep_run_meta.json into output_path after the run.
  bool write_summary{true};
};

enum class GroupStatus {
  Written,
  Skipped,
};

inline std::string group_status_name(GroupStatus s) {
  switch (s) {
    case GroupStatus::Written:
      return "written";
    case GroupStatus::Skipped:
      return "skipped";
    default:
      return "unknown";
  }
}

struct GroupOutcome {
  Group group;
  GroupStatus status{GroupStatus::Skipped};
  SkipReason reason{SkipReason::None};

  ScanResult scan;          // first pass
  size_t n_trials{0};       // trials stacked into the block
  size_t n_channels{0};
  std::string output_path;  // empty unless written
  std::string message;      // diagnostic for skipped groups
};

struct RunSummary {
  std::vector<GroupOutcome> groups;

  size_t n_written() const;
  size_t n_skipped() const;
};

// Scan a directory for its longest trial, then load every trial again,
// zero-pad it to that length and stack the results.
//
// Returns std::nullopt if no trial file loaded. Throws std::invalid_argument
// if the padded trials disagree in shape (e.g. differing channel counts).
// If scan is non-null it receives the first-pass result.
std::optional<DatasetBlock> build_group_block(const std::string& dir,
                                              const std::string& ext = ".csv",
                                              ScanResult* scan = nullptr);

// Runs the fixed band x intensity catalog one group at a time.
//
// No group failure stops the run: each group ends either written or skipped
// with a SkipReason.
class Preprocessor {
public:
  explicit Preprocessor(PipelineConfig config);

  const PipelineConfig& config() const { return config_; }

  GroupOutcome process_group(const Group& g) const;

  RunSummary run() const;

private:
  PipelineConfig config_;
};

} // namespace eegpad
