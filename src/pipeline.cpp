#include "eegpad/pipeline.hpp"

#include "eegpad/csv_reader.hpp"
#include "eegpad/npy_io.hpp"
#include "eegpad/run_summary.hpp"
#include "eegpad/trial_ops.hpp"
#include "eegpad/utils.hpp"

#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <utility>

namespace eegpad {

namespace {

std::string shape_string(const DatasetBlock& b) {
  return "(" + std::to_string(b.n_trials) + ", " + std::to_string(b.n_rows) + ", " +
         std::to_string(b.n_cols) + ")";
}

std::string dir_basename(const std::string& dir) {
  return std::filesystem::u8path(dir).filename().u8string();
}

} // namespace

size_t RunSummary::n_written() const {
  size_t n = 0;
  for (const auto& g : groups) {
    if (g.status == GroupStatus::Written) ++n;
  }
  return n;
}

size_t RunSummary::n_skipped() const {
  return groups.size() - n_written();
}

std::optional<DatasetBlock> build_group_block(const std::string& dir,
                                              const std::string& ext,
                                              ScanResult* scan) {
  // Pass 1: longest trial.
  const ScanResult sr = scan_max_length(dir, ext);
  if (scan) *scan = sr;
  std::cout << "Max sequence length found: " << sr.max_rows << " timepoints.\n";

  // Pass 2: reload, pad, collect.
  const std::vector<std::string> files = list_trial_files(dir, ext);
  const std::string name = dir_basename(dir);
  std::vector<TrialTable> trials;
  trials.reserve(files.size());
  for (size_t i = 0; i < files.size(); ++i) {
    LoadResult lr = load_trial_table(files[i]);
    if (lr.ok()) {
      pad_rows_inplace(&*lr.table, sr.max_rows);
      trials.push_back(std::move(*lr.table));
    }
    std::cout << "\rProcessing " << name << ": " << (i + 1) << "/" << files.size() << std::flush;
  }
  if (!files.empty()) std::cout << "\n";

  return stack_trials(trials);
}

Preprocessor::Preprocessor(PipelineConfig config) : config_(std::move(config)) {}

GroupOutcome Preprocessor::process_group(const Group& g) const {
  GroupOutcome out;
  out.group = g;

  if (!directory_exists(g.source_dir)) {
    out.reason = SkipReason::NotFound;
    out.message = "Input folder not found at " + g.source_dir;
    std::cerr << "WARNING: " << out.message << ". Skipping.\n";
    return out;
  }

  std::optional<DatasetBlock> block;
  try {
    block = build_group_block(g.source_dir, config_.extension, &out.scan);
  } catch (const std::invalid_argument& e) {
    out.reason = SkipReason::ShapeMismatch;
    out.message = e.what();
    std::cerr << "WARNING: Trials in " << g.source_dir << " cannot be stacked: " << e.what()
              << ". Skipping.\n";
    return out;
  }

  if (!block) {
    out.reason = SkipReason::EmptyOrAllInvalid;
    out.message = "No valid CSV files found in " + g.source_dir;
    std::cerr << out.message << ". Skipping.\n";
    return out;
  }

  out.n_trials = block->n_trials;
  out.n_channels = block->n_cols;

  const std::string path =
      (std::filesystem::u8path(config_.output_path) / std::filesystem::u8path(g.output_name))
          .u8string();
  try {
    write_npy(path, *block);
  } catch (const std::exception& e) {
    out.reason = SkipReason::WriteFailed;
    out.message = e.what();
    std::cerr << "Error: " << e.what() << "\n";
    return out;
  }

  out.status = GroupStatus::Written;
  out.output_path = path;
  std::cout << "SUCCESS: Saved " << shape_string(*block) << " to " << path << "\n";
  return out;
}

RunSummary Preprocessor::run() const {
  std::cout << "--- Starting EEG trial preprocessing ---\n";

  try {
    ensure_directory(config_.output_path);
  } catch (const std::filesystem::filesystem_error& e) {
    // Each group will report WriteFailed.
    std::cerr << "WARNING: Cannot create output directory " << config_.output_path << ": "
              << e.what() << "\n";
  }

  RunSummary summary;
  for (const auto& g : build_catalog(config_.base_path)) {
    std::cout << "\nProcessing: " << g.band << " samples/" << g.intensity << "\n";
    summary.groups.push_back(process_group(g));
  }

  std::cout << "\n--- Preprocessing complete: " << summary.n_written() << " written, "
            << summary.n_skipped() << " skipped. ---\n";
  for (const auto& o : summary.groups) {
    if (o.status == GroupStatus::Written) continue;
    std::cout << "  skipped " << o.group.output_name << " (" << skip_reason_name(o.reason)
              << ")\n";
  }
  std::cout << "All 3D arrays saved to the '" << config_.output_path << "' directory.\n";

  if (config_.write_summary) {
    const std::string meta_path =
        (std::filesystem::u8path(config_.output_path) / std::filesystem::u8path(kRunSummaryFileName))
            .u8string();
    if (!write_run_summary_json(meta_path, config_, summary)) {
      std::cerr << "WARNING: Failed to write run summary: " << meta_path << "\n";
    }
  }

  return summary;
}

} // namespace eegpad
