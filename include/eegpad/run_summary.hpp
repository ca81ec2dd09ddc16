#pragma once

#include "eegpad/pipeline.hpp"

#include <string>

namespace eegpad {

inline constexpr const char* kRunSummaryFileName = "eegpad_prep_run_meta.json";

// JSON document describing one preprocessing run: tool/version provenance,
// the configured paths, one entry per group, and the written outputs
// (file names relative to the output directory).
//
// No timestamps are included, so re-running on unchanged input reproduces the
// file byte for byte.
std::string run_summary_json(const PipelineConfig& config, const RunSummary& summary);

// Write run_summary_json() atomically. Returns false on failure.
bool write_run_summary_json(const std::string& json_path,
                            const PipelineConfig& config,
                            const RunSummary& summary);

} // namespace eegpad
