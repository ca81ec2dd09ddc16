#include "eegpad/run_summary.hpp"

#include "eegpad/version.hpp"

#include "test_support.hpp"

#include <iostream>
#include <string>

using namespace eegpad;

static size_t count_of(const std::string& s, const std::string& needle) {
  size_t n = 0;
  for (size_t pos = s.find(needle); pos != std::string::npos; pos = s.find(needle, pos + 1)) ++n;
  return n;
}

int main() {
  PipelineConfig config;
  config.base_path = "in \"quoted\"";
  config.output_path = "out";

  RunSummary summary;
  {
    GroupOutcome o;
    o.group.band = "Raw EEG";
    o.group.intensity = "Low Intensity";
    o.group.source_dir = "in/Raw EEG samples/Low Intensity";
    o.group.output_name = "array_3D_raw_low.npy";
    o.status = GroupStatus::Written;
    o.scan.n_files = 3;
    o.scan.n_valid = 3;
    o.scan.max_rows = 80;
    o.n_trials = 3;
    o.n_channels = 4;
    o.output_path = "out/array_3D_raw_low.npy";
    summary.groups.push_back(o);
  }
  {
    GroupOutcome o;
    o.group.band = "Raw EEG";
    o.group.intensity = "Medium Intensity";
    o.group.source_dir = "in/Raw EEG samples/Medium Intensity";
    o.group.output_name = "array_3D_raw_medium.npy";
    o.reason = SkipReason::NotFound;
    summary.groups.push_back(o);
  }

  assert(summary.n_written() == 1);
  assert(summary.n_skipped() == 1);

  const std::string json = run_summary_json(config, summary);
  assert(json.front() == '{');
  assert(json.back() == '\n');
  assert(json.find("\"BasePath\": \"in \\\"quoted\\\"\"") != std::string::npos);
  assert(json.find("\"Version\": \"" + version_string() + "\"") != std::string::npos);
  assert(count_of(json, "\"Band\": ") == 2);
  assert(count_of(json, "\"SkipReason\": null") == 1);
  assert(count_of(json, "\"SkipReason\": \"not_found\"") == 1);
  assert(count_of(json, "\"Output\": null") == 1);
  assert(json.find("\"Outputs\": [\n    \"array_3D_raw_low.npy\"\n  ]") != std::string::npos);
  assert(json.find("Timestamp") == std::string::npos);

  // Deterministic for identical input.
  assert(run_summary_json(config, summary) == json);

  std::cout << "test_run_summary: OK\n";
  return 0;
}
