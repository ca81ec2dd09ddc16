#include "eegpad/run_summary.hpp"

#include "eegpad/utils.hpp"
#include "eegpad/version.hpp"

#include <sstream>
#include <vector>

namespace eegpad {

std::string run_summary_json(const PipelineConfig& config, const RunSummary& summary) {
  std::ostringstream out;

  auto write_string_or_null = [&](const std::string& s) {
    if (s.empty()) {
      out << "null";
    } else {
      out << "\"" << json_escape(s) << "\"";
    }
  };

  out << "{\n";
  out << "  \"Tool\": \"eegpad_prep_cli\",\n";
  out << "  \"Version\": \"" << json_escape(version_string()) << "\",\n";
  out << "  \"BuildType\": \"" << json_escape(build_type_string()) << "\",\n";
  out << "  \"BasePath\": \"" << json_escape(config.base_path) << "\",\n";
  out << "  \"OutputDir\": \"" << json_escape(config.output_path) << "\",\n";
  out << "  \"Extension\": \"" << json_escape(config.extension) << "\",\n";

  std::vector<std::string> outputs;
  out << "  \"Groups\": [\n";
  for (size_t i = 0; i < summary.groups.size(); ++i) {
    const GroupOutcome& o = summary.groups[i];
    const bool written = (o.status == GroupStatus::Written);
    if (written) outputs.push_back(o.group.output_name);

    out << "    {\n";
    out << "      \"Band\": \"" << json_escape(o.group.band) << "\",\n";
    out << "      \"Intensity\": \"" << json_escape(o.group.intensity) << "\",\n";
    out << "      \"InputDir\": \"" << json_escape(o.group.source_dir) << "\",\n";
    out << "      \"Status\": \"" << group_status_name(o.status) << "\",\n";
    out << "      \"SkipReason\": ";
    write_string_or_null(written ? std::string() : skip_reason_name(o.reason));
    out << ",\n";
    out << "      \"FilesSeen\": " << o.scan.n_files << ",\n";
    out << "      \"FilesValid\": " << o.scan.n_valid << ",\n";
    out << "      \"MaxLength\": " << o.scan.max_rows << ",\n";
    out << "      \"Trials\": " << o.n_trials << ",\n";
    out << "      \"Channels\": " << o.n_channels << ",\n";
    out << "      \"Output\": ";
    write_string_or_null(written ? o.group.output_name : std::string());
    out << "\n";
    out << "    }";
    if (i + 1 < summary.groups.size()) out << ",";
    out << "\n";
  }
  out << "  ],\n";

  out << "  \"Outputs\": [\n";
  for (size_t i = 0; i < outputs.size(); ++i) {
    out << "    \"" << json_escape(outputs[i]) << "\"";
    if (i + 1 < outputs.size()) out << ",";
    out << "\n";
  }
  out << "  ]\n";
  out << "}\n";
  return out.str();
}

bool write_run_summary_json(const std::string& json_path,
                            const PipelineConfig& config,
                            const RunSummary& summary) {
  return write_file_atomic(json_path, run_summary_json(config, summary));
}

} // namespace eegpad
