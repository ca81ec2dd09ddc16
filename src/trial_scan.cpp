#include "eegpad/trial_scan.hpp"

#include "eegpad/csv_reader.hpp"
#include "eegpad/utils.hpp"

#include <algorithm>
#include <filesystem>
#include <iostream>

namespace eegpad {

std::vector<std::string> list_trial_files(const std::string& dir, const std::string& ext) {
  std::vector<std::filesystem::path> paths;
  const std::filesystem::path d = std::filesystem::u8path(dir);
  std::error_code ec;
  if (!std::filesystem::is_directory(d, ec)) return {};

  const std::string want = to_lower(ext);
  for (auto it = std::filesystem::directory_iterator(d, ec);
       it != std::filesystem::directory_iterator();
       it.increment(ec)) {
    if (ec) break;
    if (!it->is_regular_file(ec)) continue;
    const std::filesystem::path p = it->path();
    if (to_lower(p.extension().u8string()) != want) continue;
    paths.push_back(p);
  }

  std::sort(paths.begin(), paths.end(),
            [](const std::filesystem::path& a, const std::filesystem::path& b) {
              return a.u8string() < b.u8string();
            });

  std::vector<std::string> out;
  out.reserve(paths.size());
  for (const auto& p : paths) out.push_back(p.u8string());
  return out;
}

ScanResult scan_max_length(const std::string& dir, const std::string& ext) {
  ScanResult r;
  const std::vector<std::string> files = list_trial_files(dir, ext);
  r.n_files = files.size();

  const std::string name = std::filesystem::u8path(dir).filename().u8string();
  std::cout << "-> Scanning " << files.size() << " files for max sequence length in "
            << name << "...\n";

  for (const auto& path : files) {
    const LoadResult lr = load_trial_table(path);
    if (!lr.ok()) continue;
    ++r.n_valid;
    r.max_rows = std::max(r.max_rows, lr.table->n_rows);
  }
  return r;
}

} // namespace eegpad
