#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace eegpad {

// List regular files in dir whose extension matches ext (case-insensitive,
// including the dot, e.g. ".csv").
//
// The result is sorted by UTF-8 path so trial order is reproducible across
// platforms and runs. Returns an empty list if dir does not exist.
std::vector<std::string> list_trial_files(const std::string& dir, const std::string& ext = ".csv");

struct ScanResult {
  size_t max_rows{0};  // longest valid trial; 0 if none
  size_t n_files{0};   // files matching the extension
  size_t n_valid{0};   // files that loaded successfully
};

// First pass over a group directory: load every trial file and track the
// longest one. Files that fail to load are skipped (logged by the loader).
//
// Progress is printed to stdout.
ScanResult scan_max_length(const std::string& dir, const std::string& ext = ".csv");

} // namespace eegpad
