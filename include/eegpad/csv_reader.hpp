#pragma once

#include "eegpad/types.hpp"

#include <optional>
#include <string>

namespace eegpad {

// Reads one trial CSV (header row + numeric channel columns) into a TrialTable.
//
// - Delimiter is detected from the header: ',' by default, ';' or tab when
//   those are more frequent outside quoted fields.
// - A leading unnamed column (empty header cell or pandas' "Unnamed: 0") is a
//   serialized row index and is dropped.
// - Empty cells and nan/na/null tokens become NaN.
// - A header-only file yields a table with zero rows.
class CSVReader {
public:
  CSVReader() = default;

  // Throws std::runtime_error if the file cannot be opened or parsed.
  TrialTable read(const std::string& path) const;
};

struct LoadResult {
  std::optional<TrialTable> table;
  SkipReason reason{SkipReason::None};
  std::string message;

  bool ok() const { return table.has_value(); }
};

// Non-throwing wrapper around CSVReader::read().
//
// On failure the error is printed to stderr and the result carries
// SkipReason::FileParseError; callers skip the file.
LoadResult load_trial_table(const std::string& path);

} // namespace eegpad
