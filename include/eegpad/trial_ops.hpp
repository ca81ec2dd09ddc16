#pragma once

#include "eegpad/types.hpp"

#include <cstddef>
#include <optional>
#include <vector>

namespace eegpad {

// Zero-pad a trial along the time axis.
//
// If t.n_rows < target_rows, (target_rows - t.n_rows) rows of 0.0 are appended;
// the original samples stay in place and the column count is unchanged.
// If t.n_rows >= target_rows, the trial is returned unchanged (never truncated).
TrialTable pad_rows(const TrialTable& t, size_t target_rows);

// In-place variant of pad_rows().
void pad_rows_inplace(TrialTable* t, size_t target_rows);

// Stack trials into a block with the trial index as the leading axis.
//
// Returns std::nullopt for an empty input. Throws std::invalid_argument when
// the trials do not all share the same (rows, cols) shape.
std::optional<DatasetBlock> stack_trials(const std::vector<TrialTable>& trials);

} // namespace eegpad
