#include "eegpad/trial_ops.hpp"

#include <stdexcept>
#include <string>

namespace eegpad {

TrialTable pad_rows(const TrialTable& t, size_t target_rows) {
  TrialTable out = t;
  pad_rows_inplace(&out, target_rows);
  return out;
}

void pad_rows_inplace(TrialTable* t, size_t target_rows) {
  if (!t) throw std::invalid_argument("pad_rows_inplace: t is null");
  if (t->n_rows >= target_rows) return;
  t->data.resize(target_rows * t->n_cols, 0.0);
  t->n_rows = target_rows;
}

std::optional<DatasetBlock> stack_trials(const std::vector<TrialTable>& trials) {
  if (trials.empty()) return std::nullopt;

  const size_t n_rows = trials[0].n_rows;
  const size_t n_cols = trials[0].n_cols;
  for (size_t i = 0; i < trials.size(); ++i) {
    const TrialTable& t = trials[i];
    if (t.n_rows != n_rows || t.n_cols != n_cols) {
      throw std::invalid_argument("stack_trials: trial " + std::to_string(i) + " has shape (" +
                                  std::to_string(t.n_rows) + ", " + std::to_string(t.n_cols) +
                                  "), expected (" + std::to_string(n_rows) + ", " +
                                  std::to_string(n_cols) + ")");
    }
    if (t.data.size() != n_rows * n_cols) {
      throw std::invalid_argument("stack_trials: trial " + std::to_string(i) +
                                  " data size does not match its shape");
    }
  }

  DatasetBlock b;
  b.n_trials = trials.size();
  b.n_rows = n_rows;
  b.n_cols = n_cols;
  b.data.reserve(b.n_trials * n_rows * n_cols);
  for (const auto& t : trials) {
    b.data.insert(b.data.end(), t.data.begin(), t.data.end());
  }
  return b;
}

} // namespace eegpad
