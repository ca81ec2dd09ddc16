#include "eegpad/trial_ops.hpp"

#include "test_support.hpp"

#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace eegpad;

static TrialTable make_trial(size_t rows, size_t cols, double base) {
  TrialTable t;
  t.n_rows = rows;
  t.n_cols = cols;
  for (size_t c = 0; c < cols; ++c) t.channel_names.push_back("C" + std::to_string(c + 1));
  t.data.resize(rows * cols);
  for (size_t r = 0; r < rows; ++r) {
    for (size_t c = 0; c < cols; ++c) {
      t.at(r, c) = base + static_cast<double>(r) + 0.1 * static_cast<double>(c + 1);
    }
  }
  return t;
}

int main() {
  // Padding to a longer target keeps the prefix and appends zero rows.
  {
    const TrialTable t = make_trial(5, 3, 1.0);
    const TrialTable p = pad_rows(t, 9);
    assert(p.n_rows == 9);
    assert(p.n_cols == 3);
    assert(p.data.size() == 27);
    assert(p.channel_names == t.channel_names);
    for (size_t r = 0; r < 5; ++r) {
      for (size_t c = 0; c < 3; ++c) assert(p.at(r, c) == t.at(r, c));
    }
    for (size_t r = 5; r < 9; ++r) {
      for (size_t c = 0; c < 3; ++c) assert(p.at(r, c) == 0.0);
    }
  }

  // Equal or shorter target: unchanged, never truncated.
  {
    const TrialTable t = make_trial(6, 2, -3.0);
    const TrialTable same = pad_rows(t, 6);
    assert(same.n_rows == 6);
    assert(same.data == t.data);

    const TrialTable shorter = pad_rows(t, 2);
    assert(shorter.n_rows == 6);
    assert(shorter.data == t.data);

    const TrialTable zero = pad_rows(t, 0);
    assert(zero.n_rows == 6);
  }

  // An empty trial pads to an all-zero block.
  {
    TrialTable t = make_trial(0, 4, 0.0);
    pad_rows_inplace(&t, 3);
    assert(t.n_rows == 3);
    assert(t.data.size() == 12);
    for (double v : t.data) assert(v == 0.0);
  }

  // Stacking N same-shaped trials yields (N, R, C) with block[i] == trial i.
  {
    std::vector<TrialTable> trials = {make_trial(4, 2, 0.0), make_trial(4, 2, 10.0),
                                      make_trial(4, 2, 20.0)};
    const auto b = stack_trials(trials);
    assert(b.has_value());
    assert(b->n_trials == 3);
    assert(b->n_rows == 4);
    assert(b->n_cols == 2);
    assert(b->data.size() == 24);
    for (size_t i = 0; i < trials.size(); ++i) {
      for (size_t r = 0; r < 4; ++r) {
        for (size_t c = 0; c < 2; ++c) assert(b->at(i, r, c) == trials[i].at(r, c));
      }
    }
  }

  // Empty input produces no block.
  {
    const std::vector<TrialTable> none;
    assert(!stack_trials(none).has_value());
  }

  // Shape disagreements are rejected.
  {
    bool threw = false;
    try {
      (void)stack_trials({make_trial(4, 2, 0.0), make_trial(4, 3, 0.0)});
    } catch (const std::invalid_argument&) {
      threw = true;
    }
    assert(threw);

    threw = false;
    try {
      (void)stack_trials({make_trial(4, 2, 0.0), make_trial(5, 2, 0.0)});
    } catch (const std::invalid_argument&) {
      threw = true;
    }
    assert(threw);
  }

  // Pad-then-stack over mixed lengths, as the pipeline does it.
  {
    std::vector<TrialTable> trials = {make_trial(50, 4, 1.0), make_trial(80, 4, 2.0),
                                      make_trial(65, 4, 3.0)};
    for (auto& t : trials) pad_rows_inplace(&t, 80);
    const auto b = stack_trials(trials);
    assert(b.has_value());
    assert(b->n_trials == 3 && b->n_rows == 80 && b->n_cols == 4);
    for (size_t r = 50; r < 80; ++r) {
      for (size_t c = 0; c < 4; ++c) assert(b->at(0, r, c) == 0.0);
    }
    assert(b->at(0, 49, 0) != 0.0);
    assert(b->at(2, 64, 3) != 0.0);
    assert(b->at(2, 65, 3) == 0.0);
  }

  std::cout << "test_trial_ops: OK\n";
  return 0;
}
