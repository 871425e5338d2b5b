#include "core/PuzzleEnv.hpp"

namespace core {

template <concepts::Puzzle Puzzle>
typename PuzzleEnv<Puzzle>::action_array_t PuzzleEnv<Puzzle>::actions() {
  action_array_t out;
  for (core::action_t a = 0; a < kNumActions; ++a) {
    out[a] = a;
  }
  return out;
}

}  // namespace core
