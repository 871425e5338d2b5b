#pragma once

#include "core/PuzzleEnv.hpp"
#include "puzzles/cube2x2/Puzzle.hpp"

namespace cube2x2 {

using Env = core::PuzzleEnv<Puzzle>;

static_assert(Env::kEncodedShape[0] == kNumEncodedCorners);
static_assert(Env::kEncodedShape[1] == kNumSlots * kNumOrientations);

}  // namespace cube2x2
