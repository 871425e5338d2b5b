#pragma once

#include "puzzles/cube2x2/Constants.hpp"
#include "puzzles/cube2x2/Types.hpp"
#include "util/EigenUtil.hpp"

namespace cube2x2 {

/*
 * One-hot encoding of where each of the first 7 physical corners is, and how it is twisted.
 *
 * Row c has a single 1, at column slot * 3 + orientation, for the slot that corner c occupies.
 * The last corner is omitted: its slot and orientation follow from the other 7.
 */
struct InputTensorizor {
  using Tensor =
    eigen_util::FTensor<Eigen::Sizes<kNumEncodedCorners, kNumSlots * kNumOrientations>>;

  static Tensor tensorize(const State& state);
};

}  // namespace cube2x2

#include "inline/puzzles/cube2x2/InputTensorizor.inl"
