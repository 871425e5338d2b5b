#include "puzzles/cube2x2/InputTensorizor.hpp"

namespace cube2x2 {

inline InputTensorizor::Tensor InputTensorizor::tensorize(const State& state) {
  Tensor tensor;
  tensor.setZero();
  for (int slot = 0; slot < kNumSlots; ++slot) {
    int corner = state.corner_pos[slot];
    if (corner >= kNumEncodedCorners) continue;
    tensor(corner, slot * kNumOrientations + state.corner_ort[slot]) = 1;
  }
  return tensor;
}

}  // namespace cube2x2
