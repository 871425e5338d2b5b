#pragma once

#include "core/BasicTypes.hpp"
#include "core/concepts/PuzzleConstantsConcept.hpp"

#include <bitset>

namespace core {

template <concepts::PuzzleConstants PuzzleConstants, typename State_>
struct PuzzleTypes {
  using State = State_;
  static constexpr int kNumActions = PuzzleConstants::kNumActions;
  static constexpr int kNumGenerators = PuzzleConstants::kNumGenerators;

  using ActionMask = std::bitset<kNumActions>;
};

}  // namespace core
