#pragma once

#include "util/CppUtil.hpp"

#include <concepts>

namespace core {
namespace concepts {

template <class PC>
concept PuzzleConstants = requires {
  { util::decay_copy(PC::kPuzzleName) } -> std::same_as<const char*>;
  { util::decay_copy(PC::kNumActions) } -> std::same_as<int>;
  { util::decay_copy(PC::kNumGenerators) } -> std::same_as<int>;
};

}  // namespace concepts
}  // namespace core
