#pragma once

#include "core/PuzzleTypes.hpp"
#include "core/concepts/InputTensorizorConcept.hpp"
#include "core/concepts/PuzzleConstantsConcept.hpp"
#include "core/concepts/PuzzleIOConcept.hpp"
#include "core/concepts/PuzzleRulesConcept.hpp"
#include "util/CppUtil.hpp"

#include <concepts>
#include <type_traits>

namespace core {

namespace concepts {

/*
 * All Puzzle classes P must satisfy core::concepts::Puzzle<P>.
 *
 * States are plain values: trivially copyable so that search code can store them by the million,
 * comparable and hashable so that they can key a transposition table.
 */
template <class P>
concept Puzzle = requires {
  requires core::concepts::PuzzleConstants<typename P::Constants>;
  requires std::same_as<typename P::Types,
                        core::PuzzleTypes<typename P::Constants, typename P::State>>;

  requires std::is_default_constructible_v<typename P::State>;
  requires std::is_trivially_copyable_v<typename P::State>;
  requires util::concepts::UsableAsHashMapKey<typename P::State>;

  requires core::concepts::PuzzleRules<typename P::Rules, typename P::Types, typename P::State>;
  requires core::concepts::PuzzleIO<typename P::IO, typename P::State>;
  requires core::concepts::InputTensorizor<typename P::InputTensorizor, typename P::State>;

  // Any puzzle-specific one-time static-initialization code should be placed in a static method
  // called static_init().
  { P::static_init() };
};

}  // namespace concepts

}  // namespace core
