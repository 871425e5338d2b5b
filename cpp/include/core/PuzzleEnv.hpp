#pragma once

#include "core/BasicTypes.hpp"
#include "core/concepts/PuzzleConcept.hpp"
#include "util/EigenUtil.hpp"

#include <array>
#include <string>

namespace core {

/*
 * PuzzleEnv<Puzzle> is the uniform record through which an external harness (a search algorithm,
 * a training loop) consumes a puzzle:
 *
 * {name, initial state, goal predicate, action enumeration, transform function, inverse-action
 *  function, render function, action-render/parse functions, encoded-feature shape, encode function}
 *
 * Everything is static, so a harness is written as a template over the Puzzle type:
 *
 * template <core::concepts::Puzzle Puzzle>
 * void explore() {
 *   using Env = core::PuzzleEnv<Puzzle>;
 *   auto state = Env::initial_state();
 *   for (core::action_t a : Env::actions()) {
 *     auto child = Env::transform(state, a);
 *     ...
 *   }
 * }
 *
 * All functions are pure over immutable values, and safe to call concurrently.
 */
template <concepts::Puzzle Puzzle>
struct PuzzleEnv {
  using State = Puzzle::State;
  using Rules = Puzzle::Rules;
  using IO = Puzzle::IO;
  using RenderedState = IO::RenderedState;
  using Tensor = Puzzle::InputTensorizor::Tensor;
  using EncodedShape = eigen_util::extract_shape_t<Tensor>;

  static constexpr int kNumActions = Puzzle::Constants::kNumActions;
  using action_array_t = std::array<core::action_t, kNumActions>;

  static constexpr const char* kName = Puzzle::Constants::kPuzzleName;
  static constexpr auto kEncodedShape = eigen_util::to_std_array_v<EncodedShape>;

  static State initial_state() { return Rules::identity(); }
  static bool is_goal(const State& state) { return Rules::is_goal(state); }
  static action_array_t actions();
  static State transform(const State& state, core::action_t action) {
    return Rules::transform(state, action);
  }
  static core::action_t inverse_action(core::action_t action) { return Rules::inverse(action); }
  static RenderedState render(const State& state) { return IO::render(state); }
  static std::string render_action(core::action_t action) { return IO::action_to_str(action); }

  // Returns core::kNullAction if str does not name an action.
  static core::action_t parse_action(const std::string& str) { return IO::action_from_str(str); }
  static Tensor encode(const State& state) { return Puzzle::InputTensorizor::tensorize(state); }
};

}  // namespace core

#include "inline/core/PuzzleEnv.inl"
