#pragma once

#include "core/BasicTypes.hpp"

#include <concepts>

namespace core {
namespace concepts {

/*
 * The move algebra of a puzzle. Every action is legal in every state, and every action has an
 * inverse action. apply() mutates in place; transform() is the pure form of the same thing.
 */
template <typename PR, typename PuzzleTypes, typename State>
concept PuzzleRules = requires(const State& const_state, State& state, core::action_t action) {
  { PR::init_state(state) };
  { PR::identity() } -> std::same_as<State>;
  { PR::is_goal(const_state) } -> std::same_as<bool>;
  { PR::get_legal_moves(const_state) } -> std::same_as<typename PuzzleTypes::ActionMask>;
  { PR::inverse(action) } -> std::same_as<core::action_t>;
  { PR::apply(state, action) };
  { PR::transform(const_state, action) } -> std::same_as<State>;
  { PR::validate(const_state) };
};

}  // namespace concepts
}  // namespace core
