#pragma once

#include "core/concepts/PuzzleConcept.hpp"

/*
 * This file contains unit-testing code that can be shared by all puzzles. Each function checks a
 * property of the move algebra that every Puzzle must have, using gtest EXPECT_* macros.
 */

namespace core {
namespace tests {

template <concepts::Puzzle Puzzle>
struct Common {
  using State = Puzzle::State;
  using Rules = Puzzle::Rules;
  using IO = Puzzle::IO;

  static constexpr int kNumActions = Puzzle::Constants::kNumActions;
  static constexpr int kNumGenerators = Puzzle::Constants::kNumGenerators;

  // inverse(inverse(a)) == a, and inverse(a) != a, for every action a.
  static void gtest_inverse_involution();

  // transform(transform(s, a), inverse(a)) == s, starting from the identity.
  static void gtest_transform_then_inverse();

  // Every generator returns to the identity after exactly cycle_length applications.
  static void gtest_generator_order(int cycle_length);

  // The identity is a goal, and no single action from the identity is.
  static void gtest_goal_predicate();

  // action_from_str(action_to_str(a)) == a, and unknown text maps to core::kNullAction.
  static void gtest_action_str_round_trip();

  // Every row of the encoding of every state along a random walk is one-hot.
  static void gtest_tensorize_one_hot(int num_steps, uint32_t seed);

  // A random walk followed by the inverses of its actions, in reverse order, returns to the start.
  static void gtest_random_walk_undo(int num_steps, uint32_t seed);
};

}  // namespace tests
}  // namespace core

#include "inline/core/tests/Common.inl"
