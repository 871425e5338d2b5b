#include "core/tests/Common.hpp"

#include "core/BasicTypes.hpp"
#include "util/EigenUtil.hpp"

#include <gtest/gtest.h>

#include <random>
#include <vector>

namespace core {
namespace tests {

template <concepts::Puzzle Puzzle>
void Common<Puzzle>::gtest_inverse_involution() {
  for (core::action_t a = 0; a < kNumActions; ++a) {
    core::action_t inv = Rules::inverse(a);
    EXPECT_GE(inv, 0);
    EXPECT_LT(inv, kNumActions);
    EXPECT_NE(inv, a);
    EXPECT_EQ(Rules::inverse(inv), a);
  }
}

template <concepts::Puzzle Puzzle>
void Common<Puzzle>::gtest_transform_then_inverse() {
  const State start = Rules::identity();
  for (core::action_t a = 0; a < kNumActions; ++a) {
    State state = Rules::transform(start, a);
    EXPECT_NE(state, start) << IO::action_to_str(a);
    state = Rules::transform(state, Rules::inverse(a));
    EXPECT_EQ(state, start) << IO::action_to_str(a) << " " << IO::compact_state_repr(state);
  }
}

template <concepts::Puzzle Puzzle>
void Common<Puzzle>::gtest_generator_order(int cycle_length) {
  const State start = Rules::identity();
  for (core::action_t a = 0; a < kNumActions; ++a) {
    State state = start;
    for (int k = 1; k < cycle_length; ++k) {
      Rules::apply(state, a);
      EXPECT_NE(state, start) << IO::action_to_str(a) << "^" << k;
    }
    Rules::apply(state, a);
    EXPECT_EQ(state, start) << IO::action_to_str(a) << "^" << cycle_length;
  }
}

template <concepts::Puzzle Puzzle>
void Common<Puzzle>::gtest_goal_predicate() {
  const State start = Rules::identity();
  EXPECT_TRUE(Rules::is_goal(start));
  for (core::action_t a = 0; a < kNumActions; ++a) {
    EXPECT_FALSE(Rules::is_goal(Rules::transform(start, a))) << IO::action_to_str(a);
  }
}

template <concepts::Puzzle Puzzle>
void Common<Puzzle>::gtest_action_str_round_trip() {
  for (core::action_t a = 0; a < kNumActions; ++a) {
    std::string str = IO::action_to_str(a);
    EXPECT_EQ(IO::action_from_str(str), a) << str;
  }
  EXPECT_EQ(IO::action_from_str("ZZ"), core::kNullAction);
  EXPECT_EQ(IO::action_from_str(""), core::kNullAction);
}

template <concepts::Puzzle Puzzle>
void Common<Puzzle>::gtest_tensorize_one_hot(int num_steps, uint32_t seed) {
  using InputTensorizor = Puzzle::InputTensorizor;
  using Tensor = InputTensorizor::Tensor;
  using Shape = eigen_util::extract_shape_t<Tensor>;
  static_assert(eigen_util::rank_v<Shape> == 2, "one row per encoded piece");
  constexpr int kNumRows = eigen_util::to_std_array_v<Shape>[0];
  constexpr int kNumCols = eigen_util::to_std_array_v<Shape>[1];

  std::mt19937 prng(seed);
  std::uniform_int_distribution<core::action_t> dist(0, kNumActions - 1);

  State state = Rules::identity();
  for (int step = 0; step <= num_steps; ++step) {
    Tensor tensor = InputTensorizor::tensorize(state);
    EXPECT_EQ(eigen_util::count(tensor), kNumRows) << IO::compact_state_repr(state);
    for (int r = 0; r < kNumRows; ++r) {
      float row_sum = 0;
      for (int c = 0; c < kNumCols; ++c) {
        row_sum += tensor(r, c);
      }
      EXPECT_EQ(row_sum, 1) << "row " << r << " of " << IO::compact_state_repr(state);
    }
    Rules::apply(state, dist(prng));
  }
}

template <concepts::Puzzle Puzzle>
void Common<Puzzle>::gtest_random_walk_undo(int num_steps, uint32_t seed) {
  std::mt19937 prng(seed);
  std::uniform_int_distribution<core::action_t> dist(0, kNumActions - 1);

  const State start = Rules::identity();
  State state = start;
  std::vector<core::action_t> actions;
  for (int step = 0; step < num_steps; ++step) {
    core::action_t a = dist(prng);
    actions.push_back(a);
    Rules::apply(state, a);
    Rules::validate(state);
  }

  for (auto it = actions.rbegin(); it != actions.rend(); ++it) {
    Rules::apply(state, Rules::inverse(*it));
  }
  EXPECT_EQ(state, start) << IO::compact_state_repr(state);
}

}  // namespace tests
}  // namespace core
