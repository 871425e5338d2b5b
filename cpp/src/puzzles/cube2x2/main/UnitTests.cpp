#include "core/tests/Common.hpp"
#include "puzzles/cube2x2/MoveTables.hpp"
#include "puzzles/cube2x2/Puzzle.hpp"
#include "util/EigenUtil.hpp"
#include "util/Exception.hpp"
#include "util/GTestUtil.hpp"
#include "util/Rendering.hpp"

#include <gtest/gtest.h>

#include <array>
#include <random>
#include <sstream>
#include <string>
#include <unordered_set>
#include <utility>
#include <vector>

using Puzzle = cube2x2::Puzzle;
using State = Puzzle::State;
using Rules = Puzzle::Rules;
using IO = Puzzle::IO;
using InputTensorizor = Puzzle::InputTensorizor;
using RenderedState = cube2x2::RenderedState;
using Env = cube2x2::Env;
using Common = core::tests::Common<Puzzle>;

namespace {

using FaceStrs = std::array<std::string, cube2x2::kNumFaces>;  // top, left, back, front, right, bottom
using OneHots = std::vector<std::pair<int, int>>;            // (row, col) of each set entry

State apply_all(const std::vector<core::action_t>& actions) {
  State state = Rules::identity();
  for (core::action_t a : actions) {
    Rules::apply(state, a);
  }
  return state;
}

void expect_faces(const RenderedState& rendered, const FaceStrs& expected) {
  for (int f = 0; f < cube2x2::kNumFaces; ++f) {
    std::string actual;
    for (cube2x2::color_t c : rendered.faces[f]) {
      actual += cube2x2::color_to_char(c);
    }
    EXPECT_EQ(actual, expected[f]) << cube2x2::face_to_str(cube2x2::face_t(f));
  }
}

void expect_one_hots(const InputTensorizor::Tensor& tensor, const OneHots& expected) {
  EXPECT_EQ(eigen_util::count(tensor), int(expected.size()));
  for (const auto& [row, col] : expected) {
    EXPECT_EQ(tensor(row, col), 1) << "(" << row << ", " << col << ")";
  }
}

void expect_state(const State& state, const std::array<int, cube2x2::kNumSlots>& pos,
                  const std::array<int, cube2x2::kNumSlots>& ort) {
  for (int s = 0; s < cube2x2::kNumSlots; ++s) {
    EXPECT_EQ(state.corner_pos[s], pos[s]) << "slot " << s;
    EXPECT_EQ(state.corner_ort[s], ort[s]) << "slot " << s;
  }
}

}  // namespace

TEST(Cube2x2, Common) {
  Common::gtest_inverse_involution();
  Common::gtest_transform_then_inverse();
  Common::gtest_generator_order(cube2x2::kCycleLength);
  Common::gtest_goal_predicate();
  Common::gtest_action_str_round_trip();
  Common::gtest_tensorize_one_hot(200, 1234);
  Common::gtest_random_walk_undo(500, 5678);
}

TEST(Cube2x2, static_init) { EXPECT_NO_THROW(Puzzle::static_init()); }

TEST(Cube2x2, identity) {
  State state = Rules::identity();
  expect_state(state, {0, 1, 2, 3, 4, 5, 6, 7}, {0, 0, 0, 0, 0, 0, 0, 0});
  EXPECT_EQ(IO::compact_state_repr(state), "[0 1 2 3 4 5 6 7|0 0 0 0 0 0 0 0]");
  EXPECT_TRUE(state.valid());
  EXPECT_NO_THROW(Rules::validate(state));

  State state2;
  Rules::init_state(state2);
  EXPECT_EQ(state, state2);
}

TEST(Cube2x2, legal_moves) {
  State state = apply_all({cube2x2::kR, cube2x2::kB});
  Puzzle::Types::ActionMask mask = Rules::get_legal_moves(state);
  EXPECT_EQ(int(mask.count()), cube2x2::kNumActions);
}

TEST(Cube2x2, inverse_pairs) {
  EXPECT_EQ(Rules::inverse(cube2x2::kR), cube2x2::kRInv);
  EXPECT_EQ(Rules::inverse(cube2x2::kT), cube2x2::kTInv);
  EXPECT_EQ(Rules::inverse(cube2x2::kB), cube2x2::kBInv);
  EXPECT_EQ(Rules::inverse(cube2x2::kRInv), cube2x2::kR);
  EXPECT_EQ(Rules::inverse(cube2x2::kTInv), cube2x2::kT);
  EXPECT_EQ(Rules::inverse(cube2x2::kBInv), cube2x2::kB);
}

TEST(Cube2x2, derived_inverse_tables) {
  using cube2x2::tables::kMoveSpecs;

  const cube2x2::MoveSpec& r = kMoveSpecs[cube2x2::kRInv];
  std::vector<std::pair<int, int>> cycle;
  for (const auto& m : r.cycle) cycle.emplace_back(m.src, m.dst);
  EXPECT_EQ(cycle, (std::vector<std::pair<int, int>>{{2, 1}, {6, 2}, {5, 6}, {1, 5}}));
  std::array<int, cube2x2::kNumSlots> twist;
  for (int s = 0; s < cube2x2::kNumSlots; ++s) twist[s] = r.twist[s];
  EXPECT_EQ(twist, (std::array<int, cube2x2::kNumSlots>{0, 2, 1, 0, 0, 1, 2, 0}));

  const cube2x2::MoveSpec& b = kMoveSpecs[cube2x2::kBInv];
  cycle.clear();
  for (const auto& m : b.cycle) cycle.emplace_back(m.src, m.dst);
  EXPECT_EQ(cycle, (std::vector<std::pair<int, int>>{{3, 2}, {7, 3}, {6, 7}, {2, 6}}));
  for (int s = 0; s < cube2x2::kNumSlots; ++s) twist[s] = b.twist[s];
  EXPECT_EQ(twist, (std::array<int, cube2x2::kNumSlots>{0, 0, 2, 1, 0, 0, 1, 2}));

  const cube2x2::MoveSpec& t = kMoveSpecs[cube2x2::kTInv];
  for (int s = 0; s < cube2x2::kNumSlots; ++s) EXPECT_EQ(t.twist[s], 0);
}

TEST(Cube2x2, R) {
  State state = apply_all({cube2x2::kR});
  expect_state(state, {0, 5, 1, 3, 4, 6, 2, 7}, {0, 2, 1, 0, 0, 1, 2, 0});
  EXPECT_EQ(IO::compact_state_repr(state), "[0 5 1 3 4 6 2 7|0 2 1 0 0 1 2 0]");
  expect_faces(IO::render(state), {"WRWR", "GGGG", "WOWO", "RYRY", "BBBB", "YOYO"});
  expect_one_hots(InputTensorizor::tensorize(state),
                  {{0, 0}, {1, 7}, {2, 20}, {3, 9}, {4, 12}, {5, 5}, {6, 16}});
}

TEST(Cube2x2, T) {
  State state = apply_all({cube2x2::kT});
  expect_state(state, {1, 2, 3, 0, 4, 5, 6, 7}, {0, 0, 0, 0, 0, 0, 0, 0});
  expect_faces(IO::render(state), {"WWWW", "RRGG", "GGOO", "BBRR", "OOBB", "YYYY"});
  expect_one_hots(InputTensorizor::tensorize(state),
                  {{0, 9}, {1, 0}, {2, 3}, {3, 6}, {4, 12}, {5, 15}, {6, 18}});
}

TEST(Cube2x2, B) {
  State state = apply_all({cube2x2::kB});
  expect_state(state, {0, 1, 6, 2, 4, 5, 7, 3}, {0, 0, 2, 1, 0, 0, 1, 2});
  expect_faces(IO::render(state), {"BBWW", "WGWG", "OOOO", "RRRR", "BYBY", "YYGG"});
  expect_one_hots(InputTensorizor::tensorize(state),
                  {{0, 0}, {1, 3}, {2, 10}, {3, 23}, {4, 12}, {5, 15}, {6, 8}});
}

TEST(Cube2x2, RInv) {
  State state = apply_all({cube2x2::kRInv});
  expect_state(state, {0, 2, 6, 3, 4, 1, 5, 7}, {0, 2, 1, 0, 0, 1, 2, 0});
  expect_faces(IO::render(state), {"WOWO", "GGGG", "YOYO", "RWRW", "BBBB", "YRYR"});
  expect_one_hots(InputTensorizor::tensorize(state),
                  {{0, 0}, {1, 16}, {2, 5}, {3, 9}, {4, 12}, {5, 20}, {6, 7}});
}

TEST(Cube2x2, TInv) {
  State state = apply_all({cube2x2::kTInv});
  expect_state(state, {3, 0, 1, 2, 4, 5, 6, 7}, {0, 0, 0, 0, 0, 0, 0, 0});
  expect_faces(IO::render(state), {"WWWW", "OOGG", "BBOO", "GGRR", "RRBB", "YYYY"});
  expect_one_hots(InputTensorizor::tensorize(state),
                  {{0, 3}, {1, 6}, {2, 9}, {3, 0}, {4, 12}, {5, 15}, {6, 18}});
}

TEST(Cube2x2, BInv) {
  State state = apply_all({cube2x2::kBInv});
  expect_state(state, {0, 1, 3, 7, 4, 5, 2, 6}, {0, 0, 2, 1, 0, 0, 1, 2});
  expect_faces(IO::render(state), {"GGWW", "YGYG", "OOOO", "RRRR", "BWBW", "YYBB"});
  expect_one_hots(InputTensorizor::tensorize(state),
                  {{0, 0}, {1, 3}, {2, 19}, {3, 8}, {4, 12}, {5, 15}, {6, 23}});
}

TEST(Cube2x2, RTBR) {
  State state = apply_all({cube2x2::kR, cube2x2::kT, cube2x2::kB, cube2x2::kR});
  expect_state(state, {5, 6, 1, 3, 4, 7, 2, 0}, {2, 0, 2, 1, 0, 2, 0, 2});
  expect_faces(IO::render(state), {"OBRY", "WYWG", "RGBG", "BORG", "BWYO", "YORW"});
  expect_one_hots(InputTensorizor::tensorize(state),
                  {{0, 23}, {1, 8}, {2, 18}, {3, 10}, {4, 12}, {5, 2}, {6, 3}});
}

TEST(Cube2x2, undo_single_move) {
  EXPECT_TRUE(Rules::is_goal(apply_all({cube2x2::kR, cube2x2::kRInv})));
}

TEST(Cube2x2, undo_composition) {
  State state = apply_all({cube2x2::kR, cube2x2::kT, Rules::inverse(cube2x2::kT),
                           Rules::inverse(cube2x2::kR)});
  EXPECT_EQ(state, Rules::identity());

  // Undoing in the wrong order does not return to the identity.
  state = apply_all({cube2x2::kR, cube2x2::kT, Rules::inverse(cube2x2::kR),
                     Rules::inverse(cube2x2::kT)});
  EXPECT_NE(state, Rules::identity());
}

TEST(Cube2x2, quarter_turn_cycle) {
  State state = apply_all({cube2x2::kR, cube2x2::kR});
  EXPECT_FALSE(Rules::is_goal(state));
  Rules::apply(state, cube2x2::kR);
  Rules::apply(state, cube2x2::kR);
  EXPECT_TRUE(Rules::is_goal(state));
}

TEST(Cube2x2, transform_is_pure) {
  const State state = apply_all({cube2x2::kB, cube2x2::kT});
  State copy = state;
  State child = Rules::transform(state, cube2x2::kR);
  EXPECT_EQ(state, copy);
  EXPECT_NE(child, state);
}

TEST(Cube2x2, render_identity) {
  RenderedState rendered = IO::render(Rules::identity());
  expect_faces(rendered, {"WWWW", "GGGG", "OOOO", "RRRR", "BBBB", "YYYY"});

  // The top face shows the first-listed color of the top corners, and so on.
  using cube2x2::tables::kCornerColors;
  for (cube2x2::color_t c : rendered.top()) EXPECT_EQ(c, kCornerColors[cube2x2::kTFL][0]);
  for (cube2x2::color_t c : rendered.bottom()) EXPECT_EQ(c, kCornerColors[cube2x2::kDFL][0]);
  for (cube2x2::color_t c : rendered.front()) EXPECT_EQ(c, kCornerColors[cube2x2::kTFL][1]);
  for (cube2x2::color_t c : rendered.left()) EXPECT_EQ(c, kCornerColors[cube2x2::kTFL][2]);
  EXPECT_EQ(rendered.at(cube2x2::kRight, 1, 0), cube2x2::kBlue);
  EXPECT_EQ(rendered.back()[3], cube2x2::kOrange);
}

TEST(Cube2x2, placements_cover_every_cell) {
  std::array<int, cube2x2::kNumFaces * cube2x2::kNumCellsPerFace> hits{};
  for (int s = 0; s < cube2x2::kNumSlots; ++s) {
    for (int i = 0; i < cube2x2::kNumColorsPerCorner; ++i) {
      const cube2x2::FaceCell& fc = cube2x2::tables::kCornerPlacements[s][i];
      hits[fc.face * cube2x2::kNumCellsPerFace + fc.cell]++;
    }
  }
  for (int h : hits) EXPECT_EQ(h, 1);
}

TEST(Cube2x2, render_color_counts) {
  std::mt19937 prng(42);
  std::uniform_int_distribution<core::action_t> dist(0, cube2x2::kNumActions - 1);
  State state = Rules::identity();
  for (int step = 0; step < 100; ++step) {
    Rules::apply(state, dist(prng));
    std::array<int, cube2x2::kNumColors> counts{};
    for (const auto& face : IO::render(state).faces) {
      for (cube2x2::color_t c : face) counts[c]++;
    }
    for (int n : counts) EXPECT_EQ(n, cube2x2::kNumCellsPerFace);

    // No move touches the DFL slot.
    EXPECT_EQ(state.corner_pos[cube2x2::kDFL], cube2x2::kDFL);
    EXPECT_EQ(state.corner_ort[cube2x2::kDFL], 0);
  }
}

TEST(Cube2x2, tensorize_identity) {
  InputTensorizor::Tensor tensor = InputTensorizor::tensorize(Rules::identity());
  OneHots expected;
  for (int p = 0; p < cube2x2::kNumEncodedCorners; ++p) {
    expected.emplace_back(p, p * cube2x2::kNumOrientations);
  }
  expect_one_hots(tensor, expected);
}

TEST(Cube2x2, tensorize_is_fresh) {
  InputTensorizor::Tensor a = InputTensorizor::tensorize(apply_all({cube2x2::kR}));
  InputTensorizor::Tensor b = InputTensorizor::tensorize(Rules::identity());
  InputTensorizor::Tensor c = InputTensorizor::tensorize(Rules::identity());
  EXPECT_FALSE(eigen_util::equal(a, b));
  EXPECT_TRUE(eigen_util::equal(b, c));
}

TEST(Cube2x2, action_strs) {
  EXPECT_EQ(IO::action_to_str(cube2x2::kR), "R+");
  EXPECT_EQ(IO::action_to_str(cube2x2::kT), "U+");
  EXPECT_EQ(IO::action_to_str(cube2x2::kB), "B+");
  EXPECT_EQ(IO::action_to_str(cube2x2::kRInv), "R-");
  EXPECT_EQ(IO::action_to_str(cube2x2::kTInv), "U-");
  EXPECT_EQ(IO::action_to_str(cube2x2::kBInv), "B-");
  EXPECT_EQ(IO::action_from_str("ZZ"), core::kNullAction);
  EXPECT_EQ(IO::action_from_str("r+"), core::kNullAction);
  EXPECT_EQ(IO::action_from_str("R+ "), core::kNullAction);
}

TEST(Cube2x2, invalid_actions) {
  State state = Rules::identity();
  EXPECT_THROW(Rules::apply(state, -1), util::Exception);
  EXPECT_THROW(Rules::apply(state, cube2x2::kNumActions), util::Exception);
  EXPECT_THROW(Rules::transform(state, 99), util::Exception);
  EXPECT_THROW(Rules::inverse(cube2x2::kNumActions), util::Exception);
  EXPECT_THROW(IO::action_to_str(-1), util::Exception);
  EXPECT_EQ(state, Rules::identity());
}

TEST(Cube2x2, invalid_states) {
  State state = Rules::identity();
  state.corner_pos[1] = 0;
  EXPECT_FALSE(state.valid());
  EXPECT_THROW(Rules::validate(state), util::Exception);

  state = Rules::identity();
  state.corner_ort[4] = 3;
  EXPECT_FALSE(state.valid());
  EXPECT_THROW(Rules::validate(state), util::Exception);

  state = Rules::identity();
  state.corner_pos[7] = 8;
  EXPECT_THROW(Rules::validate(state), util::Exception);
}

TEST(Cube2x2, hash) {
  State a = apply_all({cube2x2::kR, cube2x2::kT});
  State b = apply_all({cube2x2::kR, cube2x2::kT});
  EXPECT_EQ(std::hash<State>{}(a), std::hash<State>{}(b));

  // The 6 neighbors of the identity are all distinct.
  std::unordered_set<State> neighbors;
  for (core::action_t action = 0; action < cube2x2::kNumActions; ++action) {
    neighbors.insert(Rules::transform(Rules::identity(), action));
  }
  EXPECT_EQ(neighbors.size(), size_t(cube2x2::kNumActions));
  EXPECT_EQ(neighbors.count(Rules::identity()), 0u);
}

TEST(Cube2x2, print_state) {
  util::Rendering::Guard guard(util::Rendering::kText);

  std::ostringstream ss;
  IO::print_state(ss, Rules::identity());
  EXPECT_EQ(ss.str(),
            "   WW\n"
            "   WW\n"
            "GG RR BB OO\n"
            "GG RR BB OO\n"
            "   YY\n"
            "   YY\n");

  ss.str("");
  IO::print_state(ss, apply_all({cube2x2::kR}));
  EXPECT_EQ(ss.str(),
            "   WR\n"
            "   WR\n"
            "GG RY BB WO\n"
            "GG RY BB WO\n"
            "   YO\n"
            "   YO\n");
}

TEST(Cube2x2, print_state_terminal) {
  util::Rendering::Guard guard(util::Rendering::kTerminal);

  std::ostringstream ss;
  IO::print_state(ss, Rules::identity());
  std::string out = ss.str();
  EXPECT_NE(out.find("\033[38;5;208m"), std::string::npos);  // orange
  EXPECT_EQ(out.find('W'), std::string::npos);
}

TEST(Cube2x2, env) {
  EXPECT_STREQ(Env::kName, "cube2x2");
  EXPECT_EQ(Env::kEncodedShape[0], 7);
  EXPECT_EQ(Env::kEncodedShape[1], 24);

  Env::action_array_t actions = Env::actions();
  for (int i = 0; i < cube2x2::kNumActions; ++i) {
    EXPECT_EQ(actions[i], i);
    EXPECT_EQ(Env::parse_action(Env::render_action(actions[i])), actions[i]);
    EXPECT_EQ(Env::inverse_action(Env::inverse_action(actions[i])), actions[i]);
  }
  EXPECT_EQ(Env::parse_action("ZZ"), core::kNullAction);

  State state = Env::initial_state();
  EXPECT_TRUE(Env::is_goal(state));
  state = Env::transform(state, cube2x2::kB);
  EXPECT_FALSE(Env::is_goal(state));
  EXPECT_EQ(Env::render(state), IO::render(state));
  EXPECT_TRUE(eigen_util::equal(Env::encode(state), InputTensorizor::tensorize(state)));
}

int main(int argc, char** argv) { return launch_gtest(argc, argv); }
