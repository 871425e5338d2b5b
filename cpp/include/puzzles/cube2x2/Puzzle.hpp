#pragma once

#include "core/BasicTypes.hpp"
#include "core/PuzzleTypes.hpp"
#include "core/concepts/PuzzleConcept.hpp"
#include "puzzles/cube2x2/Constants.hpp"
#include "puzzles/cube2x2/InputTensorizor.hpp"
#include "puzzles/cube2x2/Types.hpp"

#include <ostream>
#include <string>

namespace cube2x2 {

/*
 * The 2x2x2 cube, reduced to its corners: a State is a permutation of the 8 corner cubelets among
 * the 8 slots, together with a twist for each of them.
 *
 * The moves are quarter turns of the right, top and back faces, and their inverses. Holding the
 * down-front-left corner fixed this way, every position of the cube is reachable, and every
 * reachable position has exactly one State.
 */
struct Puzzle {
  struct Constants {
    static constexpr const char* kPuzzleName = "cube2x2";
    static constexpr int kNumActions = cube2x2::kNumActions;
    static constexpr int kNumGenerators = cube2x2::kNumGenerators;
  };

  using State = cube2x2::State;
  using Types = core::PuzzleTypes<Constants, State>;
  using InputTensorizor = cube2x2::InputTensorizor;

  struct Rules {
    static void init_state(State& state);
    static State identity();
    static bool is_goal(const State& state);
    static Types::ActionMask get_legal_moves(const State& state);

    // Throws util::Exception if action is out of range.
    static core::action_t inverse(core::action_t action);
    static void apply(State& state, core::action_t action);
    static State transform(const State& state, core::action_t action);

    // Throws util::Exception if state is not a valid State.
    static void validate(const State& state);
  };

  struct IO {
    using RenderedState = cube2x2::RenderedState;

    static std::string action_delimiter() { return " "; }

    // "R+", "U+", "B+" for the generators, "R-", "U-", "B-" for their inverses.
    static std::string action_to_str(core::action_t action);
    static core::action_t action_from_str(const std::string& str);
    static RenderedState render(const State& state);

    /*
     * Prints the unfolded net:
     *
     *    WW
     *    WW
     * GG RR BB OO
     * GG RR BB OO
     *    YY
     *    YY
     *
     * In terminal mode, each cell is a colored block instead of a letter.
     */
    static void print_state(std::ostream& ss, const State& state);

    // "[0 5 1 3 4 6 2 7|0 2 1 0 0 1 2 0]": corner_pos, then corner_ort
    static std::string compact_state_repr(const State& state);
  };

  // Checks the static tables for consistency. Throws util::Exception on failure.
  static void static_init();
};

}  // namespace cube2x2

static_assert(core::concepts::Puzzle<cube2x2::Puzzle>);

#include "inline/puzzles/cube2x2/Puzzle.inl"

// Ensures the env bindings are available whenever the Puzzle is.
#include "puzzles/cube2x2/Bindings.hpp"
