#include "puzzles/cube2x2/Puzzle.hpp"

#include "puzzles/cube2x2/MoveTables.hpp"
#include "util/Asserts.hpp"
#include "util/Exception.hpp"
#include "util/FiniteGroups.hpp"

namespace cube2x2 {

inline void Puzzle::Rules::init_state(State& state) {
  for (int slot = 0; slot < kNumSlots; ++slot) {
    state.corner_pos[slot] = slot;
    state.corner_ort[slot] = groups::C3::kIdentity;
  }
}

inline Puzzle::State Puzzle::Rules::identity() {
  State state;
  init_state(state);
  return state;
}

inline bool Puzzle::Rules::is_goal(const State& state) { return state == identity(); }

inline Puzzle::Types::ActionMask Puzzle::Rules::get_legal_moves(const State&) {
  Types::ActionMask mask;
  mask.set();
  return mask;
}

inline core::action_t Puzzle::Rules::inverse(core::action_t action) {
  if (action < 0 || action >= kNumActions) {
    throw util::Exception("Invalid action: {}", action);
  }
  return tables::kInverseActions[action];
}

inline void Puzzle::Rules::apply(State& state, core::action_t action) {
  if (action < 0 || action >= kNumActions) {
    throw util::Exception("Invalid action: {}", action);
  }
  DEBUG_ASSERT(state.valid(), "Invalid state: {}", IO::compact_state_repr(state));

  const MoveSpec& spec = tables::kMoveSpecs[action];
  const State prev = state;
  for (const SlotMove& m : spec.cycle) {
    state.corner_pos[m.dst] = prev.corner_pos[m.src];
    state.corner_ort[m.dst] = prev.corner_ort[m.src];
  }
  for (int slot = 0; slot < kNumSlots; ++slot) {
    state.corner_ort[slot] = groups::C3::compose(state.corner_ort[slot], spec.twist[slot]);
  }
}

inline Puzzle::State Puzzle::Rules::transform(const State& state, core::action_t action) {
  State out = state;
  apply(out, action);
  return out;
}

inline void Puzzle::Rules::validate(const State& state) {
  if (!state.valid()) {
    throw util::Exception("Invalid {} state: {}", Constants::kPuzzleName,
                          IO::compact_state_repr(state));
  }
}

}  // namespace cube2x2
