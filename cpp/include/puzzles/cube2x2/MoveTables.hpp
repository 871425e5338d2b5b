#pragma once

#include "puzzles/cube2x2/Constants.hpp"
#include "puzzles/cube2x2/Types.hpp"

#include <array>

namespace cube2x2 {
namespace tables {

/*
 * Quarter turns of the right, top and back faces, in action order (kR, kT, kB).
 *
 * The twist array is keyed by destination slot. A twist of 1 means the sticker that was listed
 * first for the cubelet (its top/bottom sticker when untwisted) now sits one step clockwise.
 */
constexpr MoveSpec kGeneratorSpecs[kNumGenerators] = {
  // kR
  {{{{kTFR, kTBR}, {kTBR, kDBR}, {kDBR, kDFR}, {kDFR, kTFR}}}, {0, 2, 1, 0, 0, 1, 2, 0}},
  // kT
  {{{{kTFL, kTBL}, {kTFR, kTFL}, {kTBR, kTFR}, {kTBL, kTBR}}}, {0, 0, 0, 0, 0, 0, 0, 0}},
  // kB
  {{{{kTBR, kTBL}, {kTBL, kDBL}, {kDBL, kDBR}, {kDBR, kTBR}}}, {0, 0, 2, 1, 0, 0, 1, 2}},
};

// kInverseActions[a] undoes a.
constexpr core::action_t kInverseActions[kNumActions] = {kRInv, kTInv, kBInv, kR, kT, kB};

namespace detail {

/*
 * The move that undoes spec: every (src, dst) pair is reversed, and the cubelet leaving dst for
 * src has the twist it picked up at dst removed.
 */
constexpr MoveSpec invert(const MoveSpec& spec) {
  MoveSpec out{};
  for (int i = 0; i < kCycleLength; ++i) {
    SlotMove m = spec.cycle[i];
    out.cycle[i] = SlotMove{m.dst, m.src};
    out.twist[m.src] = groups::C3::inverse(spec.twist[m.dst]);
  }
  return out;
}

constexpr std::array<MoveSpec, kNumActions> make_move_specs() {
  std::array<MoveSpec, kNumActions> specs{};
  for (int g = 0; g < kNumGenerators; ++g) {
    specs[g] = kGeneratorSpecs[g];
    specs[kInverseActions[g]] = invert(kGeneratorSpecs[g]);
  }
  return specs;
}

// Each generator permutes 4 distinct slots, and twists no slot outside of them.
constexpr bool well_formed(const MoveSpec& spec) {
  bool src_seen[kNumSlots] = {};
  bool dst_seen[kNumSlots] = {};
  for (const SlotMove& m : spec.cycle) {
    if (m.src < 0 || m.src >= kNumSlots || m.dst < 0 || m.dst >= kNumSlots) return false;
    if (src_seen[m.src] || dst_seen[m.dst]) return false;
    src_seen[m.src] = true;
    dst_seen[m.dst] = true;
  }
  int twist_sum = 0;
  for (int s = 0; s < kNumSlots; ++s) {
    if (src_seen[s] != dst_seen[s]) return false;
    if (spec.twist[s] < 0 || spec.twist[s] >= kNumOrientations) return false;
    if (spec.twist[s] && !dst_seen[s]) return false;
    twist_sum += spec.twist[s];
  }
  return twist_sum % kNumOrientations == 0;
}

}  // namespace detail

// Indexed by action.
constexpr std::array<MoveSpec, kNumActions> kMoveSpecs = detail::make_move_specs();

static_assert(detail::well_formed(kMoveSpecs[kR]));
static_assert(detail::well_formed(kMoveSpecs[kT]));
static_assert(detail::well_formed(kMoveSpecs[kB]));
static_assert(detail::well_formed(kMoveSpecs[kRInv]));
static_assert(detail::well_formed(kMoveSpecs[kTInv]));
static_assert(detail::well_formed(kMoveSpecs[kBInv]));

}  // namespace tables
}  // namespace cube2x2
