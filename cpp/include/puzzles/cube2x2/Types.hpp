#pragma once

#include "puzzles/cube2x2/Constants.hpp"

#include <array>
#include <cstddef>
#include <functional>

namespace cube2x2 {

// Converts {kWhite, kRed, kGreen, kBlue, kOrange, kYellow} to {'W', 'R', 'G', 'B', 'O', 'Y'}
char color_to_char(color_t c);

// Inverse of color_to_char(). Returns kNumColors for any other char.
color_t char_to_color(char c);

const char* face_to_str(face_t f);

/*
 * corner_pos[i] is the physical corner occupying slot i, and corner_ort[i] is its orientation.
 *
 * A valid State has a permutation of 0..7 in corner_pos, and only values in 0..2 in corner_ort.
 * States are produced by Puzzle::Rules::identity() and Puzzle::Rules::transform().
 */
struct State {
  auto operator<=>(const State& other) const = default;
  size_t hash() const;
  bool valid() const;

  std::array<corner_t, kNumSlots> corner_pos;
  std::array<orientation_t, kNumSlots> corner_ort;
};
static_assert(sizeof(State) == 16);

struct SlotMove {
  slot_t src;
  slot_t dst;
};

/*
 * A move: the cubelet in slot cycle[i].src goes to slot cycle[i].dst, keeping its orientation.
 * Then twist[s] is composed into the orientation of whatever cubelet is now in slot s.
 */
struct MoveSpec {
  std::array<SlotMove, kCycleLength> cycle;
  std::array<orientation_t, kNumSlots> twist;
};

struct FaceCell {
  face_t face;
  int8_t cell;  // row * kFaceDimension + col
};

/*
 * The visible colors of a State. Each face is a 2x2 grid of cells, indexed row-major, as seen
 * looking at that face in the standard unfolded net:
 *
 *         top
 *   left front right back
 *        bottom
 */
struct RenderedState {
  using Face = std::array<color_t, kNumCellsPerFace>;

  auto operator<=>(const RenderedState& other) const = default;
  const Face& face(face_t f) const { return faces[f]; }
  color_t at(face_t f, int row, int col) const { return faces[f][row * kFaceDimension + col]; }

  const Face& top() const { return faces[kTop]; }
  const Face& left() const { return faces[kLeft]; }
  const Face& back() const { return faces[kBack]; }
  const Face& front() const { return faces[kFront]; }
  const Face& right() const { return faces[kRight]; }
  const Face& bottom() const { return faces[kBottom]; }

  std::array<Face, kNumFaces> faces;
};

namespace tables {

/*
 * kCornerColors[c] is the 3-color label of physical corner c, listed clockwise starting from its
 * top or bottom sticker.
 *
 * kCornerPlacements[s] gives the (face, cell) coordinates that the 3 stickers of an untwisted
 * cubelet in slot s show up at, in the same clockwise order. Across all slots it covers each of
 * the 24 (face, cell) pairs exactly once.
 */
extern const color_t kCornerColors[kNumCorners][kNumColorsPerCorner];
extern const FaceCell kCornerPlacements[kNumSlots][kNumColorsPerCorner];

}  // namespace tables

}  // namespace cube2x2

namespace std {

template <>
struct hash<cube2x2::State> {
  size_t operator()(const cube2x2::State& state) const { return state.hash(); }
};

}  // namespace std

#include "inline/puzzles/cube2x2/Types.inl"
