#include "puzzles/cube2x2/Types.hpp"

#include "util/CppUtil.hpp"

#include <bitset>

namespace cube2x2 {

inline char color_to_char(color_t c) {
  constexpr char kChars[] = "WRGBOY?";
  return (c >= 0 && c < kNumColors) ? kChars[c] : '?';
}

inline color_t char_to_color(char c) {
  switch (c) {
    case 'W':
      return kWhite;
    case 'R':
      return kRed;
    case 'G':
      return kGreen;
    case 'B':
      return kBlue;
    case 'O':
      return kOrange;
    case 'Y':
      return kYellow;
    default:
      return kNumColors;
  }
}

inline const char* face_to_str(face_t f) {
  constexpr const char* kNames[kNumFaces] = {"top", "left", "back", "front", "right", "bottom"};
  return kNames[f];
}

inline size_t State::hash() const { return util::hash_memory<sizeof(State)>(this); }

inline bool State::valid() const {
  std::bitset<kNumCorners> seen;
  for (int slot = 0; slot < kNumSlots; ++slot) {
    int c = corner_pos[slot];
    if (c < 0 || c >= kNumCorners || seen[c]) return false;
    seen[c] = true;

    int o = corner_ort[slot];
    if (o < 0 || o >= kNumOrientations) return false;
  }
  return true;
}

}  // namespace cube2x2
