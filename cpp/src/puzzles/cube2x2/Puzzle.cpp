#include "puzzles/cube2x2/Puzzle.hpp"

#include "puzzles/cube2x2/MoveTables.hpp"
#include "util/AnsiCodes.hpp"
#include "util/Asserts.hpp"
#include "util/CppUtil.hpp"
#include "util/Exception.hpp"
#include "util/LoggingUtil.hpp"

#include <fmt/format.h>

#include <bitset>
#include <cstdio>

namespace cube2x2 {

namespace {

constexpr const char* kActionTokens[kNumActions] = {"R+", "U+", "B+", "R-", "U-", "B-"};

const char* color_code(color_t c) {
  switch (c) {
    case kWhite:
      return ansi::kWhite("");
    case kRed:
      return ansi::kRed("");
    case kGreen:
      return ansi::kGreen("");
    case kBlue:
      return ansi::kBlue("");
    case kOrange:
      return ansi::kOrange("");
    case kYellow:
      return ansi::kYellow("");
    default:
      throw util::Exception("Invalid color: {}", int(c));
  }
}

// Writes one row of one face into buf, returning the number of chars written.
int print_face_row(char* buf, int n, const RenderedState::Face& face, int row) {
  int cx = 0;
  for (int col = 0; col < kFaceDimension; ++col) {
    color_t c = face[row * kFaceDimension + col];
    char letter[2] = {color_to_char(c), '\0'};
    cx += snprintf(buf + cx, n - cx, "%s%s%s", color_code(c), ansi::kRectangle(letter),
                   ansi::kReset(""));
  }
  return cx;
}

}  // namespace

void Puzzle::static_init() {
  // Every (face, cell) pair must be claimed by exactly one sticker.
  std::bitset<kNumFaces * kNumCellsPerFace> covered;
  for (int slot = 0; slot < kNumSlots; ++slot) {
    for (int i = 0; i < kNumColorsPerCorner; ++i) {
      const FaceCell& fc = tables::kCornerPlacements[slot][i];
      int index = fc.face * kNumCellsPerFace + fc.cell;
      if (fc.cell < 0 || fc.cell >= kNumCellsPerFace || covered[index]) {
        throw util::Exception("Bad placement table entry: slot={} i={} face={} cell={}", slot, i,
                              face_to_str(fc.face), int(fc.cell));
      }
      covered[index] = true;
    }
  }

  // The solved cube shows a single color per face.
  RenderedState rendered = IO::render(Rules::identity());
  for (int f = 0; f < kNumFaces; ++f) {
    const RenderedState::Face& face = rendered.faces[f];
    for (int cell = 1; cell < kNumCellsPerFace; ++cell) {
      if (face[cell] != face[0]) {
        throw util::Exception("Solved {} face is not uniform", face_to_str(face_t(f)));
      }
    }
  }

  LOG_DEBUG("{}: {} actions, {} slots, encoded shape {}x{}", Constants::kPuzzleName, kNumActions,
            kNumSlots, kNumEncodedCorners, kNumSlots * kNumOrientations);
}

std::string Puzzle::IO::action_to_str(core::action_t action) {
  if (action < 0 || action >= kNumActions) {
    throw util::Exception("Invalid action: {}", action);
  }
  return kActionTokens[action];
}

core::action_t Puzzle::IO::action_from_str(const std::string& str) {
  for (core::action_t a = 0; a < kNumActions; ++a) {
    if (str == kActionTokens[a]) return a;
  }
  return core::kNullAction;
}

Puzzle::IO::RenderedState Puzzle::IO::render(const State& state) {
  DEBUG_ASSERT(state.valid(), "Invalid state: {}", compact_state_repr(state));

  RenderedState out{};
  for (int slot = 0; slot < kNumSlots; ++slot) {
    const color_t* colors = tables::kCornerColors[state.corner_pos[slot]];
    group::element_t ort = state.corner_ort[slot];
    for (int i = 0; i < kNumColorsPerCorner; ++i) {
      const FaceCell& fc = tables::kCornerPlacements[slot][i];
      out.faces[fc.face][fc.cell] = colors[groups::C3::compose(i, groups::C3::inverse(ort))];
    }
  }
  return out;
}

void Puzzle::IO::print_state(std::ostream& ss, const State& state) {
  RenderedState rendered = render(state);

  // Faces in the middle band of the net, left to right.
  constexpr face_t kBand[] = {kLeft, kFront, kRight, kBack};

  constexpr int buf_size = 4096;
  char buffer[buf_size];
  int cx = 0;

  auto print_lone_face = [&](face_t f) {
    for (int row = 0; row < kFaceDimension; ++row) {
      cx += snprintf(buffer + cx, buf_size - cx, "%*s", kFaceDimension + 1, "");
      cx += print_face_row(buffer + cx, buf_size - cx, rendered.face(f), row);
      cx += snprintf(buffer + cx, buf_size - cx, "\n");
    }
  };

  print_lone_face(kTop);
  for (int row = 0; row < kFaceDimension; ++row) {
    for (int i = 0; i < 4; ++i) {
      if (i > 0) cx += snprintf(buffer + cx, buf_size - cx, " ");
      cx += print_face_row(buffer + cx, buf_size - cx, rendered.face(kBand[i]), row);
    }
    cx += snprintf(buffer + cx, buf_size - cx, "\n");
  }
  print_lone_face(kBottom);

  RELEASE_ASSERT(cx < buf_size, "Buffer overflow ({} < {})", cx, buf_size);
  ss << buffer;
}

std::string Puzzle::IO::compact_state_repr(const State& state) {
  return fmt::format("{}|{}", util::std_array_to_string(state.corner_pos, "[", " ", ""),
                     util::std_array_to_string(state.corner_ort, "", " ", "]"));
}

}  // namespace cube2x2
