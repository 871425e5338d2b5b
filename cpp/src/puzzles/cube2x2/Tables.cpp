#include "puzzles/cube2x2/Types.hpp"

namespace cube2x2 {
namespace tables {

const color_t kCornerColors[kNumCorners][kNumColorsPerCorner] = {
  {kWhite, kRed, kGreen},      // TFL
  {kWhite, kBlue, kRed},       // TFR
  {kWhite, kOrange, kBlue},    // TBR
  {kWhite, kGreen, kOrange},   // TBL
  {kYellow, kGreen, kRed},     // DFL
  {kYellow, kRed, kBlue},      // DFR
  {kYellow, kBlue, kOrange},   // DBR
  {kYellow, kOrange, kGreen},  // DBL
};

const FaceCell kCornerPlacements[kNumSlots][kNumColorsPerCorner] = {
  {{kTop, 2}, {kFront, 0}, {kLeft, 1}},     // TFL
  {{kTop, 3}, {kRight, 0}, {kFront, 1}},    // TFR
  {{kTop, 1}, {kBack, 0}, {kRight, 1}},     // TBR
  {{kTop, 0}, {kLeft, 0}, {kBack, 1}},      // TBL
  {{kBottom, 0}, {kLeft, 3}, {kFront, 2}},  // DFL
  {{kBottom, 1}, {kFront, 3}, {kRight, 2}}, // DFR
  {{kBottom, 3}, {kRight, 3}, {kBack, 2}},  // DBR
  {{kBottom, 2}, {kBack, 3}, {kLeft, 2}},   // DBL
};

}  // namespace tables
}  // namespace cube2x2
