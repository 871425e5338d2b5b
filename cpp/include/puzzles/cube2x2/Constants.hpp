#pragma once

#include "core/BasicTypes.hpp"
#include "util/FiniteGroups.hpp"

#include <cstdint>

/*
 * Slot numbering. T/D = top/down, F/B = front/back, L/R = left/right:
 *
 *   top layer            bottom layer
 *
 *   3 (TBL)  2 (TBR)     7 (DBL)  6 (DBR)
 *   0 (TFL)  1 (TFR)     4 (DFL)  5 (DFR)
 *
 * Physical corners use the same numbering: corner c is the cubelet that occupies slot c in the
 * solved state.
 */
namespace cube2x2 {

using slot_t = int8_t;
using corner_t = int8_t;
using orientation_t = int8_t;  // element of groups::C3

const int kNumSlots = 8;
const int kNumCorners = kNumSlots;
const int kNumEncodedCorners = kNumCorners - 1;  // the last corner is implied by the other 7
const int kNumOrientations = groups::C3::kOrder;
const int kCycleLength = groups::C4::kOrder;
const int kNumColorsPerCorner = 3;

const int kNumFaces = 6;
const int kFaceDimension = 2;
const int kNumCellsPerFace = kFaceDimension * kFaceDimension;

const slot_t kTFL = 0;
const slot_t kTFR = 1;
const slot_t kTBR = 2;
const slot_t kTBL = 3;
const slot_t kDFL = 4;
const slot_t kDFR = 5;
const slot_t kDBR = 6;
const slot_t kDBL = 7;

/*
 * Actions. The first kNumGenerators are quarter turns of the right, top and back faces; the rest
 * are their inverses, in the same order.
 */
const int kNumGenerators = 3;
const int kNumActions = 2 * kNumGenerators;

const core::action_t kR = 0;
const core::action_t kT = 1;
const core::action_t kB = 2;
const core::action_t kRInv = 3;
const core::action_t kTInv = 4;
const core::action_t kBInv = 5;

// Face order matches the cell placement table in Tables.cpp.
enum face_t : int8_t { kTop, kLeft, kBack, kFront, kRight, kBottom };

enum color_t : int8_t { kWhite, kRed, kGreen, kBlue, kOrange, kYellow, kNumColors };

}  // namespace cube2x2
