#pragma once

#include "util/CppUtil.hpp"

#include <concepts>
#include <cstdint>

namespace group {

using element_t = int32_t;
constexpr element_t kIdentity = 0;  // in every group, 0 is the identity element

namespace concepts {

template <typename G>
concept FiniteGroup = requires(group::element_t x, group::element_t y) {
  { util::decay_copy(G::kOrder) } -> std::same_as<int>;
  { G::inverse(x) } -> std::convertible_to<group::element_t>;

  // If the group acts on a set S, and s is a member of S, then:
  //
  // compose(x, y)(s) = x(y(s))
  { G::compose(x, y) } -> std::convertible_to<group::element_t>;
};

}  // namespace concepts

}  // namespace group

namespace groups {

// Cn:
//
// 0: identity
// 1: clockwise rotation by 2pi/N
template <int N>
struct CyclicGroup {
  static constexpr int kOrder = N;
  static constexpr group::element_t inverse(group::element_t x);
  static constexpr group::element_t compose(group::element_t x, group::element_t y);
};

/*
 * The twist group of a corner cubelet. A cubelet's orientation in its slot is an element of C3,
 * and a move's twist delta acts on it by composition.
 */
struct C3 : public CyclicGroup<3> {
  static constexpr group::element_t kIdentity = 0;
  static constexpr group::element_t kTwistCW = 1;
  static constexpr group::element_t kTwistCCW = 2;
};

/*
 * Quarter turns of a single face.
 */
struct C4 : public CyclicGroup<4> {
  static constexpr group::element_t kIdentity = 0;
  static constexpr group::element_t kRot90 = 1;
  static constexpr group::element_t kRot180 = 2;
  static constexpr group::element_t kRot270 = 3;
};

}  // namespace groups

static_assert(group::concepts::FiniteGroup<groups::C3>);
static_assert(group::concepts::FiniteGroup<groups::C4>);

#include "inline/util/FiniteGroups.inl"
