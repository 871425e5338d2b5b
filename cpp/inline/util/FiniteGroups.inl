#include "util/FiniteGroups.hpp"

namespace groups {

template <int N>
constexpr group::element_t CyclicGroup<N>::inverse(group::element_t x) {
  return (N - x) % N;
}

template <int N>
constexpr group::element_t CyclicGroup<N>::compose(group::element_t x, group::element_t y) {
  return (x + y) % N;
}

}  // namespace groups
