#pragma once

#include "util/EigenUtil.hpp"

#include <concepts>

namespace core {
namespace concepts {

/*
 * Converts a State into the input tensor of a neural network. The returned tensor is freshly
 * zeroed and filled on every call, so no state carries over between calls.
 */
template <typename IT, typename State>
concept InputTensorizor = requires(const State& state) {
  requires eigen_util::concepts::FTensor<typename IT::Tensor>;
  { IT::tensorize(state) } -> std::same_as<typename IT::Tensor>;
};

}  // namespace concepts
}  // namespace core
