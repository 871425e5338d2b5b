#include "util/EigenUtil.hpp"

namespace eigen_util {

template <concepts::FTensor TensorT>
typename TensorT::Scalar sum(const TensorT& tensor) {
  eigen_util::FTensor<Eigen::Sizes<>> out = tensor.sum();
  return out(0);
}

template <concepts::FTensor TensorT>
bool any(const TensorT& tensor) {
  const auto* data = tensor.data();
  for (int i = 0; i < tensor.size(); ++i) {
    if (data[i]) return true;
  }
  return false;
}

template <concepts::FTensor TensorT>
int count(const TensorT& tensor) {
  int c = 0;
  for (int i = 0; i < tensor.size(); ++i) {
    c += bool(tensor.data()[i]);
  }
  return c;
}

template <concepts::FTensor TensorT>
bool equal(const TensorT& tensor1, const TensorT& tensor2) {
  for (int i = 0; i < tensor1.size(); ++i) {
    if (tensor1.data()[i] != tensor2.data()[i]) return false;
  }
  return true;
}

template <concepts::FTensor TensorT>
uint64_t hash(const TensorT& tensor) {
  using Scalar = TensorT::Scalar;
  constexpr int N = TensorT::Dimensions::total_size;
  return util::hash_memory<N * sizeof(Scalar)>(tensor.data());
}

}  // namespace eigen_util
