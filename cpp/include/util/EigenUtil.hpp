#pragma once

#include "util/CppUtil.hpp"

#include <unsupported/Eigen/CXX11/Tensor>

#include <array>
#include <cstdint>
#include <type_traits>

/*
 * Various util functions that make the eigen3 library more pleasant to use.
 */
namespace eigen_util {

// eigen_util::Shape<...> is a type alias for Eigen::Sizes<...>
template <int64_t... Is>
using Shape = Eigen::Sizes<Is...>;

/*
 * eigen_util::concepts::Shape<T> is for concept requirements.
 */
template <typename T>
struct is_eigen_shape {
  static const bool value = false;
};
template <int64_t... Is>
struct is_eigen_shape<Eigen::Sizes<Is...>> {
  static const bool value = true;
};
template <typename T>
inline constexpr bool is_eigen_shape_v = is_eigen_shape<T>::value;

namespace concepts {

template <typename T>
concept Shape = is_eigen_shape_v<T>;

}  // namespace concepts

/*
 * rank_v<Eigen::Sizes<...>> is the rank of the Eigen::Sizes.
 */
template <typename T>
struct rank {};
template <int64_t... Is>
struct rank<Eigen::Sizes<Is...>> {
  static constexpr int value = sizeof...(Is);
};
template <typename T>
inline constexpr int rank_v = rank<T>::value;

/*
 * to_std_array_v<Eigen::Sizes<7, 24>> is std::array<int64_t, 2>{7, 24}
 */
template <typename T>
struct to_std_array {};
template <int64_t... Is>
struct to_std_array<Eigen::Sizes<Is...>> {
  static constexpr std::array<int64_t, sizeof...(Is)> value = {Is...};
};
template <typename T>
inline constexpr auto to_std_array_v = to_std_array<T>::value;

/*
 * The following are equivalent:
 *
 * using T = Eigen::TensorFixedSize<float, Eigen::Sizes<1, 2, 3>, Eigen::RowMajor>;
 *
 * and:
 *
 * using S = Eigen::Sizes<1, 2, 3>;
 * using T = eigen_util::FTensor<S>;
 *
 * We default to RowMajor so that the memory layout matches what row-major consumers (numpy,
 * pytorch) expect when the tensor is handed to a model.
 *
 * The "f" stands for "fixed-size".
 */
template <concepts::Shape Shape>
using FTensor = Eigen::TensorFixedSize<float, Shape, Eigen::RowMajor>;

template <typename T>
struct is_ftensor {
  static const bool value = false;
};
template <typename Shape>
struct is_ftensor<FTensor<Shape>> {
  static const bool value = true;
};
template <typename T>
inline constexpr bool is_ftensor_v = is_ftensor<T>::value;

namespace concepts {

template <typename T>
concept FTensor = is_ftensor_v<T>;

}  // namespace concepts

/*
 * using T = eigen_util::FTensor<Eigen::Sizes<1, 2, 3>>;
 * using S = extract_shape_t<T>;  // Eigen::Sizes<1, 2, 3>
 */
template <typename T>
struct extract_shape {};
template <concepts::Shape Shape>
struct extract_shape<FTensor<Shape>> {
  using type = Shape;
};
template <typename T>
using extract_shape_t = typename extract_shape<T>::type;

/*
 * Convenience methods that return scalars.
 */
template <concepts::FTensor TensorT>
typename TensorT::Scalar sum(const TensorT& tensor);
template <concepts::FTensor TensorT>
bool any(const TensorT& tensor);
template <concepts::FTensor TensorT>
int count(const TensorT& tensor);  // number of nonzero entries

template <concepts::FTensor TensorT>
bool equal(const TensorT& tensor1, const TensorT& tensor2);

template <concepts::FTensor TensorT>
uint64_t hash(const TensorT& tensor);

}  // namespace eigen_util

#include "inline/util/EigenUtil.inl"
