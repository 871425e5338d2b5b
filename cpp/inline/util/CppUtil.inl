#include "util/CppUtil.hpp"

#include <sstream>

namespace util {

template <typename T, size_t N>
std::string std_array_to_string(const std::array<T, N>& arr, const std::string& left,
                                const std::string& delim, const std::string& right) {
  std::ostringstream ss;
  ss << left;
  for (size_t i = 0; i < N; ++i) {
    if (i > 0) ss << delim;
    if constexpr (std::is_integral_v<T>) {
      ss << int64_t(arr[i]);
    } else {
      ss << arr[i];
    }
  }
  ss << right;
  return ss.str();
}

template <size_t size>
uint64_t hash_memory(const void* ptr) {
  const uint8_t* bytes = reinterpret_cast<const uint8_t*>(ptr);
  uint64_t hash = 0xcbf29ce484222325;  // FNV offset basis

  for (size_t i = 0; i < size; ++i) {
    hash = (hash ^ bytes[i]) * 1099511628211;  // FNV prime
  }
  return hash;
}

}  // namespace util
