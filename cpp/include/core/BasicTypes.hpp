#pragma once

#include <cstdint>

namespace core {

using action_t = int32_t;

// Returned by IO::action_from_str() for text that does not name an action.
constexpr action_t kNullAction = -1;

}  // namespace core
