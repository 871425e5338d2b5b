#pragma once

#include "core/BasicTypes.hpp"

#include <concepts>
#include <ostream>
#include <string>

namespace core {
namespace concepts {

template <typename PI, typename State>
concept PuzzleIO = requires(std::ostream& ss, const State& state, const std::string& str) {
  { PI::action_delimiter() } -> std::same_as<std::string>;
  { PI::action_to_str(core::action_t{}) } -> std::same_as<std::string>;

  // Must return core::kNullAction for any str that action_to_str() does not produce.
  { PI::action_from_str(str) } -> std::same_as<core::action_t>;
  { PI::render(state) } -> std::same_as<typename PI::RenderedState>;
  { PI::print_state(ss, state) };

  // compact_state_repr is used in testing and debugging
  { PI::compact_state_repr(state) } -> std::same_as<std::string>;
};

}  // namespace concepts
}  // namespace core
