#pragma once

namespace util {

// Width of the terminal attached to stdout, or a fixed fallback width when stdout is not a tty.
int get_screen_width();

}  // namespace util

#include "inline/util/ScreenUtil.inl"
