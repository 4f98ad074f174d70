#pragma once

#include <cstddef>

namespace beadview {

// Scroll offset that keeps cursor inside [scroll, scroll + visible_height).
// The result is clamped to [0, max(0, list_length - visible_height)].
auto ensure_visible(size_t cursor, size_t scroll, size_t list_length, size_t visible_height) -> size_t;

// Cursor inside [0, list_length), or 0 when the list is empty
auto clamp_cursor(size_t cursor, size_t list_length) -> size_t;

} // namespace beadview
