#include "beadview/core/viewport.hpp"
#include <algorithm>

namespace beadview {

auto ensure_visible(size_t cursor, size_t scroll, size_t list_length, size_t visible_height) -> size_t {
    visible_height = std::max<size_t>(visible_height, 1);

    if (cursor < scroll) {
        scroll = cursor;
    } else if (cursor >= scroll + visible_height) {
        scroll = cursor - visible_height + 1;
    }

    size_t max_scroll = list_length > visible_height ? list_length - visible_height : 0;
    return std::min(scroll, max_scroll);
}

auto clamp_cursor(size_t cursor, size_t list_length) -> size_t {
    if (list_length == 0) {
        return 0;
    }
    return std::min(cursor, list_length - 1);
}

} // namespace beadview
