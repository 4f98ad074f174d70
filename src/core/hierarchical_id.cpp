#include "beadview/core/hierarchical_id.hpp"
#include <algorithm>
#include <charconv>
#include <optional>
#include <string>

namespace beadview {

namespace {

auto split_segments(std::string_view id) -> std::vector<std::string_view> {
    std::vector<std::string_view> segments;
    size_t start = 0;
    while (true) {
        auto dot = id.find('.', start);
        if (dot == std::string_view::npos) {
            segments.push_back(id.substr(start));
            break;
        }
        segments.push_back(id.substr(start, dot - start));
        start = dot + 1;
    }
    return segments;
}

auto parse_integer(std::string_view segment) -> std::optional<long long> {
    if (segment.empty()) {
        return std::nullopt;
    }
    long long value{};
    auto [ptr, ec] = std::from_chars(segment.data(), segment.data() + segment.size(), value);
    if (ec != std::errc{} || ptr != segment.data() + segment.size()) {
        return std::nullopt;
    }
    return value;
}

template<typename T>
auto three_way(const T& a, const T& b) -> int {
    if (a < b) return -1;
    if (b < a) return 1;
    return 0;
}

} // namespace

auto compare_hierarchical_ids(std::string_view a, std::string_view b) -> int {
    if (a == b) {
        return 0;
    }

    auto parts_a = split_segments(a);
    auto parts_b = split_segments(b);

    if (parts_a[0] != parts_b[0]) {
        return three_way(parts_a[0], parts_b[0]);
    }

    size_t max_len = std::max(parts_a.size(), parts_b.size());
    for (size_t i = 1; i < max_len; ++i) {
        if (i >= parts_a.size()) {
            return -1;
        }
        if (i >= parts_b.size()) {
            return 1;
        }

        auto num_a = parse_integer(parts_a[i]);
        auto num_b = parse_integer(parts_b[i]);

        if (num_a && num_b) {
            if (*num_a != *num_b) {
                return three_way(*num_a, *num_b);
            }
        } else if (parts_a[i] != parts_b[i]) {
            return three_way(parts_a[i], parts_b[i]);
        }
    }

    // Numerically equal but textually different segments ("01" vs "1")
    return three_way(a, b);
}

auto sort_by_priority(std::vector<Issue>& issues) -> void {
    std::stable_sort(issues.begin(), issues.end(), [](const Issue& x, const Issue& y) {
        if (x.priority != y.priority) {
            return x.priority < y.priority;
        }
        return compare_hierarchical_ids(x.id, y.id) < 0;
    });
}

auto sort_by_status_then_priority(std::vector<Issue>& issues, const StatusOrderFunc& status_order)
    -> void {
    std::stable_sort(issues.begin(), issues.end(), [&status_order](const Issue& x, const Issue& y) {
        int sx = status_order(x);
        int sy = status_order(y);
        if (sx != sy) {
            return sx < sy;
        }
        if (x.priority != y.priority) {
            return x.priority < y.priority;
        }
        return compare_hierarchical_ids(x.id, y.id) < 0;
    });
}

} // namespace beadview
