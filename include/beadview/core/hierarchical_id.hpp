#pragma once

#include "beadview/core/issue.hpp"
#include <functional>
#include <string_view>
#include <vector>

namespace beadview {

// Total order over dotted identifiers such as bv-xyz, bv-xyz.1, bv-xyz.1.2.
// Returns -1, 0 or 1.
//   bv-abc     < bv-xyz      base segment compares as a string
//   bv-xyz.9   < bv-xyz.10   numeric segments compare as numbers
//   bv-xyz.1   < bv-xyz.1.1  parent before children
auto compare_hierarchical_ids(std::string_view a, std::string_view b) -> int;

using StatusOrderFunc = std::function<int(const Issue&)>;

// Priority ascending, then hierarchical id
auto sort_by_priority(std::vector<Issue>& issues) -> void;

// Status order (lower first), then priority, then hierarchical id
auto sort_by_status_then_priority(std::vector<Issue>& issues, const StatusOrderFunc& status_order)
    -> void;

} // namespace beadview
