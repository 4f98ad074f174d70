#pragma once

#include "beadview/core/issue.hpp"
#include <string>
#include <unordered_map>
#include <vector>

namespace beadview {

enum class StatusFilter {
    ALL,
    UNREVIEWED,
    NEEDS_REVISION
};

// All criteria must hold; empty search and empty labels are vacuously true
struct FilterCriteria {
    StatusFilter status_filter = StatusFilter::ALL;
    std::string search_query;
    std::vector<std::string> required_labels;
};

// One row of the flattened tree. item_index points into the item vector
// that was flattened.
struct DisplayNode {
    size_t item_index{};
    size_t depth{};
    std::string tree_prefix;  // "│  ", "   ", "├─ ", "└─ " segments
    bool is_last = true;

    auto operator==(const DisplayNode& other) const -> bool = default;
};

inline constexpr const char* kBranchGlyph = "├─ ";
inline constexpr const char* kCornerGlyph = "└─ ";
inline constexpr const char* kContinuationGlyph = "│  ";
inline constexpr const char* kBlankGlyph = "   ";

// parent id -> indexes of its children, in edge order
using ChildrenMap = std::unordered_map<std::string, std::vector<size_t>>;

auto build_children_map(const std::vector<Issue>& items) -> ChildrenMap;

auto should_show(const Issue& issue, const FilterCriteria& criteria) -> bool;

// Depth-first pre-order from items[root_index]. The root is always emitted;
// filtered-out nodes are skipped but their children are still visited.
auto flatten_tree(const std::vector<Issue>& items, size_t root_index, const FilterCriteria& criteria)
    -> std::vector<DisplayNode>;

auto cycle_status_filter(StatusFilter current) -> StatusFilter;
auto status_filter_name(StatusFilter filter) -> std::string;

struct EpicProgress {
    size_t total{};
    size_t closed{};

    auto fraction() const -> double
    {
        return total > 0 ? static_cast<double>(closed) / static_cast<double>(total) : 0.0;
    }
};

// Breadth-first count of every descendant of epic_id, each visited once
auto count_epic_children(const std::string& epic_id, const std::vector<Issue>& items) -> EpicProgress;

} // namespace beadview
