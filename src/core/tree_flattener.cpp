#include "beadview/core/tree_flattener.hpp"
#include <deque>
#include <functional>
#include <unordered_set>

namespace beadview {

auto build_children_map(const std::vector<Issue>& items) -> ChildrenMap {
    ChildrenMap children;
    for (size_t i = 0; i < items.size(); ++i) {
        for (const auto& dep : items[i].dependencies) {
            if (dep.type == DependencyType::PARENT_CHILD) {
                children[dep.depends_on_id].push_back(i);
            }
        }
    }
    return children;
}

auto should_show(const Issue& issue, const FilterCriteria& criteria) -> bool {
    switch (criteria.status_filter) {
    case StatusFilter::ALL:
        break;
    case StatusFilter::UNREVIEWED:
        if (!is_unreviewed(issue.review_status)) {
            return false;
        }
        break;
    case StatusFilter::NEEDS_REVISION:
        if (issue.review_status != ReviewStatus::NEEDS_REVISION) {
            return false;
        }
        break;
    }

    if (!criteria.search_query.empty()) {
        if (!contains_ignore_case(issue.title, criteria.search_query)
            && !contains_ignore_case(issue.id, criteria.search_query)) {
            return false;
        }
    }

    for (const auto& required : criteria.required_labels) {
        if (!issue.has_label_ignore_case(required)) {
            return false;
        }
    }

    return true;
}

auto flatten_tree(const std::vector<Issue>& items, size_t root_index, const FilterCriteria& criteria)
    -> std::vector<DisplayNode> {
    std::vector<DisplayNode> nodes;
    if (root_index >= items.size()) {
        return nodes;
    }

    nodes.push_back(DisplayNode{.item_index = root_index, .depth = 0, .tree_prefix = "", .is_last = true});

    auto children = build_children_map(items);
    std::unordered_set<size_t> visited{root_index};

    // parent_path[k] is whether the ancestor at depth k was the last sibling;
    // the root occupies slot 0 and never draws a column.
    std::function<void(size_t, size_t, std::vector<bool>&)> visit;
    visit = [&](size_t parent_index, size_t depth, std::vector<bool>& parent_path) {
        auto it = children.find(items[parent_index].id);
        if (it == children.end()) {
            return;
        }
        const auto& kids = it->second;
        for (size_t i = 0; i < kids.size(); ++i) {
            size_t child_index = kids[i];
            if (!visited.insert(child_index).second) {
                continue;
            }
            bool is_last = i == kids.size() - 1;

            std::string prefix;
            for (size_t j = 1; j < parent_path.size(); ++j) {
                prefix += parent_path[j] ? kBlankGlyph : kContinuationGlyph;
            }
            prefix += is_last ? kCornerGlyph : kBranchGlyph;

            if (should_show(items[child_index], criteria)) {
                nodes.push_back(DisplayNode{
                    .item_index = child_index, .depth = depth, .tree_prefix = prefix, .is_last = is_last});
            }

            parent_path.push_back(is_last);
            visit(child_index, depth + 1, parent_path);
            parent_path.pop_back();
        }
    };

    std::vector<bool> root_path{true};
    visit(root_index, 1, root_path);
    return nodes;
}

auto cycle_status_filter(StatusFilter current) -> StatusFilter {
    switch (current) {
    case StatusFilter::ALL:
        return StatusFilter::UNREVIEWED;
    case StatusFilter::UNREVIEWED:
        return StatusFilter::NEEDS_REVISION;
    case StatusFilter::NEEDS_REVISION:
        return StatusFilter::ALL;
    }
    return StatusFilter::ALL;
}

auto status_filter_name(StatusFilter filter) -> std::string {
    switch (filter) {
    case StatusFilter::ALL:
        return "all";
    case StatusFilter::UNREVIEWED:
        return "unreviewed";
    case StatusFilter::NEEDS_REVISION:
        return "needs_revision";
    }
    return "all";
}

auto count_epic_children(const std::string& epic_id, const std::vector<Issue>& items) -> EpicProgress {
    auto children = build_children_map(items);

    EpicProgress progress;
    std::unordered_set<std::string> visited{epic_id};
    std::deque<std::string> queue{epic_id};

    while (!queue.empty()) {
        auto current = queue.front();
        queue.pop_front();

        auto it = children.find(current);
        if (it == children.end()) {
            continue;
        }
        for (size_t child_index : it->second) {
            const auto& child = items[child_index];
            if (!visited.insert(child.id).second) {
                continue;
            }
            progress.total++;
            if (child.status == Status::CLOSED) {
                progress.closed++;
            }
            queue.push_back(child.id);
        }
    }

    return progress;
}

} // namespace beadview
