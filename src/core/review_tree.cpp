#include "beadview/core/review_tree.hpp"
#include "beadview/core/tree_flattener.hpp"
#include <deque>
#include <unordered_map>
#include <unordered_set>

namespace beadview {

auto ReviewTree::all_issues() const -> std::vector<Issue> {
    std::vector<Issue> result;
    result.reserve(total_count());
    result.push_back(root);
    result.insert(result.end(), descendants.begin(), descendants.end());
    return result;
}

auto load_review_tree(const std::string& root_id, const std::vector<Issue>& issues) -> ReviewTree {
    std::unordered_map<std::string, const Issue*> issue_map;
    for (const auto& issue : issues) {
        issue_map.emplace(issue.id, &issue);
    }

    auto root_it = issue_map.find(root_id);
    if (root_it == issue_map.end()) {
        throw NotFoundError(root_id);
    }

    ReviewTree tree;
    tree.root = *root_it->second;

    auto children = build_children_map(issues);

    std::unordered_set<std::string> in_tree{root_id};
    std::deque<std::string> queue{root_id};
    while (!queue.empty()) {
        auto current = queue.front();
        queue.pop_front();

        auto child_it = children.find(current);
        if (child_it == children.end()) {
            continue;
        }
        for (size_t child_index : child_it->second) {
            const auto& child = issues[child_index];
            if (in_tree.insert(child.id).second) {
                tree.descendants.push_back(child);
                queue.push_back(child.id);
            }
        }
    }

    std::unordered_set<std::string> blocker_ids;
    for (const auto& issue : tree.all_issues()) {
        for (const auto& dep : issue.dependencies) {
            if (dep.type != DependencyType::BLOCKS) {
                continue;
            }
            const auto& blocker_id = dep.depends_on_id;
            if (in_tree.contains(blocker_id) || blocker_ids.contains(blocker_id)) {
                continue;
            }
            if (auto blocker_it = issue_map.find(blocker_id); blocker_it != issue_map.end()) {
                tree.blockers.push_back(*blocker_it->second);
                blocker_ids.insert(blocker_id);
            }
        }
    }

    return tree;
}

} // namespace beadview
