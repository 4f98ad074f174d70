#pragma once

#include "beadview/core/issue.hpp"
#include <stdexcept>
#include <string>
#include <vector>

namespace beadview {

class NotFoundError : public std::runtime_error {
public:
    explicit NotFoundError(const std::string& id)
        : std::runtime_error("issue not found: " + id), id_(id) {}

    auto id() const -> const std::string& { return id_; }

private:
    std::string id_;
};

// An issue, all of its descendants via parent-child edges, and the issues
// outside the tree that block something inside it.
struct ReviewTree {
    Issue root;
    std::vector<Issue> descendants;  // breadth-first discovery order
    std::vector<Issue> blockers;

    // Root first, then descendants
    auto all_issues() const -> std::vector<Issue>;
    auto total_count() const -> size_t { return 1 + descendants.size(); }
};

// Throws NotFoundError when root_id is not in issues
auto load_review_tree(const std::string& root_id, const std::vector<Issue>& issues) -> ReviewTree;

} // namespace beadview
