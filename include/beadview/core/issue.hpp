#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace beadview {

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

enum class Status {
    OPEN,
    IN_PROGRESS,
    BLOCKED,
    CLOSED
};

enum class IssueType {
    BUG,
    FEATURE,
    TASK,
    EPIC,
    CHORE
};

// NONE is the empty status of an item that was never touched by a review
enum class ReviewStatus {
    NONE,
    UNREVIEWED,
    APPROVED,
    NEEDS_REVISION,
    DEFERRED
};

// What a reviewer decided; NOTE records text without a status change
enum class ReviewOutcome {
    APPROVED,
    NEEDS_REVISION,
    DEFERRED,
    NOTE
};

enum class DependencyType {
    BLOCKS,
    RELATED,
    PARENT_CHILD,
    DISCOVERED_FROM
};

// depends_on_id is the parent for PARENT_CHILD, the blocker for BLOCKS
struct Dependency {
    std::string issue_id;
    std::string depends_on_id;
    DependencyType type = DependencyType::BLOCKS;

    auto operator==(const Dependency& other) const -> bool = default;
};

struct Comment {
    std::string author;
    std::string text;
    TimePoint created_at{};
};

struct Issue {
    std::string id;
    std::string title;
    Status status = Status::OPEN;
    int priority{};
    IssueType issue_type = IssueType::TASK;
    std::vector<std::string> labels;
    std::optional<std::string> assignee;

    std::string description;
    std::string design;
    std::string acceptance_criteria;
    std::string notes;

    std::vector<Dependency> dependencies;
    std::vector<Comment> comments;

    ReviewStatus review_status = ReviewStatus::NONE;
    std::string reviewed_by;
    std::optional<TimePoint> reviewed_at;

    auto has_label(std::string_view label) const -> bool;
    auto has_label_ignore_case(std::string_view label) const -> bool;
};

auto is_unreviewed(ReviewStatus status) -> bool;

auto to_string(Status status) -> std::string;
auto to_string(IssueType type) -> std::string;
auto to_string(ReviewStatus status) -> std::string;
auto to_string(ReviewOutcome outcome) -> std::string;
auto to_string(DependencyType type) -> std::string;

auto parse_status(std::string_view text) -> std::optional<Status>;
auto parse_issue_type(std::string_view text) -> std::optional<IssueType>;
auto parse_review_status(std::string_view text) -> std::optional<ReviewStatus>;
auto parse_review_outcome(std::string_view text) -> std::optional<ReviewOutcome>;
auto parse_dependency_type(std::string_view text) -> std::optional<DependencyType>;

// Status an outcome leaves on the item, std::nullopt for NOTE
auto review_status_for(ReviewOutcome outcome) -> std::optional<ReviewStatus>;

auto to_lowercase(std::string_view text) -> std::string;
auto trim(std::string_view text) -> std::string;
auto equals_ignore_case(std::string_view a, std::string_view b) -> bool;
auto contains_ignore_case(std::string_view haystack, std::string_view needle) -> bool;
// Drops the last UTF-8 encoded character, if any
auto pop_last_character(std::string& text) -> void;

} // namespace beadview
