#include "beadview/core/issue.hpp"
#include <algorithm>
#include <cctype>

namespace beadview {

auto Issue::has_label(std::string_view label) const -> bool {
    return std::find(labels.begin(), labels.end(), label) != labels.end();
}

auto Issue::has_label_ignore_case(std::string_view label) const -> bool {
    return std::any_of(labels.begin(), labels.end(),
                       [label](const std::string& l) { return equals_ignore_case(l, label); });
}

auto is_unreviewed(ReviewStatus status) -> bool {
    return status == ReviewStatus::NONE || status == ReviewStatus::UNREVIEWED;
}

auto to_string(Status status) -> std::string {
    switch (status) {
    case Status::OPEN:
        return "open";
    case Status::IN_PROGRESS:
        return "in_progress";
    case Status::BLOCKED:
        return "blocked";
    case Status::CLOSED:
        return "closed";
    }
    return "open";
}

auto to_string(IssueType type) -> std::string {
    switch (type) {
    case IssueType::BUG:
        return "bug";
    case IssueType::FEATURE:
        return "feature";
    case IssueType::TASK:
        return "task";
    case IssueType::EPIC:
        return "epic";
    case IssueType::CHORE:
        return "chore";
    }
    return "task";
}

auto to_string(ReviewStatus status) -> std::string {
    switch (status) {
    case ReviewStatus::NONE:
        return "";
    case ReviewStatus::UNREVIEWED:
        return "unreviewed";
    case ReviewStatus::APPROVED:
        return "approved";
    case ReviewStatus::NEEDS_REVISION:
        return "needs_revision";
    case ReviewStatus::DEFERRED:
        return "deferred";
    }
    return "";
}

auto to_string(ReviewOutcome outcome) -> std::string {
    switch (outcome) {
    case ReviewOutcome::APPROVED:
        return "approved";
    case ReviewOutcome::NEEDS_REVISION:
        return "needs_revision";
    case ReviewOutcome::DEFERRED:
        return "deferred";
    case ReviewOutcome::NOTE:
        return "note";
    }
    return "note";
}

auto to_string(DependencyType type) -> std::string {
    switch (type) {
    case DependencyType::BLOCKS:
        return "blocks";
    case DependencyType::RELATED:
        return "related";
    case DependencyType::PARENT_CHILD:
        return "parent-child";
    case DependencyType::DISCOVERED_FROM:
        return "discovered-from";
    }
    return "blocks";
}

auto parse_status(std::string_view text) -> std::optional<Status> {
    if (text == "open") return Status::OPEN;
    if (text == "in_progress") return Status::IN_PROGRESS;
    if (text == "blocked") return Status::BLOCKED;
    if (text == "closed") return Status::CLOSED;
    return std::nullopt;
}

auto parse_issue_type(std::string_view text) -> std::optional<IssueType> {
    if (text == "bug") return IssueType::BUG;
    if (text == "feature") return IssueType::FEATURE;
    if (text == "task") return IssueType::TASK;
    if (text == "epic") return IssueType::EPIC;
    if (text == "chore") return IssueType::CHORE;
    return std::nullopt;
}

auto parse_review_status(std::string_view text) -> std::optional<ReviewStatus> {
    if (text.empty()) return ReviewStatus::NONE;
    if (text == "unreviewed") return ReviewStatus::UNREVIEWED;
    if (text == "approved") return ReviewStatus::APPROVED;
    if (text == "needs_revision") return ReviewStatus::NEEDS_REVISION;
    if (text == "deferred") return ReviewStatus::DEFERRED;
    return std::nullopt;
}

auto parse_review_outcome(std::string_view text) -> std::optional<ReviewOutcome> {
    if (text == "approved") return ReviewOutcome::APPROVED;
    if (text == "needs_revision") return ReviewOutcome::NEEDS_REVISION;
    if (text == "deferred") return ReviewOutcome::DEFERRED;
    if (text == "note") return ReviewOutcome::NOTE;
    return std::nullopt;
}

auto parse_dependency_type(std::string_view text) -> std::optional<DependencyType> {
    // beads treats an untyped dependency as blocking
    if (text.empty() || text == "blocks") return DependencyType::BLOCKS;
    if (text == "related") return DependencyType::RELATED;
    if (text == "parent-child") return DependencyType::PARENT_CHILD;
    if (text == "discovered-from") return DependencyType::DISCOVERED_FROM;
    return std::nullopt;
}

auto review_status_for(ReviewOutcome outcome) -> std::optional<ReviewStatus> {
    switch (outcome) {
    case ReviewOutcome::APPROVED:
        return ReviewStatus::APPROVED;
    case ReviewOutcome::NEEDS_REVISION:
        return ReviewStatus::NEEDS_REVISION;
    case ReviewOutcome::DEFERRED:
        return ReviewStatus::DEFERRED;
    case ReviewOutcome::NOTE:
        return std::nullopt;
    }
    return std::nullopt;
}

auto to_lowercase(std::string_view text) -> std::string {
    std::string result{text};
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

auto trim(std::string_view text) -> std::string {
    auto start = text.find_first_not_of(" \t\r\n");
    if (start == std::string_view::npos) {
        return "";
    }
    auto end = text.find_last_not_of(" \t\r\n");
    return std::string(text.substr(start, end - start + 1));
}

auto equals_ignore_case(std::string_view a, std::string_view b) -> bool {
    return a.size() == b.size()
           && std::equal(a.begin(), a.end(), b.begin(), [](unsigned char x, unsigned char y) {
                  return std::tolower(x) == std::tolower(y);
              });
}

auto contains_ignore_case(std::string_view haystack, std::string_view needle) -> bool {
    return to_lowercase(haystack).find(to_lowercase(needle)) != std::string::npos;
}

auto pop_last_character(std::string& text) -> void {
    while (!text.empty()) {
        auto byte = static_cast<unsigned char>(text.back());
        text.pop_back();
        if ((byte & 0xC0) != 0x80) {
            break;
        }
    }
}

} // namespace beadview
