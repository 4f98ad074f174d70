#pragma once

#include "beadview/core/issue.hpp"
#include <string>
#include <vector>

namespace beadview {

// One decision made during a session, in the order it was made
struct ReviewAction {
    std::string issue_id;
    ReviewOutcome outcome = ReviewOutcome::APPROVED;
    std::string reviewer;
    std::string notes;
    std::string review_type;
    TimePoint timestamp{};
};

struct SessionStats {
    TimePoint started_at{};
    size_t items_reviewed{};  // first transition out of unreviewed only
    size_t approved{};
    size_t needs_revision{};
    size_t deferred{};
};

inline constexpr const char* kNotesSeparator = "\n\n---\n\n";

// Applies review decisions to items and keeps the action log that is handed
// to persistence when the session ends. Performs no I/O.
class ReviewSession {
public:
    ReviewSession() = default;
    ReviewSession(std::string reviewer, std::string review_type, TimePoint started_at = Clock::now());

    // Status outcomes overwrite review status, reviewer and timestamp.
    // items_reviewed moves only when the item was unreviewed, but the outcome
    // counter moves on every status action, re-reviews included, so approving
    // and then revising one item counts one approval and one revision. A
    // non-empty note is appended to the item's notes. NOTE outcomes without
    // text record nothing.
    auto record_action(Issue& issue, ReviewOutcome outcome, const std::string& note, TimePoint at) -> void;

    // Returns false when issue_id is not in items
    auto record_action(std::vector<Issue>& items, const std::string& issue_id, ReviewOutcome outcome,
                       const std::string& note, TimePoint at) -> bool;

    auto actions() const -> const std::vector<ReviewAction>& { return actions_; }
    auto pending_count() const -> size_t { return actions_.size(); }
    auto stats() const -> const SessionStats& { return stats_; }
    auto reviewer() const -> const std::string& { return reviewer_; }
    auto review_type() const -> const std::string& { return review_type_; }

    // Clipboard text: a short status list, or a markdown brief grouped by outcome
    auto simple_prompt() const -> std::string;
    auto full_prompt(const std::vector<Issue>& items) const -> std::string;

private:
    std::string reviewer_;
    std::string review_type_;
    SessionStats stats_;
    std::vector<ReviewAction> actions_;

    // Latest status action per issue, in first-seen order
    auto latest_status_actions() const -> std::vector<ReviewAction>;
};

} // namespace beadview
