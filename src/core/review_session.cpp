#include "beadview/core/review_session.hpp"
#include <algorithm>
#include <sstream>
#include <unordered_map>
#include <unordered_set>

namespace beadview {

namespace {

auto outcome_marker(ReviewOutcome outcome) -> const char* {
    switch (outcome) {
    case ReviewOutcome::APPROVED:
        return "✓";
    case ReviewOutcome::NEEDS_REVISION:
        return "!";
    case ReviewOutcome::DEFERRED:
        return "?";
    case ReviewOutcome::NOTE:
        return "✎";
    }
    return "✓";
}

auto title_for(const std::vector<Issue>& items, const std::string& id) -> std::string {
    auto it = std::find_if(items.begin(), items.end(), [&id](const Issue& issue) { return issue.id == id; });
    return it != items.end() ? it->title : id;
}

} // namespace

ReviewSession::ReviewSession(std::string reviewer, std::string review_type, TimePoint started_at)
    : reviewer_(std::move(reviewer)), review_type_(std::move(review_type)) {
    stats_.started_at = started_at;
}

auto ReviewSession::record_action(Issue& issue, ReviewOutcome outcome, const std::string& note, TimePoint at)
    -> void {
    if (outcome == ReviewOutcome::NOTE && note.empty()) {
        return;
    }

    if (!note.empty()) {
        issue.notes = issue.notes.empty() ? note : issue.notes + kNotesSeparator + note;
    }

    if (auto new_status = review_status_for(outcome)) {
        bool was_unreviewed = is_unreviewed(issue.review_status);
        issue.review_status = *new_status;
        issue.reviewed_by = reviewer_;
        issue.reviewed_at = at;

        if (was_unreviewed) {
            stats_.items_reviewed++;
        }
        switch (outcome) {
        case ReviewOutcome::APPROVED:
            stats_.approved++;
            break;
        case ReviewOutcome::NEEDS_REVISION:
            stats_.needs_revision++;
            break;
        case ReviewOutcome::DEFERRED:
            stats_.deferred++;
            break;
        case ReviewOutcome::NOTE:
            break;
        }
    }

    actions_.push_back(ReviewAction{
        .issue_id = issue.id,
        .outcome = outcome,
        .reviewer = reviewer_,
        .notes = note,
        .review_type = review_type_,
        .timestamp = at
    });
}

auto ReviewSession::record_action(std::vector<Issue>& items, const std::string& issue_id, ReviewOutcome outcome,
                                  const std::string& note, TimePoint at) -> bool {
    auto it = std::find_if(items.begin(), items.end(),
                           [&issue_id](const Issue& issue) { return issue.id == issue_id; });
    if (it == items.end()) {
        return false;
    }
    record_action(*it, outcome, note, at);
    return true;
}

auto ReviewSession::latest_status_actions() const -> std::vector<ReviewAction> {
    std::vector<ReviewAction> latest;
    std::unordered_map<std::string, size_t> position;
    for (const auto& action : actions_) {
        if (action.outcome == ReviewOutcome::NOTE) {
            continue;
        }
        if (auto it = position.find(action.issue_id); it != position.end()) {
            latest[it->second] = action;
        } else {
            position.emplace(action.issue_id, latest.size());
            latest.push_back(action);
        }
    }
    return latest;
}

auto ReviewSession::simple_prompt() const -> std::string {
    if (actions_.empty()) {
        return "No reviews recorded in this session.";
    }

    std::unordered_set<std::string> issue_ids;
    for (const auto& action : actions_) {
        issue_ids.insert(action.issue_id);
    }

    std::ostringstream out;
    out << "# Review Session Summary\n\n";
    out << "Reviewed " << issue_ids.size() << " issues:\n\n";
    for (const auto& action : actions_) {
        out << "- " << outcome_marker(action.outcome) << " " << action.issue_id << " → "
            << to_string(action.outcome) << "\n";
    }
    return out.str();
}

auto ReviewSession::full_prompt(const std::vector<Issue>& items) const -> std::string {
    if (actions_.empty()) {
        return "No reviews recorded in this session.";
    }

    auto latest = latest_status_actions();
    auto count = [&latest](ReviewOutcome outcome) {
        return std::count_if(latest.begin(), latest.end(),
                             [outcome](const ReviewAction& a) { return a.outcome == outcome; });
    };
    auto approved = count(ReviewOutcome::APPROVED);
    auto revision = count(ReviewOutcome::NEEDS_REVISION);
    auto deferred = count(ReviewOutcome::DEFERRED);

    std::ostringstream out;
    out << "# Review Session Summary\n\n";
    out << "You are reviewing a beads issue tracking session. "
        << "Go over the review feedback and suggest changes.\n\n";

    out << "## Session Stats\n";
    out << "- Approved: " << approved << " issues\n";
    out << "- Needs Revision: " << revision << " issues\n";
    out << "- Deferred: " << deferred << " issues\n\n";

    if (approved > 0) {
        out << "## Approved Issues\n";
        for (const auto& action : latest) {
            if (action.outcome == ReviewOutcome::APPROVED) {
                out << "- `" << action.issue_id << "`: " << title_for(items, action.issue_id) << "\n";
            }
        }
        out << "\n";
    }

    if (revision > 0) {
        out << "## Issues Needing Revision\n";
        for (const auto& action : latest) {
            if (action.outcome != ReviewOutcome::NEEDS_REVISION) {
                continue;
            }
            out << "### `" << action.issue_id << "`: " << title_for(items, action.issue_id) << "\n";
            if (!action.notes.empty()) {
                out << "**Review Notes:** " << action.notes << "\n";
            }
            out << "**Action Required:** Review feedback and suggest implementation changes.\n\n";
        }
    }

    if (deferred > 0) {
        out << "## Deferred Issues\n";
        for (const auto& action : latest) {
            if (action.outcome != ReviewOutcome::DEFERRED) {
                continue;
            }
            out << "### `" << action.issue_id << "`: " << title_for(items, action.issue_id) << "\n";
            if (!action.notes.empty()) {
                out << "**Reason:** " << action.notes << "\n";
            }
            out << "\n";
        }
    }

    bool has_notes = std::any_of(actions_.begin(), actions_.end(),
                                 [](const ReviewAction& a) { return a.outcome == ReviewOutcome::NOTE; });
    if (has_notes) {
        out << "## Reviewer Notes\n";
        for (const auto& action : actions_) {
            if (action.outcome == ReviewOutcome::NOTE) {
                out << "- `" << action.issue_id << "`: " << action.notes << "\n";
            }
        }
        out << "\n";
    }

    out << "---\n\n";
    out << "For each issue with review feedback:\n";
    out << "1. Analyze the review notes\n";
    out << "2. Suggest concrete changes based on feedback\n";
    out << "3. Explain current bead state and dependencies\n";

    return out.str();
}

} // namespace beadview
