#pragma once

#include "beadview/core/issue.hpp"
#include "beadview/core/review_session.hpp"
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace beadview {

inline constexpr const char* kReviewMarker = "[REVIEW]";
inline constexpr const char* kReviewEndMarker = "[/REVIEW]";
inline constexpr const char* kLegacyReviewMarker = "---REVIEW---";

// A review decision recovered from a structured comment
struct ParsedReview {
    std::string status;  // raw outcome text, e.g. "approved" or "note"
    std::string reviewer;
    std::optional<TimePoint> reviewed_at;
    std::string review_type;
    std::string notes;
};

// RFC 3339 in UTC, e.g. 2026-01-05T14:03:00Z
auto format_rfc3339(TimePoint time) -> std::string;
// Accepts a trailing Z or a numeric offset; fractional seconds are ignored
auto parse_rfc3339(std::string_view text) -> std::optional<TimePoint>;

// [REVIEW] ... [/REVIEW] block with lowercase field names
auto format_review_comment(const ReviewAction& action) -> std::string;

// Understands both markers and title-case field names. std::nullopt when the
// text is not a review comment or carries no status.
auto parse_review_from_comment(std::string_view text) -> std::optional<ParsedReview>;

// Most recent review among the comments whose status is a review status
auto latest_review_from_comments(const std::vector<Comment>& comments) -> std::optional<ParsedReview>;

// Copies the latest review found in the issue's comments onto its review
// fields. Returns false when there is none.
auto restore_review_state(Issue& issue) -> bool;

} // namespace beadview
