#include "beadview/core/review_comment.hpp"
#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace beadview {

namespace {

struct Field {
    const char* name;
    std::string ParsedReview::*member;
};

constexpr const char* kNoteIndent = "  ";

// "date" is handled separately
constexpr Field kFields[] = {
    {"status:", &ParsedReview::status},
    {"reviewer:", &ParsedReview::reviewer},
    {"type:", &ParsedReview::review_type},
    {"notes:", &ParsedReview::notes},
};

auto starts_with_ignore_case(std::string_view text, std::string_view prefix) -> bool {
    return text.size() >= prefix.size() && equals_ignore_case(text.substr(0, prefix.size()), prefix);
}

} // namespace

auto format_rfc3339(TimePoint time) -> std::string {
    auto seconds = Clock::to_time_t(time);
    std::tm utc{};
    gmtime_r(&seconds, &utc);

    std::ostringstream out;
    out << std::put_time(&utc, "%Y-%m-%dT%H:%M:%SZ");
    return out.str();
}

auto parse_rfc3339(std::string_view text) -> std::optional<TimePoint> {
    std::string input{trim(text)};
    std::istringstream in(input);

    std::tm parsed{};
    in >> std::get_time(&parsed, "%Y-%m-%dT%H:%M:%S");
    if (in.fail()) {
        return std::nullopt;
    }

    if (in.peek() == '.') {
        in.get();
        while (std::isdigit(in.peek())) {
            in.get();
        }
    }

    long offset_seconds = 0;
    int zone = in.get();
    if (zone == 'Z' || zone == 'z') {
        offset_seconds = 0;
    } else if (zone == '+' || zone == '-') {
        int hours = 0;
        int minutes = 0;
        char colon = 0;
        in >> std::setw(2) >> hours >> colon >> std::setw(2) >> minutes;
        if (in.fail() || colon != ':') {
            return std::nullopt;
        }
        offset_seconds = (hours * 3600L + minutes * 60L) * (zone == '-' ? -1 : 1);
    } else {
        return std::nullopt;
    }

    auto utc_seconds = timegm(&parsed);
    if (utc_seconds == static_cast<std::time_t>(-1)) {
        return std::nullopt;
    }
    return Clock::from_time_t(utc_seconds - offset_seconds);
}

auto format_review_comment(const ReviewAction& action) -> std::string {
    std::ostringstream out;
    out << kReviewMarker << "\n";
    out << "status: " << to_string(action.outcome) << "\n";
    out << "reviewer: " << action.reviewer << "\n";
    out << "date: " << format_rfc3339(action.timestamp) << "\n";
    if (!action.review_type.empty()) {
        out << "type: " << action.review_type << "\n";
    }
    if (!action.notes.empty()) {
        // Continuation lines are indented so they never read as a field or the end marker
        std::istringstream note_lines(action.notes);
        std::string note_line;
        bool first = true;
        while (std::getline(note_lines, note_line)) {
            out << (first ? "notes: " : kNoteIndent) << note_line << "\n";
            first = false;
        }
    }
    out << kReviewEndMarker;
    return out.str();
}

auto parse_review_from_comment(std::string_view text) -> std::optional<ParsedReview> {
    if (text.find(kReviewMarker) == std::string_view::npos
        && text.find(kLegacyReviewMarker) == std::string_view::npos) {
        return std::nullopt;
    }

    ParsedReview review;
    bool in_notes = false;

    std::istringstream lines{std::string(text)};
    std::string raw_line;
    while (std::getline(lines, raw_line)) {
        if (in_notes && raw_line.starts_with(kNoteIndent)) {
            review.notes += "\n" + raw_line.substr(std::string_view(kNoteIndent).size());
            continue;
        }

        auto line = trim(raw_line);
        if (line == kReviewMarker || line == kLegacyReviewMarker) {
            continue;
        }
        if (line == kReviewEndMarker) {
            break;
        }

        if (starts_with_ignore_case(line, "date:")) {
            review.reviewed_at = parse_rfc3339(std::string_view(line).substr(5));
            in_notes = false;
            continue;
        }

        bool matched = false;
        for (const auto& field : kFields) {
            std::string_view name{field.name};
            if (starts_with_ignore_case(line, name)) {
                review.*field.member = trim(std::string_view(line).substr(name.size()));
                in_notes = field.member == &ParsedReview::notes;
                matched = true;
                break;
            }
        }

        // Notes may run over several lines
        if (!matched && in_notes) {
            review.notes += "\n" + line;
        }
    }

    if (review.status.empty()) {
        return std::nullopt;
    }
    return review;
}

auto latest_review_from_comments(const std::vector<Comment>& comments) -> std::optional<ParsedReview> {
    std::optional<ParsedReview> latest;

    for (const auto& comment : comments) {
        auto review = parse_review_from_comment(comment.text);
        if (!review) {
            continue;
        }
        auto status = parse_review_status(review->status);
        if (!status || *status == ReviewStatus::NONE) {
            continue;
        }

        if (!latest || !latest->reviewed_at
            || (review->reviewed_at && *review->reviewed_at >= *latest->reviewed_at)) {
            latest = std::move(review);
        }
    }

    return latest;
}

auto restore_review_state(Issue& issue) -> bool {
    auto latest = latest_review_from_comments(issue.comments);
    if (!latest) {
        return false;
    }
    if (auto status = parse_review_status(latest->status)) {
        issue.review_status = *status;
    }
    issue.reviewed_by = latest->reviewer;
    issue.reviewed_at = latest->reviewed_at;
    return true;
}

} // namespace beadview
