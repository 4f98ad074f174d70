#include "beadview/parsers/jsonl_issue_parser.hpp"
#include "beadview/core/review_comment.hpp"
#include <spdlog/spdlog.h>
#include <sstream>

namespace beadview {

namespace {

using json = nlohmann::json;

constexpr std::string_view kUtf8Bom = "\xEF\xBB\xBF";

auto string_field(const json& object, const char* key) -> std::string {
    auto it = object.find(key);
    if (it == object.end() || !it->is_string()) {
        return "";
    }
    return it->get<std::string>();
}

} // namespace

auto JsonlIssueParser::parse_issues(const std::string& content) -> std::vector<Issue> {
    std::vector<Issue> issues;
    std::istringstream iss(content);
    std::string line;
    size_t line_number = 0;

    while (std::getline(iss, line)) {
        line_number++;
        if (line_number == 1 && line.starts_with(kUtf8Bom)) {
            line.erase(0, kUtf8Bom.size());
        }
        if (trim(line).empty()) {
            continue;
        }

        if (auto issue = parse_issue_line(line)) {
            issues.push_back(std::move(*issue));
        } else {
            spdlog::warn("skipping invalid issue on line {}", line_number);
        }
    }

    spdlog::debug("parsed {} issues from {} lines", issues.size(), line_number);
    return issues;
}

auto JsonlIssueParser::parse_issue_line(const std::string& line) -> std::optional<Issue> {
    try {
        auto object = json::parse(line);
        if (!object.is_object()) {
            return std::nullopt;
        }
        return issue_from_json(object);
    } catch (const json::exception& e) {
        spdlog::debug("malformed JSON: {}", e.what());
        return std::nullopt;
    }
}

auto JsonlIssueParser::issue_from_json(const json& object) -> std::optional<Issue> {
    Issue issue;
    issue.id = string_field(object, "id");
    issue.title = string_field(object, "title");
    if (issue.id.empty() || issue.title.empty()) {
        return std::nullopt;
    }

    auto status = parse_status(string_field(object, "status"));
    auto issue_type = parse_issue_type(string_field(object, "issue_type"));
    if (!status || !issue_type) {
        spdlog::debug("{}: unknown status or issue type", issue.id);
        return std::nullopt;
    }
    issue.status = *status;
    issue.issue_type = *issue_type;
    issue.priority = object.value("priority", 0);

    issue.description = string_field(object, "description");
    issue.design = string_field(object, "design");
    issue.acceptance_criteria = string_field(object, "acceptance_criteria");
    issue.notes = string_field(object, "notes");

    if (auto assignee = string_field(object, "assignee"); !assignee.empty()) {
        issue.assignee = assignee;
    }

    if (auto it = object.find("labels"); it != object.end() && it->is_array()) {
        for (const auto& label : *it) {
            if (label.is_string()) {
                issue.labels.push_back(label.get<std::string>());
            }
        }
    }

    if (auto it = object.find("dependencies"); it != object.end() && it->is_array()) {
        for (const auto& entry : *it) {
            if (auto dependency = dependency_from_json(entry)) {
                // The owning issue is implied when the record leaves it out
                if (dependency->issue_id.empty()) {
                    dependency->issue_id = issue.id;
                }
                issue.dependencies.push_back(std::move(*dependency));
            }
        }
    }

    if (auto it = object.find("comments"); it != object.end() && it->is_array()) {
        for (const auto& entry : *it) {
            if (entry.is_object()) {
                issue.comments.push_back(comment_from_json(entry));
            }
        }
    }

    // Review fields are not part of beads but are kept when present
    if (auto review_status = parse_review_status(string_field(object, "review_status"))) {
        issue.review_status = *review_status;
    }
    issue.reviewed_by = string_field(object, "reviewed_by");
    issue.reviewed_at = parse_rfc3339(string_field(object, "reviewed_at"));

    return issue;
}

auto JsonlIssueParser::comment_from_json(const json& object) -> Comment {
    return Comment{
        .author = string_field(object, "author"),
        .text = string_field(object, "text"),
        .created_at = parse_rfc3339(string_field(object, "created_at")).value_or(TimePoint{})
    };
}

auto JsonlIssueParser::dependency_from_json(const json& object) -> std::optional<Dependency> {
    if (!object.is_object()) {
        return std::nullopt;
    }
    auto depends_on = string_field(object, "depends_on_id");
    auto type = parse_dependency_type(string_field(object, "type"));
    if (depends_on.empty() || !type) {
        return std::nullopt;
    }
    return Dependency{.issue_id = string_field(object, "issue_id"), .depends_on_id = depends_on, .type = *type};
}

} // namespace beadview
