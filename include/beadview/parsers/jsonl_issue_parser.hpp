#pragma once

#include "beadview/core/issue.hpp"
#include "beadview/interfaces.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace beadview {

// Reads the beads issues.jsonl format: one issue object per line
class JsonlIssueParser : public IIssueParser {
public:
    auto parse_issues(const std::string& content) -> std::vector<Issue> override;

    // std::nullopt for malformed JSON or an issue that fails validation
    static auto parse_issue_line(const std::string& line) -> std::optional<Issue>;

private:
    static auto issue_from_json(const nlohmann::json& object) -> std::optional<Issue>;
    static auto comment_from_json(const nlohmann::json& object) -> Comment;
    static auto dependency_from_json(const nlohmann::json& object) -> std::optional<Dependency>;
};

} // namespace beadview
