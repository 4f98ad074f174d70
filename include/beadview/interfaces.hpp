#pragma once

#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace beadview {

// Forward declarations
struct Issue;
struct ReviewAction;
struct DashboardModel;
struct KeyPress;

using UpdateFunction = std::function<DashboardModel(DashboardModel, const KeyPress&)>;

// A prior review decision read back from the review log
struct ReviewRecord {
    std::string issue_id;
    std::string author;
    std::string text;
    std::string created_at;  // RFC 3339
};

struct SaveResult {
    size_t saved{};
    size_t failed{};
    std::vector<std::string> errors;
};

struct FuzzyMatch {
    size_t index{};  // position in the candidate list
    int score{};
};

// Abstract interfaces for dependency injection
class ITerminal {
public:
    virtual ~ITerminal() = default;
    virtual auto is_interactive() -> bool = 0;
    // Runs the event loop until the model asks to quit and returns the final model
    virtual auto run_session(const DashboardModel& initial_model, UpdateFunction update_function)
        -> DashboardModel = 0;
    virtual auto restore_terminal_state() -> void = 0;
};

class IIssueParser {
public:
    virtual ~IIssueParser() = default;
    virtual auto parse_issues(const std::string& content) -> std::vector<Issue> = 0;
};

class IReviewSaver {
public:
    virtual ~IReviewSaver() = default;
    virtual auto save(const std::vector<ReviewAction>& actions) -> SaveResult = 0;
    virtual auto load_records() -> std::vector<ReviewRecord> = 0;
};

class IClipboard {
public:
    virtual ~IClipboard() = default;
    virtual auto write_all(const std::string& text) -> bool = 0;
};

class IFuzzyMatcher {
public:
    virtual ~IFuzzyMatcher() = default;
    // Matches ordered by descending score
    virtual auto find(const std::string& query, const std::vector<std::string>& candidates) const
        -> std::vector<FuzzyMatch> = 0;
};

} // namespace beadview
