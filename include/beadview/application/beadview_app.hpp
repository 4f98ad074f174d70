#pragma once

#include "beadview/core/issue.hpp"
#include "beadview/interfaces.hpp"
#include "beadview/ui/dashboard.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace beadview {

struct Config {
    std::string issues_file = ".beads/issues.jsonl";
    std::string root_id;
    std::string reviewer;
    std::string review_type = "plan";
    std::string reviews_file = ".bv/reviews.jsonl";
    bool interactive = true;
    bool dry_run = false;
    std::string log_file;  // empty: no log file
    bool verbose = false;
};

class BeadviewApp {
private:
    std::unique_ptr<ITerminal> terminal_;
    std::unique_ptr<IIssueParser> parser_;
    std::unique_ptr<IReviewSaver> saver_;
    std::unique_ptr<IClipboard> clipboard_;
    std::shared_ptr<const IFuzzyMatcher> matcher_;

public:
    BeadviewApp(std::unique_ptr<ITerminal> terminal,
                std::unique_ptr<IIssueParser> parser,
                std::unique_ptr<IReviewSaver> saver,
                std::unique_ptr<IClipboard> clipboard,
                std::shared_ptr<const IFuzzyMatcher> matcher);

    auto run(const Config& config) -> int;

private:
    // update() plus the side effects it asks for (clipboard writes)
    auto update_with_effects(DashboardModel model, const KeyPress& key) -> DashboardModel;

    auto run_batch_mode(const DashboardModel& model) -> void;
    auto finish_session(const DashboardModel& model, const Config& config) -> int;
};

// std::nullopt when the file cannot be opened
auto read_text_file(const std::string& path) -> std::optional<std::string>;

// Attaches each record to its issue as a comment. Returns how many matched.
auto merge_review_records(std::vector<Issue>& issues, const std::vector<ReviewRecord>& records) -> size_t;

} // namespace beadview
