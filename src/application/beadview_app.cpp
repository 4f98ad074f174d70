#include "beadview/application/beadview_app.hpp"
#include "beadview/core/review_comment.hpp"
#include "beadview/core/review_tree.hpp"
#include "beadview/ui/view.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <fstream>
#include <iostream>
#include <sstream>
#include <unordered_map>

namespace beadview {

auto read_text_file(const std::string& path) -> std::optional<std::string> {
    std::ifstream file(path);
    if (!file.is_open()) {
        return std::nullopt;
    }
    std::ostringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

auto merge_review_records(std::vector<Issue>& issues, const std::vector<ReviewRecord>& records) -> size_t {
    std::unordered_map<std::string, size_t> index_by_id;
    for (size_t i = 0; i < issues.size(); ++i) {
        index_by_id.emplace(issues[i].id, i);
    }

    size_t merged = 0;
    for (const auto& record : records) {
        auto it = index_by_id.find(record.issue_id);
        if (it == index_by_id.end()) {
            spdlog::debug("review record for unknown issue {}", record.issue_id);
            continue;
        }
        issues[it->second].comments.push_back(Comment{
            .author = record.author,
            .text = record.text,
            .created_at = parse_rfc3339(record.created_at).value_or(TimePoint{})
        });
        merged++;
    }
    return merged;
}

BeadviewApp::BeadviewApp(std::unique_ptr<ITerminal> terminal, std::unique_ptr<IIssueParser> parser,
                         std::unique_ptr<IReviewSaver> saver, std::unique_ptr<IClipboard> clipboard,
                         std::shared_ptr<const IFuzzyMatcher> matcher)
    : terminal_(std::move(terminal)), parser_(std::move(parser)), saver_(std::move(saver)),
      clipboard_(std::move(clipboard)), matcher_(std::move(matcher)) {}

auto BeadviewApp::run(const Config& config) -> int {
    auto content = read_text_file(config.issues_file);
    if (!content) {
        std::cerr << "Error: Could not read issues from " << config.issues_file << "\n";
        return 1;
    }

    auto issues = parser_->parse_issues(*content);
    spdlog::info("loaded {} issues from {}", issues.size(), config.issues_file);

    auto merged = merge_review_records(issues, saver_->load_records());
    if (merged > 0) {
        spdlog::info("merged {} prior review records", merged);
    }

    ReviewTree tree;
    try {
        tree = load_review_tree(config.root_id, issues);
    } catch (const NotFoundError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    restore_review_state(tree.root);
    for (auto& issue : tree.descendants) {
        restore_review_state(issue);
    }

    std::cout << "Reviewing " << tree.root.id << " (" << tree.total_count() << " issues, "
              << tree.blockers.size() << " external blockers)\n";

    auto model = make_dashboard(tree, config.reviewer, config.review_type, matcher_);

    if (config.interactive && terminal_->is_interactive()) {
        auto final_model = terminal_->run_session(
            model, [this](DashboardModel m, const KeyPress& key) { return update_with_effects(std::move(m), key); });
        terminal_->restore_terminal_state();
        return finish_session(final_model, config);
    }

    run_batch_mode(model);
    return 0;
}

auto BeadviewApp::update_with_effects(DashboardModel model, const KeyPress& key) -> DashboardModel {
    model = update(std::move(model), key);
    if (model.pending_clipboard) {
        model.prompt_copied = clipboard_->write_all(*model.pending_clipboard);
        model.pending_clipboard.reset();
    }
    return model;
}

auto BeadviewApp::run_batch_mode(const DashboardModel& model) -> void {
    size_t reviewed = 0;
    for (const auto& node : model.nodes) {
        const auto& issue = model.items[node.item_index];
        if (!is_unreviewed(issue.review_status)) {
            reviewed++;
        }
        std::cout << review_indicator(issue.review_status) << " " << node.tree_prefix << issue.id << " "
                  << issue.title << "\n";
    }

    if (!model.blockers.empty()) {
        std::cout << "\nBLOCKERS (external)\n";
        for (const auto& blocker : model.blockers) {
            std::cout << "  " << blocker.id << " " << blocker.title << " [" << to_string(blocker.status) << "]\n";
        }
    }

    std::cout << "\n" << reviewed << "/" << model.nodes.size() << " reviewed\n";
}

auto BeadviewApp::finish_session(const DashboardModel& model, const Config& config) -> int {
    const auto& actions = model.session.actions();

    if (model.exit_action != ExitAction::SAVE || actions.empty()) {
        if (!actions.empty()) {
            std::cout << "Discarded " << actions.size() << " review actions.\n";
        }
        return 0;
    }

    if (config.dry_run) {
        std::cout << "Dry run - " << actions.size() << " review actions not saved.\n";
        return 0;
    }

    auto result = saver_->save(actions);
    std::cout << "Saved " << result.saved << " review actions to " << config.reviews_file << "\n";
    for (const auto& error : result.errors) {
        std::cerr << "Warning: " << error << "\n";
    }
    if (result.failed > 0) {
        spdlog::error("{} review actions failed to save", result.failed);
        return 1;
    }
    return 0;
}

} // namespace beadview
