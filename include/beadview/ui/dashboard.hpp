#pragma once

#include "beadview/core/issue.hpp"
#include "beadview/core/review_session.hpp"
#include "beadview/core/review_tree.hpp"
#include "beadview/core/tree_flattener.hpp"
#include "beadview/ui/input_event.hpp"
#include "beadview/ui/label_selector.hpp"
#include <optional>
#include <string>
#include <vector>

namespace beadview {

// At most one overlay owns the keyboard at a time
enum class Overlay {
    NONE,
    SEARCH,
    LABEL_INPUT,
    ASSIGNEE,
    NOTE,
    HELP,
    SUMMARY,
    SELECTOR
};

enum class ExitAction {
    NONE,
    SAVE,
    DISCARD
};

inline constexpr int kDefaultWidth = 80;
inline constexpr int kDefaultHeight = 24;

// Immutable UI state - ALL dashboard state in one place
struct DashboardModel {
    // --- Data state ---
    std::vector<Issue> items;  // root first, then descendants
    std::vector<Issue> blockers;
    ReviewSession session;

    // Flattened view of items, rebuilt on every filter change
    std::vector<DisplayNode> nodes;
    size_t cursor{};
    size_t scroll{};
    int width = kDefaultWidth;
    int height = kDefaultHeight;

    // Filters
    StatusFilter status_filter = StatusFilter::ALL;
    std::string search_query;
    std::vector<std::string> active_labels;

    // Detail panel
    bool detail_focus = false;
    size_t detail_scroll{};

    // Overlays and their text buffers
    Overlay overlay = Overlay::NONE;
    std::string label_input;
    std::string assignee_input;
    std::string note_input;
    ReviewOutcome note_outcome = ReviewOutcome::NOTE;
    LabelSelector selector;

    // Effects requested from the outer loop
    std::optional<std::string> pending_clipboard;
    bool prompt_copied = false;
    ExitAction exit_action = ExitAction::NONE;

    auto selected_issue() const -> const Issue*
    {
        if (cursor >= nodes.size()) return nullptr;
        return &items[nodes[cursor].item_index];
    }

    auto criteria() const -> FilterCriteria
    {
        return FilterCriteria{
            .status_filter = status_filter, .search_query = search_query, .required_labels = active_labels};
    }

    auto is_quitting() const -> bool { return exit_action != ExitAction::NONE; }

    // Tree rows that fit below the header and above the footer
    auto visible_height() const -> size_t;
};

auto make_dashboard(const ReviewTree& tree, std::string reviewer, std::string review_type,
                    std::shared_ptr<const IFuzzyMatcher> matcher, TimePoint started_at = Clock::now())
    -> DashboardModel;

// Re-flattens the tree, clamps the cursor and re-runs the viewport rule
auto rebuild_nodes(DashboardModel& model) -> void;

auto update(DashboardModel model, const KeyPress& key) -> DashboardModel;
auto resize(DashboardModel model, int width, int height) -> DashboardModel;

} // namespace beadview
