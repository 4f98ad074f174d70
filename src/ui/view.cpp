#include "beadview/ui/view.hpp"
#include <algorithm>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace beadview {

namespace {

constexpr size_t kSelectorMaxVisible = 15;
constexpr size_t kProgressBarWidth = 8;

auto review_tone(ReviewStatus status) -> Tone {
    switch (status) {
    case ReviewStatus::APPROVED:
        return Tone::SUCCESS;
    case ReviewStatus::NEEDS_REVISION:
        return Tone::DANGER;
    case ReviewStatus::DEFERRED:
        return Tone::WARNING;
    default:
        return Tone::NORMAL;
    }
}

auto format_short_time(TimePoint time) -> std::string {
    auto seconds = Clock::to_time_t(time);
    std::tm local{};
    localtime_r(&seconds, &local);
    std::ostringstream out;
    out << std::put_time(&local, "%m/%d %H:%M");
    return out.str();
}

auto split_lines(const std::string& text) -> std::vector<std::string> {
    std::vector<std::string> lines;
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) {
        lines.push_back(line);
    }
    if (!text.empty() && text.back() == '\n') {
        lines.emplace_back();
    }
    return lines;
}

auto append_section(std::vector<Line>& lines, const std::string& heading, const std::string& body) -> void {
    if (body.empty()) {
        return;
    }
    lines.push_back(Line{.text = "## " + heading, .is_highlighted = false, .tone = Tone::ACCENT});
    for (auto& text : split_lines(body)) {
        lines.push_back(Line{.text = std::move(text)});
    }
    lines.push_back(Line{});
}

auto reviewed_in_view(const DashboardModel& model) -> size_t {
    return std::count_if(model.nodes.begin(), model.nodes.end(), [&model](const DisplayNode& node) {
        return !is_unreviewed(model.items[node.item_index].review_status);
    });
}

auto join_labels(const std::vector<std::string>& labels, const std::string& separator) -> std::string {
    std::string joined;
    for (size_t i = 0; i < labels.size(); ++i) {
        if (i > 0) {
            joined += separator;
        }
        joined += labels[i];
    }
    return joined;
}

auto compose_input_modal(const std::string& title, const std::vector<std::string>& preamble,
                         const std::string& prompt, const std::string& input, const std::string& hint)
    -> std::vector<Line> {
    std::vector<Line> lines{Line{.text = title, .is_highlighted = true, .tone = Tone::ACCENT}, Line{}};
    for (const auto& text : preamble) {
        lines.push_back(Line{.text = text, .is_highlighted = false, .tone = Tone::MUTED});
    }
    lines.push_back(Line{.text = prompt, .is_highlighted = false, .tone = Tone::MUTED});

    auto input_lines = split_lines(input);
    if (input_lines.empty()) {
        input_lines.emplace_back();
    }
    input_lines.back() += "█";
    for (auto& text : input_lines) {
        lines.push_back(Line{.text = std::move(text), .is_highlighted = false, .tone = Tone::ACCENT});
    }

    lines.push_back(Line{});
    lines.push_back(Line{.text = hint, .is_highlighted = false, .tone = Tone::MUTED});
    return lines;
}

auto note_title(ReviewOutcome outcome) -> std::string {
    switch (outcome) {
    case ReviewOutcome::NEEDS_REVISION:
        return "Request Revision";
    case ReviewOutcome::DEFERRED:
        return "Defer Review";
    default:
        return "Add Note";
    }
}

auto compose_modal(const DashboardModel& model, TimePoint now) -> std::vector<Line> {
    const auto* issue = model.selected_issue();
    std::string issue_id = issue ? issue->id : "";

    switch (model.overlay) {
    case Overlay::LABEL_INPUT: {
        std::vector<std::string> preamble;
        if (!model.active_labels.empty()) {
            preamble.push_back("Active: [" + join_labels(model.active_labels, "] [") + "]");
            preamble.emplace_back();
        }
        return compose_input_modal("Add Scope Filter", preamble, "Label:", model.label_input,
                                   "[Enter] Add  [Esc] Cancel  [Backspace] Remove last");
    }
    case Overlay::ASSIGNEE:
        return compose_input_modal("Assign " + issue_id, {}, "Assignee:", model.assignee_input,
                                   "[Enter] Save  [Esc] Cancel");
    case Overlay::NOTE:
        return compose_input_modal(note_title(model.note_outcome) + " for " + issue_id, {}, "Enter your notes:",
                                   model.note_input, "[Ctrl+S] Submit  [Enter] New line  [Esc] Cancel");
    case Overlay::HELP:
        return compose_help_lines();
    case Overlay::SUMMARY:
        return compose_summary_lines(model, now);
    case Overlay::SELECTOR:
        return compose_selector_lines(model.selector, kSelectorMaxVisible);
    case Overlay::NONE:
    case Overlay::SEARCH:
        break;
    }
    return {};
}

auto control_hints_for(const DashboardModel& model) -> std::string {
    switch (model.overlay) {
    case Overlay::SEARCH:
        return "Type to filter, [Enter] keep, [Esc] clear";
    case Overlay::SUMMARY:
        return "[q] save & quit  [Q] discard & quit  [p] copy ID list  [P] copy AI prompt  [Esc] back";
    case Overlay::HELP:
        return "Press any key to close";
    case Overlay::SELECTOR:
        return "[j/k] nav  [i] search  [r] ID lookup  [s] +scope  [Enter] select  [q] close";
    case Overlay::LABEL_INPUT:
    case Overlay::ASSIGNEE:
    case Overlay::NOTE:
        return "";
    case Overlay::NONE:
        break;
    }
    return "[j/k] navigate  [/] jump  [n]ote  [a]pprove  [r]evise  [d]efer  [A]ssign  [L]abels  [?/q]";
}

auto selector_item_text(const LabelItem& item, bool selected, bool scope_active) -> std::string {
    std::string text = selected ? "▸ " : "  ";
    switch (item.type) {
    case SelectorItemType::EPIC:
        text += "📋 " + item.title;
        break;
    case SelectorItemType::BEAD:
        text += "🔷 " + item.value + " " + item.title;
        return text;
    case SelectorItemType::LABEL:
        text += item.title;
        break;
    }

    if (scope_active && item.overlap_count > 0) {
        text += "  (" + std::to_string(item.overlap_count) + " overlap)";
    } else {
        text += "  " + progress_bar(item.progress, item.closed_count, item.issue_count);
    }
    return text;
}

} // namespace

auto review_indicator(ReviewStatus status) -> std::string {
    switch (status) {
    case ReviewStatus::APPROVED:
        return "[✓]";
    case ReviewStatus::NEEDS_REVISION:
        return "[!]";
    case ReviewStatus::DEFERRED:
        return "[?]";
    default:
        return "[ ]";
    }
}

auto format_duration(std::chrono::seconds duration) -> std::string {
    auto total = std::max<long long>(duration.count(), 0);
    auto hours = total / 3600;
    auto minutes = (total % 3600) / 60;
    auto seconds = total % 60;

    std::string text;
    if (hours > 0) {
        text += std::to_string(hours) + "h";
    }
    if (hours > 0 || minutes > 0) {
        text += std::to_string(minutes) + "m";
    }
    text += std::to_string(seconds) + "s";
    return text;
}

auto progress_bar(double progress, size_t closed, size_t total) -> std::string {
    if (total == 0) {
        return "(0)";
    }
    auto filled = std::min(static_cast<size_t>(progress * kProgressBarWidth), kProgressBarWidth);

    std::string bar = "[";
    for (size_t i = 0; i < kProgressBarWidth; ++i) {
        bar += i < filled ? "█" : "░";
    }
    bar += "] " + std::to_string(closed) + "/" + std::to_string(total);
    if (progress >= 1.0) {
        bar += " ✓";
    }
    return bar;
}

auto compose_tree_row(const DashboardModel& model, size_t node_index) -> Line {
    const auto& node = model.nodes[node_index];
    const auto& issue = model.items[node.item_index];
    bool is_cursor = node_index == model.cursor;

    std::string text = is_cursor ? "▸ " : "  ";
    text += review_indicator(issue.review_status) + " ";
    text += node.tree_prefix;
    text += issue.id + " " + issue.title;

    return Line{.text = text, .is_highlighted = is_cursor, .tone = review_tone(issue.review_status)};
}

auto compose_detail_lines(const Issue& issue) -> std::vector<Line> {
    std::vector<Line> lines;
    lines.push_back(Line{.text = issue.id + ": " + issue.title, .is_highlighted = true, .tone = Tone::ACCENT});
    lines.push_back(Line{.text = std::string(40, '-'), .is_highlighted = false, .tone = Tone::MUTED});
    lines.push_back(Line{
        .text = "Status: " + to_string(issue.status) + " | Priority: " + std::to_string(issue.priority)
                + " | Type: " + to_string(issue.issue_type),
        .is_highlighted = false,
        .tone = Tone::MUTED});

    std::string review_name = "UNREVIEWED";
    if (issue.review_status != ReviewStatus::NONE) {
        review_name = to_string(issue.review_status);
        std::transform(review_name.begin(), review_name.end(), review_name.begin(),
                       [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    }
    std::string review = "Review: " + review_name;
    if (!issue.reviewed_by.empty()) {
        review += " by " + issue.reviewed_by;
    }
    if (issue.reviewed_at) {
        review += " @ " + format_short_time(*issue.reviewed_at);
    }
    lines.push_back(Line{.text = review, .is_highlighted = false, .tone = review_tone(issue.review_status)});

    if (issue.assignee) {
        lines.push_back(Line{.text = "Assignee: " + *issue.assignee});
    }
    if (!issue.labels.empty()) {
        lines.push_back(Line{.text = "Labels: [" + join_labels(issue.labels, "] [") + "]"});
    }
    lines.push_back(Line{});

    append_section(lines, "Description", issue.description);
    append_section(lines, "Design", issue.design);
    append_section(lines, "Acceptance Criteria", issue.acceptance_criteria);
    append_section(lines, "Notes", issue.notes);
    return lines;
}

auto compose_summary_lines(const DashboardModel& model, TimePoint now) -> std::vector<Line> {
    const auto& stats = model.session.stats();
    auto elapsed = std::chrono::duration_cast<std::chrono::seconds>(now - stats.started_at);
    std::string root_id = model.items.empty() ? "" : model.items.front().id;

    std::vector<Line> lines{
        Line{.text = "Review Session Summary", .is_highlighted = true, .tone = Tone::ACCENT},
        Line{.text = std::string(40, '-'), .is_highlighted = false, .tone = Tone::MUTED},
        Line{},
        Line{.text = "Root:     " + root_id, .is_highlighted = false, .tone = Tone::MUTED},
        Line{.text = "Reviewer: " + model.session.reviewer(), .is_highlighted = false, .tone = Tone::MUTED},
        Line{.text = "Duration: " + format_duration(elapsed), .is_highlighted = false, .tone = Tone::MUTED},
        Line{},
        Line{.text = "Items Reviewed:"},
        Line{.text = "  Total:            " + std::to_string(stats.items_reviewed)},
        Line{.text = "  ✓ Approved:       " + std::to_string(stats.approved), .is_highlighted = false,
             .tone = Tone::SUCCESS},
        Line{.text = "  ! Needs Revision: " + std::to_string(stats.needs_revision), .is_highlighted = false,
             .tone = Tone::DANGER},
        Line{.text = "  ? Deferred:       " + std::to_string(stats.deferred), .is_highlighted = false,
             .tone = Tone::WARNING},
        Line{},
    };

    size_t total = model.nodes.size();
    size_t reviewed = reviewed_in_view(model);
    size_t percent = total > 0 ? reviewed * 100 / total : 0;
    lines.push_back(Line{.text = "Overall Progress:"});
    lines.push_back(Line{.text = "  " + std::to_string(reviewed) + "/" + std::to_string(total) + " items reviewed ("
                                 + std::to_string(percent) + "%)"});
    lines.push_back(Line{.text = "  " + std::to_string(model.session.pending_count()) + " actions pending save"});
    lines.push_back(Line{});

    if (model.prompt_copied) {
        lines.push_back(Line{.text = "✓ Copied to clipboard!", .is_highlighted = true, .tone = Tone::SUCCESS});
        lines.push_back(Line{});
    }

    lines.push_back(Line{.text = "q save & quit  Q discard & quit", .is_highlighted = false, .tone = Tone::MUTED});
    lines.push_back(Line{.text = "p copy ID list  P copy AI prompt", .is_highlighted = false, .tone = Tone::MUTED});
    lines.push_back(Line{.text = "Esc continue reviewing", .is_highlighted = false, .tone = Tone::MUTED});
    return lines;
}

auto compose_help_lines() -> std::vector<Line> {
    auto section = [](const std::string& name) {
        return Line{.text = name, .is_highlighted = true, .tone = Tone::ACCENT};
    };
    auto entry = [](const std::string& keys, const std::string& description) {
        std::string text = "  " + keys;
        text += std::string(text.size() < 13 ? 13 - text.size() : 1, ' ');
        return Line{.text = text + description};
    };

    return {
        Line{.text = "Review Dashboard Help", .is_highlighted = true, .tone = Tone::ACCENT},
        Line{},
        section("Navigation"),
        entry("j/k, ↑/↓", "Move cursor / scroll detail"),
        entry("g/G", "Go to first/last item"),
        entry("[/]", "Jump to prev/next unreviewed"),
        entry("Tab", "Switch focus: tree / detail"),
        entry("/", "Search issues"),
        Line{},
        section("Review Actions"),
        entry("a", "Approve current item"),
        entry("r", "Request revision (+ note)"),
        entry("d", "Defer review (+ note)"),
        entry("n", "Add note (no status change)"),
        entry("A", "Assign to reviewer"),
        Line{},
        section("Filters"),
        entry("f", "Cycle: all → unreviewed → needs_revision"),
        entry("s", "Add scope filter"),
        entry("S", "Clear all scope filters"),
        entry("L", "Pick label, epic or issue"),
        Line{},
        section("Other"),
        entry("?", "Show this help"),
        entry("q", "Show summary / quit"),
        entry("Esc", "Close modal / cancel"),
    };
}

auto compose_selector_lines(const LabelSelector& selector, size_t max_visible) -> std::vector<Line> {
    std::vector<Line> lines;
    bool scope_active = selector.is_scope_active();

    lines.push_back(Line{.text = scope_active ? "Select Label (within scope)" : "Select Label or Epic",
                         .is_highlighted = true,
                         .tone = Tone::ACCENT});
    if (scope_active) {
        lines.push_back(Line{
            .text = "⊕ " + join_labels(selector.scope_labels(), " ∩ ") + "  ("
                    + std::to_string(selector.candidates().size()) + ")",
            .is_highlighted = false,
            .tone = Tone::ACCENT});
    }
    lines.push_back(Line{});

    std::string search = selector.search_text();
    if (selector.is_insert_mode()) {
        search += "█";
    } else if (search.empty()) {
        search = "Search labels and epics...";
    }
    lines.push_back(Line{.text = "> " + search, .is_highlighted = selector.is_insert_mode(), .tone = Tone::NORMAL});
    lines.push_back(Line{});

    const auto& candidates = selector.candidates();
    if (candidates.empty()) {
        lines.push_back(Line{.text = "  No matching labels or epics", .is_highlighted = false, .tone = Tone::MUTED});
    } else {
        // Candidates arrive grouped by type, so a heading goes before each new group
        std::optional<SelectorItemType> current_group;
        size_t shown = std::min(candidates.size(), max_visible);
        for (size_t i = 0; i < shown; ++i) {
            const auto& item = candidates[i];
            if (current_group != item.type) {
                if (current_group) {
                    lines.push_back(Line{});
                }
                current_group = item.type;
                std::string heading = item.type == SelectorItemType::BEAD ? "ISSUES"
                    : item.type == SelectorItemType::EPIC                 ? "EPICS"
                    : scope_active                                         ? "MATCHING LABELS (within scope)"
                                                                           : "LABELS";
                lines.push_back(Line{.text = heading, .is_highlighted = false, .tone = Tone::ACCENT});
            }
            bool selected = i == selector.selected_index();
            lines.push_back(Line{.text = selector_item_text(item, selected, scope_active),
                                 .is_highlighted = selected,
                                 .tone = Tone::NORMAL});
        }
        if (candidates.size() > shown) {
            lines.push_back(Line{.text = "  ... and " + std::to_string(candidates.size() - shown) + " more",
                                 .is_highlighted = false,
                                 .tone = Tone::MUTED});
        }
    }

    lines.push_back(Line{});
    std::string footer;
    switch (selector.insert_variant().value_or(InsertVariant::SEARCH)) {
    case InsertVariant::SCOPE_ADD:
        footer = "SCOPE+ type to filter, ↑↓ nav, enter: add scope, esc: cancel";
        break;
    case InsertVariant::REVIEW_LOOKUP:
        footer = "REVIEW type ID or title, ↑↓ nav, enter: view bead, esc: cancel";
        break;
    case InsertVariant::SEARCH:
        footer = "SEARCH type to filter, ↑↓ nav, enter: select, esc: cancel";
        break;
    }
    if (!selector.is_insert_mode()) {
        footer = scope_active ? "SCOPE j/k nav, s: +scope, ⌫: -scope, enter: select, esc: clear"
                              : "NORMAL j/k nav, i: search, r: ID lookup, s: +scope, enter: select, q: close";
    }
    lines.push_back(Line{.text = footer, .is_highlighted = false, .tone = Tone::MUTED});
    return lines;
}

auto compose_screen(const DashboardModel& model, TimePoint now) -> Screen {
    Screen screen;
    if (model.items.empty()) {
        screen.title = "Review";
        screen.content.push_back(Line{.text = "No issues to review.", .is_highlighted = false, .tone = Tone::MUTED});
        screen.control_hints = "Press 'q' to quit";
        return screen;
    }

    screen.title = "Review: " + model.items.front().title;

    if (model.overlay == Overlay::SEARCH) {
        screen.content.push_back(Line{.text = "Search: " + model.search_query + "█",
                                      .is_highlighted = true,
                                      .tone = Tone::ACCENT});
    }

    if (model.nodes.empty()) {
        screen.content.push_back(Line{.text = "No matching issues", .is_highlighted = false, .tone = Tone::MUTED});
    }
    size_t end = std::min(model.scroll + model.visible_height(), model.nodes.size());
    for (size_t i = model.scroll; i < end; ++i) {
        screen.content.push_back(compose_tree_row(model, i));
    }

    if (!model.blockers.empty()) {
        screen.content.push_back(Line{});
        screen.content.push_back(Line{.text = "BLOCKERS (external)", .is_highlighted = false, .tone = Tone::DANGER});
        for (const auto& blocker : model.blockers) {
            screen.content.push_back(
                Line{.text = "  └─ " + blocker.id + " " + blocker.title, .is_highlighted = false, .tone = Tone::DANGER});
        }
    }

    if (model.width >= kSplitViewMinWidth) {
        if (const auto* issue = model.selected_issue()) {
            auto detail = compose_detail_lines(*issue);
            size_t skip = std::min(model.detail_scroll, detail.size());
            screen.detail.assign(detail.begin() + static_cast<std::ptrdiff_t>(skip), detail.end());
        } else {
            screen.detail.push_back(Line{.text = "No issue selected", .is_highlighted = false, .tone = Tone::MUTED});
        }
    }

    screen.modal = compose_modal(model, now);

    std::string status = "[" + std::to_string(reviewed_in_view(model)) + "/" + std::to_string(model.nodes.size())
                         + " reviewed]  Filter: [" + status_filter_name(model.status_filter) + "]";
    if (!model.active_labels.empty()) {
        status += "  Labels: " + join_labels(model.active_labels, " ∩ ");
    }
    if (!model.search_query.empty() && model.overlay != Overlay::SEARCH) {
        status += "  Search: '" + model.search_query + "'";
    }
    if (model.session.pending_count() > 0) {
        status += "  Pending: " + std::to_string(model.session.pending_count());
    }
    if (model.detail_focus) {
        status += "  [detail]";
    }
    screen.status_line = status;
    screen.control_hints = control_hints_for(model);
    return screen;
}

} // namespace beadview
