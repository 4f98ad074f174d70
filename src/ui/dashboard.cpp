#include "beadview/ui/dashboard.hpp"
#include "beadview/core/viewport.hpp"
#include <algorithm>

namespace beadview {

namespace {

constexpr int kChromeLines = 7;  // header, progress, separators, footer
constexpr size_t kMinVisibleRows = 3;

auto selected_item_index(const DashboardModel& model) -> std::optional<size_t> {
    if (model.cursor >= model.nodes.size()) {
        return std::nullopt;
    }
    return model.nodes[model.cursor].item_index;
}

auto scroll_to_cursor(DashboardModel& model) -> void {
    model.scroll = ensure_visible(model.cursor, model.scroll, model.nodes.size(), model.visible_height());
}

auto move_cursor_to(DashboardModel& model, size_t index) -> void {
    if (index != model.cursor) {
        model.detail_scroll = 0;
    }
    model.cursor = index;
    scroll_to_cursor(model);
}

// Filter changes that reshape the list start over at the top
auto restart_at_top(DashboardModel& model) -> void {
    model.cursor = 0;
    model.scroll = 0;
    rebuild_nodes(model);
}

auto is_node_unreviewed(const DashboardModel& model, size_t node) -> bool {
    return is_unreviewed(model.items[model.nodes[node].item_index].review_status);
}

auto jump_to_next_unreviewed(DashboardModel& model) -> void {
    size_t count = model.nodes.size();
    for (size_t step = 1; step <= count; ++step) {
        size_t candidate = (model.cursor + step) % count;
        if (is_node_unreviewed(model, candidate)) {
            move_cursor_to(model, candidate);
            return;
        }
    }
}

auto jump_to_previous_unreviewed(DashboardModel& model) -> void {
    size_t count = model.nodes.size();
    for (size_t step = 1; step <= count; ++step) {
        size_t candidate = (model.cursor + count - step) % count;
        if (is_node_unreviewed(model, candidate)) {
            move_cursor_to(model, candidate);
            return;
        }
    }
}

auto open_note(DashboardModel& model, ReviewOutcome outcome) -> void {
    if (!selected_item_index(model)) {
        return;
    }
    model.note_outcome = outcome;
    model.note_input.clear();
    model.overlay = Overlay::NOTE;
}

auto handle_search_key(DashboardModel model, const KeyPress& key) -> DashboardModel {
    switch (key.event) {
    case InputEvent::ESCAPE:
        model.overlay = Overlay::NONE;
        model.search_query.clear();
        restart_at_top(model);
        break;
    case InputEvent::ENTER:
        model.overlay = Overlay::NONE;
        scroll_to_cursor(model);  // the search bar no longer takes a row
        break;
    case InputEvent::BACKSPACE:
        if (!model.search_query.empty()) {
            pop_last_character(model.search_query);
            restart_at_top(model);
        }
        break;
    case InputEvent::CHARACTER:
        model.search_query += key.text;
        restart_at_top(model);
        break;
    default:
        break;
    }
    return model;
}

auto handle_label_input_key(DashboardModel model, const KeyPress& key) -> DashboardModel {
    switch (key.event) {
    case InputEvent::ESCAPE:
        model.overlay = Overlay::NONE;
        model.label_input.clear();
        break;
    case InputEvent::ENTER: {
        auto label = trim(model.label_input);
        if (!label.empty()) {
            bool exists = std::any_of(model.active_labels.begin(), model.active_labels.end(),
                                      [&label](const std::string& l) { return equals_ignore_case(l, label); });
            if (!exists) {
                model.active_labels.push_back(label);
                restart_at_top(model);
            }
        }
        model.overlay = Overlay::NONE;
        model.label_input.clear();
        break;
    }
    case InputEvent::BACKSPACE:
        if (!model.label_input.empty()) {
            pop_last_character(model.label_input);
        } else if (!model.active_labels.empty()) {
            model.active_labels.pop_back();
            restart_at_top(model);
        }
        break;
    case InputEvent::CHARACTER:
        model.label_input += key.text;
        break;
    default:
        break;
    }
    return model;
}

auto handle_assignee_key(DashboardModel model, const KeyPress& key) -> DashboardModel {
    switch (key.event) {
    case InputEvent::ESCAPE:
        model.overlay = Overlay::NONE;
        model.assignee_input.clear();
        break;
    case InputEvent::ENTER:
        if (auto index = selected_item_index(model)) {
            auto assignee = trim(model.assignee_input);
            if (assignee.empty()) {
                model.items[*index].assignee.reset();
            } else {
                model.items[*index].assignee = assignee;
            }
        }
        model.overlay = Overlay::NONE;
        model.assignee_input.clear();
        break;
    case InputEvent::BACKSPACE:
        pop_last_character(model.assignee_input);
        break;
    case InputEvent::CHARACTER:
        model.assignee_input += key.text;
        break;
    default:
        break;
    }
    return model;
}

auto handle_note_key(DashboardModel model, const KeyPress& key) -> DashboardModel {
    switch (key.event) {
    case InputEvent::ESCAPE:
        model.overlay = Overlay::NONE;
        model.note_input.clear();
        break;
    case InputEvent::SUBMIT:
        if (auto index = selected_item_index(model)) {
            model.session.record_action(model.items[*index], model.note_outcome, trim(model.note_input),
                                        Clock::now());
        }
        model.overlay = Overlay::NONE;
        model.note_input.clear();
        break;
    case InputEvent::ENTER:
        model.note_input += "\n";
        break;
    case InputEvent::BACKSPACE:
        pop_last_character(model.note_input);
        break;
    case InputEvent::CHARACTER:
        model.note_input += key.text;
        break;
    default:
        break;
    }
    return model;
}

auto handle_summary_key(DashboardModel model, const KeyPress& key) -> DashboardModel {
    if (key.event == InputEvent::ESCAPE) {
        model.overlay = Overlay::NONE;
        model.prompt_copied = false;
    } else if (key.is_char('q')) {
        model.exit_action = ExitAction::SAVE;
    } else if (key.is_char('Q')) {
        model.exit_action = ExitAction::DISCARD;
    } else if (key.is_char('p')) {
        model.pending_clipboard = model.session.simple_prompt();
    } else if (key.is_char('P')) {
        model.pending_clipboard = model.session.full_prompt(model.items);
    }
    return model;
}

auto apply_selector_result(DashboardModel& model) -> void {
    const auto& item = model.selector.selected_item();
    if (item) {
        if (item->type == SelectorItemType::LABEL) {
            model.active_labels = model.selector.scoped_labels().empty()
                ? std::vector<std::string>{item->value} : model.selector.scoped_labels();
            restart_at_top(model);
        } else {
            auto it = std::find_if(model.nodes.begin(), model.nodes.end(), [&](const DisplayNode& node) {
                return model.items[node.item_index].id == item->value;
            });
            if (it != model.nodes.end()) {
                move_cursor_to(model, static_cast<size_t>(it - model.nodes.begin()));
            }
        }
    }
}

auto handle_selector_key(DashboardModel model, const KeyPress& key) -> DashboardModel {
    model.selector.handle_key(key);

    switch (model.selector.outcome()) {
    case SelectorOutcome::PENDING:
        break;
    case SelectorOutcome::CONFIRMED:
        apply_selector_result(model);
        model.overlay = Overlay::NONE;
        model.selector.reset();
        break;
    case SelectorOutcome::CANCELLED:
        model.overlay = Overlay::NONE;
        model.selector.reset();
        break;
    }
    return model;
}

auto handle_navigation_key(DashboardModel model, const KeyPress& key) -> DashboardModel {
    bool down = key.event == InputEvent::ARROW_DOWN || key.is_char('j');
    bool up = key.event == InputEvent::ARROW_UP || key.is_char('k');

    if (down) {
        if (model.detail_focus) {
            model.detail_scroll++;
        } else if (model.cursor + 1 < model.nodes.size()) {
            move_cursor_to(model, model.cursor + 1);
        }
        return model;
    }
    if (up) {
        if (model.detail_focus) {
            if (model.detail_scroll > 0) {
                model.detail_scroll--;
            }
        } else if (model.cursor > 0) {
            move_cursor_to(model, model.cursor - 1);
        }
        return model;
    }

    switch (key.event) {
    case InputEvent::HOME:
        move_cursor_to(model, 0);
        return model;
    case InputEvent::END:
        move_cursor_to(model, model.nodes.empty() ? 0 : model.nodes.size() - 1);
        return model;
    case InputEvent::TAB:
        model.detail_focus = !model.detail_focus;
        return model;
    case InputEvent::ESCAPE:
        break;  // same as 'q'
    case InputEvent::CHARACTER:
        break;
    default:
        return model;
    }

    if (key.event == InputEvent::ESCAPE || key.is_char('q')) {
        // Pending decisions get a chance to be saved
        if (model.session.pending_count() > 0) {
            model.overlay = Overlay::SUMMARY;
        } else {
            model.exit_action = ExitAction::DISCARD;
        }
        return model;
    }

    if (key.text.size() != 1) {
        return model;
    }

    switch (key.text[0]) {
    case 'g':
        move_cursor_to(model, 0);
        break;
    case 'G':
        move_cursor_to(model, model.nodes.empty() ? 0 : model.nodes.size() - 1);
        break;
    case 'f':
        model.status_filter = cycle_status_filter(model.status_filter);
        rebuild_nodes(model);
        break;
    case ']':
        jump_to_next_unreviewed(model);
        break;
    case '[':
        jump_to_previous_unreviewed(model);
        break;
    case 'a':
        if (auto index = selected_item_index(model)) {
            model.session.record_action(model.items[*index], ReviewOutcome::APPROVED, "", Clock::now());
        }
        break;
    case 'r':
        open_note(model, ReviewOutcome::NEEDS_REVISION);
        break;
    case 'd':
        open_note(model, ReviewOutcome::DEFERRED);
        break;
    case 'n':
        open_note(model, ReviewOutcome::NOTE);
        break;
    case 'A':
        if (auto index = selected_item_index(model)) {
            model.assignee_input = model.items[*index].assignee.value_or("");
            model.overlay = Overlay::ASSIGNEE;
        }
        break;
    case '/':
        model.overlay = Overlay::SEARCH;
        model.search_query.clear();
        restart_at_top(model);
        break;
    case 's':
        model.overlay = Overlay::LABEL_INPUT;
        model.label_input.clear();
        break;
    case 'S':
        model.active_labels.clear();
        restart_at_top(model);
        break;
    case 'L':
        model.selector.reset();
        model.overlay = Overlay::SELECTOR;
        break;
    case '?':
        model.overlay = Overlay::HELP;
        break;
    default:
        break;
    }
    return model;
}

} // namespace

auto DashboardModel::visible_height() const -> size_t {
    int rows = height - kChromeLines;
    if (overlay == Overlay::SEARCH) {
        rows--;  // search bar takes a line
    }
    return std::max(static_cast<size_t>(std::max(rows, 0)), kMinVisibleRows);
}

auto make_dashboard(const ReviewTree& tree, std::string reviewer, std::string review_type,
                    std::shared_ptr<const IFuzzyMatcher> matcher, TimePoint started_at) -> DashboardModel {
    DashboardModel model;
    model.items = tree.all_issues();
    model.blockers = tree.blockers;
    model.session = ReviewSession(std::move(reviewer), std::move(review_type), started_at);
    model.selector = LabelSelector(build_selector_catalog(model.items), std::move(matcher));
    rebuild_nodes(model);
    return model;
}

auto rebuild_nodes(DashboardModel& model) -> void {
    model.nodes = model.items.empty() ? std::vector<DisplayNode>{} : flatten_tree(model.items, 0, model.criteria());
    model.cursor = clamp_cursor(model.cursor, model.nodes.size());
    scroll_to_cursor(model);
}

auto update(DashboardModel model, const KeyPress& key) -> DashboardModel {
    if (model.is_quitting()) {
        return model;
    }

    switch (model.overlay) {
    case Overlay::HELP:
        // Any key closes help
        model.overlay = Overlay::NONE;
        return model;
    case Overlay::SUMMARY:
        return handle_summary_key(std::move(model), key);
    case Overlay::SEARCH:
        return handle_search_key(std::move(model), key);
    case Overlay::LABEL_INPUT:
        return handle_label_input_key(std::move(model), key);
    case Overlay::ASSIGNEE:
        return handle_assignee_key(std::move(model), key);
    case Overlay::NOTE:
        return handle_note_key(std::move(model), key);
    case Overlay::SELECTOR:
        return handle_selector_key(std::move(model), key);
    case Overlay::NONE:
        break;
    }
    return handle_navigation_key(std::move(model), key);
}

auto resize(DashboardModel model, int width, int height) -> DashboardModel {
    model.width = width;
    model.height = height;
    scroll_to_cursor(model);
    return model;
}

} // namespace beadview
