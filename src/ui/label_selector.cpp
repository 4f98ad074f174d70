#include "beadview/ui/label_selector.hpp"
#include <algorithm>

namespace beadview {

LabelSelector::LabelSelector(std::shared_ptr<const SelectorCatalog> catalog,
                             std::shared_ptr<const IFuzzyMatcher> matcher)
    : scope_(std::move(catalog)), matcher_(std::move(matcher)), candidates_(scope_.candidates()) {}

auto LabelSelector::insert_variant() const -> std::optional<InsertVariant> {
    if (const auto* insert = std::get_if<InsertMode>(&mode_)) {
        return insert->variant;
    }
    return std::nullopt;
}

auto LabelSelector::handle_key(const KeyPress& key) -> bool {
    if (outcome_ != SelectorOutcome::PENDING) {
        return false;
    }
    if (const auto* insert = std::get_if<InsertMode>(&mode_)) {
        return handle_insert_key(insert->variant, key);
    }
    return handle_normal_key(key);
}

auto LabelSelector::handle_insert_key(InsertVariant variant, const KeyPress& key) -> bool {
    switch (key.event) {
    case InputEvent::ESCAPE:
        mode_ = NormalMode{};
        // Search and scope-add keep their text so typing can resume
        if (variant == InsertVariant::REVIEW_LOOKUP) {
            search_text_.clear();
            candidates_ = scope_.candidates();
            selected_index_ = 0;
        }
        return true;

    case InputEvent::ENTER: {
        if (selected_index_ >= candidates_.size()) {
            return true;
        }
        const auto& item = candidates_[selected_index_];
        if (variant == InsertVariant::SCOPE_ADD && item.type == SelectorItemType::LABEL) {
            auto label = item.value;
            search_text_.clear();
            candidates_ = scope_.add_to_scope(label);
            selected_index_ = 0;
            return true;
        }
        confirm_selection();
        return true;
    }

    case InputEvent::BACKSPACE:
        if (!search_text_.empty()) {
            pop_last_character(search_text_);
            refilter();
        }
        return true;

    case InputEvent::ARROW_UP:
        move_up();
        return true;

    case InputEvent::ARROW_DOWN:
        move_down();
        return true;

    case InputEvent::CHARACTER:
        // Every printable key is text here, including j, k and s
        search_text_ += key.text;
        refilter();
        return true;

    default:
        return false;
    }
}

auto LabelSelector::handle_normal_key(const KeyPress& key) -> bool {
    switch (key.event) {
    case InputEvent::ARROW_UP:
        move_up();
        return true;
    case InputEvent::ARROW_DOWN:
        move_down();
        return true;
    case InputEvent::ENTER:
        confirm_selection();
        return true;
    case InputEvent::ESCAPE:
        if (scope_.is_active()) {
            candidates_ = scope_.clear_scope();
            scoped_labels_.clear();
            search_text_.clear();
            selected_index_ = 0;
            return true;
        }
        outcome_ = SelectorOutcome::CANCELLED;
        selected_item_.reset();
        return true;
    case InputEvent::BACKSPACE:
        if (!search_text_.empty()) {
            search_text_.clear();
            refilter();
        } else if (scope_.is_active()) {
            candidates_ = scope_.remove_last_scope();
            selected_index_ = 0;
        }
        return true;
    default:
        break;
    }

    if (key.is_char('k')) {
        move_up();
        return true;
    }
    if (key.is_char('j')) {
        move_down();
        return true;
    }
    if (key.is_char('i') || key.is_char('/')) {
        mode_ = InsertMode{InsertVariant::SEARCH};
        return true;
    }
    if (key.is_char('s')) {
        mode_ = InsertMode{InsertVariant::SCOPE_ADD};
        return true;
    }
    if (key.is_char('r')) {
        mode_ = InsertMode{InsertVariant::REVIEW_LOOKUP};
        search_text_.clear();
        candidates_.clear();
        selected_index_ = 0;
        return true;
    }
    if (key.is_char('q')) {
        outcome_ = SelectorOutcome::CANCELLED;
        selected_item_.reset();
        return true;
    }
    return false;
}

auto LabelSelector::reset() -> void {
    scope_.clear_scope();
    mode_ = NormalMode{};
    outcome_ = SelectorOutcome::PENDING;
    search_text_.clear();
    candidates_ = scope_.candidates();
    selected_index_ = 0;
    selected_item_.reset();
    scoped_labels_.clear();
}

auto LabelSelector::move_up() -> void {
    if (selected_index_ > 0) {
        selected_index_--;
    }
}

auto LabelSelector::move_down() -> void {
    if (selected_index_ + 1 < candidates_.size()) {
        selected_index_++;
    }
}

auto LabelSelector::confirm_selection() -> void {
    if (selected_index_ >= candidates_.size()) {
        return;
    }
    const auto& item = candidates_[selected_index_];
    selected_item_ = item;

    scoped_labels_.clear();
    if (scope_.is_active() && item.type == SelectorItemType::LABEL) {
        scoped_labels_ = scope_.scope_labels();
        scoped_labels_.push_back(item.value);
    }

    mode_ = NormalMode{};
    outcome_ = SelectorOutcome::CONFIRMED;
}

auto LabelSelector::refilter() -> void {
    auto query = trim(search_text_);
    if (insert_variant() == InsertVariant::REVIEW_LOOKUP) {
        lookup_issues(query);
    } else {
        fuzzy_filter(query);
    }
    selected_index_ = 0;
}

auto LabelSelector::fuzzy_filter(const std::string& query) -> void {
    // The pool is the scope result while a scope is active
    const auto& pool = scope_.candidates();
    if (query.empty()) {
        candidates_ = pool;
        return;
    }

    candidates_.clear();
    if (!matcher_) {
        return;
    }

    std::vector<std::string> haystacks;
    haystacks.reserve(pool.size());
    for (const auto& item : pool) {
        haystacks.push_back(item.title + " " + item.value);
    }

    for (const auto& match : matcher_->find(query, haystacks)) {
        candidates_.push_back(pool[match.index]);
    }

    // Epics stay above labels, score order within each group
    std::stable_partition(candidates_.begin(), candidates_.end(),
                          [](const LabelItem& item) { return item.type == SelectorItemType::EPIC; });
}

auto LabelSelector::lookup_issues(const std::string& query) -> void {
    candidates_.clear();
    if (query.empty()) {
        return;
    }

    auto needle = to_lowercase(query);
    std::vector<LabelItem> id_matches;
    std::vector<LabelItem> title_matches;

    for (const auto& issue : scope_.catalog().issues) {
        auto id_lower = to_lowercase(issue.id);
        LabelItem item{
            .type = SelectorItemType::BEAD,
            .value = issue.id,
            .title = issue.title,
            .issue_count = 1,
            .closed_count = issue.status == Status::CLOSED ? 1u : 0u,
            .progress = 0.0,
            .overlap_count = 0
        };
        if (id_lower.starts_with(needle)) {
            id_matches.push_back(std::move(item));
        } else if (contains_ignore_case(issue.title, query)) {
            title_matches.push_back(std::move(item));
        }
    }

    std::stable_sort(id_matches.begin(), id_matches.end(),
                     [](const LabelItem& a, const LabelItem& b) { return a.value < b.value; });
    std::stable_sort(title_matches.begin(), title_matches.end(),
                     [](const LabelItem& a, const LabelItem& b) { return a.title < b.title; });

    candidates_ = std::move(id_matches);
    candidates_.insert(candidates_.end(), title_matches.begin(), title_matches.end());
}

} // namespace beadview
