#pragma once

#include "beadview/core/scope_filter.hpp"
#include "beadview/interfaces.hpp"
#include "beadview/ui/input_event.hpp"
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace beadview {

// Keys navigate and trigger commands
struct NormalMode {
    auto operator==(const NormalMode&) const -> bool = default;
};

enum class InsertVariant {
    SEARCH,        // fuzzy search over labels and epics
    SCOPE_ADD,     // Enter on a label narrows the scope
    REVIEW_LOOKUP  // identifier prefix or title lookup over issues
};

// Keys are typed into the search buffer
struct InsertMode {
    InsertVariant variant = InsertVariant::SEARCH;

    auto operator==(const InsertMode&) const -> bool = default;
};

using SelectorMode = std::variant<NormalMode, InsertMode>;

enum class SelectorOutcome {
    PENDING,
    CONFIRMED,
    CANCELLED
};

// Modal picker for labels, epics and single issues. The caller feeds keys
// until outcome() leaves PENDING, reads the result, then calls reset().
class LabelSelector {
public:
    LabelSelector() = default;
    LabelSelector(std::shared_ptr<const SelectorCatalog> catalog, std::shared_ptr<const IFuzzyMatcher> matcher);

    // Returns true when the key was consumed
    auto handle_key(const KeyPress& key) -> bool;
    auto reset() -> void;

    auto mode() const -> const SelectorMode& { return mode_; }
    auto is_insert_mode() const -> bool { return std::holds_alternative<InsertMode>(mode_); }
    auto insert_variant() const -> std::optional<InsertVariant>;

    auto outcome() const -> SelectorOutcome { return outcome_; }
    auto selected_item() const -> const std::optional<LabelItem>& { return selected_item_; }
    // Scope labels plus the selected label, when a label was confirmed inside a scope
    auto scoped_labels() const -> const std::vector<std::string>& { return scoped_labels_; }

    auto scope_labels() const -> const std::vector<std::string>& { return scope_.scope_labels(); }
    auto is_scope_active() const -> bool { return scope_.is_active(); }
    auto search_text() const -> const std::string& { return search_text_; }
    auto candidates() const -> const std::vector<LabelItem>& { return candidates_; }
    auto selected_index() const -> size_t { return selected_index_; }

private:
    ScopeFilter scope_;
    std::shared_ptr<const IFuzzyMatcher> matcher_;

    SelectorMode mode_ = NormalMode{};
    SelectorOutcome outcome_ = SelectorOutcome::PENDING;
    std::string search_text_;
    std::vector<LabelItem> candidates_;
    size_t selected_index_{};
    std::optional<LabelItem> selected_item_;
    std::vector<std::string> scoped_labels_;

    auto handle_normal_key(const KeyPress& key) -> bool;
    auto handle_insert_key(InsertVariant variant, const KeyPress& key) -> bool;

    auto move_up() -> void;
    auto move_down() -> void;
    auto confirm_selection() -> void;
    auto refilter() -> void;
    auto fuzzy_filter(const std::string& query) -> void;
    auto lookup_issues(const std::string& query) -> void;
};

} // namespace beadview
