#pragma once

#include "beadview/core/issue.hpp"
#include <memory>
#include <string>
#include <vector>

namespace beadview {

enum class SelectorItemType {
    LABEL,
    EPIC,
    BEAD  // single issue found by identifier lookup
};

auto to_string(SelectorItemType type) -> std::string;

// One selectable row of the label/epic selector
struct LabelItem {
    SelectorItemType type = SelectorItemType::LABEL;
    std::string value;  // label name or issue id
    std::string title;  // label name for labels, issue title otherwise
    size_t issue_count{};
    size_t closed_count{};
    double progress{};
    size_t overlap_count{};  // only set while a scope is active

    auto operator==(const LabelItem& other) const -> bool = default;
};

// Everything the selector can offer, built once per item set and shared
// between copies of the selector.
struct SelectorCatalog {
    std::vector<Issue> issues;
    std::vector<LabelItem> all_items;  // open epics first, then labels
};

// Open epics ordered by progress then title, followed by every distinct
// label in alphabetical order with direct issue and closed counts.
auto build_selector_catalog(std::vector<Issue> issues) -> std::shared_ptr<const SelectorCatalog>;

// Narrows the selector to labels that co-occur with every scope label.
// Each mutation returns the recomputed candidate list.
class ScopeFilter {
public:
    ScopeFilter();
    explicit ScopeFilter(std::shared_ptr<const SelectorCatalog> catalog);

    auto add_to_scope(const std::string& label) -> std::vector<LabelItem>;
    auto remove_last_scope() -> std::vector<LabelItem>;
    auto clear_scope() -> std::vector<LabelItem>;

    auto scope_labels() const -> const std::vector<std::string>& { return scope_labels_; }
    auto is_active() const -> bool { return !scope_labels_.empty(); }
    auto candidates() const -> const std::vector<LabelItem>& { return candidates_; }
    auto catalog() const -> const SelectorCatalog& { return *catalog_; }

private:
    std::shared_ptr<const SelectorCatalog> catalog_;
    std::vector<std::string> scope_labels_;
    std::vector<LabelItem> candidates_;

    auto recompute() -> void;
};

} // namespace beadview
