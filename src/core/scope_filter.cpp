#include "beadview/core/scope_filter.hpp"
#include "beadview/core/tree_flattener.hpp"
#include <algorithm>
#include <map>
#include <unordered_map>
#include <unordered_set>

namespace beadview {

auto to_string(SelectorItemType type) -> std::string {
    switch (type) {
    case SelectorItemType::LABEL:
        return "label";
    case SelectorItemType::EPIC:
        return "epic";
    case SelectorItemType::BEAD:
        return "bead";
    }
    return "label";
}

auto build_selector_catalog(std::vector<Issue> issues) -> std::shared_ptr<const SelectorCatalog> {
    auto catalog = std::make_shared<SelectorCatalog>();

    std::vector<LabelItem> epics;
    struct LabelCounts {
        size_t total{};
        size_t closed{};
    };
    std::map<std::string, LabelCounts> label_counts;  // ordered by name

    for (const auto& issue : issues) {
        if (issue.issue_type == IssueType::EPIC && issue.status != Status::CLOSED) {
            auto progress = count_epic_children(issue.id, issues);
            epics.push_back(LabelItem{
                .type = SelectorItemType::EPIC,
                .value = issue.id,
                .title = issue.title,
                .issue_count = progress.total,
                .closed_count = progress.closed,
                .progress = progress.fraction(),
                .overlap_count = 0
            });
        }

        for (const auto& label : issue.labels) {
            auto& counts = label_counts[label];
            counts.total++;
            if (issue.status == Status::CLOSED) {
                counts.closed++;
            }
        }
    }

    std::stable_sort(epics.begin(), epics.end(), [](const LabelItem& a, const LabelItem& b) {
        if (a.progress != b.progress) {
            return a.progress < b.progress;
        }
        return a.title < b.title;
    });

    catalog->all_items = std::move(epics);
    for (const auto& [name, counts] : label_counts) {
        catalog->all_items.push_back(LabelItem{
            .type = SelectorItemType::LABEL,
            .value = name,
            .title = name,
            .issue_count = counts.total,
            .closed_count = counts.closed,
            .progress = counts.total > 0
                ? static_cast<double>(counts.closed) / static_cast<double>(counts.total) : 0.0,
            .overlap_count = 0
        });
    }

    catalog->issues = std::move(issues);
    return catalog;
}

ScopeFilter::ScopeFilter() : ScopeFilter(std::make_shared<SelectorCatalog>()) {}

ScopeFilter::ScopeFilter(std::shared_ptr<const SelectorCatalog> catalog)
    : catalog_(std::move(catalog)), candidates_(catalog_->all_items) {}

auto ScopeFilter::add_to_scope(const std::string& label) -> std::vector<LabelItem> {
    if (std::find(scope_labels_.begin(), scope_labels_.end(), label) == scope_labels_.end()) {
        scope_labels_.push_back(label);
    }
    recompute();
    return candidates_;
}

auto ScopeFilter::remove_last_scope() -> std::vector<LabelItem> {
    if (!scope_labels_.empty()) {
        scope_labels_.pop_back();
        recompute();
    }
    return candidates_;
}

auto ScopeFilter::clear_scope() -> std::vector<LabelItem> {
    scope_labels_.clear();
    recompute();
    return candidates_;
}

auto ScopeFilter::recompute() -> void {
    if (scope_labels_.empty()) {
        candidates_ = catalog_->all_items;
        return;
    }

    std::unordered_set<std::string> scope_set(scope_labels_.begin(), scope_labels_.end());

    std::unordered_map<std::string, size_t> overlap;
    for (const auto& issue : catalog_->issues) {
        bool has_all = std::all_of(scope_labels_.begin(), scope_labels_.end(),
                                   [&issue](const std::string& label) { return issue.has_label(label); });
        if (!has_all) {
            continue;
        }
        for (const auto& label : issue.labels) {
            if (!scope_set.contains(label)) {
                overlap[label]++;
            }
        }
    }

    std::vector<LabelItem> filtered;
    for (const auto& item : catalog_->all_items) {
        if (item.type != SelectorItemType::LABEL || scope_set.contains(item.value)) {
            continue;
        }
        auto it = overlap.find(item.value);
        if (it != overlap.end() && it->second > 0) {
            auto copy = item;
            copy.overlap_count = it->second;
            filtered.push_back(std::move(copy));
        }
    }

    std::stable_sort(filtered.begin(), filtered.end(), [](const LabelItem& a, const LabelItem& b) {
        return a.overlap_count > b.overlap_count;
    });

    candidates_ = std::move(filtered);
}

} // namespace beadview
