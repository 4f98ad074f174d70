#include "beadview/io/subsequence_fuzzy_matcher.hpp"
#include "beadview/core/issue.hpp"
#include <algorithm>

namespace beadview {

namespace {

constexpr int kMatchScore = 16;
constexpr int kConsecutiveBonus = 15;
constexpr int kStartBonus = 20;
constexpr int kSeparatorBonus = 10;
constexpr int kLeadingPenalty = 1;
constexpr int kMaxLeadingPenalty = 10;

auto is_separator(char c) -> bool {
    return c == ' ' || c == '-' || c == '_' || c == '.' || c == '/' || c == ':';
}

} // namespace

auto SubsequenceFuzzyMatcher::score(const std::string& query, const std::string& candidate) -> std::optional<int> {
    if (query.empty()) {
        return 0;
    }

    auto needle = to_lowercase(query);
    auto haystack = to_lowercase(candidate);

    int total = 0;
    size_t q = 0;
    std::optional<size_t> previous_match;
    std::optional<size_t> first_match;

    for (size_t h = 0; h < haystack.size() && q < needle.size(); ++h) {
        if (haystack[h] != needle[q]) {
            continue;
        }
        total += kMatchScore;
        if (h == 0) {
            total += kStartBonus;
        } else if (is_separator(haystack[h - 1])) {
            total += kSeparatorBonus;
        }
        if (previous_match && *previous_match + 1 == h) {
            total += kConsecutiveBonus;
        }
        if (!first_match) {
            first_match = h;
        }
        previous_match = h;
        q++;
    }

    if (q < needle.size()) {
        return std::nullopt;
    }

    total -= std::min(static_cast<int>(*first_match) * kLeadingPenalty, kMaxLeadingPenalty);
    return total;
}

auto SubsequenceFuzzyMatcher::find(const std::string& query, const std::vector<std::string>& candidates) const
    -> std::vector<FuzzyMatch> {
    std::vector<FuzzyMatch> matches;
    for (size_t i = 0; i < candidates.size(); ++i) {
        if (auto s = score(query, candidates[i])) {
            matches.push_back(FuzzyMatch{.index = i, .score = *s});
        }
    }
    std::stable_sort(matches.begin(), matches.end(),
                     [](const FuzzyMatch& a, const FuzzyMatch& b) { return a.score > b.score; });
    return matches;
}

} // namespace beadview
