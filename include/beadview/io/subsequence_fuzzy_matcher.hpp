#pragma once

#include "beadview/interfaces.hpp"
#include <optional>
#include <string>
#include <vector>

namespace beadview {

// Case-insensitive subsequence matcher. Consecutive runs, a match on the
// first character and matches right after a word separator score higher.
class SubsequenceFuzzyMatcher : public IFuzzyMatcher {
public:
    auto find(const std::string& query, const std::vector<std::string>& candidates) const
        -> std::vector<FuzzyMatch> override;

    // nullopt when query is not a subsequence of candidate
    static auto score(const std::string& query, const std::string& candidate) -> std::optional<int>;
};

} // namespace beadview
