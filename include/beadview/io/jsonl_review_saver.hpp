#pragma once

#include "beadview/core/review_session.hpp"
#include "beadview/interfaces.hpp"
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace beadview {

// Appends each review action as a structured [REVIEW] comment record to a
// JSON Lines file, and reads those records back on the next start.
class JsonlReviewSaver : public IReviewSaver {
public:
    explicit JsonlReviewSaver(std::filesystem::path path);

    auto save(const std::vector<ReviewAction>& actions) -> SaveResult override;
    auto load_records() -> std::vector<ReviewRecord> override;

    auto path() const -> const std::filesystem::path& { return path_; }

    static auto to_json_line(const ReviewAction& action) -> std::string;
    static auto parse_record_line(const std::string& line) -> std::optional<ReviewRecord>;

private:
    std::filesystem::path path_;
};

} // namespace beadview
