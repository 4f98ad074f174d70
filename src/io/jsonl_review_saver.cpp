#include "beadview/io/jsonl_review_saver.hpp"
#include "beadview/core/review_comment.hpp"
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <fstream>
#include <system_error>

namespace beadview {

using json = nlohmann::json;

JsonlReviewSaver::JsonlReviewSaver(std::filesystem::path path) : path_(std::move(path)) {}

auto JsonlReviewSaver::to_json_line(const ReviewAction& action) -> std::string {
    json record{
        {"issue_id", action.issue_id},
        {"author", action.reviewer},
        {"text", format_review_comment(action)},
        {"created_at", format_rfc3339(action.timestamp)},
    };
    return record.dump();
}

auto JsonlReviewSaver::parse_record_line(const std::string& line) -> std::optional<ReviewRecord> {
    try {
        auto object = json::parse(line);
        if (!object.is_object()) {
            return std::nullopt;
        }
        ReviewRecord record{
            .issue_id = object.value("issue_id", ""),
            .author = object.value("author", ""),
            .text = object.value("text", ""),
            .created_at = object.value("created_at", "")
        };
        if (record.issue_id.empty() || record.text.empty()) {
            return std::nullopt;
        }
        return record;
    } catch (const json::exception& e) {
        spdlog::debug("malformed review record: {}", e.what());
        return std::nullopt;
    }
}

auto JsonlReviewSaver::save(const std::vector<ReviewAction>& actions) -> SaveResult {
    SaveResult result;
    if (actions.empty()) {
        return result;
    }

    if (path_.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(path_.parent_path(), ec);
        if (ec) {
            spdlog::error("cannot create {}: {}", path_.parent_path().string(), ec.message());
        }
    }

    std::ofstream file(path_, std::ios::app);
    if (!file.is_open()) {
        result.failed = actions.size();
        for (const auto& action : actions) {
            result.errors.push_back(action.issue_id + ": cannot open " + path_.string());
        }
        return result;
    }

    for (const auto& action : actions) {
        file << to_json_line(action) << "\n";
        if (file.good()) {
            result.saved++;
        } else {
            result.failed++;
            result.errors.push_back(action.issue_id + ": write to " + path_.string() + " failed");
            file.clear();
        }
    }
    file.flush();

    spdlog::info("saved {} review records to {} ({} failed)", result.saved, path_.string(), result.failed);
    return result;
}

auto JsonlReviewSaver::load_records() -> std::vector<ReviewRecord> {
    std::vector<ReviewRecord> records;
    std::ifstream file(path_);
    if (!file.is_open()) {
        // No earlier session
        return records;
    }

    std::string line;
    size_t line_number = 0;
    while (std::getline(file, line)) {
        line_number++;
        if (trim(line).empty()) {
            continue;
        }
        if (auto record = parse_record_line(line)) {
            records.push_back(std::move(*record));
        } else {
            spdlog::warn("{}: skipping invalid review record on line {}", path_.string(), line_number);
        }
    }
    return records;
}

} // namespace beadview
