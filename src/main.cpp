#include "beadview/application/beadview_app.hpp"
#include "beadview/io/jsonl_review_saver.hpp"
#include "beadview/io/osc52_clipboard.hpp"
#include "beadview/io/subsequence_fuzzy_matcher.hpp"
#include "beadview/parsers/jsonl_issue_parser.hpp"
#include "beadview/ui/ftxui_terminal.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/spdlog.h>

#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>

namespace {

auto print_usage() -> void {
    std::cout << "Usage: beadview [options] <root-issue-id>\n";
    std::cout << "  -r, --root <id>        Issue whose subtree is reviewed\n";
    std::cout << "  -i, --issues <file>    Issues file (default: .beads/issues.jsonl)\n";
    std::cout << "      --reviewer <name>  Reviewer name (default: $USER)\n";
    std::cout << "      --type <type>      Review type recorded with each decision (default: plan)\n";
    std::cout << "      --reviews <file>   Review log to append to (default: .bv/reviews.jsonl)\n";
    std::cout << "      --non-interactive  Print the tree and review progress, then exit\n";
    std::cout << "      --dry-run          Review without saving decisions\n";
    std::cout << "      --log-file <file>  Write diagnostics to file\n";
    std::cout << "  -v, --verbose          More diagnostics\n";
    std::cout << "  -h, --help             Show this help\n";
    std::cout << "\nExamples:\n";
    std::cout << "  beadview bv-12                          # Review epic bv-12\n";
    std::cout << "  beadview -r bv-12 --non-interactive     # Print review progress\n";
    std::cout << "  beadview bv-12 --log-file beadview.log  # Keep a diagnostic log\n";
}

// std::nullopt means exit with the given code right away
auto parse_args(int argc, char* argv[], beadview::Config& config) -> std::optional<int> {
    if (const char* user = std::getenv("USER")) {
        config.reviewer = user;
    }

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        bool has_value = i + 1 < argc;
        if ((arg == "-r" || arg == "--root") && has_value) {
            config.root_id = argv[++i];
        } else if ((arg == "-i" || arg == "--issues") && has_value) {
            config.issues_file = argv[++i];
        } else if (arg == "--reviewer" && has_value) {
            config.reviewer = argv[++i];
        } else if (arg == "--type" && has_value) {
            config.review_type = argv[++i];
        } else if (arg == "--reviews" && has_value) {
            config.reviews_file = argv[++i];
        } else if (arg == "--log-file" && has_value) {
            config.log_file = argv[++i];
        } else if (arg == "--non-interactive") {
            config.interactive = false;
        } else if (arg == "--dry-run") {
            config.dry_run = true;
        } else if (arg == "-v" || arg == "--verbose") {
            config.verbose = true;
        } else if (arg == "-h" || arg == "--help") {
            print_usage();
            return 0;
        } else if (!arg.starts_with("-") && config.root_id.empty()) {
            config.root_id = arg;
        } else {
            std::cerr << "Unknown or incomplete option: " << arg << "\n\n";
            print_usage();
            return 1;
        }
    }

    if (config.root_id.empty()) {
        std::cerr << "Error: no root issue given\n\n";
        print_usage();
        return 1;
    }
    if (config.reviewer.empty()) {
        config.reviewer = "unknown";
    }
    return std::nullopt;
}

auto setup_logging(const beadview::Config& config) -> void {
    auto level = config.verbose ? spdlog::level::debug : spdlog::level::info;

    if (!config.log_file.empty()) {
        try {
            auto sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(config.log_file, true);
            auto log = std::make_shared<spdlog::logger>("beadview", std::move(sink));
            log->set_level(level);
            log->flush_on(level);
            spdlog::set_default_logger(std::move(log));
        } catch (const spdlog::spdlog_ex& e) {
            std::cerr << "Warning: Could not open log file " << config.log_file << ": " << e.what() << "\n";
            spdlog::set_level(spdlog::level::off);
            return;
        }
    } else if (config.verbose && !config.interactive) {
        // Console logging only where it cannot tear the fullscreen UI
        spdlog::set_level(spdlog::level::info);
    } else {
        spdlog::set_level(spdlog::level::off);
    }

    spdlog::set_pattern("[%H:%M:%S.%e] [%l] %v");
}

} // namespace

auto main(int argc, char* argv[]) -> int {
    beadview::Config config;
    if (auto exit_code = parse_args(argc, argv, config)) {
        return *exit_code;
    }

    setup_logging(config);
    spdlog::info("beadview starting, root {}", config.root_id);

    auto terminal = std::make_unique<beadview::FTXUITerminal>();
    auto parser = std::make_unique<beadview::JsonlIssueParser>();
    auto saver = std::make_unique<beadview::JsonlReviewSaver>(std::filesystem::path(config.reviews_file));
    auto clipboard = std::make_unique<beadview::Osc52Clipboard>();
    auto matcher = std::make_shared<const beadview::SubsequenceFuzzyMatcher>();

    beadview::BeadviewApp app(std::move(terminal), std::move(parser), std::move(saver), std::move(clipboard),
                              std::move(matcher));
    return app.run(config);
}
