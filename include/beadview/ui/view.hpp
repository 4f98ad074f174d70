#pragma once

#include "beadview/ui/dashboard.hpp"
#include <string>
#include <vector>

namespace beadview {

// Color intent of a line; the terminal decides the actual palette
enum class Tone {
    NORMAL,
    ACCENT,
    SUCCESS,
    WARNING,
    DANGER,
    MUTED
};

// Screen structure for declarative rendering
struct Line {
    std::string text;
    bool is_highlighted = false;
    Tone tone = Tone::NORMAL;
};

struct Screen {
    std::string title;
    std::vector<Line> content;  // tree rows
    std::vector<Line> detail;   // side panel, empty on narrow terminals
    std::vector<Line> modal;    // centered overlay, empty when none is open
    std::string status_line;
    std::string control_hints;
};

inline constexpr int kSplitViewMinWidth = 100;

auto compose_screen(const DashboardModel& model, TimePoint now = Clock::now()) -> Screen;

// Individual pieces, exposed for the batch printer and tests
auto review_indicator(ReviewStatus status) -> std::string;
auto compose_tree_row(const DashboardModel& model, size_t node_index) -> Line;
auto compose_detail_lines(const Issue& issue) -> std::vector<Line>;
auto compose_summary_lines(const DashboardModel& model, TimePoint now) -> std::vector<Line>;
auto compose_help_lines() -> std::vector<Line>;
auto compose_selector_lines(const LabelSelector& selector, size_t max_visible) -> std::vector<Line>;
auto format_duration(std::chrono::seconds duration) -> std::string;
auto progress_bar(double progress, size_t closed, size_t total) -> std::string;

} // namespace beadview
