#pragma once

#include "beadview/interfaces.hpp"
#include "beadview/ui/dashboard.hpp"
#include "beadview/ui/input_event.hpp"
#include "beadview/ui/view.hpp"

#include <ftxui/component/event.hpp>
#include <ftxui/dom/elements.hpp>

namespace beadview {

class FTXUITerminal : public ITerminal {
public:
    FTXUITerminal() = default;
    ~FTXUITerminal() override;

    // Delete copy operations to ensure single instance
    FTXUITerminal(const FTXUITerminal&) = delete;
    auto operator=(const FTXUITerminal&) -> FTXUITerminal& = delete;

    auto is_interactive() -> bool override;
    auto run_session(const DashboardModel& initial_model, UpdateFunction update_function)
        -> DashboardModel override;
    auto restore_terminal_state() -> void override;

    static auto map_event(const ftxui::Event& event) -> KeyPress;
    static auto screen_to_element(const Screen& screen) -> ftxui::Element;

private:
    bool session_active_ = false;
};

} // namespace beadview
