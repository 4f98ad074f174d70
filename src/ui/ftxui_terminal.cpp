#include "beadview/ui/ftxui_terminal.hpp"

#include <ftxui/component/component.hpp>
#include <ftxui/component/screen_interactive.hpp>
#include <ftxui/screen/terminal.hpp>

#include <spdlog/spdlog.h>
#include <unistd.h>

namespace beadview {

namespace {

auto tone_color(Tone tone) -> ftxui::Color {
    switch (tone) {
    case Tone::NORMAL:
        return ftxui::Color::Default;
    case Tone::ACCENT:
        return ftxui::Color::Cyan;
    case Tone::SUCCESS:
        return ftxui::Color::Green;
    case Tone::WARNING:
        return ftxui::Color::Yellow;
    case Tone::DANGER:
        return ftxui::Color::Red;
    case Tone::MUTED:
        return ftxui::Color::GrayDark;
    }
    return ftxui::Color::Default;
}

auto lines_to_element(const std::vector<Line>& lines) -> ftxui::Element {
    using namespace ftxui;

    Elements elements;
    for (const auto& line : lines) {
        auto element = text(line.text);
        if (line.tone != Tone::NORMAL) {
            element |= color(tone_color(line.tone));
        }
        if (line.tone == Tone::MUTED) {
            element |= dim;
        }
        if (line.is_highlighted) {
            element |= inverted;
        }
        elements.push_back(element);
    }
    return vbox(std::move(elements));
}

} // namespace

FTXUITerminal::~FTXUITerminal() {
    restore_terminal_state();
}

auto FTXUITerminal::is_interactive() -> bool {
    return isatty(STDIN_FILENO) != 0 && isatty(STDOUT_FILENO) != 0;
}

auto FTXUITerminal::restore_terminal_state() -> void {
    if (session_active_) {
        // FTXUI restores the terminal when the screen leaves its loop
        session_active_ = false;
    }
}

auto FTXUITerminal::map_event(const ftxui::Event& event) -> KeyPress {
    using ftxui::Event;

    if (event == Event::Return) return KeyPress::of(InputEvent::ENTER);
    if (event == Event::Escape) return KeyPress::of(InputEvent::ESCAPE);
    if (event == Event::Backspace) return KeyPress::of(InputEvent::BACKSPACE);
    if (event == Event::Tab) return KeyPress::of(InputEvent::TAB);
    if (event == Event::ArrowUp) return KeyPress::of(InputEvent::ARROW_UP);
    if (event == Event::ArrowDown) return KeyPress::of(InputEvent::ARROW_DOWN);
    if (event == Event::ArrowLeft) return KeyPress::of(InputEvent::ARROW_LEFT);
    if (event == Event::ArrowRight) return KeyPress::of(InputEvent::ARROW_RIGHT);
    if (event == Event::Home) return KeyPress::of(InputEvent::HOME);
    if (event == Event::End) return KeyPress::of(InputEvent::END);
    // Ctrl+S arrives as the raw DC3 control byte
    if (event == Event::Special("\x13")) return KeyPress::of(InputEvent::SUBMIT);

    if (event.is_character()) {
        return KeyPress{InputEvent::CHARACTER, event.character()};
    }
    return KeyPress::of(InputEvent::UNKNOWN);
}

auto FTXUITerminal::screen_to_element(const Screen& screen) -> ftxui::Element {
    using namespace ftxui;

    auto header = text(screen.title) | bold | color(Color::Cyan);

    auto body = lines_to_element(screen.content) | flex;
    if (!screen.detail.empty()) {
        body = hbox({
            body,
            separator(),
            lines_to_element(screen.detail) | flex,
        });
    }

    auto base = vbox({
        header,
        separator(),
        body | flex,
        separator(),
        text(screen.status_line) | bold | color(Color::Cyan),
        text(screen.control_hints) | dim,
    });

    if (screen.modal.empty()) {
        return base;
    }

    auto modal = lines_to_element(screen.modal) | border | clear_under | center;
    return dbox({base, modal});
}

auto FTXUITerminal::run_session(const DashboardModel& initial_model, UpdateFunction update_function)
    -> DashboardModel {
    using namespace ftxui;

    auto current_model = initial_model;
    auto screen = ScreenInteractive::Fullscreen();
    session_active_ = true;

    auto component = CatchEvent(
        Renderer([&] {
            auto size = Terminal::Size();
            if (size.dimx != current_model.width || size.dimy != current_model.height) {
                current_model = resize(std::move(current_model), size.dimx, size.dimy);
            }
            return screen_to_element(compose_screen(current_model));
        }),
        [&](Event event) -> bool {
            auto key = map_event(event);
            if (key.event == InputEvent::UNKNOWN) {
                return false;
            }
            current_model = update_function(std::move(current_model), key);
            if (current_model.is_quitting()) {
                screen.ExitLoopClosure()();
            }
            return true;
        });

    spdlog::debug("entering interactive session");
    screen.Loop(component);
    spdlog::debug("interactive session finished");
    return current_model;
}

} // namespace beadview
