#pragma once

#include "beadview/interfaces.hpp"
#include <iostream>
#include <string>

namespace beadview {

// Copies text through the terminal with the OSC 52 escape sequence, which
// works over SSH and inside tmux without a native clipboard tool.
class Osc52Clipboard : public IClipboard {
public:
    explicit Osc52Clipboard(std::ostream& out = std::cout) : out_(out) {}

    auto write_all(const std::string& text) -> bool override;

    static auto escape_sequence(const std::string& text) -> std::string;

private:
    std::ostream& out_;
};

auto base64_encode(const std::string& data) -> std::string;

} // namespace beadview
