#include "beadview/io/osc52_clipboard.hpp"
#include <spdlog/spdlog.h>
#include <cstdint>

namespace beadview {

namespace {

constexpr const char* kBase64Alphabet = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

} // namespace

auto base64_encode(const std::string& data) -> std::string {
    std::string encoded;
    encoded.reserve(((data.size() + 2) / 3) * 4);

    size_t i = 0;
    while (i + 2 < data.size()) {
        uint32_t triple = (static_cast<unsigned char>(data[i]) << 16)
                          | (static_cast<unsigned char>(data[i + 1]) << 8)
                          | static_cast<unsigned char>(data[i + 2]);
        encoded += kBase64Alphabet[(triple >> 18) & 0x3F];
        encoded += kBase64Alphabet[(triple >> 12) & 0x3F];
        encoded += kBase64Alphabet[(triple >> 6) & 0x3F];
        encoded += kBase64Alphabet[triple & 0x3F];
        i += 3;
    }

    size_t remaining = data.size() - i;
    if (remaining == 1) {
        uint32_t value = static_cast<unsigned char>(data[i]) << 16;
        encoded += kBase64Alphabet[(value >> 18) & 0x3F];
        encoded += kBase64Alphabet[(value >> 12) & 0x3F];
        encoded += "==";
    } else if (remaining == 2) {
        uint32_t value = (static_cast<unsigned char>(data[i]) << 16) | (static_cast<unsigned char>(data[i + 1]) << 8);
        encoded += kBase64Alphabet[(value >> 18) & 0x3F];
        encoded += kBase64Alphabet[(value >> 12) & 0x3F];
        encoded += kBase64Alphabet[(value >> 6) & 0x3F];
        encoded += '=';
    }

    return encoded;
}

auto Osc52Clipboard::escape_sequence(const std::string& text) -> std::string {
    return "\x1b]52;c;" + base64_encode(text) + "\x07";
}

auto Osc52Clipboard::write_all(const std::string& text) -> bool {
    out_ << escape_sequence(text) << std::flush;
    if (!out_.good()) {
        spdlog::warn("clipboard write failed ({} bytes)", text.size());
        return false;
    }
    spdlog::debug("copied {} bytes to clipboard", text.size());
    return true;
}

} // namespace beadview
