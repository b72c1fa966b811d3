/**
 * @file utf8.cpp
 * @brief UTF-8 validation and replacement decoding.
 */

#include "verdict/utf8.hpp"

#include <cstdint>

namespace runbox {

namespace {

constexpr std::string_view kReplacement = "\xEF\xBF\xBD";

/**
 * @brief Length of the well-formed sequence starting at `pos`, or the
 *        negated length of the maximal ill-formed prefix to replace.
 */
int sequence_length(std::string_view s, size_t pos) noexcept {
    const auto lead = static_cast<uint8_t>(s[pos]);
    if (lead < 0x80) return 1;

    int need = 0;
    uint8_t lo = 0x80;
    uint8_t hi = 0xBF;
    if (lead >= 0xC2 && lead <= 0xDF) {
        need = 1;
    } else if (lead == 0xE0) {
        need = 2; lo = 0xA0;
    } else if (lead >= 0xE1 && lead <= 0xEC) {
        need = 2;
    } else if (lead == 0xED) {
        need = 2; hi = 0x9F;                // no surrogates
    } else if (lead >= 0xEE && lead <= 0xEF) {
        need = 2;
    } else if (lead == 0xF0) {
        need = 3; lo = 0x90;
    } else if (lead >= 0xF1 && lead <= 0xF3) {
        need = 3;
    } else if (lead == 0xF4) {
        need = 3; hi = 0x8F;                // <= U+10FFFF
    } else {
        return -1;
    }

    int consumed = 1;
    for (int i = 0; i < need; ++i) {
        size_t at = pos + 1 + static_cast<size_t>(i);
        if (at >= s.size()) return -consumed;
        auto byte = static_cast<uint8_t>(s[at]);
        // Only the first continuation byte has a narrowed range.
        uint8_t min = i == 0 ? lo : 0x80;
        uint8_t max = i == 0 ? hi : 0xBF;
        if (byte < min || byte > max) return -consumed;
        ++consumed;
    }
    return consumed;
}

}  // anonymous namespace

bool is_valid_utf8(std::string_view raw) noexcept {
    size_t pos = 0;
    while (pos < raw.size()) {
        int len = sequence_length(raw, pos);
        if (len < 0) return false;
        pos += static_cast<size_t>(len);
    }
    return true;
}

std::string decode_utf8_lossy(std::string_view raw) {
    if (is_valid_utf8(raw)) return std::string{raw};

    std::string out;
    out.reserve(raw.size() + 16);
    size_t pos = 0;
    while (pos < raw.size()) {
        int len = sequence_length(raw, pos);
        if (len > 0) {
            out.append(raw.substr(pos, static_cast<size_t>(len)));
            pos += static_cast<size_t>(len);
        } else {
            out.append(kReplacement);
            pos += static_cast<size_t>(-len);
        }
    }
    return out;
}

}  // namespace runbox
