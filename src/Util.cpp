/**
 * @file Util.cpp
 * @brief Implementation of text helpers
 */

#include "tomlcli/Util.hpp"

namespace tomlcli {

std::size_t find_invalid_utf8(std::string_view text) noexcept {
    const std::size_t n = text.size();
    std::size_t i = 0;

    while (i < n) {
        const auto c = static_cast<unsigned char>(text[i]);
        if (c < 0x80) {
            ++i;
            continue;
        }

        std::size_t len = 0;
        unsigned char lo = 0x80;
        unsigned char hi = 0xBF;
        if (c >= 0xC2 && c <= 0xDF) {
            len = 2;
        } else if (c == 0xE0) {
            len = 3; lo = 0xA0;           // no overlongs
        } else if (c == 0xED) {
            len = 3; hi = 0x9F;           // no surrogates
        } else if (c >= 0xE1 && c <= 0xEF) {
            len = 3;
        } else if (c == 0xF0) {
            len = 4; lo = 0x90;           // no overlongs
        } else if (c >= 0xF1 && c <= 0xF3) {
            len = 4;
        } else if (c == 0xF4) {
            len = 4; hi = 0x8F;           // <= U+10FFFF
        } else {
            return i;
        }

        if (i + len > n) {
            return i;
        }
        const auto c1 = static_cast<unsigned char>(text[i + 1]);
        if (c1 < lo || c1 > hi) {
            return i;
        }
        for (std::size_t k = 2; k < len; ++k) {
            const auto ck = static_cast<unsigned char>(text[i + k]);
            if (ck < 0x80 || ck > 0xBF) {
                return i;
            }
        }
        i += len;
    }
    return std::string_view::npos;
}

} // namespace tomlcli
