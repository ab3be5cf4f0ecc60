/**
 * @file Util.hpp
 * @brief Small text helpers shared by the key path parser and the codec
 */

#ifndef TOMLCLI_UTIL_HPP
#define TOMLCLI_UTIL_HPP

#include <cstddef>
#include <string_view>

namespace tomlcli {

/**
 * @brief Locate the first byte that does not belong to a well-formed
 *        UTF-8 sequence
 *
 * Overlong encodings, surrogate code points (U+D800..U+DFFF), values
 * above U+10FFFF and truncated sequences are all rejected.
 *
 * @return Byte offset of the offending sequence, or std::string_view::npos
 *         if the whole text is valid
 */
std::size_t find_invalid_utf8(std::string_view text) noexcept;

inline bool is_valid_utf8(std::string_view text) noexcept {
    return find_invalid_utf8(text) == std::string_view::npos;
}

} // namespace tomlcli

#endif // TOMLCLI_UTIL_HPP
