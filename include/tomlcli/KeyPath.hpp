/**
 * @file KeyPath.hpp
 * @brief TOML key path parsing and formatting
 *
 * A key path addresses a value inside a nested TOML document using the
 * same syntax TOML uses for dotted keys:
 *
 * - Bare keys: `server.port`, `bare-Key_1`
 * - Basic quoted keys: `"quoted key‽"`, `""` (the empty key), `"a\"b"`
 * - Literal quoted keys: `'C:\path'`
 * - Whitespace around dots is ignored: `dotted . b` == `dotted.b`
 */

#ifndef TOMLCLI_KEYPATH_HPP
#define TOMLCLI_KEYPATH_HPP

#include "tomlcli/Errors.hpp"
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace tomlcli {

/**
 * @brief One component of a key path
 *
 * The style records how the segment was written. Lookup only ever uses
 * the unescaped name.
 */
struct KeySegment {
    enum class Style { bare, basic, literal };

    std::string name;
    Style style = Style::bare;

    friend bool operator==(const KeySegment& a, const KeySegment& b) {
        return a.name == b.name && a.style == b.style;
    }
    friend bool operator!=(const KeySegment& a, const KeySegment& b) {
        return !(a == b);
    }
};

/**
 * @brief Non-empty, ordered sequence of key segments
 */
class KeyPath {
public:
    using const_iterator = std::vector<KeySegment>::const_iterator;

    /**
     * @brief Construct from already-parsed segments
     * @throws std::invalid_argument if segments is empty
     */
    explicit KeyPath(std::vector<KeySegment> segments);

    const std::vector<KeySegment>& segments() const noexcept { return segments_; }
    std::size_t size() const noexcept { return segments_.size(); }
    const KeySegment& operator[](std::size_t i) const { return segments_[i]; }
    const KeySegment& back() const { return segments_.back(); }

    const_iterator begin() const noexcept { return segments_.begin(); }
    const_iterator end() const noexcept { return segments_.end(); }

    /**
     * @brief Canonical text of the whole path (see join_key_path)
     */
    std::string to_string() const;

private:
    std::vector<KeySegment> segments_;
};

/**
 * @brief Parse a user-supplied key path
 *
 * @param raw Path text, e.g. `foo.y.yy` or `"quoted key".x`
 * @return Parsed path with at least one segment
 * @throws PathSyntaxError on empty input, missing keys around a dot,
 *         whitespace inside a bare key, unterminated quotes, bad escapes
 *         or bytes that are not valid UTF-8
 *
 * Examples:
 * ```cpp
 * parse_key_path("a.b.c");        // [a, b, c]
 * parse_key_path(" dotted . b ");  // [dotted, b]
 * parse_key_path("\"\"");          // [""] (the empty key)
 * parse_key_path("a..b");         // throws PathSyntaxError
 * ```
 */
KeyPath parse_key_path(std::string_view raw);

/**
 * @brief Check whether a key can be written without quotes
 * @return true if key is non-empty and only contains [A-Za-z0-9_-]
 */
bool is_bare_key(std::string_view key) noexcept;

/**
 * @brief Render a single key the way it would appear in a TOML document
 *
 * Bare keys are returned verbatim; anything else becomes a basic string.
 *
 * Examples:
 * - "server" → server
 * - "quoted key" → "quoted key"
 * - "" → ""
 */
std::string format_key(std::string_view key);

/**
 * @brief Join the first @p count segments of a path with dots
 *
 * Each segment is rendered with format_key(), so the result parses back
 * to the same names.
 */
std::string join_key_path(const KeyPath& path, std::size_t count);

} // namespace tomlcli

#endif // TOMLCLI_KEYPATH_HPP
