/**
 * @file KeyPath.cpp
 * @brief Implementation of key path parsing
 */

#include "tomlcli/KeyPath.hpp"
#include "tomlcli/Util.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cstdint>
#include <sstream>
#include <stdexcept>

namespace tomlcli {

namespace {

bool is_bare_char(char c) noexcept {
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
           (c >= '0' && c <= '9') || c == '_' || c == '-';
}

bool is_whitespace(char c) noexcept {
    return c == ' ' || c == '\t';
}

// TOML forbids raw control characters in strings, except tab.
bool is_forbidden_control(unsigned char c) noexcept {
    return (c < 0x20 && c != '\t') || c == 0x7F;
}

void append_utf8(std::string& out, std::uint32_t cp) {
    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
}

/**
 * @brief Single-pass recursive-descent parser over the raw path text
 */
class KeyPathParser {
public:
    explicit KeyPathParser(std::string_view raw) : raw_(raw) {}

    KeyPath parse() {
        const std::size_t bad = find_invalid_utf8(raw_);
        if (bad != std::string_view::npos) {
            pos_ = bad;
            fail("invalid UTF-8 sequence");
        }

        skip_whitespace();
        if (at_end()) {
            fail("key path is empty");
        }

        std::vector<KeySegment> segments;
        for (;;) {
            skip_whitespace();
            segments.push_back(parse_segment());
            skip_whitespace();
            if (at_end()) break;
            if (peek() != '.') {
                fail(std::string("expected '.' or end of key path, found '") + peek() + "'");
            }
            ++pos_;
        }
        return KeyPath(std::move(segments));
    }

private:
    std::string_view raw_;
    std::size_t pos_ = 0;

    bool at_end() const noexcept { return pos_ >= raw_.size(); }
    char peek() const noexcept { return raw_[pos_]; }

    [[noreturn]] void fail(const std::string& details) const {
        throw PathSyntaxError(std::string(raw_), pos_ + 1, details);
    }

    void skip_whitespace() noexcept {
        while (!at_end() && is_whitespace(peek())) ++pos_;
    }

    KeySegment parse_segment() {
        if (at_end()) {
            fail("expected a key after '.'");
        }
        const char c = peek();
        if (c == '"') return {parse_basic(), KeySegment::Style::basic};
        if (c == '\'') return {parse_literal(), KeySegment::Style::literal};
        if (is_bare_char(c)) return {parse_bare(), KeySegment::Style::bare};
        if (c == '.') fail("expected a key before '.'");
        fail(std::string("unexpected character '") + c + "'");
    }

    std::string parse_bare() {
        const std::size_t start = pos_;
        while (!at_end() && is_bare_char(peek())) ++pos_;
        return std::string(raw_.substr(start, pos_ - start));
    }

    std::string parse_literal() {
        const std::size_t open = pos_++;
        std::string out;
        while (!at_end() && peek() != '\'') {
            if (is_forbidden_control(static_cast<unsigned char>(peek()))) {
                fail("control character in quoted key");
            }
            out += raw_[pos_++];
        }
        if (at_end()) {
            pos_ = open;
            fail("unterminated quoted key");
        }
        ++pos_; // closing quote
        return out;
    }

    std::string parse_basic() {
        const std::size_t open = pos_++;
        std::string out;
        while (!at_end() && peek() != '"') {
            const char c = raw_[pos_];
            if (c == '\\') {
                parse_escape(out);
                continue;
            }
            if (is_forbidden_control(static_cast<unsigned char>(c))) {
                fail("control character in quoted key");
            }
            out += c;
            ++pos_;
        }
        if (at_end()) {
            pos_ = open;
            fail("unterminated quoted key");
        }
        ++pos_; // closing quote
        return out;
    }

    void parse_escape(std::string& out) {
        ++pos_; // backslash
        if (at_end()) {
            fail("unterminated escape sequence");
        }
        const char e = raw_[pos_++];
        switch (e) {
            case 'b': out += '\b'; return;
            case 't': out += '\t'; return;
            case 'n': out += '\n'; return;
            case 'f': out += '\f'; return;
            case 'r': out += '\r'; return;
            case '"': out += '"'; return;
            case '\\': out += '\\'; return;
            case 'u': append_utf8(out, parse_hex(4)); return;
            case 'U': append_utf8(out, parse_hex(8)); return;
            default:
                --pos_;
                fail(std::string("invalid escape sequence '\\") + e + "'");
        }
    }

    std::uint32_t parse_hex(std::size_t digits) {
        const std::size_t start = pos_;
        std::uint32_t cp = 0;
        for (std::size_t i = 0; i < digits; ++i) {
            if (at_end()) {
                fail("truncated unicode escape");
            }
            const char h = raw_[pos_];
            std::uint32_t v = 0;
            if (h >= '0' && h <= '9') v = static_cast<std::uint32_t>(h - '0');
            else if (h >= 'a' && h <= 'f') v = static_cast<std::uint32_t>(h - 'a' + 10);
            else if (h >= 'A' && h <= 'F') v = static_cast<std::uint32_t>(h - 'A' + 10);
            else fail("invalid hex digit in unicode escape");
            cp = (cp << 4) | v;
            ++pos_;
        }
        if (cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
            pos_ = start;
            fail("unicode escape is not a scalar value");
        }
        return cp;
    }
};

} // anonymous namespace

KeyPath::KeyPath(std::vector<KeySegment> segments)
    : segments_(std::move(segments)) {
    if (segments_.empty()) {
        throw std::invalid_argument("KeyPath requires at least one segment");
    }
}

std::string KeyPath::to_string() const {
    return join_key_path(*this, segments_.size());
}

KeyPath parse_key_path(std::string_view raw) {
    return KeyPathParser(raw).parse();
}

bool is_bare_key(std::string_view key) noexcept {
    return !key.empty() && std::all_of(key.begin(), key.end(), is_bare_char);
}

std::string format_key(std::string_view key) {
    if (is_bare_key(key)) {
        return std::string(key);
    }
    // A JSON string literal is also a valid TOML basic string.
    return nlohmann::json(std::string(key)).dump();
}

std::string join_key_path(const KeyPath& path, std::size_t count) {
    std::ostringstream oss;
    const std::size_t n = std::min(count, path.size());
    for (std::size_t i = 0; i < n; ++i) {
        if (i > 0) oss << '.';
        oss << format_key(path[i].name);
    }
    return oss.str();
}

} // namespace tomlcli
