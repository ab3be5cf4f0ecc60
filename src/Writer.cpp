/**
 * @file Writer.cpp
 * @brief toml11-based serializer
 */

#include "tomlcli/Writer.hpp"
#include "tomlcli/Errors.hpp"

namespace tomlcli {

namespace {

void flatten_strings(Value& value) {
    if (value.is_string()) {
        auto& fmt = value.as_string_fmt();
        if (fmt.fmt == toml::string_format::multiline_basic ||
            fmt.fmt == toml::string_format::multiline_literal) {
            fmt.fmt = toml::string_format::basic;
        }
    } else if (value.is_array()) {
        for (Value& item : value.as_array()) flatten_strings(item);
    } else if (value.is_table()) {
        for (auto& kv : value.as_table()) flatten_strings(kv.second);
    }
}

bool holds_values(const Table& table) {
    for (const auto& kv : table) {
        if (!kv.second.is_table() && !kv.second.is_array_of_tables()) return true;
    }
    return false;
}

// toml11 refuses to write values into an implicit table.
void promote_implicit_tables(Value& table) {
    auto& fmt = table.as_table_fmt();
    if (fmt.fmt == toml::table_format::implicit && holds_values(table.as_table())) {
        fmt.fmt = toml::table_format::multiline;
    }
    for (auto& kv : table.as_table()) {
        if (is_container_table(kv.second)) promote_implicit_tables(kv.second);
    }
}

// Inline output has nowhere to put comments.
void make_inline(Value& value) {
    value.comments().clear();
    if (value.is_table()) {
        value.as_table_fmt().fmt = toml::table_format::oneline;
        for (auto& kv : value.as_table()) make_inline(kv.second);
    } else if (value.is_array()) {
        value.as_array_fmt().fmt = toml::array_format::oneline;
        for (Value& item : value.as_array()) make_inline(item);
    }
}

std::string drop_blank_lines(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        if (c == '\n' && (out.empty() || out.back() == '\n')) continue;
        out += c;
    }
    return out;
}

std::string format_checked(const Value& value) {
    try {
        return toml::format(value);
    } catch (const toml::exception& e) {
        throw TomlCliError(std::string("Cannot serialize document: ") + e.what());
    }
}

} // anonymous namespace

std::string write_document(const Value& root) {
    Value doc = root;
    doc.as_table_fmt().fmt = toml::table_format::multiline;
    flatten_strings(doc);
    promote_implicit_tables(doc);
    return drop_blank_lines(format_checked(doc));
}

void write_document(std::ostream& os, const Value& root) {
    os << write_document(root);
}

std::string format_value(const Value& value) {
    Value copy = value;
    flatten_strings(copy);
    make_inline(copy);
    return format_checked(copy);
}

} // namespace tomlcli
