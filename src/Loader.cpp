/**
 * @file Loader.cpp
 * @brief toml11 parsing and file reading
 */

#include "tomlcli/Loader.hpp"
#include "tomlcli/Errors.hpp"
#include "tomlcli/Log.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <vector>

namespace fs = std::filesystem;

namespace tomlcli {

namespace {

/**
 * @brief Convert the first toml11 diagnostic into a DocumentParseError
 *
 * toml11 titles start with the name of the failing parser function
 * ("toml::parse_key_value_pair: ..."); only the message after it is kept.
 */
DocumentParseError to_parse_error(const std::string& source_name,
                                  const std::vector<toml::error_info>& errors) {
    if (errors.empty()) {
        return DocumentParseError(source_name, 0, 0, "invalid TOML");
    }

    const toml::error_info& first = errors.front();
    std::string details = first.title();
    if (details.rfind("toml::", 0) == 0) {
        const auto colon = details.find(": ");
        if (colon != std::string::npos) {
            details.erase(0, colon + 2);
        }
    }

    std::size_t line = 0;
    std::size_t column = 0;
    if (!first.locations().empty()) {
        const toml::source_location& where = first.locations().front().first;
        line = where.first_line_number();
        column = where.first_column_number();
    }
    return DocumentParseError(source_name, line, column, details);
}

} // anonymous namespace

// ============================================================================
// Public API
// ============================================================================

Value parse_document(std::string_view text, const std::string& source_name) {
    std::vector<unsigned char> bytes(text.begin(), text.end());
    auto result = toml::try_parse<toml::ordered_type_config>(std::move(bytes), source_name);
    if (result.is_err()) {
        throw to_parse_error(source_name, result.unwrap_err());
    }

    Value root = std::move(result.unwrap());
    logger().debug("parsed '{}': {} top-level entries", source_name, root.as_table().size());
    return root;
}

std::string read_text_file(const std::string& path) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        throw FileNotFoundError(path);
    }

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw IoError(path, "Failed to open file");
    }

    std::ostringstream ss;
    ss << file.rdbuf();
    if (file.bad()) {
        throw IoError(path, "Failed to read file");
    }

    std::string content = ss.str();
    logger().debug("read {} bytes from '{}'", content.size(), path);
    return content;
}

Value load_document(const std::string& path) {
    return parse_document(read_text_file(path), path);
}

} // namespace tomlcli
