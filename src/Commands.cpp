/**
 * @file Commands.cpp
 * @brief Implementation of the command pipelines
 */

#include "tomlcli/Commands.hpp"
#include "tomlcli/DocumentFile.hpp"
#include "tomlcli/KeyPath.hpp"
#include "tomlcli/Loader.hpp"
#include "tomlcli/Log.hpp"
#include "tomlcli/Mutator.hpp"
#include "tomlcli/Resolver.hpp"
#include "tomlcli/Writer.hpp"

namespace tomlcli {

namespace {

KeyPath parse_logged(std::string_view raw) {
    KeyPath path = parse_key_path(raw);
    logger().debug("key path '{}' has {} segment(s)", path.to_string(), path.size());
    return path;
}

} // anonymous namespace

std::string run_get(const GetOptions& opts) {
    const KeyPath path = parse_logged(opts.key_path);
    const DocumentFile doc = DocumentFile::open(opts.file);
    return encode_value(resolve_get(doc.root(), path), opts.format, path);
}

std::string run_set(const SetOptions& opts) {
    const KeyPath path = parse_logged(opts.key_path);
    DocumentFile doc = DocumentFile::open(opts.file);
    set_path(doc.root(), path, coerce_value(opts.value));

    if (opts.print_only) {
        return write_document(doc.root());
    }
    doc.commit();
    return {};
}

std::string get_in_text(std::string_view toml_text, std::string_view key_path,
                        OutputFormat format) {
    const KeyPath path = parse_logged(key_path);
    const Value root = parse_document(toml_text);
    return encode_value(resolve_get(root, path), format, path);
}

std::string set_in_text(std::string_view toml_text, std::string_view key_path,
                        const std::string& value) {
    const KeyPath path = parse_logged(key_path);
    Value root = parse_document(toml_text);
    set_path(root, path, coerce_value(value));
    return write_document(root);
}

} // namespace tomlcli
