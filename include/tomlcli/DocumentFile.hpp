/**
 * @file DocumentFile.hpp
 * @brief Exclusive handle on one TOML file for the length of a command
 *
 * Lifecycle: open() reads and parses the file; the caller inspects or
 * mutates root(); commit() writes the whole document back atomically.
 * Destroying the handle without commit() discards all changes, so a
 * failed command never touches the file.
 */

#ifndef TOMLCLI_DOCUMENTFILE_HPP
#define TOMLCLI_DOCUMENTFILE_HPP

#include "tomlcli/Document.hpp"
#include <string>

namespace tomlcli {

class DocumentFile {
public:
    /**
     * @brief Read and parse a TOML file
     * @throws FileNotFoundError, IoError, DocumentParseError
     */
    static DocumentFile open(const std::string& path);

    DocumentFile(DocumentFile&&) = default;
    DocumentFile& operator=(DocumentFile&&) = default;
    DocumentFile(const DocumentFile&) = delete;
    DocumentFile& operator=(const DocumentFile&) = delete;

    const std::string& path() const noexcept { return path_; }

    Value& root() noexcept { return root_; }
    const Value& root() const noexcept { return root_; }

    /**
     * @brief Serialize the document and replace the file with it
     *
     * The text is written to a temporary file next to the target, given
     * the target's permissions, then renamed over it. If the target is a
     * symlink, the file it points to is replaced. On failure the
     * temporary file is removed and the original is left as it was.
     *
     * @throws IoError if any step fails
     */
    void commit();

    /**
     * @brief Whether commit() has completed successfully
     */
    bool committed() const noexcept { return committed_; }

private:
    DocumentFile(std::string path, Value root);

    std::string path_;
    Value root_;
    bool committed_ = false;
};

} // namespace tomlcli

#endif // TOMLCLI_DOCUMENTFILE_HPP
