/**
 * @file DocumentFile.cpp
 * @brief Implementation of the document file handle
 */

#include "tomlcli/DocumentFile.hpp"
#include "tomlcli/Errors.hpp"
#include "tomlcli/Loader.hpp"
#include "tomlcli/Log.hpp"
#include "tomlcli/Writer.hpp"

#include <filesystem>
#include <fstream>
#include <system_error>

#ifndef _WIN32
    #include <unistd.h>
#endif

namespace fs = std::filesystem;

namespace tomlcli {

namespace {

/**
 * @brief Removes a temporary file unless released
 */
class TempFileGuard {
public:
    explicit TempFileGuard(fs::path path) : path_(std::move(path)) {}
    ~TempFileGuard() {
        if (!released_) {
            std::error_code ec;
            fs::remove(path_, ec);
        }
    }
    TempFileGuard(const TempFileGuard&) = delete;
    TempFileGuard& operator=(const TempFileGuard&) = delete;

    void release() noexcept { released_ = true; }

private:
    fs::path path_;
    bool released_ = false;
};

fs::path resolve_target(const std::string& path) {
    std::error_code ec;
    if (fs::is_symlink(path, ec)) {
        fs::path target = fs::canonical(path, ec);
        if (ec) {
            throw IoError(path, "Failed to resolve symlink (" + ec.message() + ")");
        }
        return target;
    }
    return fs::path(path);
}

fs::path temp_path_for(const fs::path& target) {
    fs::path tmp = target;
#ifdef _WIN32
    tmp += ".tomlcli.tmp";
#else
    tmp += ".tomlcli." + std::to_string(::getpid()) + ".tmp";
#endif
    return tmp;
}

} // anonymous namespace

DocumentFile::DocumentFile(std::string path, Value root)
    : path_(std::move(path))
    , root_(std::move(root))
{}

DocumentFile DocumentFile::open(const std::string& path) {
    return DocumentFile(path, load_document(path));
}

void DocumentFile::commit() {
    const std::string text = write_document(root_);
    const fs::path target = resolve_target(path_);
    const fs::path tmp = temp_path_for(target);

    TempFileGuard guard(tmp);
    {
        std::ofstream ofs(tmp, std::ios::binary | std::ios::trunc);
        if (!ofs) {
            throw IoError(tmp.string(), "Failed to open for write");
        }
        ofs << text;
        ofs.flush();
        if (!ofs) {
            throw IoError(tmp.string(), "Failed to write");
        }
    }

    std::error_code ec;
    const auto perms = fs::status(target, ec).permissions();
    if (!ec) {
        fs::permissions(tmp, perms, fs::perm_options::replace, ec);
        if (ec) {
            throw IoError(tmp.string(), "Failed to copy permissions (" + ec.message() + ")");
        }
    }

    fs::rename(tmp, target, ec);
    if (ec) {
        throw IoError(target.string(), "Failed to replace file (" + ec.message() + ")");
    }
    guard.release();

    committed_ = true;
    logger().debug("wrote {} bytes to '{}'", text.size(), target.string());
}

} // namespace tomlcli
