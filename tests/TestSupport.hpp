/**
 * @file TestSupport.hpp
 * @brief Shared fixtures for the tomlcli test suite
 *
 * @copyright (c) 2026. MIT License.
 */

#ifndef TOMLCLI_TESTS_TESTSUPPORT_HPP
#define TOMLCLI_TESTS_TESTSUPPORT_HPP

#include "tomlcli/Document.hpp"

#include <atomic>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <system_error>
#include <vector>

#ifndef _WIN32
    #include <unistd.h>
#endif

namespace tomlcli_test {

namespace fs = std::filesystem;

/**
 * @brief The document used by the end-to-end `get` tests
 */
inline const char* const kInput = R"(
key = "value"
int = 17
bool = true

# this is a TOML comment
bare-Key_1 = "bare"  # another TOML comment
"quoted key‽" = "quoted"
"" = "empty"
dotted.a = "dotted-a"
dotted . b = "dotted-b"

[foo]
x = "foo-x"
y.yy = "foo-yy"
)";

/**
 * @brief RAII wrapper for a private temporary directory
 */
class TempDir {
public:
    TempDir() {
        static std::atomic<int> counter{0};
        std::string name = "tomlcli_test_";
#ifndef _WIN32
        name += std::to_string(::getpid()) + "_";
#endif
        name += std::to_string(counter++);
        path_ = fs::temp_directory_path() / name;
        fs::remove_all(path_);
        fs::create_directories(path_);
    }

    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const fs::path& path() const { return path_; }

    /**
     * @brief Write a file inside the directory and return its path
     */
    std::string write(const std::string& filename, const std::string& content) const {
        fs::path file = path_ / filename;
        std::ofstream f(file, std::ios::binary);
        f << content;
        return file.string();
    }

private:
    fs::path path_;
};

/**
 * @brief Keys of a table value in iteration order
 */
inline std::vector<std::string> keys_of(const tomlcli::Value& table) {
    std::vector<std::string> keys;
    for (const auto& kv : table.as_table()) {
        keys.push_back(kv.first);
    }
    return keys;
}

inline std::string read_file(const std::string& path) {
    std::ifstream f(path, std::ios::binary);
    std::ostringstream ss;
    ss << f.rdbuf();
    return ss.str();
}

} // namespace tomlcli_test

#endif // TOMLCLI_TESTS_TESTSUPPORT_HPP
