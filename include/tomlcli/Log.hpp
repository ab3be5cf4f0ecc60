/**
 * @file Log.hpp
 * @brief Process-wide diagnostic logger
 *
 * All library components log through a single spdlog logger named
 * "tomlcli" that writes to stderr. The default level is `warn`, so a
 * successful command prints nothing; `--verbose` lowers it to `debug`.
 */

#ifndef TOMLCLI_LOG_HPP
#define TOMLCLI_LOG_HPP

#include <spdlog/spdlog.h>
#include <memory>

namespace tomlcli {

/**
 * @brief The shared "tomlcli" logger (created on first use)
 */
spdlog::logger& logger();

/**
 * @brief Switch between debug output and the quiet default
 */
void set_verbose(bool verbose);

} // namespace tomlcli

#endif // TOMLCLI_LOG_HPP
