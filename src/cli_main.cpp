#include <cxxopts.hpp>
#include <iostream>
#include <string>
#include <vector>
#include "tomlcli/Commands.hpp"
#include "tomlcli/Errors.hpp"
#include "tomlcli/Log.hpp"

using namespace tomlcli;

namespace {

void expect_args(const std::vector<std::string>& cmdv, std::size_t want) {
    if (cmdv.size() < want) {
        throw UsageError("insufficient arguments for command '" + cmdv[0] + "'");
    }
    if (cmdv.size() > want) {
        throw UsageError("too many arguments for command '" + cmdv[0] + "'");
    }
}

} // namespace

int main(int argc, char** argv) {
    try {
        cxxopts::Options options("toml", "Get and set values in TOML documents by key path");
        options.positional_help("get FILE KEY-PATH | set FILE KEY-PATH VALUE");

        options.add_options()
            ("r,raw", "get: print a string value without JSON quoting")
            ("t,output-toml", "get: print the value as TOML")
            ("p,print", "set: print the updated document instead of rewriting FILE")
            ("v,verbose", "Log resolution steps to standard error")
            ("h,help", "Show help");

        // Command + arguments captured as positional strings
        options.add_options("positional")
            ("command", "Command and its arguments", cxxopts::value<std::vector<std::string>>());

        options.parse_positional({"command"});

        auto result = options.parse(argc, argv);
        if (result.count("help")) {
            std::cout << options.help({""}) << "\n";
            return 0;
        }
        if (!result.count("command")) {
            std::cerr << options.help({""}) << "\n";
            return 1;
        }

        set_verbose(result.count("verbose") > 0);

        auto cmdv = result["command"].as<std::vector<std::string>>();
        const std::string cmd = cmdv[0];
        const bool raw = result.count("raw") > 0;
        const bool as_toml = result.count("output-toml") > 0;
        const bool print_only = result.count("print") > 0;

        // GET
        if (cmd == "get") {
            expect_args(cmdv, 3);
            if (raw && as_toml) {
                throw UsageError("--raw and --output-toml cannot be combined");
            }
            if (print_only) {
                throw UsageError("--print only applies to 'set'");
            }
            GetOptions opts;
            opts.file = cmdv[1];
            opts.key_path = cmdv[2];
            if (raw) opts.format = OutputFormat::raw;
            if (as_toml) opts.format = OutputFormat::toml;

            std::cout << run_get(opts) << std::flush;
            return 0;
        }

        // SET
        if (cmd == "set") {
            expect_args(cmdv, 4);
            if (raw || as_toml) {
                throw UsageError("--raw and --output-toml only apply to 'get'");
            }
            SetOptions opts;
            opts.file = cmdv[1];
            opts.key_path = cmdv[2];
            opts.value = cmdv[3];
            opts.print_only = print_only;

            std::cout << run_set(opts) << std::flush;
            return 0;
        }

        throw UsageError("unknown command '" + cmd + "' (expected 'get' or 'set')");

    } catch (const UsageError& ue) {
        std::cerr << "Error: " << ue.what() << " (see --help)\n";
        return 1;
    } catch (const std::exception& ex) {
        std::cerr << "Error: " << ex.what() << "\n";
        return 1;
    }
}
