#pragma once

#include <string>
#include <vector>
#include <optional>
#include <core/types.hpp>

// A parsed `rjy` invocation.
struct CommandLine {
    std::string command;                 // new, list, drop, rc, dc, help, version
    std::vector<std::string> args;       // positionals after the command
    bool all = false;                    // drop --all
    int debug = 0;                       // number of -d / --debug flags

    // The single optional positional for drop / rc / dc
    std::optional<std::string> key() const {
        if (args.empty()) return std::nullopt;
        return args.front();
    }
};

// Parse argv. Flags may appear anywhere; `--` ends flag parsing.
// Checks argument counts per command and returns a usage error otherwise.
Result<CommandLine> parse_command_line(const std::vector<std::string>& argv);
