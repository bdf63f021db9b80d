#include "command_line.hpp"
#include <fmt/format.h>
#include <map>
#include <utility>

namespace {

// command -> {min positionals, max positionals}
const std::map<std::string, std::pair<size_t, size_t>>& arity() {
    static const std::map<std::string, std::pair<size_t, size_t>> table = {
        {"new",     {2, 2}},
        {"list",    {0, 0}},
        {"drop",    {0, 1}},
        {"rc",      {0, 1}},
        {"dc",      {0, 1}},
        {"help",    {0, 0}},
        {"version", {0, 0}},
    };
    return table;
}

} // namespace

Result<CommandLine> parse_command_line(const std::vector<std::string>& argv) {
    CommandLine cl;
    std::vector<std::string> positionals;
    bool flags_done = false;

    for (const auto& a : argv) {
        if (!flags_done && a == "--") {
            flags_done = true;
        } else if (!flags_done && (a == "-d" || a == "--debug")) {
            cl.debug++;
        } else if (!flags_done && a.size() > 2 && a[0] == '-' && a[1] == 'd'
                   && a.find_first_not_of('d', 1) == std::string::npos) {
            cl.debug += static_cast<int>(a.size() - 1);   // -dd
        } else if (!flags_done && a == "--all") {
            cl.all = true;
        } else if (!flags_done && (a == "--help" || a == "-h")) {
            cl.command = "help";
        } else if (!flags_done && (a == "--version" || a == "-V")) {
            cl.command = "version";
        } else if (!flags_done && a.size() > 1 && a[0] == '-') {
            return Result<CommandLine>::Err(fmt::format("Unknown option: {}", a));
        } else {
            positionals.push_back(a);
        }
    }

    if (cl.command == "help" || cl.command == "version") {
        return Result<CommandLine>::Ok(cl);
    }

    if (positionals.empty()) {
        return Result<CommandLine>::Err("Missing command.");
    }

    cl.command = positionals.front();
    cl.args.assign(positionals.begin() + 1, positionals.end());

    auto it = arity().find(cl.command);
    if (it == arity().end()) {
        return Result<CommandLine>::Err(fmt::format("Unknown command: {}", cl.command));
    }

    if (cl.all && cl.command != "drop") {
        return Result<CommandLine>::Err("--all is only valid for 'drop'.");
    }

    auto [min_args, max_args] = it->second;
    if (cl.args.size() < min_args) {
        return Result<CommandLine>::Err(fmt::format("Missing arguments for '{}'.", cl.command));
    }
    if (cl.args.size() > max_args) {
        return Result<CommandLine>::Err(fmt::format("Too many arguments for '{}'.", cl.command));
    }

    return Result<CommandLine>::Ok(cl);
}
