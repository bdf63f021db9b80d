#include <iostream>
#include <vector>
#include <string>
#include "cli/rjy_cli.hpp"
#include "cli/theme.hpp"
#include <core/constants.hpp>
#include <core/errors.hpp>
#include <managers/session_log.hpp>
#include <fmt/format.h>

int main(int argc, char** argv) {
    std::vector<std::string> args(argv + 1, argv + argc);

    auto parsed = parse_command_line(args);
    if (parsed.is_err()) {
        std::cerr << theme::fail(parsed.error);
        print_usage(std::cerr);
        return 1;
    }
    const CommandLine& cl = parsed.value;

    if (cl.command == "help") {
        print_usage(std::cout);
        return 0;
    }
    if (cl.command == "version") {
        std::cout << "rjy " << RJY_VERSION << "\n";
        return 0;
    }

    rjy_log_echo() = cl.debug > 0;
    // argv is not logged whole: links carry auth tokens
    rjy_log(fmt::format("rjy {} ({} argument(s))", cl.command, cl.args.size()));

    try {
        auto cli = RjyCli::from_environment(std::cout);
        cli->run(cl);
        return 0;
    } catch (const SessionError& e) {
        rjy_log(fmt::format("error ({}): {}", error_kind_name(e.kind()), e.what()));
        std::cerr << theme::fail(std::string("Error: ") + e.what());
        return 1;
    } catch (const std::exception& e) {
        rjy_log(fmt::format("error: {}", e.what()));
        std::cerr << theme::fail(std::string("Error: ") + e.what());
        return 1;
    }
}
