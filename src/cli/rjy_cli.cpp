#include "rjy_cli.hpp"
#include "session_table.hpp"
#include "theme.hpp"
#include <core/config.hpp>
#include <core/constants.hpp>
#include <core/errors.hpp>
#include <core/utils.hpp>
#include <managers/session_log.hpp>
#include <platform/platform.hpp>
#include <fmt/format.h>

RjyCli::RjyCli(std::unique_ptr<ProcessControl> proc,
               std::filesystem::path sessions_path,
               std::ostream& out,
               bool use_color)
    : proc_(std::move(proc)),
      out_(out),
      use_color_(use_color),
      store_(std::move(sessions_path)),
      registry_(*proc_, [this](const std::string& msg) { out_ << theme::ok(msg); }) {}

std::unique_ptr<RjyCli> RjyCli::from_environment(std::ostream& out) {
    auto home = platform::home_dir();
    if (!home) {
        throw SessionError(ErrorKind::ConfigError,
            "Cannot determine home directory: HOME is not set.");
    }

    auto config = Config::load(*home);
    if (config.is_err()) {
        throw SessionError(ErrorKind::ConfigError, config.error);
    }

    auto proc = std::make_unique<SshProcessControl>(config.value.ssh(), rjy_log_path());
    bool color = platform::stdout_is_tty() && env_or_empty("NO_COLOR").empty();
    return std::make_unique<RjyCli>(std::move(proc),
                                    get_sessions_path(config.value, *home),
                                    out, color);
}

template <typename Fn>
void RjyCli::mutate(Fn&& fn) {
    store_.load(registry_);
    try {
        fn();
    } catch (const SessionError&) {
        try {
            store_.save(registry_);
        } catch (const SessionError& e) {
            // The operation's own error is the one reported
            rjy_log(fmt::format("save after failed command: {}", e.what()));
        }
        throw;
    }
    store_.save(registry_);
}

// ── Commands ─────────────────────────────────────────────────

void RjyCli::run(const CommandLine& cl) {
    if (cl.command == "new") {
        run_new(cl.args.at(0), cl.args.at(1));
    } else if (cl.command == "list") {
        run_list();
    } else if (cl.command == "drop") {
        run_drop(cl.key(), cl.all);
    } else if (cl.command == "rc") {
        run_reconnect(cl.key());
    } else if (cl.command == "dc") {
        run_disconnect(cl.key());
    } else {
        throw std::invalid_argument("Unknown command: " + cl.command);
    }
}

void RjyCli::run_new(const std::string& link, const std::string& host) {
    mutate([&] { registry_.create(link, host); });
}

void RjyCli::run_list() {
    store_.load(registry_);
    auto rows = registry_.list();
    if (rows.empty()) {
        out_ << "No active remote Jupyter sessions.\n";
        return;
    }
    out_ << render_session_table(rows, use_color_);
}

void RjyCli::run_drop(const std::optional<std::string>& key, bool all) {
    mutate([&] { registry_.drop_request(key, all); });
}

void RjyCli::run_reconnect(const std::optional<std::string>& key) {
    mutate([&] {
        if (key) registry_.reconnect(*key);
        else registry_.reconnect_all();
    });
}

void RjyCli::run_disconnect(const std::optional<std::string>& key) {
    mutate([&] {
        if (key) registry_.disconnect(*key);
        else registry_.disconnect_all();
    });
}

void print_usage(std::ostream& out) {
    out << theme::section("rjy: remote Jupyter tunnels");
    out << theme::usage_row("new", "<link> <host>", "Forward a remote notebook to localhost");
    out << theme::usage_row("list", "", "Show tracked sessions");
    out << theme::usage_row("rc", "[key]", "Reconnect one session, or all");
    out << theme::usage_row("dc", "[key]", "Disconnect one session, or all");
    out << theme::usage_row("drop", "<key> | --all", "Disconnect and forget sessions");
    out << "\n";
    out << theme::dim("    -d, --debug    Echo the debug log to stderr") << "\n";
    out << theme::dim("    --version      Show version") << "\n";
    out << theme::dim("    --help         Show this help") << "\n\n";
    out << theme::dim(fmt::format("    Sessions are kept in ~/{}", SESSIONS_FILE_NAME)) << "\n\n";
}
