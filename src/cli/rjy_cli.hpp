#pragma once

#include <string>
#include <memory>
#include <optional>
#include <ostream>
#include <filesystem>
#include <managers/process_control.hpp>
#include <managers/session_registry.hpp>
#include <managers/session_store.hpp>
#include "command_line.hpp"

// One invocation: load the registry, run a single command, save it back.
class RjyCli {
public:
    RjyCli(std::unique_ptr<ProcessControl> proc,
           std::filesystem::path sessions_path,
           std::ostream& out,
           bool use_color = true);

    // Resolve HOME, ~/.rjy.yaml and the session file, and use real ssh.
    // Throws SessionError(ConfigError) if HOME is unset or the config is bad.
    static std::unique_ptr<RjyCli> from_environment(std::ostream& out);

    // Dispatch a parsed command. Errors propagate as exceptions.
    void run(const CommandLine& cl);

    void run_new(const std::string& link, const std::string& host);
    void run_list();
    void run_drop(const std::optional<std::string>& key, bool all);
    void run_reconnect(const std::optional<std::string>& key);
    void run_disconnect(const std::optional<std::string>& key);

private:
    // Save even when the operation failed part-way, then rethrow, so a bulk
    // operation that aborted keeps the part it already applied.
    template <typename Fn>
    void mutate(Fn&& fn);

    std::unique_ptr<ProcessControl> proc_;
    std::ostream& out_;
    bool use_color_;
    SessionStore store_;
    SessionRegistry registry_;
};

void print_usage(std::ostream& out);
