#include "process_control.hpp"
#include "session_log.hpp"
#include <core/constants.hpp>
#include <core/errors.hpp>
#include <platform/process.hpp>
#include <fmt/format.h>
#include <fmt/ranges.h>

SshProcessControl::SshProcessControl(SshSettings settings, std::string stderr_log)
    : settings_(std::move(settings)), stderr_log_(std::move(stderr_log)) {}

std::vector<std::string> SshProcessControl::forward_args(const std::string& host,
                                                         uint16_t port) const {
    std::vector<std::string> args = settings_.options;
    args.push_back("-L");
    args.push_back(fmt::format(FORWARD_SPEC, settings_.bind_address, port, port));
    args.push_back(host);
    return args;
}

uint32_t SshProcessControl::spawn_forward(const std::string& host, uint16_t port) {
    auto args = forward_args(host, port);
    rjy_log(fmt::format("spawn: {} {}", settings_.program, fmt::join(args, " ")));

    auto result = platform::spawn_detached(settings_.program, args, stderr_log_);
    if (result.is_err()) {
        rjy_log(fmt::format("spawn failed: {}", result.error));
        throw SessionError(ErrorKind::SpawnError,
            fmt::format("Could not start SSH tunnel to {}:{}: {}", host, port, result.error));
    }

    rjy_log(fmt::format("spawn: pid={}", result.value));
    return static_cast<uint32_t>(result.value);
}

bool SshProcessControl::is_alive(uint32_t pid) const {
    return platform::pid_alive(static_cast<int>(pid));
}

void SshProcessControl::terminate(uint32_t pid) {
    auto result = platform::send_terminate(static_cast<int>(pid));
    if (result.is_err()) {
        rjy_log(fmt::format("terminate {} failed: {}", pid, result.error));
        throw SessionError(ErrorKind::SignalError, result.error);
    }
    rjy_log(fmt::format("terminate: sent SIGTERM to {}", pid));
}
