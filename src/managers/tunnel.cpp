#include "tunnel.hpp"
#include "process_control.hpp"
#include "session_log.hpp"
#include <core/errors.hpp>
#include <core/link.hpp>
#include <fmt/format.h>

std::string make_key(const std::string& host, uint16_t port) {
    return fmt::format("{}:{}", host, port);
}

std::string Tunnel::key() const {
    return make_key(host, port);
}

SessionStatus Tunnel::status(const ProcessControl& proc) const {
    if (!pid) return SessionStatus::Disconnected;
    return proc.is_alive(*pid) ? SessionStatus::Connected : SessionStatus::Disconnected;
}

bool Tunnel::is_alive(const ProcessControl& proc) const {
    return status(proc) == SessionStatus::Connected;
}

std::optional<uint32_t> Tunnel::effective_pid(const ProcessControl& proc) const {
    if (status(proc) == SessionStatus::Connected) return pid;
    return std::nullopt;
}

Tunnel Tunnel::start(const std::string& host, const std::string& link,
                     ProcessControl& proc) {
    auto parts = parse_link(link);
    if (parts.is_err()) {
        throw SessionError(ErrorKind::InvalidLink, parts.error);
    }

    Tunnel t;
    t.host = host;
    t.port = parts.value.port;
    t.link = link;
    t.token = parts.value.token;
    t.pid = proc.spawn_forward(host, t.port);
    rjy_log(fmt::format("Tunnel {} started (pid={})", t.key(), *t.pid));
    return t;
}

void Tunnel::terminate(ProcessControl& proc, StatusCallback notify) {
    auto emit = [&](const std::string& msg) {
        rjy_log(fmt::format("Tunnel {}: {}", key(), msg));
        if (notify) notify(msg);
    };

    if (!pid || !proc.is_alive(*pid)) {
        emit("Connection has already closed.");
        pid.reset();
        return;
    }

    uint32_t p = *pid;
    pid.reset();
    proc.terminate(p);
    emit(fmt::format("Disconnected session {} (Process ID={}).", key(), p));
}

bool Tunnel::operator==(const Tunnel& other) const {
    return host == other.host && port == other.port && link == other.link &&
           pid == other.pid && token == other.token;
}
