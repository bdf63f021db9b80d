#pragma once

#include <string>
#include <optional>
#include <cstdint>
#include <core/types.hpp>

class ProcessControl;

// One tracked SSH port-forward to a remote Jupyter server.
struct Tunnel {
    std::string host;
    uint16_t port = 0;
    std::string link;               // original URL, kept verbatim for reconnects
    std::optional<uint32_t> pid;    // forwarding process; empty once terminated
    std::string token;

    // "{host}:{port}"
    std::string key() const;

    // Connected only if a pid is tracked and that process is alive.
    // Never clears a stale pid.
    SessionStatus status(const ProcessControl& proc) const;
    bool is_alive(const ProcessControl& proc) const;

    // The pid if Connected, otherwise nothing (hides stale pids).
    std::optional<uint32_t> effective_pid(const ProcessControl& proc) const;

    // Parse the link and spawn a forward for host:port.
    // Throws SessionError (InvalidLink or SpawnError).
    static Tunnel start(const std::string& host, const std::string& link,
                        ProcessControl& proc);

    // Stop the forwarding process if it is alive, then forget the pid.
    // A second call is a no-op. Throws SessionError(SignalError) if the
    // signal cannot be delivered; the pid is cleared either way.
    void terminate(ProcessControl& proc, StatusCallback notify = nullptr);

    bool operator==(const Tunnel& other) const;
    bool operator!=(const Tunnel& other) const { return !(*this == other); }
};

std::string make_key(const std::string& host, uint16_t port);
