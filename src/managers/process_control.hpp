#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include <core/types.hpp>

// OS capability used by tunnels: start a port forward, probe a pid, stop it.
// Tests substitute a fake.
class ProcessControl {
public:
    virtual ~ProcessControl() = default;

    // Start forwarding localhost:port to host:port. Returns the forwarding
    // process id. Throws SessionError(SpawnError) on failure.
    virtual uint32_t spawn_forward(const std::string& host, uint16_t port) = 0;

    virtual bool is_alive(uint32_t pid) const = 0;

    // Request termination. Throws SessionError(SignalError) on failure.
    virtual void terminate(uint32_t pid) = 0;
};

// Runs `ssh <options> -L bind:port:localhost:port host` as a detached process.
class SshProcessControl : public ProcessControl {
public:
    explicit SshProcessControl(SshSettings settings, std::string stderr_log = "");

    uint32_t spawn_forward(const std::string& host, uint16_t port) override;
    bool is_alive(uint32_t pid) const override;
    void terminate(uint32_t pid) override;

    // argv (without the program) for a forward to host:port
    std::vector<std::string> forward_args(const std::string& host, uint16_t port) const;

private:
    SshSettings settings_;
    std::string stderr_log_;
};
