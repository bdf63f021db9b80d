#pragma once

#include <string>
#include <vector>
#include <map>
#include <optional>
#include <core/types.hpp>
#include "tunnel.hpp"

class ProcessControl;

// All tracked tunnels, keyed by "{host}:{port}". Every operation either
// succeeds or throws SessionError; bulk operations stop at the first error
// and leave whatever was already applied.
class SessionRegistry {
public:
    explicit SessionRegistry(ProcessControl& proc, StatusCallback notify = nullptr);

    // Start a new tunnel. DuplicateKey if host:port is already tracked.
    void create(const std::string& link, const std::string& host);

    // Snapshot for display. Stale pids are shown as empty.
    std::vector<SessionRow> list() const;

    // Restart the tunnel if its process died; no-op if it is alive.
    void reconnect(const std::string& key);
    void reconnect_all();

    // Terminate but keep the entry.
    void disconnect(const std::string& key);
    void disconnect_all();

    // Remove the entry and terminate it.
    void drop(const std::string& key);
    void drop_all();

    // `rjy drop [key] [--all]`: exactly one of key / all must be given.
    void drop_request(const std::optional<std::string>& key, bool all);

    // Used by SessionStore on load. CorruptState if key != tunnel.key().
    void insert_loaded(const std::string& key, Tunnel tunnel);

    bool contains(const std::string& key) const { return tunnels_.count(key) > 0; }
    const Tunnel* find(const std::string& key) const;
    size_t size() const { return tunnels_.size(); }
    bool empty() const { return tunnels_.empty(); }
    const std::map<std::string, Tunnel>& tunnels() const { return tunnels_; }
    void clear() { tunnels_.clear(); }

private:
    Tunnel take(const std::string& key);
    Tunnel& get(const std::string& key);
    std::vector<std::string> snapshot_keys() const;
    void emit(const std::string& msg) const;

    ProcessControl& proc_;
    StatusCallback notify_;
    std::map<std::string, Tunnel> tunnels_;
};
