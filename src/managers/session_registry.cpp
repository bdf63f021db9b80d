#include "session_registry.hpp"
#include "process_control.hpp"
#include "session_log.hpp"
#include <core/errors.hpp>
#include <core/link.hpp>
#include <fmt/format.h>

static SessionError key_not_found(const std::string& key) {
    return SessionError(ErrorKind::KeyNotFound,
        fmt::format("Could not find a remote Jupyter session with key '{}'.", key));
}

SessionRegistry::SessionRegistry(ProcessControl& proc, StatusCallback notify)
    : proc_(proc), notify_(std::move(notify)) {}

void SessionRegistry::emit(const std::string& msg) const {
    rjy_log(fmt::format("SessionRegistry: {}", msg));
    if (notify_) notify_(msg);
}

// ── Lookup ───────────────────────────────────────────────────

const Tunnel* SessionRegistry::find(const std::string& key) const {
    auto it = tunnels_.find(key);
    return it == tunnels_.end() ? nullptr : &it->second;
}

Tunnel& SessionRegistry::get(const std::string& key) {
    auto it = tunnels_.find(key);
    if (it == tunnels_.end()) throw key_not_found(key);
    return it->second;
}

Tunnel SessionRegistry::take(const std::string& key) {
    auto it = tunnels_.find(key);
    if (it == tunnels_.end()) throw key_not_found(key);
    Tunnel t = std::move(it->second);
    tunnels_.erase(it);
    return t;
}

std::vector<std::string> SessionRegistry::snapshot_keys() const {
    std::vector<std::string> keys;
    keys.reserve(tunnels_.size());
    for (const auto& [key, t] : tunnels_) keys.push_back(key);
    return keys;
}

void SessionRegistry::insert_loaded(const std::string& key, Tunnel tunnel) {
    if (key != tunnel.key()) {
        throw SessionError(ErrorKind::CorruptState,
            fmt::format("Session key '{}' does not match its host and port ({}).",
                        key, tunnel.key()));
    }
    if (tunnels_.count(key)) {
        throw SessionError(ErrorKind::CorruptState,
            fmt::format("Session key '{}' appears more than once.", key));
    }
    tunnels_.emplace(key, std::move(tunnel));
}

// ── Create / list ────────────────────────────────────────────

void SessionRegistry::create(const std::string& link, const std::string& host) {
    auto parts = parse_link(link);
    if (parts.is_err()) {
        throw SessionError(ErrorKind::InvalidLink, parts.error);
    }

    std::string key = make_key(host, parts.value.port);
    if (tunnels_.count(key)) {
        throw SessionError(ErrorKind::DuplicateKey, fmt::format(
            "A remote Jupyter session with key '{}' is already registered.\n"
            "If you'd like to reconnect, use 'rjy rc {}'.", key, key));
    }

    Tunnel t = Tunnel::start(host, link, proc_);
    tunnels_.emplace(key, std::move(t));
    emit(fmt::format("Created new session {}.", key));
}

std::vector<SessionRow> SessionRegistry::list() const {
    std::vector<SessionRow> rows;
    rows.reserve(tunnels_.size());
    for (const auto& [key, t] : tunnels_) {
        SessionRow row;
        row.key = key;
        row.status = t.status(proc_);
        row.pid = row.status == SessionStatus::Connected ? t.pid : std::nullopt;
        row.link = t.link;
        rows.push_back(std::move(row));
    }
    return rows;
}

// ── Reconnect ────────────────────────────────────────────────

void SessionRegistry::reconnect(const std::string& key) {
    Tunnel old = take(key);

    if (old.is_alive(proc_)) {
        tunnels_.emplace(key, std::move(old));
        emit(fmt::format("Session {} is already connected.", key));
        return;
    }

    try {
        Tunnel fresh = Tunnel::start(old.host, old.link, proc_);
        tunnels_.emplace(key, std::move(fresh));
    } catch (...) {
        // Keep tracking the tunnel so a later `rc` can retry it
        tunnels_.emplace(key, std::move(old));
        throw;
    }
    emit(fmt::format("Reconnected session {}.", key));
}

void SessionRegistry::reconnect_all() {
    for (const auto& key : snapshot_keys()) {
        reconnect(key);
    }
}

// ── Disconnect ───────────────────────────────────────────────

void SessionRegistry::disconnect(const std::string& key) {
    get(key).terminate(proc_, notify_);
}

void SessionRegistry::disconnect_all() {
    for (const auto& key : snapshot_keys()) {
        disconnect(key);
    }
}

// ── Drop ─────────────────────────────────────────────────────

void SessionRegistry::drop(const std::string& key) {
    Tunnel t = take(key);
    t.terminate(proc_, notify_);
    emit(fmt::format("Dropped session {}.", key));
}

void SessionRegistry::drop_all() {
    for (const auto& key : snapshot_keys()) {
        drop(key);
    }
}

void SessionRegistry::drop_request(const std::optional<std::string>& key, bool all) {
    if (key && all) {
        throw SessionError(ErrorKind::AmbiguousArguments,
                           "Specify either a key or --all, not both.");
    }
    if (!key && !all) {
        throw SessionError(ErrorKind::AmbiguousArguments,
                           "Specify either a key or --all.");
    }
    if (all) {
        drop_all();
    } else {
        drop(*key);
    }
}
