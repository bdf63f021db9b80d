#pragma once

#include <string>
#include <filesystem>
#include "session_registry.hpp"

namespace fs = std::filesystem;

// The registry on disk: a YAML map of key -> {host, port, link, pid, token}
// in a single owner-only (0600) file.
class SessionStore {
public:
    explicit SessionStore(fs::path path);

    // Replace the registry's contents with the file's. A missing or blank
    // file is bootstrapped as an empty registry and written back.
    // Throws SessionError (CorruptState, IOError, PermissionError).
    void load(SessionRegistry& registry);

    // Write the registry, creating the file if needed, mode 0600.
    // Throws SessionError (IOError, PermissionError).
    void save(const SessionRegistry& registry);

    const fs::path& path() const { return path_; }

    // YAML text for a registry; exposed for tests.
    static std::string serialize(const SessionRegistry& registry);

private:
    void parse_into(const std::string& contents, SessionRegistry& registry) const;

    fs::path path_;
};
