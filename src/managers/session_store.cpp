#include "session_store.hpp"
#include "session_log.hpp"
#include <core/constants.hpp>
#include <core/errors.hpp>
#include <core/utils.hpp>
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>
#include <fstream>
#include <sstream>
#include <limits>

SessionStore::SessionStore(fs::path path)
    : path_(std::move(path)) {}

// ── Load ─────────────────────────────────────────────────────

void SessionStore::load(SessionRegistry& registry) {
    std::error_code ec;
    bool exists = fs::exists(path_, ec);
    if (ec) {
        throw SessionError(ErrorKind::IOError,
            fmt::format("Failed to access '{}': {}", path_.string(), ec.message()));
    }

    if (!exists) {
        rjy_log(fmt::format("SessionStore: {} missing, creating empty registry", path_.string()));
        registry.clear();
        save(registry);
        return;
    }

    std::ifstream fin(path_.string(), std::ios::binary);
    if (!fin) {
        throw SessionError(ErrorKind::IOError,
            fmt::format("Failed to open '{}' for reading.", path_.string()));
    }
    std::stringstream buf;
    buf << fin.rdbuf();
    if (fin.bad()) {
        throw SessionError(ErrorKind::IOError,
            fmt::format("Failed to read '{}'.", path_.string()));
    }
    std::string contents = buf.str();

    // Exists but empty: treat like a missing file
    if (is_blank(contents)) {
        rjy_log(fmt::format("SessionStore: {} is empty, creating empty registry", path_.string()));
        registry.clear();
        save(registry);
        return;
    }

    registry.clear();
    parse_into(contents, registry);
    rjy_log(fmt::format("SessionStore: loaded {} session(s) from {}",
                        registry.size(), path_.string()));
}

void SessionStore::parse_into(const std::string& contents, SessionRegistry& registry) const {
    auto corrupt = [&](const std::string& why) {
        return SessionError(ErrorKind::CorruptState,
            fmt::format("Session file '{}' is corrupt: {}", path_.string(), why));
    };

    YAML::Node root;
    try {
        root = YAML::Load(contents);
    } catch (const YAML::Exception& e) {
        throw corrupt(e.what());
    }

    if (root.IsNull()) return;
    if (!root.IsMap()) throw corrupt("expected a mapping of sessions");

    for (const auto& entry : root) {
        std::string key;
        Tunnel t;
        try {
            key = entry.first.as<std::string>();
            const YAML::Node& n = entry.second;
            if (!n.IsMap()) throw corrupt(fmt::format("entry '{}' is not a mapping", key));

            for (const char* field : {"host", "port", "link", "token"}) {
                if (!n[field] || !n[field].IsScalar()) {
                    throw corrupt(fmt::format("entry '{}' has no '{}'", key, field));
                }
            }

            t.host = n["host"].as<std::string>();
            t.link = n["link"].as<std::string>();
            t.token = n["token"].as<std::string>();

            int port = n["port"].as<int>();
            if (port < MIN_PORT || port > MAX_PORT) {
                throw corrupt(fmt::format("entry '{}' has invalid port {}", key, port));
            }
            t.port = static_cast<uint16_t>(port);

            if (n["pid"] && !n["pid"].IsNull()) {
                int64_t pid = n["pid"].as<int64_t>();
                if (pid <= 0 || pid > std::numeric_limits<uint32_t>::max()) {
                    throw corrupt(fmt::format("entry '{}' has invalid pid {}", key, pid));
                }
                t.pid = static_cast<uint32_t>(pid);
            }
        } catch (const YAML::Exception& e) {
            throw corrupt(e.what());
        }

        try {
            registry.insert_loaded(key, std::move(t));
        } catch (const SessionError& e) {
            throw corrupt(e.what());
        }
    }
}

// ── Save ─────────────────────────────────────────────────────

std::string SessionStore::serialize(const SessionRegistry& registry) {
    YAML::Emitter out;
    out << YAML::BeginMap;
    for (const auto& [key, t] : registry.tunnels()) {
        out << YAML::Key << key << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "host" << YAML::Value << t.host;
        out << YAML::Key << "port" << YAML::Value << static_cast<int>(t.port);
        out << YAML::Key << "link" << YAML::Value << YAML::DoubleQuoted << t.link;
        if (t.pid) {
            out << YAML::Key << "pid" << YAML::Value << *t.pid;
        } else {
            out << YAML::Key << "pid" << YAML::Value << YAML::Null;
        }
        out << YAML::Key << "token" << YAML::Value << YAML::DoubleQuoted << t.token;
        out << YAML::EndMap;
    }
    out << YAML::EndMap;
    return std::string(out.c_str()) + "\n";
}

void SessionStore::save(const SessionRegistry& registry) {
    std::string data = serialize(registry);

    std::error_code ec;
    if (path_.has_parent_path()) {
        fs::create_directories(path_.parent_path(), ec);
        if (ec) {
            throw SessionError(ErrorKind::IOError,
                fmt::format("Failed to create directory '{}': {}",
                            path_.parent_path().string(), ec.message()));
        }
    }

    std::ofstream fout(path_.string(), std::ios::binary | std::ios::trunc);
    if (!fout) {
        throw SessionError(ErrorKind::IOError,
            fmt::format("Failed to open file '{}' for writing.", path_.string()));
    }

    // Only the owner may read or write: the file holds auth tokens
    fs::permissions(path_, fs::perms::owner_read | fs::perms::owner_write,
                    fs::perm_options::replace, ec);
    if (ec) {
        throw SessionError(ErrorKind::PermissionError,
            fmt::format("Failed to set file permissions on '{}': {}",
                        path_.string(), ec.message()));
    }

    fout << data;
    fout.flush();
    if (!fout) {
        throw SessionError(ErrorKind::IOError,
            fmt::format("Failed to write the remote Jupyter session file '{}'.",
                        path_.string()));
    }

    rjy_log(fmt::format("SessionStore: saved {} session(s) to {}",
                        registry.size(), path_.string()));
}
