#pragma once

#include <string>
#include <optional>
#include <vector>
#include <functional>
#include <cstdint>

// Result type for operations that can fail
template <typename T>
struct Result {
    bool success;
    T value;
    std::string error;

    static Result<T> Ok(T val) {
        return {true, std::move(val), ""};
    }

    static Result<T> Err(const std::string& err) {
        return {false, T{}, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Specialization for void
template <>
struct Result<void> {
    bool success;
    std::string error;

    static Result<void> Ok() {
        return {true, ""};
    }

    static Result<void> Err(const std::string& err) {
        return {false, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Port and auth token pulled out of a Jupyter link
struct LinkParts {
    uint16_t port = 0;
    std::string token;
};

enum class SessionStatus {
    Connected,
    Disconnected,
};

inline std::string status_label(SessionStatus s) {
    return s == SessionStatus::Connected ? "connected" : "disconnected";
}

// One row of `rjy list`
struct SessionRow {
    std::string key;
    std::optional<uint32_t> pid;    // empty unless the process is alive
    SessionStatus status = SessionStatus::Disconnected;
    std::string link;
};

// User configuration (~/.rjy.yaml)
struct SshSettings {
    std::string program = "ssh";
    std::vector<std::string> options = {"-Y", "-N"};
    std::string bind_address = "localhost";
};

// Status callback for operations
using StatusCallback = std::function<void(const std::string&)>;
