#pragma once

#include <stdexcept>
#include <string>

enum class ErrorKind {
    InvalidLink,
    DuplicateKey,
    KeyNotFound,
    AmbiguousArguments,
    SpawnError,
    SignalError,
    CorruptState,
    IOError,
    PermissionError,
    ConfigError,
};

const char* error_kind_name(ErrorKind kind);

// Error raised by the registry, store and process layer. Caught once in main.
class SessionError : public std::runtime_error {
public:
    SessionError(ErrorKind kind, const std::string& msg)
        : std::runtime_error(msg), kind_(kind) {}

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};
