#include "errors.hpp"

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::InvalidLink:        return "InvalidLink";
        case ErrorKind::DuplicateKey:       return "DuplicateKey";
        case ErrorKind::KeyNotFound:        return "KeyNotFound";
        case ErrorKind::AmbiguousArguments: return "AmbiguousArguments";
        case ErrorKind::SpawnError:         return "SpawnError";
        case ErrorKind::SignalError:        return "SignalError";
        case ErrorKind::CorruptState:       return "CorruptState";
        case ErrorKind::IOError:            return "IOError";
        case ErrorKind::PermissionError:    return "PermissionError";
        case ErrorKind::ConfigError:        return "ConfigError";
    }
    return "Unknown";
}
