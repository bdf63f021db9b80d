#include "utils.hpp"
#include <fmt/format.h>
#include <cstdlib>
#include <cstring>

std::string env_or_empty(const char* name) {
    const char* v = std::getenv(name);
    return v ? std::string(v) : std::string();
}

std::string errno_message(int err) {
    return fmt::format("{} (errno {})", std::strerror(err), err);
}
