#include "platform.hpp"
#include <cstdlib>
#include <system_error>
#include <unistd.h>

namespace fs = std::filesystem;

namespace platform {

std::optional<fs::path> home_dir() {
    const char* home = std::getenv("HOME");
    if (!home || !*home) return std::nullopt;
    return fs::path(home);
}

fs::path temp_dir() {
    std::error_code ec;
    fs::path p = fs::temp_directory_path(ec);
    if (ec) return fs::path("/tmp");
    return p;
}

bool stdout_is_tty() {
    return isatty(STDOUT_FILENO) == 1;
}

} // namespace platform
