#pragma once

#include <string>
#include <optional>
#include <filesystem>

namespace platform {

// Returns the user's home directory from HOME, or nothing if HOME is unset
// or empty.
std::optional<std::filesystem::path> home_dir();

// Returns the system temporary directory.
std::filesystem::path temp_dir();

// True if stdout is attached to a terminal.
bool stdout_is_tty();

} // namespace platform
