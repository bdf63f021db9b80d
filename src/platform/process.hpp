#pragma once

#include <string>
#include <vector>
#include <core/types.hpp>

namespace platform {

// Spawn a child process detached from the invoking terminal: it gets its own
// session, stdin/stdout go to /dev/null and stderr to `stderr_log` (append)
// or /dev/null. The child is not reaped and keeps running after we exit.
// Returns the child's pid, or an error if fork or exec failed.
Result<int> spawn_detached(const std::string& program,
                           const std::vector<std::string>& args,
                           const std::string& stderr_log = "");

// True if a process with this pid exists and we are allowed to signal it.
bool pid_alive(int pid);

// Send SIGTERM to pid.
Result<void> send_terminate(int pid);

} // namespace platform
