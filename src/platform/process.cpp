#include "process.hpp"
#include <core/utils.hpp>
#include <fmt/format.h>

#include <unistd.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <signal.h>
#include <fcntl.h>
#include <cerrno>

namespace platform {

// Point fd at path, or at /dev/null if path is empty.
static void redirect_fd(int fd, const std::string& path, int flags) {
    int target = open(path.empty() ? "/dev/null" : path.c_str(), flags, 0600);
    if (target < 0) target = open("/dev/null", flags);
    if (target >= 0) {
        dup2(target, fd);
        if (target != fd) close(target);
    }
}

Result<int> spawn_detached(const std::string& program,
                           const std::vector<std::string>& args,
                           const std::string& stderr_log) {
    // The child writes errno here if exec fails; CLOEXEC closes it on success.
    int status_pipe[2];
    if (pipe(status_pipe) != 0) {
        return Result<int>::Err(fmt::format("pipe() failed: {}", errno_message(errno)));
    }
    fcntl(status_pipe[1], F_SETFD, FD_CLOEXEC);

    std::vector<const char*> argv;
    argv.push_back(program.c_str());
    for (const auto& a : args) argv.push_back(a.c_str());
    argv.push_back(nullptr);

    pid_t pid = fork();
    if (pid < 0) {
        int err = errno;
        close(status_pipe[0]);
        close(status_pipe[1]);
        return Result<int>::Err(fmt::format("fork() failed: {}", errno_message(err)));
    }

    if (pid == 0) {
        // Child process
        close(status_pipe[0]);
        setsid();
        redirect_fd(STDIN_FILENO, "", O_RDONLY);
        redirect_fd(STDOUT_FILENO, "", O_WRONLY);
        redirect_fd(STDERR_FILENO, stderr_log, O_WRONLY | O_CREAT | O_APPEND);

        execvp(program.c_str(), const_cast<char* const*>(argv.data()));
        int err = errno;
        ssize_t ignored = write(status_pipe[1], &err, sizeof(err));
        (void)ignored;
        _exit(127);
    }

    // Parent
    close(status_pipe[1]);
    int child_errno = 0;
    ssize_t n;
    do {
        n = read(status_pipe[0], &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);
    close(status_pipe[0]);

    if (n == static_cast<ssize_t>(sizeof(child_errno))) {
        // exec failed; collect the child so it does not linger as a zombie
        waitpid(pid, nullptr, 0);
        return Result<int>::Err(fmt::format("Failed to start '{}': {}",
                                            program, errno_message(child_errno)));
    }

    return Result<int>::Ok(static_cast<int>(pid));
}

bool pid_alive(int pid) {
    if (pid <= 0) return false;

    // Reap it first if it is our own exited child, otherwise kill(0) reports
    // the zombie as alive.
    int status;
    waitpid(pid, &status, WNOHANG);

    // EPERM means the pid now belongs to someone else's process: not ours.
    return kill(pid, 0) == 0;
}

Result<void> send_terminate(int pid) {
    if (pid <= 0) {
        return Result<void>::Err(fmt::format("Invalid process ID {}", pid));
    }
    if (kill(pid, SIGTERM) != 0) {
        return Result<void>::Err(fmt::format("Failed to signal process {}: {}",
                                             pid, errno_message(errno)));
    }
    return Result<void>::Ok();
}

} // namespace platform
