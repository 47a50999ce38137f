#include "process.h"

#include <cerrno>
#include <cstring>

#include <fcntl.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace eqrender::core {

namespace {

constexpr int k_exec_failed_status = 127;
constexpr int k_signal_status_base = 128;

void close_fd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

} // namespace

bool run_process(const std::vector<std::string>& args, bool discard_output, int& exit_code, std::string& error) {
    if (args.empty() || args.front().empty()) {
        error = "empty command";
        return false;
    }

    // Reports exec failures from the child; closed by a successful exec.
    int status_pipe[2] = {-1, -1};
    if (::pipe2(status_pipe, O_CLOEXEC) != 0) {
        error = "failed to create pipe: " + std::string(std::strerror(errno));
        return false;
    }

    int null_fd = -1;
    if (discard_output) {
        null_fd = ::open("/dev/null", O_WRONLY | O_CLOEXEC);
        if (null_fd < 0) {
            error = "failed to open /dev/null: " + std::string(std::strerror(errno));
            close_fd(status_pipe[0]);
            close_fd(status_pipe[1]);
            return false;
        }
    }

    std::vector<char*> argv;
    argv.reserve(args.size() + 1U);
    for (const auto& arg : args) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    const pid_t pid = ::fork();
    if (pid < 0) {
        error = "fork failed: " + std::string(std::strerror(errno));
        close_fd(null_fd);
        close_fd(status_pipe[0]);
        close_fd(status_pipe[1]);
        return false;
    }

    if (pid == 0) {
        // Own process group: a terminal interrupt reaches eqrender, not the tool.
        if (::setpgid(0, 0) != 0) {
            const int err = errno;
            (void)!::write(status_pipe[1], &err, sizeof(err));
            _exit(k_exec_failed_status);
        }
        if (null_fd >= 0) {
            if (::dup2(null_fd, STDOUT_FILENO) < 0 || ::dup2(null_fd, STDERR_FILENO) < 0) {
                const int err = errno;
                (void)!::write(status_pipe[1], &err, sizeof(err));
                _exit(k_exec_failed_status);
            }
        }
        ::execvp(argv[0], argv.data());
        const int err = errno;
        (void)!::write(status_pipe[1], &err, sizeof(err));
        _exit(k_exec_failed_status);
    }

    close_fd(null_fd);
    close_fd(status_pipe[1]);

    int child_errno = 0;
    ssize_t got = 0;
    do {
        got = ::read(status_pipe[0], &child_errno, sizeof(child_errno));
    } while (got < 0 && errno == EINTR);
    close_fd(status_pipe[0]);

    int status = 0;
    pid_t waited = 0;
    do {
        waited = ::waitpid(pid, &status, 0);
    } while (waited < 0 && errno == EINTR);
    if (waited < 0) {
        error = "waitpid failed: " + std::string(std::strerror(errno));
        return false;
    }

    if (got == static_cast<ssize_t>(sizeof(child_errno))) {
        error = "failed to run " + args.front() + ": " + std::strerror(child_errno);
        return false;
    }

    if (WIFEXITED(status)) {
        exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        exit_code = k_signal_status_base + WTERMSIG(status);
    } else {
        exit_code = -1;
    }
    return true;
}

CommandRunner system_command_runner() {
    return [](const std::vector<std::string>& args, bool discard_output, int& exit_code, std::string& error) {
        return run_process(args, discard_output, exit_code, error);
    };
}

std::string format_command(const std::vector<std::string>& args) {
    std::string out;
    for (const auto& arg : args) {
        if (!out.empty()) {
            out += ' ';
        }
        out += arg;
    }
    return out;
}

} // namespace eqrender::core
