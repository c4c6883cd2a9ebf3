#include "process.hpp"

#include "localization.hpp"
#include "utils.hpp"

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <array>
#include <cerrno>
#include <cstring>
#include <thread>

namespace {

using Clock = std::chrono::steady_clock;

// Closes whichever ends are still open on scope exit.
struct PipeFds {
    int fds[2] = {-1, -1};
    ~PipeFds() {
        for (int& fd : fds) {
            if (fd != -1) close(fd);
        }
    }
    void close_end(int idx) {
        if (fds[idx] != -1) {
            close(fds[idx]);
            fds[idx] = -1;
        }
    }
};

int remaining_ms(Clock::time_point deadline) {
    const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now()).count();
    return left > 0 ? static_cast<int>(left) : 0;
}

void kill_and_reap(pid_t pid) {
    kill(-pid, SIGKILL);
    int status;
    while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
}

int decode_exit_status(int status) {
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return -1;
}

// Only async-signal-safe calls between fork and exec.
[[noreturn]] void exec_child(char* const* c_args, int out_fd, int err_fd) {
    setpgid(0, 0);
    int null_fd = open("/dev/null", O_RDWR);
    if (null_fd >= 0) {
        dup2(null_fd, STDIN_FILENO);
        dup2(null_fd, STDERR_FILENO);
        close(null_fd);
    }
    dup2(out_fd, STDOUT_FILENO);
    close(out_fd);

    execvp(c_args[0], c_args);
    int err = errno;
    ssize_t written = write(err_fd, &err, sizeof(err));
    (void)written;
    _exit(127);
}

} // anonymous namespace

CommandResult run_command(const std::vector<std::string>& argv, std::chrono::milliseconds timeout) {
    CommandResult result;
    if (argv.empty() || argv[0].empty()) {
        result.status = CommandStatus::NOT_FOUND;
        result.error = get_string("error.empty_command");
        return result;
    }

    PipeFds out_pipe;
    PipeFds err_pipe;
    if (pipe2(out_pipe.fds, O_CLOEXEC) != 0 || pipe2(err_pipe.fds, O_CLOEXEC) != 0) {
        result.error = string_format("error.pipe_failed", std::strerror(errno));
        return result;
    }

    std::vector<char*> c_args;
    for (const auto& arg : argv) c_args.push_back(const_cast<char*>(arg.c_str()));
    c_args.push_back(nullptr);

    const auto deadline = Clock::now() + timeout;
    pid_t pid = fork();
    if (pid == -1) {
        result.error = string_format("error.fork_failed", std::strerror(errno));
        return result;
    }
    if (pid == 0) {
        exec_child(c_args.data(), out_pipe.fds[1], err_pipe.fds[1]);
    }
    setpgid(pid, pid);
    out_pipe.close_end(1);
    err_pipe.close_end(1);

    // The error pipe is closed by exec on success; otherwise it carries errno.
    int exec_errno = 0;
    ssize_t n;
    while ((n = read(err_pipe.fds[0], &exec_errno, sizeof(exec_errno))) < 0 && errno == EINTR) {}
    if (n == static_cast<ssize_t>(sizeof(exec_errno))) {
        int status;
        while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
        result.status = (exec_errno == ENOENT || exec_errno == EACCES || exec_errno == ENOTDIR)
            ? CommandStatus::NOT_FOUND : CommandStatus::SPAWN_FAILED;
        result.error = string_format("error.exec_failed", argv[0], std::strerror(exec_errno));
        return result;
    }

    std::array<char, 4096> buf;
    bool eof = false;
    while (!eof) {
        int wait_ms = remaining_ms(deadline);
        if (wait_ms == 0) {
            kill_and_reap(pid);
            result.status = CommandStatus::TIMED_OUT;
            result.error = string_format("error.command_timeout", argv[0], timeout.count());
            return result;
        }
        pollfd pfd{out_pipe.fds[0], POLLIN, 0};
        int rc = poll(&pfd, 1, wait_ms);
        if (rc < 0) {
            if (errno == EINTR) continue;
            kill_and_reap(pid);
            result.error = string_format("error.pipe_failed", std::strerror(errno));
            return result;
        }
        if (rc == 0) continue;

        ssize_t got = read(out_pipe.fds[0], buf.data(), buf.size());
        if (got > 0) {
            result.output.append(buf.data(), static_cast<size_t>(got));
        } else if (got == 0) {
            eof = true;
        } else if (errno != EINTR) {
            kill_and_reap(pid);
            result.error = string_format("error.pipe_failed", std::strerror(errno));
            return result;
        }
    }

    // Output closed; the child may still be running until the deadline.
    while (true) {
        int status;
        pid_t waited = waitpid(pid, &status, WNOHANG);
        if (waited == pid) {
            result.status = CommandStatus::COMPLETED;
            result.exit_code = decode_exit_status(status);
            return result;
        }
        if (waited < 0 && errno != EINTR) {
            result.error = string_format("error.wait_failed", std::strerror(errno));
            return result;
        }
        if (remaining_ms(deadline) == 0) {
            kill_and_reap(pid);
            result.status = CommandStatus::TIMED_OUT;
            result.error = string_format("error.command_timeout", argv[0], timeout.count());
            return result;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
}
