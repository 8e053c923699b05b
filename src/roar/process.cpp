#include "roar/process.hpp"

#include <array>
#include <cerrno>
#include <cstring>
#include <string>

#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

#include <fmt/format.h>

#include "roar/errors.hpp"

namespace roar {

namespace {

constexpr int k_exec_failure_exit_code{127};

/** Owns both ends of a close-on-exec pipe. */
class Pipe final {
  public:
    Pipe() {
        if (::pipe2(fds_.data(), O_CLOEXEC) != 0) {
            throw ProcessError(fmt::format("pipe failed: {}", std::strerror(errno)));
        }
    }
    ~Pipe() {
        close_read();
        close_write();
    }
    Pipe(const Pipe&) = delete;
    Pipe& operator=(const Pipe&) = delete;

    [[nodiscard]] int read_fd() const noexcept { return fds_[0]; }
    [[nodiscard]] int write_fd() const noexcept { return fds_[1]; }

    void close_read() noexcept { close_fd(fds_[0]); }
    void close_write() noexcept { close_fd(fds_[1]); }

  private:
    static void close_fd(int& fd) noexcept {
        if (fd >= 0) {
            ::close(fd);
            fd = -1;
        }
    }

    std::array<int, 2> fds_{-1, -1};
};

/** Waits for the child on every exit path so it is never left a zombie. */
class ChildReaper final {
  public:
    ChildReaper(pid_t pid, Pipe& stdout_pipe, Pipe& stderr_pipe) noexcept
        : pid_(pid), stdout_pipe_(stdout_pipe), stderr_pipe_(stderr_pipe) {}
    ~ChildReaper() {
        if (pid_ > 0) {
            // Closing the read ends unblocks a child stuck writing to a full pipe.
            stdout_pipe_.close_read();
            stderr_pipe_.close_read();
            int ignored_status = 0;
            while (::waitpid(pid_, &ignored_status, 0) < 0 && errno == EINTR) {
            }
        }
    }
    ChildReaper(const ChildReaper&) = delete;
    ChildReaper& operator=(const ChildReaper&) = delete;

    /** @brief Reap the child and return its raw wait status. */
    int wait(const std::string& command) {
        int status = 0;
        while (::waitpid(pid_, &status, 0) < 0) {
            if (errno != EINTR) {
                pid_ = -1;
                throw ProcessError(fmt::format("waitpid failed for {}: {}", command, std::strerror(errno)));
            }
        }
        pid_ = -1;
        return status;
    }

  private:
    pid_t pid_;
    Pipe& stdout_pipe_;
    Pipe& stderr_pipe_;
};

void drain(Pipe& stdout_pipe, Pipe& stderr_pipe, ProcessResult& result) {
    std::array<pollfd, 2> poll_fds{{
        {stdout_pipe.read_fd(), POLLIN, 0},
        {stderr_pipe.read_fd(), POLLIN, 0},
    }};
    std::array<std::string*, 2> outputs{&result.stdout_text, &result.stderr_text};
    std::array<char, 4096> buffer{};

    std::size_t open_streams = poll_fds.size();
    while (open_streams > 0) {
        if (::poll(poll_fds.data(), poll_fds.size(), -1) < 0) {
            if (errno == EINTR) {
                continue;
            }
            throw ProcessError(fmt::format("poll failed: {}", std::strerror(errno)));
        }
        for (std::size_t index = 0; index < poll_fds.size(); ++index) {
            pollfd& entry = poll_fds[index];
            if (entry.fd < 0 || entry.revents == 0) {
                continue;
            }
            const ssize_t count = ::read(entry.fd, buffer.data(), buffer.size());
            if (count > 0) {
                outputs[index]->append(buffer.data(), static_cast<std::size_t>(count));
                continue;
            }
            if (count < 0 && errno == EINTR) {
                continue;
            }
            entry.fd = -1;
            --open_streams;
        }
    }
}

}  // namespace

ProcessResult run_process(const std::vector<std::string>& arguments) {
    if (arguments.empty()) {
        throw ProcessError("cannot run an empty command");
    }

    std::vector<char*> argv;
    argv.reserve(arguments.size() + 1);
    for (const std::string& argument : arguments) {
        argv.push_back(const_cast<char*>(argument.c_str()));
    }
    argv.push_back(nullptr);

    Pipe stdout_pipe;
    Pipe stderr_pipe;

    const pid_t pid = ::fork();
    if (pid < 0) {
        throw ProcessError(fmt::format("fork failed for {}: {}", arguments.front(), std::strerror(errno)));
    }
    if (pid == 0) {
        // Only async-signal-safe calls until exec.
        if (::dup2(stdout_pipe.write_fd(), STDOUT_FILENO) < 0 || ::dup2(stderr_pipe.write_fd(), STDERR_FILENO) < 0) {
            ::_exit(k_exec_failure_exit_code);
        }
        ::execvp(argv[0], argv.data());
        ::_exit(k_exec_failure_exit_code);
    }

    ChildReaper reaper{pid, stdout_pipe, stderr_pipe};
    stdout_pipe.close_write();
    stderr_pipe.close_write();

    ProcessResult result{};
    drain(stdout_pipe, stderr_pipe, result);

    const int status = reaper.wait(arguments.front());

    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.exit_code = 128 + WTERMSIG(status);
    }

    if (result.exit_code == k_exec_failure_exit_code && result.stdout_text.empty() && result.stderr_text.empty()) {
        throw ProcessError(fmt::format("failed to execute {}: command not found", arguments.front()));
    }
    return result;
}

}  // namespace roar
