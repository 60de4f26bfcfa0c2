#include "hwident/process.hpp"

#include "logging.hpp"
#include "platform.hpp"

#if !defined(HWIDENT_PLATFORM_WINDOWS)
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <array>
#include <cerrno>
#include <cstring>
#include <thread>
#endif

namespace hwident {

#if defined(HWIDENT_PLATFORM_WINDOWS)

CommandResult run_command(const std::vector<std::string>& argv,
                          std::chrono::milliseconds /*timeout*/) {
    LOG_DBG << "Command execution is not supported on Windows"
            << (argv.empty() ? "" : ": " + argv.front());
    return CommandResult{};
}

#else

namespace {

// Closes a descriptor on scope exit
class FileDescriptor {
  public:
    FileDescriptor() = default;
    explicit FileDescriptor(int fd) : fd_(fd) {}
    ~FileDescriptor() { reset(); }

    FileDescriptor(const FileDescriptor&) = delete;
    FileDescriptor& operator=(const FileDescriptor&) = delete;

    [[nodiscard]] int get() const noexcept { return fd_; }

    void reset(int fd = -1) {
        if (fd_ >= 0) {
            ::close(fd_);
        }
        fd_ = fd;
    }

  private:
    int fd_ = -1;
};

// Exit status used by the child when exec fails
constexpr int kExecFailed = 127;

int decode_status(int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return -1;
}

}  // namespace

CommandResult run_command(const std::vector<std::string>& argv,
                          std::chrono::milliseconds timeout) {
    CommandResult result;
    if (argv.empty()) {
        return result;
    }

    // Built before fork: the child may only call async-signal-safe functions
    std::vector<char*> cargv;
    cargv.reserve(argv.size() + 1);
    for (const auto& arg : argv) {
        cargv.push_back(const_cast<char*>(arg.c_str()));
    }
    cargv.push_back(nullptr);

    int fds[2] = {-1, -1};
    if (::pipe(fds) != 0) {
        LOG_DBG << "pipe() failed: " << std::strerror(errno);
        return result;
    }
    FileDescriptor read_end(fds[0]);
    FileDescriptor write_end(fds[1]);
    // Keeps children forked concurrently by other threads from holding the pipe open
    ::fcntl(read_end.get(), F_SETFD, FD_CLOEXEC);
    ::fcntl(write_end.get(), F_SETFD, FD_CLOEXEC);

    pid_t pid = ::fork();
    if (pid < 0) {
        LOG_DBG << "fork() failed: " << std::strerror(errno);
        return result;
    }

    if (pid == 0) {
        ::dup2(write_end.get(), STDOUT_FILENO);
        int devnull = ::open("/dev/null", O_WRONLY);
        if (devnull >= 0) {
            ::dup2(devnull, STDERR_FILENO);
            ::close(devnull);
        }
        ::close(fds[0]);
        ::close(fds[1]);
        ::execvp(cargv[0], cargv.data());
        ::_exit(kExecFailed);
    }

    write_end.reset();

    const auto deadline = std::chrono::steady_clock::now() + timeout;
    std::array<char, 4096> buffer{};
    bool eof = false;

    while (!eof) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            result.timed_out = true;
            break;
        }

        struct pollfd pfd {};
        pfd.fd = read_end.get();
        pfd.events = POLLIN;

        int ready = ::poll(&pfd, 1, static_cast<int>(remaining.count()));
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            LOG_DBG << "poll() failed: " << std::strerror(errno);
            break;
        }
        if (ready == 0) {
            continue;  // Deadline re-checked at loop head
        }

        ssize_t n = ::read(read_end.get(), buffer.data(), buffer.size());
        if (n > 0) {
            result.output.append(buffer.data(), static_cast<size_t>(n));
        } else if (n == 0) {
            eof = true;
        } else if (errno != EINTR && errno != EAGAIN) {
            break;
        }
    }

    int status = 0;
    bool reaped = false;

    // The child may close stdout and keep running; its exit is bounded too
    while (eof && !reaped) {
        pid_t w = ::waitpid(pid, &status, WNOHANG);
        if (w == pid) {
            reaped = true;
        } else if (w < 0 && errno != EINTR) {
            break;
        } else if (std::chrono::steady_clock::now() >= deadline) {
            result.timed_out = true;
            break;
        } else {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
    }

    if (!reaped) {
        // Timed out or the pipe failed: never leave the child running
        ::kill(pid, SIGKILL);
        while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
        }
    }

    result.exit_code = decode_status(status);

    if (result.timed_out) {
        result.started = true;
        return result;
    }

    result.started = result.exit_code != kExecFailed;
    return result;
}

#endif

}  // namespace hwident
