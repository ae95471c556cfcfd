#include "include/shell_pipe.hpp"
#include "include/interrupts.hpp"

#include <algorithm>
#include <array>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <stdexcept>
#include <system_error>
#include <thread>
#include <utility>
#include <vector>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/syscall.h>
#include <sys/wait.h>
#include <unistd.h>

namespace vantage::os {

namespace {

int pidfd_open(pid_t pid, unsigned int flags) {
#ifdef __NR_pidfd_open
    return static_cast<int>(syscall(__NR_pidfd_open, pid, flags));
#else
    errno = ENOSYS;
    return -1;
#endif
}

int decode_status(int status) {
    if (WIFEXITED(status))
        return WEXITSTATUS(status);
    if (WIFSIGNALED(status))
        return 128 + WTERMSIG(status);
    return -1;
}

}  // namespace

ShellPipe::ShellPipe(const std::vector<std::string>& args) {
    if (args.empty()) {
        throw std::invalid_argument("ShellPipe: Empty argument list");
    }

    std::vector<std::string> args_copy = args;
    std::vector<char*> c_args;
    c_args.reserve(args_copy.size() + 1);

    for (auto& arg : args_copy) {
        c_args.push_back(arg.data());
    }
    c_args.push_back(nullptr);

    Pipe pipe = make_pipe();

    pid_t pid = ::fork();
    if (pid == -1) {
        throw std::system_error(errno, std::generic_category(), "Failed to fork process");
    }

    if (pid == 0) {
        if (::dup2(pipe.write_end.get(), STDOUT_FILENO) == -1) ::_exit(errno);
        if (::dup2(pipe.write_end.get(), STDERR_FILENO) == -1) ::_exit(errno);

        int devnull = ::open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            ::dup2(devnull, STDIN_FILENO);
            ::close(devnull);
        }

        ::execvp(c_args[0], c_args.data());

        const char* msg = "Failed to execute binary\n";
        [[maybe_unused]] auto val = ::write(STDOUT_FILENO, msg, std::strlen(msg));

        ::_exit(127);
    }

    pipe.write_end.reset();
    read_fd_ = std::move(pipe.read_end);
    pid_ = pid;
}

void ShellPipe::terminate() noexcept {
    if (pid_ == -1)
        return;

    int status;
    if (::waitpid(pid_, &status, WNOHANG) == pid_) {
        pid_ = -1;
        return;
    }

    ::kill(pid_, SIGTERM);

    bool reaped = false;
    FileDescriptor pidfd(pidfd_open(pid_, 0));

    if (pidfd) {
        struct pollfd pfd_struct;
        pfd_struct.fd = pidfd.get();
        pfd_struct.events = POLLIN;

        int ret = ::poll(&pfd_struct, 1, 1000);
        pidfd.reset();

        if (ret > 0) {
            ::waitpid(pid_, &status, 0);
            reaped = true;
        }
    }

    if (!reaped) {
        for (int i = 0; i < 5; ++i) {
            if (::waitpid(pid_, &status, WNOHANG) == pid_) {
                reaped = true;
                break;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }

        if (!reaped) {
            ::kill(pid_, SIGKILL);
            ::waitpid(pid_, nullptr, 0);
        }
    }
    pid_ = -1;
}

ShellPipe::~ShellPipe() {
    read_fd_.reset();
    terminate();
}

std::string ShellPipe::read_all(std::chrono::milliseconds timeout,
                                std::stop_token stop,
                                std::size_t max_output) {
    std::string output;
    std::array<char, 4096> buffer;
    const auto deadline = std::chrono::steady_clock::now() + timeout;

    while (read_fd_) {
        if (g_interrupted || stop.stop_requested()) {
            timed_out_ = true;
            break;
        }

        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            timed_out_ = true;
            break;
        }

        struct pollfd pfd{};
        pfd.fd = read_fd_.get();
        pfd.events = POLLIN;

        int slice = static_cast<int>(std::min<long long>(remaining.count(), 100));
        int ret = ::poll(&pfd, 1, slice);
        if (ret == 0)
            continue;
        if (ret < 0) {
            if (errno == EINTR)
                continue;
            throw std::system_error(errno, std::generic_category(), "Failed to poll pipe");
        }

        ssize_t bytes_read = ::read(read_fd_.get(), buffer.data(), buffer.size());

        if (bytes_read > 0) {
            if (output.size() + static_cast<std::size_t>(bytes_read) > max_output) {
                output += "\n[Output truncated (too large)]";
                break;
            }
            output.append(buffer.data(), static_cast<std::size_t>(bytes_read));
        } else if (bytes_read == 0) {
            break;
        } else {
            if (errno == EINTR)
                continue;
            throw std::system_error(errno, std::generic_category(), "Failed to read from pipe");
        }
    }

    read_fd_.reset();
    if (timed_out_) {
        terminate();
    }
    return output;
}

int ShellPipe::wait() {
    if (pid_ == -1)
        return timed_out_ ? 128 + SIGTERM : -1;

    int status = 0;
    pid_t ret;
    do {
        ret = ::waitpid(pid_, &status, 0);
    } while (ret == -1 && errno == EINTR);

    if (ret == -1) {
        throw std::system_error(errno, std::generic_category(), "Failed to wait for child");
    }
    pid_ = -1;
    return decode_status(status);
}

}  // namespace vantage::os
