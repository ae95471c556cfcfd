/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#pragma once

#include <cerrno>
#include <stdexcept>
#include <system_error>
#include <utility>

#include <fcntl.h>
#include <unistd.h>

namespace vantage::os {

// Owning wrapper for a pipe end or pidfd. Closed on destruction.
class FileDescriptor {
    int fd_ = -1;

   public:
    FileDescriptor() = default;

    explicit FileDescriptor(int fd) noexcept : fd_(fd) {}

    ~FileDescriptor() noexcept {
        reset();
    }

    FileDescriptor(FileDescriptor&& other) noexcept : fd_(std::exchange(other.fd_, -1)) {}

    FileDescriptor& operator=(FileDescriptor&& other) noexcept {
        if (this != &other) {
            reset(std::exchange(other.fd_, -1));
        }
        return *this;
    }

    FileDescriptor(const FileDescriptor&) = delete;
    FileDescriptor& operator=(const FileDescriptor&) = delete;

    void reset(int new_fd = -1) noexcept {
        if (fd_ >= 0) {
            ::close(fd_);
        }
        fd_ = new_fd;
    }

    [[nodiscard]] int get() const {
        if (fd_ < 0) [[unlikely]] {
            throw std::logic_error("Accessing a closed file descriptor");
        }
        return fd_;
    }

    explicit operator bool() const noexcept {
        return fd_ >= 0;
    }
};

struct Pipe {
    FileDescriptor read_end;
    FileDescriptor write_end;
};

// Both ends are close-on-exec; the child dup2()s the write end onto its
// stdout/stderr, which clears the flag on the copies only. pipe2() is
// Linux-only, hence pipe() + fcntl.
inline Pipe make_pipe() {
    int fds[2];
    if (::pipe(fds) == -1) {
        throw std::system_error(errno, std::generic_category(), "Failed to create pipe");
    }
    Pipe pipe{FileDescriptor(fds[0]), FileDescriptor(fds[1])};

    for (int fd : fds) {
        if (::fcntl(fd, F_SETFD, FD_CLOEXEC) == -1) {
            throw std::system_error(errno, std::generic_category(), "Failed to set FD_CLOEXEC");
        }
    }
    return pipe;
}

}  // namespace vantage::os
