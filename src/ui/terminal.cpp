/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#include "include/terminal.hpp"

#include <array>
#include <cerrno>
#include <cstdio>
#include <system_error>

#include <poll.h>
#include <unistd.h>

#include "include/utils.hpp"

namespace vantage::ui {

namespace {

constexpr std::string_view kEnterAltScreen = "\033[?1049h\033[?25l";
constexpr std::string_view kLeaveAltScreen = "\033[?25h\033[?1049l";

void write_all(std::string_view data) noexcept {
    while (!data.empty()) {
        ssize_t n = ::write(STDOUT_FILENO, data.data(), data.size());
        if (n < 0) {
            if (errno == EINTR)
                continue;
            return;
        }
        data.remove_prefix(static_cast<std::size_t>(n));
    }
}

}  // namespace

std::optional<Key> decode_key(std::string_view bytes) noexcept {
    if (bytes.empty())
        return std::nullopt;

    const auto c = static_cast<unsigned char>(bytes.front());
    switch (c) {
        case '\r':
        case '\n':
            return Key{KeyCode::Enter};
        case 0x7f:
        case 0x08:
            return Key{KeyCode::Backspace};
        case '\t':
            return Key{KeyCode::Tab};
        case 0x03:
            return Key{KeyCode::CtrlC};
        case 0x04:
            return Key{KeyCode::CtrlD};
        case 0x1b:
            break;
        default:
            if (c >= 0x20 && c < 0x7f)
                return Key{KeyCode::Char, static_cast<char>(c)};
            return std::nullopt;
    }

    if (bytes.size() == 1)
        return Key{KeyCode::Escape};

    if (bytes.size() >= 3 && (bytes[1] == '[' || bytes[1] == 'O')) {
        switch (bytes[2]) {
            case 'A':
                return Key{KeyCode::Up};
            case 'B':
                return Key{KeyCode::Down};
            case 'C':
                return Key{KeyCode::Right};
            case 'D':
                return Key{KeyCode::Left};
            default:
                break;
        }
    }
    return std::nullopt;
}

Terminal::Terminal() : saved_level_(Log::threshold().load()) {
    if (!::isatty(STDIN_FILENO) || !::isatty(STDOUT_FILENO)) {
        throw std::system_error(ENOTTY, std::generic_category(), "Interactive mode needs a terminal (try --batch)");
    }
    if (::tcgetattr(STDIN_FILENO, &original_) != 0) {
        throw std::system_error(errno, std::generic_category(), "tcgetattr failed");
    }

    termios raw = original_;
    raw.c_iflag &= ~static_cast<tcflag_t>(BRKINT | ICRNL | INPCK | ISTRIP | IXON);
    raw.c_lflag &= ~static_cast<tcflag_t>(ECHO | ICANON | IEXTEN | ISIG);
    raw.c_cflag |= CS8;
    raw.c_cc[VMIN] = 0;
    raw.c_cc[VTIME] = 0;

    if (::tcsetattr(STDIN_FILENO, TCSAFLUSH, &raw) != 0) {
        throw std::system_error(errno, std::generic_category(), "tcsetattr failed");
    }

    if (saved_level_ < Log::Level::Warn)
        Log::set_level(Log::Level::Warn);

    std::fflush(stdout);
    write_all(kEnterAltScreen);
}

Terminal::~Terminal() {
    write_all(kLeaveAltScreen);
    ::tcsetattr(STDIN_FILENO, TCSAFLUSH, &original_);
    Log::set_level(saved_level_);
}

std::optional<Key> Terminal::read_key(std::chrono::milliseconds timeout) {
    pollfd pfd{STDIN_FILENO, POLLIN, 0};
    int ready = ::poll(&pfd, 1, static_cast<int>(timeout.count()));
    if (ready <= 0 || !(pfd.revents & POLLIN))
        return std::nullopt;

    std::array<char, 16> buf{};
    ssize_t n = ::read(STDIN_FILENO, buf.data(), buf.size());
    if (n <= 0)
        return std::nullopt;
    return decode_key(std::string_view(buf.data(), static_cast<std::size_t>(n)));
}

void Terminal::draw(std::string_view frame) {
    std::string out;
    out.reserve(frame.size() + 8);
    out += "\033[H\033[2J";
    out += frame;
    write_all(out);
}

std::size_t Terminal::width() const {
    return get_term_width();
}

}  // namespace vantage::ui
