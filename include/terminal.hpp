/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#pragma once

#include <chrono>
#include <cstddef>
#include <optional>
#include <string_view>

#include <termios.h>

#include "log.hpp"

namespace vantage::ui {

enum class KeyCode { Char, Enter, Backspace, Tab, Escape, Up, Down, Left, Right, CtrlC, CtrlD };

struct Key {
    KeyCode code = KeyCode::Char;
    char ch = 0;

    bool operator==(const Key&) const = default;
};

// Decodes the first key in a chunk read from the terminal. Unknown escape
// sequences yield std::nullopt.
[[nodiscard]] std::optional<Key> decode_key(std::string_view bytes) noexcept;

// Raw mode plus alternate screen for its lifetime. Throws std::system_error
// when stdin/stdout are not a terminal or the mode cannot be set.
class Terminal {
    termios original_{};
    Log::Level saved_level_;

   public:
    Terminal();
    ~Terminal();

    Terminal(const Terminal&) = delete;
    Terminal& operator=(const Terminal&) = delete;

    // Waits at most `timeout` for input.
    std::optional<Key> read_key(std::chrono::milliseconds timeout);

    // Replaces the screen contents with `frame`.
    void draw(std::string_view frame);

    [[nodiscard]] std::size_t width() const;
};

}  // namespace vantage::ui
