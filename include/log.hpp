/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#pragma once

#include <atomic>
#include <cstdio>
#include <format>
#include <mutex>
#include <print>
#include <string_view>

#include "color.hpp"

namespace Log {

enum class Level { Debug = 0, Info, Warn, Error, Off };

inline std::atomic<Level>& threshold() {
    static std::atomic<Level> level{Level::Info};
    return level;
}

inline void set_level(Level level) noexcept {
    threshold().store(level, std::memory_order_relaxed);
}

[[nodiscard]] inline bool enabled(Level level) noexcept {
    return level >= threshold().load(std::memory_order_relaxed);
}

inline void write(Level level, std::string_view msg) {
    if (!enabled(level))
        return;

    static std::mutex mutex;
    std::string_view tag = "debug";
    std::string_view color = Color::CYAN;
    switch (level) {
        case Level::Debug: break;
        case Level::Info: tag = "info"; color = Color::GREEN; break;
        case Level::Warn: tag = "warn"; color = Color::YELLOW; break;
        case Level::Error: tag = "error"; color = Color::RED; break;
        case Level::Off: return;
    }

    std::lock_guard lock(mutex);
    std::println(stderr, "{}[{}]{} {}", color, tag, Color::RESET, msg);
}

template <typename... Args>
void debug(std::format_string<Args...> fmt, Args&&... args) {
    if (enabled(Level::Debug))
        write(Level::Debug, std::format(fmt, std::forward<Args>(args)...));
}

template <typename... Args>
void info(std::format_string<Args...> fmt, Args&&... args) {
    if (enabled(Level::Info))
        write(Level::Info, std::format(fmt, std::forward<Args>(args)...));
}

template <typename... Args>
void warn(std::format_string<Args...> fmt, Args&&... args) {
    if (enabled(Level::Warn))
        write(Level::Warn, std::format(fmt, std::forward<Args>(args)...));
}

template <typename... Args>
void error(std::format_string<Args...> fmt, Args&&... args) {
    if (enabled(Level::Error))
        write(Level::Error, std::format(fmt, std::forward<Args>(args)...));
}

}  // namespace Log
