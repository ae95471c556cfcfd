/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#pragma once

#include <atomic>
#include <csignal>

extern std::atomic<bool> g_interrupted;

void signal_handler(int) noexcept;
void reset_interrupted() noexcept;

// Routes SIGINT/SIGTERM to g_interrupted and ignores SIGPIPE for its
// lifetime; the previous dispositions are restored on destruction.
class SignalGuard {
    struct sigaction old_int_ = {};
    struct sigaction old_term_ = {};
    struct sigaction old_pipe_ = {};

   public:
    SignalGuard();
    ~SignalGuard();

    SignalGuard(const SignalGuard&) = delete;
    SignalGuard& operator=(const SignalGuard&) = delete;
};
