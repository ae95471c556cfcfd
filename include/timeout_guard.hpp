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
#include <expected>
#include <functional>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>

#include "results.hpp"

namespace vantage::core {

using ProbeOutcome = std::expected<Measurement, std::string>;
using ProbeTask = std::function<ProbeOutcome(std::stop_token)>;

// Races one probe against a hard deadline. The probe runs on its own thread;
// when the deadline wins, the thread is asked to stop and parked until it
// unwinds, while the caller gets control back immediately.
class TimeoutGuard {
    struct Slot;

    struct Straggler {
        std::jthread thread;
        std::shared_ptr<Slot> slot;
    };

    std::chrono::milliseconds deadline_;
    std::vector<Straggler> stragglers_;

    void reap_finished();

   public:
    explicit TimeoutGuard(std::chrono::milliseconds deadline);
    ~TimeoutGuard();

    TimeoutGuard(const TimeoutGuard&) = delete;
    TimeoutGuard& operator=(const TimeoutGuard&) = delete;

    // std::nullopt means the deadline elapsed first; any partial data from the
    // probe is dropped.
    [[nodiscard]] std::optional<ProbeOutcome> run(ProbeTask task);

    [[nodiscard]] std::chrono::milliseconds deadline() const noexcept { return deadline_; }
    [[nodiscard]] std::size_t straggler_count() const noexcept { return stragglers_.size(); }
};

}  // namespace vantage::core
