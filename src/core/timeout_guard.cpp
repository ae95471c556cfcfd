/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#include "include/timeout_guard.hpp"

#include <condition_variable>
#include <exception>
#include <format>
#include <mutex>
#include <utility>

#include "include/log.hpp"

namespace vantage::core {

struct TimeoutGuard::Slot {
    std::mutex mutex;
    std::condition_variable done_cv;
    bool done = false;
    std::optional<ProbeOutcome> outcome;
};

TimeoutGuard::TimeoutGuard(std::chrono::milliseconds deadline) : deadline_(deadline) {}

TimeoutGuard::~TimeoutGuard() {
    if (!stragglers_.empty()) {
        Log::debug("Waiting for {} abandoned probe(s) to unwind", stragglers_.size());
    }
    // jthread requests stop and joins on destruction.
    stragglers_.clear();
}

void TimeoutGuard::reap_finished() {
    std::erase_if(stragglers_, [](const Straggler& s) {
        std::lock_guard lock(s.slot->mutex);
        return s.slot->done;
    });
}

std::optional<ProbeOutcome> TimeoutGuard::run(ProbeTask task) {
    reap_finished();

    auto slot = std::make_shared<Slot>();
    const auto expires_at = std::chrono::steady_clock::now() + deadline_;

    std::jthread thread([slot, task = std::move(task)](std::stop_token stop) {
        ProbeOutcome outcome;
        try {
            outcome = task(stop);
        } catch (const std::exception& e) {
            outcome = std::unexpected(std::format("Probe error: {}", e.what()));
        }

        {
            std::lock_guard lock(slot->mutex);
            slot->outcome = std::move(outcome);
            slot->done = true;
        }
        slot->done_cv.notify_all();
    });

    std::unique_lock lock(slot->mutex);
    bool finished = slot->done_cv.wait_until(lock, expires_at, [&] { return slot->done; });

    if (finished) {
        auto outcome = std::move(slot->outcome);
        lock.unlock();
        thread.join();
        return outcome;
    }

    lock.unlock();
    thread.request_stop();
    stragglers_.push_back(Straggler{std::move(thread), std::move(slot)});
    return std::nullopt;
}

}  // namespace vantage::core
