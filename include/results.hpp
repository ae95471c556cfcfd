// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at https://mozilla.org/MPL/2.0/.
// Copyright (c) 2025 Alfie Ardinata.

#pragma once

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

#include "target.hpp"

namespace vantage::core {

using Milliseconds = std::chrono::duration<double, std::milli>;

enum class ProbeStatus { Pending, Success, Timeout, Failed };

enum class RunStatus { Idle, Running, Cancelled, Completed };

// What a probe reports when both of its steps finish.
struct Measurement {
    Milliseconds latency{};
    double throughput_mbps = 0.0;
};

struct ProbeResult {
    std::size_t index = 0;
    Target target;
    std::optional<Milliseconds> latency;
    std::optional<double> throughput_mbps;
    ProbeStatus status = ProbeStatus::Pending;
    std::string reason;
    std::chrono::system_clock::time_point completed_at{};
    // Wall time spent on this target, including the guard's wait.
    Milliseconds elapsed{};

    [[nodiscard]] bool is_terminal() const noexcept { return status != ProbeStatus::Pending; }
    [[nodiscard]] bool is_success() const noexcept { return status == ProbeStatus::Success; }
};

[[nodiscard]] std::string_view to_string(ProbeStatus status) noexcept;
[[nodiscard]] std::string_view to_string(RunStatus status) noexcept;

}  // namespace vantage::core
