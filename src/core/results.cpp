// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at https://mozilla.org/MPL/2.0/.
// Copyright (c) 2025 Alfie Ardinata.

#include "include/results.hpp"

namespace vantage::core {

std::string_view to_string(ProbeStatus status) noexcept {
    switch (status) {
        case ProbeStatus::Pending:
            return "Pending";
        case ProbeStatus::Success:
            return "Success";
        case ProbeStatus::Timeout:
            return "Timeout";
        case ProbeStatus::Failed:
            return "Failed";
    }
    return "Unknown";
}

std::string_view to_string(RunStatus status) noexcept {
    switch (status) {
        case RunStatus::Idle:
            return "Idle";
        case RunStatus::Running:
            return "Running";
        case RunStatus::Cancelled:
            return "Cancelled";
        case RunStatus::Completed:
            return "Completed";
    }
    return "Unknown";
}

}  // namespace vantage::core
