/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#pragma once

#include <expected>
#include <stop_token>
#include <string>

#include "results.hpp"
#include "target.hpp"

namespace vantage::core {

// Runs the latency + throughput sequence for one target. Implementations are
// called from a fresh thread per target and must be safe to call
// concurrently with an abandoned earlier call.
class Prober {
   public:
    virtual ~Prober() = default;

    virtual std::expected<Measurement, std::string> probe(const Target& target,
                                                          std::stop_token stop) = 0;
};

}  // namespace vantage::core
