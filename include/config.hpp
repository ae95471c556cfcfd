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
#include <string_view>

namespace Config {
    constexpr std::string_view APP_NAME = "vantage";
    constexpr std::string_view APP_VERSION = "1.0.0";

    // Hard budget for one target's whole probe sequence.
    constexpr std::chrono::milliseconds PROBE_DEADLINE{7500};

    constexpr std::string_view DNS_TEST_DOMAIN = "www.google.com";
    constexpr std::string_view DNS_THROUGHPUT_URL = "https://speed.cloudflare.com/__down?bytes=1000000";
    constexpr long RESOLVER_TIMEOUT_MS = 2000;
    constexpr int RESOLVER_TRIES = 1;
    constexpr int RESOLVER_POLL_MS = 50;

    constexpr std::size_t MIRROR_PAYLOAD_BYTES = 1024 * 1024;
    constexpr std::size_t DNS_PAYLOAD_BYTES = 1000000;

    // Slightly under the probe deadline so curl reports its own error first.
    constexpr long HTTP_TIMEOUT_MS = 7000;
    constexpr long HTTP_CONNECT_TIMEOUT_MS = 5000;

    constexpr std::chrono::milliseconds COMMAND_TIMEOUT{15000};
    constexpr std::size_t COMMAND_MAX_OUTPUT = 1024 * 1024;

    constexpr std::chrono::milliseconds UI_FRAME_INTERVAL{100};
    constexpr int UI_SPINNER_DELAY_MS = 150;
    constexpr std::size_t TERM_WIDTH = 100;
    constexpr int UI_BAR_WIDTH = 30;
    constexpr std::size_t UI_MAX_REASON_LENGTH = 42;

    constexpr double THROUGHPUT_TIE_MBPS = 0.01;
}
