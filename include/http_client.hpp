/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#pragma once

#include <cstddef>
#include <expected>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>

#include "config.hpp"

typedef void CURL;

namespace vantage::net {

struct FetchOptions {
    std::size_t max_bytes = Config::MIRROR_PAYLOAD_BYTES;
    // "host:port:address" entry that bypasses the system resolver.
    std::optional<std::string> pinned_address;
    long timeout_ms = Config::HTTP_TIMEOUT_MS;
    long connect_timeout_ms = Config::HTTP_CONNECT_TIMEOUT_MS;
};

struct TransferStats {
    std::size_t bytes = 0;
    long http_code = 0;
    // Name lookup + TCP connect (+ TLS handshake for https), milliseconds.
    double connect_ms = 0.0;
    double total_seconds = 0.0;
    bool capped = false;

    [[nodiscard]] double throughput_mbps() const noexcept;
};

// One curl easy handle; not shareable between threads.
class HttpClient {
   public:
    HttpClient();
    ~HttpClient() = default;

    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    // Downloads at most `options.max_bytes` from `url`, discarding the body.
    std::expected<TransferStats, std::string> fetch_bounded(const std::string& url,
                                                            const FetchOptions& options,
                                                            std::stop_token stop = {});

   private:
    std::unique_ptr<CURL, void (*)(CURL*)> handle_;
};

}  // namespace vantage::net
