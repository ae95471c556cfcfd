/*
 * Copyright (c) 2025 Alfie Ardinata
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
#include "include/dns_resolver.hpp"

#include <algorithm>
#include <array>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <format>
#include <optional>
#include <stdexcept>
#include <utility>

#include <arpa/inet.h>
#include <ares.h>
#include <netdb.h>
#include <netinet/in.h>
#include <poll.h>

#include "include/interrupts.hpp"
#include "include/target.hpp"

namespace vantage::net {

namespace {

struct LookupState {
    bool done = false;
    int status = ARES_SUCCESS;
    std::vector<std::string> addresses;
};

void on_addrinfo(void* arg, int status, int /*timeouts*/, struct ares_addrinfo* result) {
    auto* state = static_cast<LookupState*>(arg);
    state->done = true;
    state->status = status;

    if (status == ARES_SUCCESS && result) {
        for (auto* node = result->nodes; node; node = node->ai_next) {
            std::array<char, INET6_ADDRSTRLEN> buf{};
            const void* src = nullptr;
            if (node->ai_family == AF_INET) {
                src = &reinterpret_cast<const sockaddr_in*>(node->ai_addr)->sin_addr;
            } else if (node->ai_family == AF_INET6) {
                src = &reinterpret_cast<const sockaddr_in6*>(node->ai_addr)->sin6_addr;
            }
            if (src && ::inet_ntop(node->ai_family, src, buf.data(), buf.size())) {
                state->addresses.emplace_back(buf.data());
            }
        }
    }
    if (result) {
        ares_freeaddrinfo(result);
    }
}

}  // namespace

// RAII holder for an ares_channel.
struct DnsResolver::Channel {
    ares_channel handle = nullptr;

    Channel(const std::string& nameserver, const ResolverOptions& options) {
        struct ares_options opts{};
        opts.timeout = static_cast<int>(options.timeout_ms);
        opts.tries = options.tries;
        opts.flags = ARES_FLAG_NOSEARCH | ARES_FLAG_NOALIASES;
        char lookups[] = "b";
        opts.lookups = lookups;
        int mask = ARES_OPT_TIMEOUTMS | ARES_OPT_TRIES | ARES_OPT_FLAGS | ARES_OPT_LOOKUPS;

        if (int rc = ares_init_options(&handle, &opts, mask); rc != ARES_SUCCESS) {
            throw std::runtime_error(std::format("c-ares init failed: {}", ares_strerror(rc)));
        }

        if (int rc = ares_set_servers_csv(handle, nameserver.c_str()); rc != ARES_SUCCESS) {
            ares_destroy(handle);
            throw std::runtime_error(std::format("Invalid nameserver {}: {}", nameserver, ares_strerror(rc)));
        }
    }

    ~Channel() {
        if (handle)
            ares_destroy(handle);
    }

    Channel(const Channel&) = delete;
    Channel& operator=(const Channel&) = delete;
};

DnsResolver::DnsResolver(std::string nameserver, ResolverOptions options)
    : nameserver_(std::move(nameserver)), options_(options) {}

std::expected<Resolution, std::string> DnsResolver::resolve(std::string_view host, std::stop_token stop) {
    std::string server = nameserver_;
    if (core::is_ipv6_address(server)) {
        server = std::format("[{}]:53", nameserver_);
    }

    std::optional<Channel> channel;
    try {
        channel.emplace(server, options_);
    } catch (const std::exception& e) {
        return std::unexpected(e.what());
    }

    LookupState state;
    struct ares_addrinfo_hints hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_flags = ARES_AI_NOSORT;

    std::string name(host);
    const auto started = std::chrono::steady_clock::now();
    ares_getaddrinfo(channel->handle, name.c_str(), nullptr, &hints, on_addrinfo, &state);

    while (!state.done) {
        if (g_interrupted || stop.stop_requested()) {
            ares_cancel(channel->handle);
            break;
        }

        std::array<ares_socket_t, ARES_GETSOCK_MAXNUM> socks{};
        int bitmask = ares_getsock(channel->handle, socks.data(), static_cast<int>(socks.size()));

        std::vector<pollfd> fds;
        for (int i = 0; i < ARES_GETSOCK_MAXNUM; ++i) {
            short events = 0;
            if (ARES_GETSOCK_READABLE(bitmask, i)) events |= POLLIN;
            if (ARES_GETSOCK_WRITABLE(bitmask, i)) events |= POLLOUT;
            if (events)
                fds.push_back(pollfd{socks[static_cast<std::size_t>(i)], events, 0});
        }

        struct timeval max_wait{0, Config::RESOLVER_POLL_MS * 1000};
        struct timeval tv{};
        struct timeval* next = ares_timeout(channel->handle, &max_wait, &tv);
        int wait_ms = static_cast<int>(next->tv_sec * 1000 + next->tv_usec / 1000);

        int ready = ::poll(fds.data(), fds.size(), std::max(wait_ms, 1));
        if (ready < 0 && errno != EINTR) {
            ares_cancel(channel->handle);
            return std::unexpected(std::format("poll failed: {}", std::strerror(errno)));
        }

        if (ready <= 0) {
            ares_process_fd(channel->handle, ARES_SOCKET_BAD, ARES_SOCKET_BAD);
            continue;
        }

        for (const auto& p : fds) {
            ares_socket_t rfd = (p.revents & (POLLIN | POLLERR | POLLHUP)) ? p.fd : ARES_SOCKET_BAD;
            ares_socket_t wfd = (p.revents & POLLOUT) ? p.fd : ARES_SOCKET_BAD;
            if (rfd != ARES_SOCKET_BAD || wfd != ARES_SOCKET_BAD)
                ares_process_fd(channel->handle, rfd, wfd);
        }
    }

    Resolution out;
    out.elapsed = std::chrono::steady_clock::now() - started;

    if (state.status == ARES_ECANCELLED || !state.done) {
        return std::unexpected("Lookup cancelled");
    }
    if (state.status != ARES_SUCCESS) {
        return std::unexpected(std::format("Failed to resolve {} via {}: {}", host, nameserver_,
                                           ares_strerror(state.status)));
    }
    if (state.addresses.empty()) {
        return std::unexpected(std::format("{} returned no addresses for {}", nameserver_, host));
    }

    out.addresses = std::move(state.addresses);
    return out;
}

}  // namespace vantage::net
