#include "include/http_client.hpp"
#include "include/interrupts.hpp"
#include "include/config.hpp"

#include <format>
#include <stdexcept>

#include <curl/curl.h>

namespace vantage::net {

namespace {

const std::string kUserAgent = std::format("{}/{}", Config::APP_NAME, Config::APP_VERSION);

struct SinkState {
    std::size_t received = 0;
    std::size_t limit = 0;
    bool capped = false;
};

size_t write_capped(void* /*ptr*/, size_t size, size_t nmemb, SinkState* state) noexcept {
    size_t total_size = size * nmemb;
    state->received += total_size;
    if (state->received >= state->limit) {
        state->capped = true;
        // Returning short makes curl abort with CURLE_WRITE_ERROR.
        return 0;
    }
    return total_size;
}

int on_progress(void* clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) noexcept {
    auto* stop = static_cast<std::stop_token*>(clientp);
    return (g_interrupted || (stop && stop->stop_requested())) ? 1 : 0;
}

}  // namespace

double TransferStats::throughput_mbps() const noexcept {
    if (total_seconds <= 0.0)
        return 0.0;
    return (static_cast<double>(bytes) * 8.0) / (total_seconds * 1'000'000.0);
}

HttpClient::HttpClient() : handle_(curl_easy_init(), curl_easy_cleanup) {
    if (!handle_) throw std::runtime_error("Failed to create curl handle");
}

std::expected<TransferStats, std::string> HttpClient::fetch_bounded(const std::string& url,
                                                                    const FetchOptions& options,
                                                                    std::stop_token stop) {
    CURL* h = handle_.get();
    curl_easy_reset(h);

    SinkState sink;
    sink.limit = options.max_bytes;

    std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)> resolve_list(nullptr, curl_slist_free_all);
    if (options.pinned_address) {
        resolve_list.reset(curl_slist_append(nullptr, options.pinned_address->c_str()));
        if (!resolve_list) {
            return std::unexpected("Failed to build resolve override");
        }
        curl_easy_setopt(h, CURLOPT_RESOLVE, resolve_list.get());
    }

    curl_easy_setopt(h, CURLOPT_URL, url.c_str());
    curl_easy_setopt(h, CURLOPT_USERAGENT, kUserAgent.c_str());
    curl_easy_setopt(h, CURLOPT_WRITEFUNCTION, write_capped);
    curl_easy_setopt(h, CURLOPT_WRITEDATA, &sink);

    curl_easy_setopt(h, CURLOPT_TIMEOUT_MS, options.timeout_ms);
    curl_easy_setopt(h, CURLOPT_CONNECTTIMEOUT_MS, options.connect_timeout_ms);
    curl_easy_setopt(h, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(h, CURLOPT_MAXREDIRS, 5L);
    curl_easy_setopt(h, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(h, CURLOPT_FORBID_REUSE, 1L);
    curl_easy_setopt(h, CURLOPT_ACCEPT_ENCODING, "identity");

    curl_easy_setopt(h, CURLOPT_XFERINFOFUNCTION, on_progress);
    curl_easy_setopt(h, CURLOPT_XFERINFODATA, &stop);
    curl_easy_setopt(h, CURLOPT_NOPROGRESS, 0L);

    CURLcode res = curl_easy_perform(h);

    if (res == CURLE_ABORTED_BY_CALLBACK) {
        return std::unexpected("Transfer cancelled");
    }
    if (res != CURLE_OK && !(res == CURLE_WRITE_ERROR && sink.capped)) {
        return std::unexpected(std::format("Network error: {}", curl_easy_strerror(res)));
    }

    TransferStats stats;
    stats.capped = sink.capped;
    stats.bytes = sink.received;

    curl_easy_getinfo(h, CURLINFO_RESPONSE_CODE, &stats.http_code);
    if (stats.http_code >= 400) {
        return std::unexpected(std::format("HTTP {}", stats.http_code));
    }

    curl_off_t connect_us = 0;
    curl_off_t appconnect_us = 0;
    curl_off_t total_us = 0;
    curl_easy_getinfo(h, CURLINFO_CONNECT_TIME_T, &connect_us);
    curl_easy_getinfo(h, CURLINFO_APPCONNECT_TIME_T, &appconnect_us);
    curl_easy_getinfo(h, CURLINFO_TOTAL_TIME_T, &total_us);

    stats.connect_ms = static_cast<double>(appconnect_us > 0 ? appconnect_us : connect_us) / 1000.0;
    stats.total_seconds = static_cast<double>(total_us) / 1'000'000.0;

    if (stats.bytes == 0) {
        return std::unexpected("Empty response body");
    }
    return stats;
}

}  // namespace vantage::net
