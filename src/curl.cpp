//
// Created by Sanger Steel on 5/7/25.
//

#include "curl.hpp"
#include <format>
#include <mutex>
#include <stdexcept>
#include "logger.hpp"

constexpr long probe_timeout_ms = 10'000;

static size_t write_cb_default(void* contents, size_t size, size_t nmemb, void* userp) {
    ((std::string *) userp)->append((char *) contents, size * nmemb);
    return size * nmemb;
}

// Non-zero aborts the transfer with CURLE_ABORTED_BY_CALLBACK
static int xferinfo_cb_cancel(void* clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    auto token = (const CancellationToken *) clientp;
    return (token && token->cancelled()) ? 1 : 0;
}

static void ensure_curl_global_init() {
    static std::once_flag init_flag;
    std::call_once(init_flag, [] {
        if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
            throw std::runtime_error("curl_global_init failed");
        }
    });
}

TransportStatus transport_status_from_curl(CURLcode code) {
    switch (code) {
        case CURLE_OK: return TransportStatus::OK;
        case CURLE_OPERATION_TIMEDOUT: return TransportStatus::TIMED_OUT;
        case CURLE_ABORTED_BY_CALLBACK: return TransportStatus::CANCELLED;
        default: return TransportStatus::FAILED;
    }
}

CURLHandler::CURLHandler(const std::string& uri, const std::string& api_key, std::optional<std::chrono::milliseconds> timeout)
    : uri(uri), timeout(timeout), api_key(api_key) {
    if (uri.empty()) {
        throw std::invalid_argument("No endpoint URL provided.");
    }
    ensure_curl_global_init();
    headers = curl_slist_append(headers, "Content-Type: application/json");
    if (!this->api_key.empty()) {
        std::string token_header = std::format("Authorization: Bearer {}", this->api_key);
        headers = curl_slist_append(headers, token_header.c_str());
    }
}

CURLHandler::~CURLHandler() {
    curl_slist_free_all(headers);
}

TransportResponse CURLHandler::perform(CURL* handle, std::string& response_body, const CancellationToken* token) {
    curl_easy_setopt(handle, CURLOPT_WRITEFUNCTION, write_cb_default);
    curl_easy_setopt(handle, CURLOPT_WRITEDATA, &response_body);
    // Signals don't mix with timeouts in a multithreaded process
    curl_easy_setopt(handle, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(handle, CURLOPT_XFERINFOFUNCTION, xferinfo_cb_cancel);
    curl_easy_setopt(handle, CURLOPT_XFERINFODATA, (void *) token);
    curl_easy_setopt(handle, CURLOPT_NOPROGRESS, 0L);
    if (Logger.level == DEBUG) {
        curl_easy_setopt(handle, CURLOPT_VERBOSE, 1L);
    }

    auto idx = Logger.set_start();
    auto res = curl_easy_perform(handle);
    Logger.set_stop_and_display_time(idx, "e2e from server");

    TransportResponse response;
    response.status = transport_status_from_curl(res);
    curl_easy_getinfo(handle, CURLINFO_RESPONSE_CODE, &response.http_status);
    curl_easy_getinfo(handle, CURLINFO_NAMELOOKUP_TIME, &response.latencies.name_lookup);
    curl_easy_getinfo(handle, CURLINFO_CONNECT_TIME, &response.latencies.connect);
    curl_easy_getinfo(handle, CURLINFO_APPCONNECT_TIME, &response.latencies.tls_handshake);
    curl_easy_getinfo(handle, CURLINFO_STARTTRANSFER_TIME, &response.latencies.ttfb);
    curl_easy_getinfo(handle, CURLINFO_TOTAL_TIME, &response.latencies.total);

    Logger.debug(std::format(
        "timing: DNS={}s, TCP={}s, SSL={}s, TTFB={}s, Total={}s",
        response.latencies.name_lookup,
        response.latencies.connect - response.latencies.name_lookup,
        response.latencies.tls_handshake - response.latencies.connect,
        response.latencies.ttfb, response.latencies.total
    ));

    if (res != CURLE_OK) {
        response.error_message = curl_easy_strerror(res);
    }
    return response;
}

TransportResponse CURLHandler::send(const RequestParameters& req, const CancellationToken& token) {
    CURL* ephemeral = curl_easy_init();
    if (!ephemeral) {
        TransportResponse failed;
        failed.error_message = "curl_easy_init failed";
        return failed;
    }
    auto post_data = req.to_json().dump();
    std::string response_body;

    curl_easy_setopt(ephemeral, CURLOPT_URL, uri.c_str());
    curl_easy_setopt(ephemeral, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(ephemeral, CURLOPT_POST, 1L);
    curl_easy_setopt(ephemeral, CURLOPT_POSTFIELDS, post_data.c_str());
    curl_easy_setopt(ephemeral, CURLOPT_POSTFIELDSIZE, (long) post_data.size());
    if (timeout.has_value()) {
        curl_easy_setopt(ephemeral, CURLOPT_TIMEOUT_MS, (long) timeout.value().count());
    }

    auto response = perform(ephemeral, response_body, &token);
    response.body = std::move(response_body);
    curl_easy_cleanup(ephemeral);
    return response;
}

TransportResponse CURLHandler::probe() {
    CURL* ephemeral = curl_easy_init();
    if (!ephemeral) {
        TransportResponse failed;
        failed.error_message = "curl_easy_init failed";
        return failed;
    }
    std::string response_body;
    long probe_timeout = probe_timeout_ms;
    if (timeout.has_value() && timeout.value().count() < probe_timeout) {
        probe_timeout = (long) timeout.value().count();
    }

    curl_easy_setopt(ephemeral, CURLOPT_URL, uri.c_str());
    curl_easy_setopt(ephemeral, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(ephemeral, CURLOPT_NOBODY, 1L);
    curl_easy_setopt(ephemeral, CURLOPT_TIMEOUT_MS, probe_timeout);

    auto response = perform(ephemeral, response_body, nullptr);
    response.body = std::move(response_body);
    curl_easy_cleanup(ephemeral);
    return response;
}
