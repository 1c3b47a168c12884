//
// Created by Sanger Steel on 5/7/25.
//

#pragma once
#include <chrono>
#include <optional>
#include <string>
#include <curl/curl.h>
#include "transport.hpp"

// TODO: libcurl with curl_easy_perform costs one thread per in-flight
//       request; a curl_multi event loop would let very high concurrency
//       levels run without a thread each
class CURLHandler final : public RequestTransportStrategy {
public:
    std::string uri;

    explicit CURLHandler(
        const std::string& uri,
        const std::string& api_key = "",
        std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    ~CURLHandler() override;

    CURLHandler(const CURLHandler&) = delete;
    CURLHandler& operator=(const CURLHandler&) = delete;

    std::optional<std::chrono::milliseconds> timeout;

    TransportResponse send(const RequestParameters& req, const CancellationToken& token) override;

    TransportResponse probe() override;

    const std::string& endpoint() const override {
        return uri;
    }

private:
    TransportResponse perform(CURL* handle, std::string& response_body, const CancellationToken* token);

    std::string api_key;
    curl_slist* headers = nullptr;
};

TransportStatus transport_status_from_curl(CURLcode code);
