//
// Created by Sanger Steel on 6/14/25.
//

#pragma once
#include <memory>
#include <string>
#include "cancellation.hpp"
#include "latency_metrics.hpp"
#include "request_parameters.hpp"

enum class TransportStatus {
    OK,          // a response arrived, whatever its HTTP status
    TIMED_OUT,   // the per-request deadline expired
    CANCELLED,   // the caller's token was cancelled mid-transfer
    FAILED,      // connection, DNS, TLS or any other transfer failure
};

const char* transport_status_as_str(TransportStatus status);

struct TransportResponse {
    TransportStatus status = TransportStatus::FAILED;
    long http_status = 0;
    std::string body;
    std::string error_message;
    LatencyMetrics latencies;

    bool http_success() const {
        return status == TransportStatus::OK && http_status >= 200 && http_status < 300;
    }
};

// One blocking request per call. Implementations must honor the token and
// their own per-request timeout, and must not throw for transfer failures.
class RequestTransportStrategy {
public:
    virtual ~RequestTransportStrategy() = default;

    virtual TransportResponse send(const RequestParameters& req, const CancellationToken& token) = 0;

    // Pre-flight reachability check. Any HTTP response counts as reachable.
    virtual TransportResponse probe() = 0;

    virtual const std::string& endpoint() const = 0;
};

using SharedClient = std::shared_ptr<RequestTransportStrategy>;
