//
// Created by Sanger Steel on 5/20/25.
//

#pragma once
#include <chrono>

using steady = std::chrono::steady_clock;
using time_point = std::chrono::time_point<steady>;
using wall_time_point = std::chrono::system_clock::time_point;
using seconds_d = std::chrono::duration<double>;

inline double seconds_between(const time_point& start, const time_point& end) {
    return std::chrono::duration_cast<seconds_d>(end - start).count();
}

inline double seconds_since_epoch(const wall_time_point& t) {
    return std::chrono::duration_cast<seconds_d>(t.time_since_epoch()).count();
}

// Timings libcurl reports for a finished transfer, in seconds from the
// start of the transfer.
struct LatencyMetrics {
    double name_lookup = 0;
    double connect = 0;
    double tls_handshake = 0;
    double ttfb = 0;
    double total = 0;
};
