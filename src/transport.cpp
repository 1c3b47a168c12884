//
// Created by Sanger Steel on 6/14/25.
//

#include "transport.hpp"

const char* transport_status_as_str(TransportStatus status) {
    switch (status) {
        case TransportStatus::OK: return "OK";
        case TransportStatus::TIMED_OUT: return "TIMED_OUT";
        case TransportStatus::CANCELLED: return "CANCELLED";
        case TransportStatus::FAILED: return "FAILED";
        default: return "INVALID";
    }
}
