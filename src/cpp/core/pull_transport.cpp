#include "steward/pull_transport.h"

namespace steward {

std::string transport_status_to_string(TransportStatus status) {
    switch (status) {
        case TransportStatus::Completed: return "completed";
        case TransportStatus::TransportError: return "transport_error";
        case TransportStatus::StallTimeout: return "stall_timeout";
        case TransportStatus::Cancelled: return "cancelled";
    }
    return "unknown";
}

} // namespace steward
