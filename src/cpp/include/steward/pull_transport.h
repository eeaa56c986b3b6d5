#pragma once

#include <chrono>
#include <functional>
#include <string>
#include "cancellation.h"
#include "transfer_types.h"

namespace steward {

// Default idle window before a pull stream is declared stalled
inline constexpr std::chrono::milliseconds DEFAULT_STALL_TIMEOUT{30000};

enum class TransportStatus {
    Completed,        // Stream ended without an error record
    TransportError,   // Connection failure, HTTP error or error record (retryable)
    StallTimeout,     // No record within the stall window (retryable)
    Cancelled         // Cancellation token fired (never retried)
};

std::string transport_status_to_string(TransportStatus status);

struct TransportResult {
    TransportStatus status = TransportStatus::Completed;
    std::string reason;        // Human readable cause for the non-Completed outcomes
    size_t records = 0;        // Records delivered to the callback

    bool ok() const { return status == TransportStatus::Completed; }
    bool retryable() const {
        return status == TransportStatus::TransportError || status == TransportStatus::StallTimeout;
    }

    static TransportResult completed(size_t records) {
        return {TransportStatus::Completed, "", records};
    }
    static TransportResult error(const std::string& reason, size_t records = 0) {
        return {TransportStatus::TransportError, reason, records};
    }
    static TransportResult stalled(std::chrono::milliseconds timeout, size_t records = 0) {
        return {TransportStatus::StallTimeout,
                "Download stalled (no progress for " + std::to_string(timeout.count()) + " ms)",
                records};
    }
    static TransportResult cancelled(size_t records = 0) {
        return {TransportStatus::Cancelled, "Download cancelled", records};
    }
};

using ProgressRecordCallback = std::function<void(const ProgressRecord&)>;

// One streaming pull request per call. Records are delivered to `on_record` in
// arrival order on the calling thread; an error record is not delivered, it
// ends the stream with TransportError. Not restartable: each retry is a new call.
class IPullTransport {
public:
    virtual ~IPullTransport() = default;

    virtual TransportResult pull(const std::string& model_id,
                                 CancellationToken& cancel_token,
                                 std::chrono::milliseconds stall_timeout,
                                 const ProgressRecordCallback& on_record) = 0;
};

} // namespace steward
