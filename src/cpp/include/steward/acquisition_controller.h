#pragma once

#include <algorithm>
#include <chrono>
#include <functional>
#include <mutex>
#include <set>
#include <string>
#include <vector>
#include "cancellation.h"
#include "model_provider.h"
#include "model_registry.h"
#include "progress_aggregator.h"
#include "pull_transport.h"

namespace steward {

// Progress update for one decoded record (or a retry notice)
struct AcquisitionProgress {
    std::string model_id;
    std::string status;             // Wire status, or the retry notice text
    TransferPhase phase = TransferPhase::Pending;
    std::string layer_id;           // Empty for unlabeled records and notices
    uint64_t layer_completed = 0;
    uint64_t layer_total = 0;
    uint64_t completed = 0;         // Aggregate over all layers seen this attempt
    uint64_t total = 0;
    int percent = 0;                // Monotonic within one attempt, restarts at 0 on retry
    int attempt = 0;
    int max_attempts = 0;
};

using AcquisitionProgressCallback = std::function<void(const AcquisitionProgress&)>;

// Waits out a backoff. The default waits on the token so a cancel cuts it short.
using SleepFunction = std::function<void(std::chrono::milliseconds, const CancellationToken&)>;

// Live state of one acquisition; owned by the acquire() call that created it
struct TransferState {
    std::string model_id;
    TransferPhase phase = TransferPhase::Pending;
    ProgressAggregator progress;    // Per-attempt layer table
    int attempt = 0;
    std::chrono::steady_clock::time_point last_event_time;
    bool cancel_requested = false;
};

class RetryPolicy {
public:
    explicit RetryPolicy(int max_attempts = 3,
                         std::chrono::milliseconds backoff_unit = std::chrono::seconds(1))
        : max_attempts_(max_attempts), backoff_unit_(backoff_unit) {}

    int max_attempts() const { return max_attempts_; }

    bool should_retry(const TransportResult& result, int attempt) const {
        return result.retryable() && attempt < max_attempts_;
    }

    // Backoff grows no further once the exponent reaches this
    static constexpr int MAX_BACKOFF_EXPONENT = 6;
    static constexpr std::chrono::milliseconds MAX_BACKOFF{60000};

    // 2^attempt units: 2s after the first failure, 4s after the second, ...
    // capped at MAX_BACKOFF
    std::chrono::milliseconds backoff_after(int attempt) const {
        int exponent = std::min(std::max(attempt, 0), MAX_BACKOFF_EXPONENT);
        return std::min(backoff_unit_ * (int64_t(1) << exponent), MAX_BACKOFF);
    }

private:
    int max_attempts_;
    std::chrono::milliseconds backoff_unit_;
};

struct AcquisitionOptions {
    int max_attempts = 3;
    std::chrono::milliseconds stall_timeout = DEFAULT_STALL_TIMEOUT;
    std::chrono::milliseconds backoff_unit = std::chrono::seconds(1);
    std::string log_level = "info";
};

/**
 * Drives pull attempts to completion.
 *
 * Retryable failures (transport errors, stalls) trigger a best-effort delete of
 * the partial model, a 2^attempt backoff and a fresh attempt with a fresh
 * aggregator. Cancellation ends the call at once with no cleanup.
 *
 * Only one acquisition per model may run at a time; a second acquire() for the
 * same model throws DownloadInProgressException. Different models may be
 * acquired concurrently from different threads.
 */
class AcquisitionController {
public:
    AcquisitionController(IPullTransport& transport,
                          IModelProvider& provider,
                          IModelRegistry* registry = nullptr,
                          AcquisitionOptions options = AcquisitionOptions(),
                          SleepFunction sleep = nullptr);

    // Returns on success. Throws DownloadCancelledException,
    // RetriesExhaustedException or DownloadInProgressException.
    void acquire(const std::string& model_id,
                 const AcquisitionProgressCallback& on_progress,
                 CancellationToken& cancel_token);

    bool is_acquiring(const std::string& model_id) const;
    std::vector<std::string> active_acquisitions() const;

    const RetryPolicy& retry_policy() const { return policy_; }

private:
    // Claims the model in the in-flight table for the lifetime of one acquire()
    class InFlightGuard {
    public:
        InFlightGuard(AcquisitionController& owner, const std::string& model_id);
        ~InFlightGuard();
        InFlightGuard(const InFlightGuard&) = delete;
        InFlightGuard& operator=(const InFlightGuard&) = delete;
    private:
        AcquisitionController& owner_;
        std::string key_;
    };

    TransportResult run_attempt(TransferState& state,
                                const AcquisitionProgressCallback& on_progress,
                                CancellationToken& cancel_token);
    void cleanup_partial(const std::string& model_id);
    void notify_retry(const TransferState& state, const AcquisitionProgressCallback& on_progress);

    bool is_debug() const { return options_.log_level == "debug" || options_.log_level == "trace"; }

    IPullTransport& transport_;
    IModelProvider& provider_;
    IModelRegistry* registry_;   // Non-owning, may be null
    AcquisitionOptions options_;
    RetryPolicy policy_;
    SleepFunction sleep_;

    mutable std::mutex in_flight_mutex_;
    std::set<std::string> in_flight_;
};

} // namespace steward
