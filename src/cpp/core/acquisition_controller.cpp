#include "steward/acquisition_controller.h"
#include "steward/error_types.h"
#include <iostream>

namespace steward {

AcquisitionController::InFlightGuard::InFlightGuard(AcquisitionController& owner, const std::string& model_id)
    : owner_(owner), key_(normalize_model_tag(model_id)) {
    std::lock_guard<std::mutex> lock(owner_.in_flight_mutex_);
    if (!owner_.in_flight_.insert(key_).second) {
        throw DownloadInProgressException(model_id);
    }
}

AcquisitionController::InFlightGuard::~InFlightGuard() {
    std::lock_guard<std::mutex> lock(owner_.in_flight_mutex_);
    owner_.in_flight_.erase(key_);
}

AcquisitionController::AcquisitionController(IPullTransport& transport,
                                             IModelProvider& provider,
                                             IModelRegistry* registry,
                                             AcquisitionOptions options,
                                             SleepFunction sleep)
    : transport_(transport), provider_(provider), registry_(registry),
      options_(options), policy_(options.max_attempts, options.backoff_unit),
      sleep_(std::move(sleep)) {
    if (!sleep_) {
        sleep_ = [](std::chrono::milliseconds duration, const CancellationToken& token) {
            token.wait_for(duration);
        };
    }
}

bool AcquisitionController::is_acquiring(const std::string& model_id) const {
    std::lock_guard<std::mutex> lock(in_flight_mutex_);
    return in_flight_.count(normalize_model_tag(model_id)) > 0;
}

std::vector<std::string> AcquisitionController::active_acquisitions() const {
    std::lock_guard<std::mutex> lock(in_flight_mutex_);
    return std::vector<std::string>(in_flight_.begin(), in_flight_.end());
}

void AcquisitionController::acquire(const std::string& model_id,
                                    const AcquisitionProgressCallback& on_progress,
                                    CancellationToken& cancel_token) {
    InFlightGuard guard(*this, model_id);

    TransferState state;
    state.model_id = model_id;

    for (int attempt = 1; ; ++attempt) {
        state.attempt = attempt;
        std::cout << "[Acquisition] Pulling model " << model_id << " (Attempt "
                  << attempt << "/" << policy_.max_attempts() << ")..." << std::endl;

        TransportResult result = run_attempt(state, on_progress, cancel_token);

        // A cancel can race a transport failure; cancellation wins
        if (result.status == TransportStatus::Cancelled || cancel_token.is_cancelled()) {
            state.phase = TransferPhase::Cancelled;
            state.cancel_requested = true;
            std::cout << "[Acquisition] Download of " << model_id << " cancelled" << std::endl;
            throw DownloadCancelledException(model_id);
        }

        if (result.ok()) {
            state.phase = TransferPhase::Succeeded;
            std::cout << "[Acquisition] Model " << model_id << " pulled successfully ("
                      << result.records << " progress records)" << std::endl;
            if (registry_) {
                registry_->mark_installed(model_id);
            }
            return;
        }

        std::cerr << "[Acquisition] Attempt " << attempt << " failed ("
                  << transport_status_to_string(result.status) << "): " << result.reason << std::endl;

        if (!policy_.should_retry(result, attempt)) {
            state.phase = TransferPhase::Failed;
            throw RetriesExhaustedException(model_id, attempt, result.reason);
        }

        notify_retry(state, on_progress);
        cleanup_partial(model_id);

        auto backoff = policy_.backoff_after(attempt);
        std::cout << "[Acquisition] Retrying in " << backoff.count() << " ms" << std::endl;
        sleep_(backoff, cancel_token);

        if (cancel_token.is_cancelled()) {
            state.phase = TransferPhase::Cancelled;
            state.cancel_requested = true;
            std::cout << "[Acquisition] Download of " << model_id << " cancelled during backoff" << std::endl;
            throw DownloadCancelledException(model_id);
        }
    }
}

TransportResult AcquisitionController::run_attempt(TransferState& state,
                                                   const AcquisitionProgressCallback& on_progress,
                                                   CancellationToken& cancel_token) {
    // Fresh aggregator: a retried attempt downloads from scratch
    state.progress = ProgressAggregator();
    state.phase = TransferPhase::Transferring;
    state.last_event_time = std::chrono::steady_clock::now();

    return transport_.pull(state.model_id, cancel_token, options_.stall_timeout,
        [&](const ProgressRecord& record) {
            state.last_event_time = std::chrono::steady_clock::now();
            AggregateProgress aggregate = state.progress.update(record);
            if (aggregate.phase != TransferPhase::Pending) {
                state.phase = aggregate.phase;
            }

            if (is_debug()) {
                std::cout << "[Acquisition] " << state.model_id << ": " << record.status
                          << " (" << aggregate.display_percent << "%)" << std::endl;
            }

            if (!on_progress) {
                return;
            }

            AcquisitionProgress progress;
            progress.model_id = state.model_id;
            progress.status = record.status;
            progress.phase = state.phase;
            progress.layer_id = record.digest;
            progress.layer_completed = record.completed;
            progress.layer_total = record.total;
            progress.completed = aggregate.completed;
            progress.total = aggregate.total;
            progress.percent = aggregate.display_percent;
            progress.attempt = state.attempt;
            progress.max_attempts = policy_.max_attempts();
            on_progress(progress);
        });
}

void AcquisitionController::notify_retry(const TransferState& state,
                                         const AcquisitionProgressCallback& on_progress) {
    if (!on_progress) {
        return;
    }
    AcquisitionProgress progress;
    progress.model_id = state.model_id;
    progress.status = "Download failed/stalled. Retrying (Attempt " +
                      std::to_string(state.attempt + 1) + ")...";
    progress.phase = TransferPhase::Pending;
    progress.attempt = state.attempt + 1;
    progress.max_attempts = policy_.max_attempts();
    on_progress(progress);
}

void AcquisitionController::cleanup_partial(const std::string& model_id) {
    std::cout << "[Acquisition] Cleaning up partial download of " << model_id << std::endl;
    try {
        if (!provider_.delete_model(model_id)) {
            std::cerr << "[Acquisition] Cleanup of " << model_id << " failed, continuing" << std::endl;
        }
    } catch (const std::exception& e) {
        std::cerr << "[Acquisition] Cleanup of " << model_id << " threw: " << e.what() << std::endl;
    }
}

} // namespace steward
