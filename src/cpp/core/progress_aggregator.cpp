#include "steward/progress_aggregator.h"
#include <algorithm>
#include <cmath>

namespace steward {

AggregateProgress ProgressAggregator::update(const ProgressRecord& record) {
    if (!record.status.empty()) {
        TransferPhase phase = phase_from_status(record.status);
        if (is_post_transfer_phase(phase)) {
            pinned_ = true;
            current_.phase = phase;
        } else if (!pinned_) {
            current_.phase = phase;
        }
    } else if (current_.phase == TransferPhase::Pending && record.has_bytes) {
        current_.phase = TransferPhase::Transferring;
    }

    // Status-only records ("pulling manifest") carry no counters and must not
    // overwrite the unlabeled layer with zeros
    if (record.has_bytes) {
        upsert_layer(record.digest, record.completed, record.total);
    }

    recompute();
    return current_;
}

AggregateProgress ProgressAggregator::update(const std::string& layer_id, uint64_t completed, uint64_t total) {
    if (current_.phase == TransferPhase::Pending) {
        current_.phase = TransferPhase::Transferring;
    }
    upsert_layer(layer_id, completed, total);
    recompute();
    return current_;
}

void ProgressAggregator::upsert_layer(const std::string& layer_id, uint64_t completed, uint64_t total) {
    const std::string key = layer_id.empty() ? UNKNOWN_LAYER_ID : layer_id;
    LayerProgress& layer = layers_[key];
    layer.layer_id = key;
    layer.bytes_completed = completed;
    layer.bytes_total = total;
}

void ProgressAggregator::recompute() {
    uint64_t completed = 0;
    uint64_t total = 0;
    for (const auto& entry : layers_) {
        completed += entry.second.bytes_completed;
        total += entry.second.bytes_total;
    }
    current_.completed = completed;
    current_.total = total;

    if (pinned_) {
        current_.percent = 100;
    } else if (total > 0) {
        double fraction = static_cast<double>(completed) / static_cast<double>(total);
        current_.percent = std::min(100, static_cast<int>(std::lround(100.0 * fraction)));
    } else {
        current_.percent = 0;
    }

    current_.display_percent = std::max(current_.display_percent, current_.percent);
}

} // namespace steward
