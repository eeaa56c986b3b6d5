#pragma once

#include <cstdint>
#include <map>
#include <string>
#include "transfer_types.h"

namespace steward {

struct AggregateProgress {
    TransferPhase phase = TransferPhase::Pending;
    uint64_t completed = 0;     // Sum of bytes completed over all known layers
    uint64_t total = 0;         // Sum of bytes total over all known layers
    int percent = 0;            // round(100 * completed / total), or 100 once pinned
    int display_percent = 0;    // High-water mark of percent; never decreases
};

/**
 * Folds per-layer byte counters into one percentage.
 *
 * The set of layers is open-ended: a layer becomes known only when its first
 * record arrives, so the total keeps growing early in a transfer and the raw
 * percent can dip when a new layer appears. display_percent hides the dip.
 * Post-transfer phases (verifying, finalizing) pin both values to 100.
 *
 * One instance covers one attempt. A retry starts from a fresh instance.
 */
class ProgressAggregator {
public:
    ProgressAggregator() = default;

    AggregateProgress update(const ProgressRecord& record);

    // Byte-only update; an empty layer_id is filed under UNKNOWN_LAYER_ID
    AggregateProgress update(const std::string& layer_id, uint64_t completed, uint64_t total);

    const AggregateProgress& current() const { return current_; }
    const std::map<std::string, LayerProgress>& layers() const { return layers_; }
    bool pinned() const { return pinned_; }

private:
    void upsert_layer(const std::string& layer_id, uint64_t completed, uint64_t total);
    void recompute();

    std::map<std::string, LayerProgress> layers_;
    AggregateProgress current_;
    bool pinned_ = false;
};

} // namespace steward
