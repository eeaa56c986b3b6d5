#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace steward {

using json = nlohmann::json;

enum class TransferPhase {
    Pending,
    Transferring,
    Verifying,
    Finalizing,
    Succeeded,
    Failed,
    Cancelled
};

std::string transfer_phase_to_string(TransferPhase phase);

// Map a wire status ("pulling 6a0746a1ec1a", "verifying sha256 digest", "success", ...)
// to the phase it reports. Anything unrecognised counts as Transferring.
TransferPhase phase_from_status(const std::string& status);

// Verifying and Finalizing report no further byte totals
inline bool is_post_transfer_phase(TransferPhase phase) {
    return phase == TransferPhase::Verifying || phase == TransferPhase::Finalizing;
}

// Synthetic key for records that carry no digest
inline constexpr const char* UNKNOWN_LAYER_ID = "unknown";

struct LayerProgress {
    std::string layer_id;
    uint64_t bytes_completed = 0;
    uint64_t bytes_total = 0;
};

// One decoded line of the pull stream
struct ProgressRecord {
    std::string status;
    std::string digest;          // Empty when the provider reports an unlabeled stream
    uint64_t completed = 0;
    uint64_t total = 0;
    bool has_bytes = false;      // True if either completed or total was present
    bool has_error = false;
    std::string error;

    // Returns nullopt if `j` is not a record (not an object, wrongly typed fields)
    static std::optional<ProgressRecord> from_json(const json& j);
};

} // namespace steward
