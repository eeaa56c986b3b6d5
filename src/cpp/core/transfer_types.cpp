#include "steward/transfer_types.h"
#include <algorithm>
#include <cctype>

namespace steward {

std::string transfer_phase_to_string(TransferPhase phase) {
    switch (phase) {
        case TransferPhase::Pending: return "pending";
        case TransferPhase::Transferring: return "transferring";
        case TransferPhase::Verifying: return "verifying";
        case TransferPhase::Finalizing: return "finalizing";
        case TransferPhase::Succeeded: return "succeeded";
        case TransferPhase::Failed: return "failed";
        case TransferPhase::Cancelled: return "cancelled";
    }
    return "unknown";
}

static bool starts_with(const std::string& s, const std::string& prefix) {
    return s.compare(0, prefix.size(), prefix) == 0;
}

TransferPhase phase_from_status(const std::string& status) {
    std::string lower = status;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (starts_with(lower, "verifying")) {
        return TransferPhase::Verifying;
    }
    if (starts_with(lower, "writing manifest") ||
        starts_with(lower, "removing") ||
        starts_with(lower, "finalizing") ||
        lower == "success") {
        return TransferPhase::Finalizing;
    }
    return TransferPhase::Transferring;
}

// Byte counters arrive as JSON numbers; negative or fractional values are clamped/truncated
static std::optional<uint64_t> read_counter(const json& value) {
    if (value.is_number_unsigned()) {
        return value.get<uint64_t>();
    }
    if (value.is_number_integer()) {
        int64_t v = value.get<int64_t>();
        return v < 0 ? 0 : static_cast<uint64_t>(v);
    }
    if (value.is_number_float()) {
        double v = value.get<double>();
        return v < 0 ? 0 : static_cast<uint64_t>(v);
    }
    if (value.is_null()) {
        return 0;
    }
    return std::nullopt;
}

std::optional<ProgressRecord> ProgressRecord::from_json(const json& j) {
    if (!j.is_object()) {
        return std::nullopt;
    }

    ProgressRecord record;

    if (j.contains("error")) {
        const json& err = j["error"];
        record.has_error = true;
        record.error = err.is_string() ? err.get<std::string>() : err.dump();
        if (record.error.empty()) {
            record.error = "unknown error";
        }
    }

    // An error record is kept whatever its status field holds
    if (j.contains("status")) {
        if (j["status"].is_string()) {
            record.status = j["status"].get<std::string>();
        } else if (!record.has_error) {
            return std::nullopt;
        }
    }

    if (j.contains("digest") && j["digest"].is_string()) {
        record.digest = j["digest"].get<std::string>();
    }

    for (const char* field : {"completed", "total"}) {
        if (!j.contains(field)) {
            continue;
        }
        auto counter = read_counter(j[field]);
        if (!counter) {
            return std::nullopt;
        }
        record.has_bytes = true;
        if (std::string(field) == "completed") {
            record.completed = *counter;
        } else {
            record.total = *counter;
        }
    }

    return record;
}

} // namespace steward
