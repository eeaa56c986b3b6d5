#pragma once

#include <string>
#include "../pull_transport.h"
#include "../utils/http_client.h"

namespace steward {
namespace providers {

// Streams POST {api}/pull and decodes the newline-delimited progress records.
// A watchdog thread stops the client when no record arrives within the stall
// window; a cancellation callback stops it when the token fires.
class HttpPullTransport : public IPullTransport {
public:
    explicit HttpPullTransport(const utils::ProviderConfig& config,
                               const std::string& log_level = "info");

    TransportResult pull(const std::string& model_id,
                         CancellationToken& cancel_token,
                         std::chrono::milliseconds stall_timeout,
                         const ProgressRecordCallback& on_record) override;

private:
    bool is_debug() const { return log_level_ == "debug" || log_level_ == "trace"; }

    utils::ProviderConfig config_;
    std::string log_level_;
};

} // namespace providers
} // namespace steward
