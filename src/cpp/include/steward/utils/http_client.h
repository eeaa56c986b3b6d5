#pragma once

#include <chrono>
#include <string>
#include <httplib.h>

namespace steward {
namespace utils {

// Where a provider's API lives and how to authenticate against it
struct ProviderConfig {
    std::string api_url = "http://localhost:11434/api";
    std::string api_key;                 // Sent as a bearer token when non-empty
    int connect_timeout_seconds = 10;
};

// "http://host:port/api" split into the part httplib connects to and the path prefix
struct HttpEndpoint {
    std::string origin;      // "http://host:port"
    std::string base_path;   // "/api" (no trailing slash, may be empty)

    static HttpEndpoint parse(const std::string& url);

    // path("/pull") -> "/api/pull"
    std::string path(const std::string& endpoint) const { return base_path + endpoint; }
};

// Remove trailing slashes so "http://x/api/" and "http://x/api" behave the same
std::string normalize_api_url(const std::string& url);

httplib::Client make_http_client(const ProviderConfig& config,
                                 std::chrono::milliseconds read_timeout);

// Human readable message for a failed httplib::Result
std::string describe_http_error(httplib::Error err, const std::string& origin);

// Best-effort extraction of {"error": "..."} from a non-200 response
std::string extract_error_message(const httplib::Response& res);

} // namespace utils
} // namespace steward
