#include "steward/utils/http_client.h"
#include <nlohmann/json.hpp>

namespace steward {
namespace utils {

std::string normalize_api_url(const std::string& url) {
    std::string normalized = url;
    while (!normalized.empty() && normalized.back() == '/') {
        normalized.pop_back();
    }
    return normalized;
}

HttpEndpoint HttpEndpoint::parse(const std::string& url) {
    std::string normalized = normalize_api_url(url);

    // Default to plain http when no scheme is given ("localhost:11434/api")
    size_t scheme_end = normalized.find("://");
    if (scheme_end == std::string::npos) {
        normalized = "http://" + normalized;
        scheme_end = 4;
    }

    HttpEndpoint endpoint;
    size_t path_start = normalized.find('/', scheme_end + 3);
    if (path_start == std::string::npos) {
        endpoint.origin = normalized;
    } else {
        endpoint.origin = normalized.substr(0, path_start);
        endpoint.base_path = normalized.substr(path_start);
    }
    return endpoint;
}

httplib::Client make_http_client(const ProviderConfig& config,
                                 std::chrono::milliseconds read_timeout) {
    HttpEndpoint endpoint = HttpEndpoint::parse(config.api_url);

    httplib::Client cli(endpoint.origin);
    cli.set_connection_timeout(config.connect_timeout_seconds, 0);
    cli.set_read_timeout(read_timeout);

    if (!config.api_key.empty()) {
        cli.set_bearer_token_auth(config.api_key);
    }

    return cli;
}

std::string describe_http_error(httplib::Error err, const std::string& origin) {
    switch (err) {
        case httplib::Error::Read:
            // Read error usually means the provider closed the connection
            return "Connection closed by provider at " + origin;
        case httplib::Error::Write:
            return "Connection write error";
        case httplib::Error::Connection:
            return "Failed to connect to provider at " + origin;
        case httplib::Error::SSLConnection:
            return "SSL connection error";
        case httplib::Error::SSLServerVerification:
            return "SSL server verification failed";
        case httplib::Error::Canceled:
            return "Request was canceled";
        default:
            return "HTTP request failed (" + httplib::to_string(err) + ")";
    }
}

std::string extract_error_message(const httplib::Response& res) {
    std::string error_msg = "HTTP request failed with status: " + std::to_string(res.status);

    auto error_json = nlohmann::json::parse(res.body, nullptr, false);
    if (!error_json.is_discarded() && error_json.is_object()) {
        if (error_json.contains("error") && error_json["error"].is_string()) {
            return error_json["error"].get<std::string>();
        }
        // OpenAI-compatible services nest it: {"error": {"message": "..."}}
        if (error_json.contains("error") && error_json["error"].is_object() &&
            error_json["error"].contains("message") && error_json["error"]["message"].is_string()) {
            return error_json["error"]["message"].get<std::string>();
        }
        if (error_json.contains("detail") && error_json["detail"].is_string()) {
            return error_json["detail"].get<std::string>();
        }
    }

    if (!res.body.empty() && res.body.length() < 200) {
        error_msg += ": " + res.body;
    }
    return error_msg;
}

} // namespace utils
} // namespace steward
