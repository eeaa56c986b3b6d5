#include "steward/providers/http_pull_transport.h"
#include "steward/ndjson_decoder.h"
#include <atomic>
#include <condition_variable>
#include <exception>
#include <iostream>
#include <mutex>
#include <thread>
#include <nlohmann/json.hpp>

namespace steward {
namespace providers {

using json = nlohmann::json;

HttpPullTransport::HttpPullTransport(const utils::ProviderConfig& config, const std::string& log_level)
    : config_(config), log_level_(log_level) {
    config_.api_url = utils::normalize_api_url(config_.api_url);
}

TransportResult HttpPullTransport::pull(const std::string& model_id,
                                        CancellationToken& cancel_token,
                                        std::chrono::milliseconds stall_timeout,
                                        const ProgressRecordCallback& on_record) {
    if (cancel_token.is_cancelled()) {
        return TransportResult::cancelled();
    }

    utils::HttpEndpoint endpoint = utils::HttpEndpoint::parse(config_.api_url);

    // Serialized before any thread starts: dump() throws on names that are not UTF-8
    std::string request_body;
    try {
        request_body = json{{"name", model_id}, {"stream", true}}.dump();
    } catch (const json::exception& e) {
        std::cerr << "[Transport] Cannot encode pull request: " << e.what() << std::endl;
        return TransportResult::error(std::string("Invalid model name: ") + e.what());
    }

    // The socket read timeout is a backstop; the watchdog normally fires first
    httplib::Client cli = utils::make_http_client(config_, stall_timeout + std::chrono::seconds(5));

    NdjsonDecoder decoder;
    size_t records = 0;
    std::string error_reason;
    std::exception_ptr callback_error;

    std::atomic<bool> stalled{false};
    std::mutex watchdog_mutex;
    std::condition_variable watchdog_cv;
    bool finished = false;
    auto last_record_time = std::chrono::steady_clock::now();

    CancellationRegistration cancel_registration(cancel_token, [&cli]() {
        cli.stop();
    });

    // Stops and joins the watchdog on every exit path
    struct WatchdogJoiner {
        std::mutex& mutex;
        std::condition_variable& cv;
        bool& finished;
        std::thread& thread;

        void join() {
            {
                std::lock_guard<std::mutex> lock(mutex);
                finished = true;
            }
            cv.notify_all();
            if (thread.joinable()) {
                thread.join();
            }
        }

        ~WatchdogJoiner() { join(); }
    };

    std::thread watchdog([&]() {
        std::unique_lock<std::mutex> lock(watchdog_mutex);
        while (!finished) {
            auto deadline = last_record_time + stall_timeout;
            if (watchdog_cv.wait_until(lock, deadline, [&] { return finished; })) {
                break;
            }
            if (std::chrono::steady_clock::now() - last_record_time >= stall_timeout) {
                stalled = true;
                cli.stop();
                break;
            }
        }
    });
    WatchdogJoiner watchdog_joiner{watchdog_mutex, watchdog_cv, finished, watchdog};

    // Returns false to abort the request
    auto deliver = [&](std::vector<ProgressRecord>& batch) -> bool {
        for (auto& record : batch) {
            if (record.has_error) {
                error_reason = record.error;
                return false;
            }
            {
                std::lock_guard<std::mutex> lock(watchdog_mutex);
                last_record_time = std::chrono::steady_clock::now();
            }
            records++;
            if (is_debug()) {
                std::cout << "[Transport] " << record.status;
                if (record.has_bytes) {
                    std::cout << " " << record.completed << "/" << record.total;
                }
                std::cout << std::endl;
            }
            try {
                on_record(record);
            } catch (...) {
                callback_error = std::current_exception();
                return false;
            }
        }
        return true;
    };

    std::cout << "[Transport] Pulling " << model_id << " from " << endpoint.origin << std::endl;

    httplib::Headers headers;
    auto res = cli.Post(endpoint.path("/pull"), headers, request_body, "application/json",
        [&](const char* data, size_t len) {
            if (cancel_token.is_cancelled() || stalled) {
                return false;
            }
            auto batch = decoder.feed(data, len);
            return deliver(batch);
        });

    watchdog_joiner.join();

    if (callback_error) {
        std::rethrow_exception(callback_error);
    }

    if (cancel_token.is_cancelled()) {
        std::cout << "[Transport] Pull of " << model_id << " cancelled" << std::endl;
        return TransportResult::cancelled(records);
    }
    if (stalled) {
        std::cout << "[Transport] Pull of " << model_id << " stalled" << std::endl;
        return TransportResult::stalled(stall_timeout, records);
    }
    if (!error_reason.empty()) {
        std::cerr << "[Transport] Provider reported error: " << error_reason << std::endl;
        return TransportResult::error(error_reason, records);
    }
    if (!res) {
        std::string reason = utils::describe_http_error(res.error(), endpoint.origin);
        std::cerr << "[Transport] " << reason << std::endl;
        return TransportResult::error(reason, records);
    }

    // Stream ended; the last line may lack its newline
    auto tail = decoder.finish();
    if (!deliver(tail)) {
        if (callback_error) {
            std::rethrow_exception(callback_error);
        }
        return TransportResult::error(error_reason, records);
    }

    if (res->status != 200) {
        std::string reason = utils::extract_error_message(*res);
        std::cerr << "[Transport] " << reason << std::endl;
        return TransportResult::error(reason, records);
    }

    if (decoder.skipped_lines() > 0 && is_debug()) {
        std::cout << "[Transport] Skipped " << decoder.skipped_lines() << " malformed line(s)" << std::endl;
    }

    return TransportResult::completed(records);
}

} // namespace providers
} // namespace steward
