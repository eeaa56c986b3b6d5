#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <map>
#include <mutex>

namespace steward {

// Cooperative cancellation shared between a caller and a running operation.
// Callbacks registered while the token is live run once, on the cancelling thread.
class CancellationToken {
public:
    using Callback = std::function<void()>;

    CancellationToken() = default;
    CancellationToken(const CancellationToken&) = delete;
    CancellationToken& operator=(const CancellationToken&) = delete;

    void cancel();

    bool is_cancelled() const { return cancelled_.load(); }

    // Sleep for up to `duration`. Returns true if the token was cancelled.
    bool wait_for(std::chrono::milliseconds duration) const;

    // Returns 0 (and runs the callback immediately) if already cancelled
    int register_callback(Callback callback);
    void unregister_callback(int id);

private:
    std::atomic<bool> cancelled_{false};
    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
    std::map<int, Callback> callbacks_;
    int next_id_ = 1;
};

// Unregisters its callback on destruction
class CancellationRegistration {
public:
    CancellationRegistration(CancellationToken& token, CancellationToken::Callback callback)
        : token_(token), id_(token.register_callback(std::move(callback))) {}

    ~CancellationRegistration() {
        if (id_ != 0) {
            token_.unregister_callback(id_);
        }
    }

    CancellationRegistration(const CancellationRegistration&) = delete;
    CancellationRegistration& operator=(const CancellationRegistration&) = delete;

private:
    CancellationToken& token_;
    int id_;
};

} // namespace steward
