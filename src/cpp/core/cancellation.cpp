#include "steward/cancellation.h"

namespace steward {

void CancellationToken::cancel() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (cancelled_.exchange(true)) {
        return;
    }

    // Callbacks run under the lock so unregister_callback() cannot return
    // while one of them is still executing against a dying object.
    // They must not call back into the token.
    for (auto& entry : callbacks_) {
        entry.second();
    }
    callbacks_.clear();
    cv_.notify_all();
}

bool CancellationToken::wait_for(std::chrono::milliseconds duration) const {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, duration, [this] { return cancelled_.load(); });
}

int CancellationToken::register_callback(Callback callback) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!cancelled_.load()) {
            int id = next_id_++;
            callbacks_[id] = std::move(callback);
            return id;
        }
    }
    callback();
    return 0;
}

void CancellationToken::unregister_callback(int id) {
    std::lock_guard<std::mutex> lock(mutex_);
    callbacks_.erase(id);
}

} // namespace steward
