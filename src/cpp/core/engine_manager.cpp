#include "steward/engine_manager.h"
#include "steward/error_types.h"
#include "steward/model_registry.h"
#include <iostream>
#include <thread>

namespace steward {

std::string engine_state_to_string(EngineState state) {
    switch (state) {
        case EngineState::Unloaded: return "unloaded";
        case EngineState::Loading: return "loading";
        case EngineState::Loaded: return "loaded";
    }
    return "unknown";
}

EngineLifecycleManager::EngineLifecycleManager(IEngineFactory& factory,
                                               std::chrono::milliseconds settle_delay,
                                               const std::string& log_level,
                                               SettleFunction settle)
    : factory_(factory), settle_delay_(settle_delay), log_level_(log_level),
      settle_(std::move(settle)) {
    if (!settle_) {
        settle_ = [](std::chrono::milliseconds delay) {
            std::this_thread::sleep_for(delay);
        };
    }
}

EngineLifecycleManager::~EngineLifecycleManager() {
    std::cout << "[EngineManager] Destructor: unloading engine" << std::endl;
    shutdown();
}

EngineState EngineLifecycleManager::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (is_loading_) {
        return EngineState::Loading;
    }
    return engine_ ? EngineState::Loaded : EngineState::Unloaded;
}

std::string EngineLifecycleManager::active_model() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return active_model_id_;
}

void EngineLifecycleManager::unload_quietly(IInferenceEngine& engine, const std::string& model_id) {
    try {
        engine.unload();
        std::cout << "[EngineManager] Unloaded " << model_id << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "[EngineManager] Unload of " << model_id << " failed (ignored): " << e.what() << std::endl;
    }
}

void EngineLifecycleManager::activate(const std::string& model_id, const EngineProgressCallback& progress) {
    std::unique_lock<std::mutex> lock(mutex_);

    // Queue behind an activation that is already running
    while (is_loading_) {
        std::cout << "[EngineManager] Another activation is in progress, waiting..." << std::endl;
        cv_.wait(lock);
    }

    if (engine_ && same_model(active_model_id_, model_id)) {
        if (is_debug()) {
            std::cout << "[EngineManager] " << model_id << " already active" << std::endl;
        }
        return;
    }

    is_loading_ = true;

    // Let in-flight inference finish before the engine changes under it
    cv_.wait(lock, [this] { return busy_count_ == 0; });

    std::unique_ptr<IInferenceEngine> current = std::move(engine_);
    std::string previous_model = active_model_id_;
    active_model_id_.clear();

    // Slow path runs without the lock
    lock.unlock();

    std::unique_ptr<IInferenceEngine> ready;
    std::string error_message;

    try {
        if (current) {
            std::cout << "[EngineManager] Reloading engine: " << previous_model
                      << " -> " << model_id << std::endl;
            try {
                current->reload(model_id, progress);
                ready = std::move(current);
                std::cout << "[EngineManager] Engine ready (reloaded) for " << model_id << std::endl;
            } catch (const std::exception& e) {
                std::cerr << "[EngineManager] Reload failed, recreating engine: " << e.what() << std::endl;
                unload_quietly(*current, previous_model);
                current.reset();

                // Give the device time to release what the old engine held
                std::cout << "[EngineManager] Waiting " << settle_delay_.count()
                          << " ms for resources to settle" << std::endl;
                settle_(settle_delay_);
            }
        }

        if (!ready) {
            std::cout << "[EngineManager] Creating new engine for " << model_id << std::endl;
            ready = factory_.create(model_id, progress);
            if (!ready) {
                throw std::runtime_error("engine factory returned no engine");
            }
            std::cout << "[EngineManager] Engine ready (new) for " << model_id << std::endl;
        }
    } catch (const std::exception& e) {
        error_message = e.what();
        std::cerr << "[EngineManager] Failed to load " << model_id << ": " << error_message << std::endl;
    } catch (...) {
        lock.lock();
        is_loading_ = false;
        cv_.notify_all();
        throw;
    }

    lock.lock();
    if (ready) {
        engine_ = std::move(ready);
        active_model_id_ = model_id;
    }
    is_loading_ = false;
    cv_.notify_all();

    if (!error_message.empty()) {
        throw EngineCreationException(model_id, error_message);
    }
}

void EngineLifecycleManager::shutdown() {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this] { return !is_loading_ && busy_count_ == 0; });

    if (!engine_) {
        return;
    }

    std::unique_ptr<IInferenceEngine> engine = std::move(engine_);
    std::string model_id = active_model_id_;
    active_model_id_.clear();
    is_loading_ = true;
    lock.unlock();

    std::cout << "[EngineManager] Shutting down engine for " << model_id << std::endl;
    unload_quietly(*engine, model_id);
    engine.reset();

    lock.lock();
    is_loading_ = false;
    cv_.notify_all();
}

template<typename Func>
json EngineLifecycleManager::run_on_engine(Func& func, IInferenceEngine*& used, std::string& model_id) {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this] { return !is_loading_; });

    if (!engine_) {
        throw EngineNotLoadedException();
    }

    used = engine_.get();
    model_id = active_model_id_;
    busy_count_++;
    lock.unlock();

    json result;
    try {
        result = func(*used);
    } catch (...) {
        lock.lock();
        busy_count_--;
        cv_.notify_all();
        throw;
    }

    lock.lock();
    busy_count_--;
    cv_.notify_all();
    return result;
}

bool EngineLifecycleManager::recover(IInferenceEngine* failed, const std::string& model_id) {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this] { return !is_loading_; });

    // Already replaced by a concurrent recovery or activation
    if (engine_.get() != failed) {
        return engine_ && same_model(active_model_id_, model_id);
    }

    is_loading_ = true;
    cv_.wait(lock, [this] { return busy_count_ == 0; });

    std::unique_ptr<IInferenceEngine> broken = std::move(engine_);
    active_model_id_.clear();
    lock.unlock();

    unload_quietly(*broken, model_id);
    broken.reset();

    std::cout << "[EngineManager] Waiting " << RECOVERY_DELAY.count()
              << " ms before reinitializing " << model_id << std::endl;

    std::unique_ptr<IInferenceEngine> fresh;
    try {
        settle_(RECOVERY_DELAY);
        fresh = factory_.create(model_id, nullptr);
    } catch (const std::exception& e) {
        std::cerr << "[EngineManager] Could not reinitialize " << model_id << ": " << e.what() << std::endl;
    } catch (...) {
        lock.lock();
        is_loading_ = false;
        cv_.notify_all();
        throw;
    }

    lock.lock();
    if (fresh) {
        engine_ = std::move(fresh);
        active_model_id_ = model_id;
        std::cout << "[EngineManager] Engine reinitialized for " << model_id << std::endl;
    }
    is_loading_ = false;
    cv_.notify_all();
    return engine_ != nullptr;
}

template<typename Func>
json EngineLifecycleManager::execute_inference(Func&& func) {
    IInferenceEngine* used = nullptr;
    std::string model_id;

    try {
        return run_on_engine(func, used, model_id);
    } catch (const EngineNotLoadedException&) {
        throw;
    } catch (const std::exception& e) {
        std::cerr << "[EngineManager] Inference on " << model_id << " failed: " << e.what() << std::endl;
        if (!recover(used, model_id)) {
            throw;
        }
    }

    std::cout << "[EngineManager] Retrying inference on " << model_id << std::endl;
    return run_on_engine(func, used, model_id);
}

json EngineLifecycleManager::chat(const json& request) {
    return execute_inference([&request](IInferenceEngine& engine) {
        return engine.chat(request);
    });
}

json EngineLifecycleManager::embed(const json& request) {
    return execute_inference([&request](IInferenceEngine& engine) {
        return engine.embed(request);
    });
}

} // namespace steward
