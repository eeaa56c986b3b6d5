#pragma once

#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <nlohmann/json.hpp>
#include "inference_engine.h"

namespace steward {

using json = nlohmann::json;

enum class EngineState {
    Unloaded,
    Loading,     // An activation is in flight
    Loaded
};

std::string engine_state_to_string(EngineState state);

/**
 * Owns the single inference engine of the process and binds it to models.
 *
 * activate() reuses the current engine through an in-place reload. If the
 * reload throws, the engine is unloaded (errors are logged, not fatal), the
 * manager waits a settle delay for device state to reset, and a fresh engine
 * is created. A creation failure leaves the manager Unloaded and is reported
 * as EngineCreationException; the next activate() starts from scratch.
 *
 * Concurrent activate() calls queue behind the one in flight. Activation has
 * no cancellation: a started reload or creation always runs to completion.
 *
 * A failed chat() or embed() drops the engine, waits RECOVERY_DELAY, creates
 * a fresh engine for the same model and retries the request once. A second
 * failure is passed to the caller.
 */
class EngineLifecycleManager {
public:
    using SettleFunction = std::function<void(std::chrono::milliseconds)>;

    static constexpr std::chrono::milliseconds DEFAULT_SETTLE_DELAY{500};
    static constexpr std::chrono::milliseconds RECOVERY_DELAY{1000};

    EngineLifecycleManager(IEngineFactory& factory,
                           std::chrono::milliseconds settle_delay = DEFAULT_SETTLE_DELAY,
                           const std::string& log_level = "info",
                           SettleFunction settle = nullptr);

    ~EngineLifecycleManager();

    EngineLifecycleManager(const EngineLifecycleManager&) = delete;
    EngineLifecycleManager& operator=(const EngineLifecycleManager&) = delete;

    // No-op if model_id is already bound
    void activate(const std::string& model_id, const EngineProgressCallback& progress = nullptr);

    // Unload the engine if present. Unload errors are logged and ignored.
    void shutdown();

    EngineState state() const;
    std::string active_model() const;
    bool is_loaded() const { return state() == EngineState::Loaded; }

    // Inference against the active engine, recovered and retried once on
    // failure. Throws EngineNotLoadedException.
    json chat(const json& request);
    json embed(const json& request);

private:
    // Runs func on the engine outside the lock while holding a busy count,
    // so activate() and shutdown() wait for it before touching the engine
    template<typename Func>
    json execute_inference(Func&& func);

    template<typename Func>
    json run_on_engine(Func& func, IInferenceEngine*& used, std::string& model_id);

    // Replace a failed engine with a fresh one for the same model. False if
    // no engine is bound afterwards.
    bool recover(IInferenceEngine* failed, const std::string& model_id);

    void unload_quietly(IInferenceEngine& engine, const std::string& model_id);

    bool is_debug() const { return log_level_ == "debug" || log_level_ == "trace"; }

    IEngineFactory& factory_;
    std::chrono::milliseconds settle_delay_;
    std::string log_level_;
    SettleFunction settle_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::unique_ptr<IInferenceEngine> engine_;
    std::string active_model_id_;
    bool is_loading_ = false;
    int busy_count_ = 0;
};

} // namespace steward
