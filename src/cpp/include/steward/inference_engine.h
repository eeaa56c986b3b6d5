#pragma once

#include <functional>
#include <memory>
#include <string>
#include <nlohmann/json.hpp>

namespace steward {

using json = nlohmann::json;

// Human readable initialization progress ("Loading llama3...", "llama3 ready")
using EngineProgressCallback = std::function<void(const std::string& text)>;

// A loaded inference engine bound to one model
class IInferenceEngine {
public:
    virtual ~IInferenceEngine() = default;

    virtual std::string model_id() const = 0;

    // Swap the bound model in place. Throws on failure, after which the
    // engine must be unloaded and discarded.
    virtual void reload(const std::string& model_id, const EngineProgressCallback& progress) = 0;

    // Release the model and its resources. May throw.
    virtual void unload() = 0;

    // Chat completion. Returns the parsed JSON answer of the model.
    virtual json chat(const json& request) = 0;

    // Embeddings for request["input"]
    virtual json embed(const json& request) = 0;
};

class IEngineFactory {
public:
    virtual ~IEngineFactory() = default;

    // Create an engine bound to model_id. Throws on failure.
    virtual std::unique_ptr<IInferenceEngine> create(const std::string& model_id,
                                                     const EngineProgressCallback& progress) = 0;
};

} // namespace steward
