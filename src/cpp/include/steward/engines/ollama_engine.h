#pragma once

#include <functional>
#include <string>
#include "../inference_engine.h"
#include "../model_registry.h"
#include "../utils/http_client.h"

namespace steward {
namespace engines {

using KindResolver = std::function<ModelKind(const std::string& model_id)>;

// Engine backed by a model held in memory by an Ollama-compatible server.
// Loading issues an empty generate (chat) or embed (embedding) request;
// unloading sends keep_alive 0.
class OllamaEngine : public IInferenceEngine {
public:
    OllamaEngine(const utils::ProviderConfig& config,
                 KindResolver resolve_kind,
                 const std::string& log_level = "info");

    ~OllamaEngine() override = default;

    // Bind the first model. Throws ProviderException.
    void load(const std::string& model_id, const EngineProgressCallback& progress);

    std::string model_id() const override { return model_id_; }

    void reload(const std::string& model_id, const EngineProgressCallback& progress) override;
    void unload() override;

    json chat(const json& request) override;
    json embed(const json& request) override;

    // Parse model output as JSON, falling back to the outermost {...} span
    static json parse_json_content(const std::string& content);

    // Timeout for load and inference requests
    static constexpr int REQUEST_TIMEOUT_SECONDS = 600;

private:
    json post(const std::string& endpoint, const json& body, int timeout_seconds);
    void send_keep_alive(const std::string& model_id, ModelKind kind, const json& keep_alive);

    utils::ProviderConfig config_;
    utils::HttpEndpoint endpoint_;
    KindResolver resolve_kind_;
    std::string log_level_;

    std::string model_id_;
    ModelKind kind_ = ModelKind::Chat;
};

class OllamaEngineFactory : public IEngineFactory {
public:
    OllamaEngineFactory(const utils::ProviderConfig& config,
                        IModelRegistry* registry = nullptr,
                        const std::string& log_level = "info");

    std::unique_ptr<IInferenceEngine> create(const std::string& model_id,
                                             const EngineProgressCallback& progress) override;

private:
    utils::ProviderConfig config_;
    IModelRegistry* registry_;   // Non-owning, used to tell chat from embedding models
    std::string log_level_;
};

} // namespace engines
} // namespace steward
