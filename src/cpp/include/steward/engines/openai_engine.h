#pragma once

#include <string>
#include "../inference_engine.h"
#include "../utils/http_client.h"

namespace steward {
namespace engines {

// Engine for a model served by a hosted OpenAI-compatible service. There is
// nothing to load: binding a model checks that the service knows it.
class OpenAiEngine : public IInferenceEngine {
public:
    explicit OpenAiEngine(const utils::ProviderConfig& config,
                          const std::string& log_level = "info");

    // GET {api}/models/{id}. Throws ProviderException.
    void load(const std::string& model_id, const EngineProgressCallback& progress);

    std::string model_id() const override { return model_id_; }

    void reload(const std::string& model_id, const EngineProgressCallback& progress) override;
    void unload() override;

    // POST {api}/chat/completions with a JSON object response format
    json chat(const json& request) override;

    // POST {api}/embeddings
    json embed(const json& request) override;

    static constexpr int REQUEST_TIMEOUT_SECONDS = 120;

private:
    json post(const std::string& endpoint, const json& body);

    utils::ProviderConfig config_;
    utils::HttpEndpoint endpoint_;
    std::string log_level_;
    std::string model_id_;
};

class OpenAiEngineFactory : public IEngineFactory {
public:
    explicit OpenAiEngineFactory(const utils::ProviderConfig& config,
                                 const std::string& log_level = "info");

    std::unique_ptr<IInferenceEngine> create(const std::string& model_id,
                                             const EngineProgressCallback& progress) override;

private:
    utils::ProviderConfig config_;
    std::string log_level_;
};

} // namespace engines
} // namespace steward
