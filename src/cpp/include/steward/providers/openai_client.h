#pragma once

#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "../model_provider.h"
#include "../utils/http_client.h"

namespace steward {
namespace providers {

using json = nlohmann::json;

// Model list of a hosted OpenAI-compatible service. Its models live with the
// service: every listed model counts as installed, and nothing is downloaded
// or deleted. Only GPT chat models are listed.
class OpenAiClient : public IModelProvider {
public:
    explicit OpenAiClient(const utils::ProviderConfig& config,
                          const std::string& log_level = "info");

    std::string name() const override { return "openai"; }

    bool is_hosted() const override { return true; }

    // GET {api}/models answers with 200 for the configured key
    bool is_available() override;

    // GET {api}/models. Throws ProviderException without a key or on failure.
    std::vector<InstalledModel> list_installed() override;

    // Hosted models cannot be deleted; always false
    bool delete_model(const std::string& model_id) override;

    static std::vector<InstalledModel> parse_models(const json& body);

private:
    utils::ProviderConfig config_;
    utils::HttpEndpoint endpoint_;
    std::string log_level_;
};

} // namespace providers
} // namespace steward
