#pragma once

#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "../model_provider.h"
#include "../utils/http_client.h"

namespace steward {
namespace providers {

using json = nlohmann::json;

// Catalog and housekeeping calls against an Ollama-compatible API
class OllamaClient : public IModelProvider {
public:
    explicit OllamaClient(const utils::ProviderConfig& config,
                          const std::string& log_level = "info");

    std::string name() const override { return "ollama"; }

    // GET {api}/tags answers with 200
    bool is_available() override;

    // GET {api}/tags
    std::vector<InstalledModel> list_installed() override;

    // DELETE {api}/delete
    bool delete_model(const std::string& model_id) override;

    // POST {api}/show; null JSON if the provider does not know the model
    json show_model(const std::string& model_id);

    const utils::ProviderConfig& config() const { return config_; }

    static std::vector<InstalledModel> parse_tags(const json& tags);

private:
    httplib::Client make_client(int read_timeout_seconds) const;

    utils::ProviderConfig config_;
    utils::HttpEndpoint endpoint_;
    std::string log_level_;
};

} // namespace providers
} // namespace steward
