#include "steward/providers/openai_client.h"
#include "steward/error_types.h"
#include <iostream>

namespace steward {
namespace providers {

OpenAiClient::OpenAiClient(const utils::ProviderConfig& config, const std::string& log_level)
    : config_(config), log_level_(log_level) {
    config_.api_url = utils::normalize_api_url(config_.api_url);
    endpoint_ = utils::HttpEndpoint::parse(config_.api_url);
}

bool OpenAiClient::is_available() {
    if (config_.api_key.empty()) {
        return false;
    }
    httplib::Client cli = utils::make_http_client(config_, std::chrono::seconds(5));
    auto res = cli.Get(endpoint_.path("/models"));
    return res && res->status == 200;
}

std::vector<InstalledModel> OpenAiClient::parse_models(const json& body) {
    std::vector<InstalledModel> models;
    if (!body.is_object() || !body.contains("data") || !body["data"].is_array()) {
        return models;
    }

    for (const auto& entry : body["data"]) {
        if (!entry.is_object() || !entry.contains("id") || !entry["id"].is_string()) {
            continue;
        }
        std::string id = entry["id"].get<std::string>();
        if (id.find("gpt") == std::string::npos) {
            continue;
        }
        InstalledModel model;
        model.name = id;
        model.family = "gpt";
        models.push_back(model);
    }
    return models;
}

std::vector<InstalledModel> OpenAiClient::list_installed() {
    if (config_.api_key.empty()) {
        throw ProviderException(name(), "No API key configured");
    }

    httplib::Client cli = utils::make_http_client(config_, std::chrono::seconds(30));
    auto res = cli.Get(endpoint_.path("/models"));

    if (!res) {
        throw ProviderException(name(), utils::describe_http_error(res.error(), endpoint_.origin));
    }
    if (res->status != 200) {
        throw ProviderException(name(), "Failed to fetch models: " + utils::extract_error_message(*res));
    }

    json body = json::parse(res->body, nullptr, false);
    if (body.is_discarded()) {
        throw ProviderException(name(), "Invalid JSON from /models");
    }

    auto models = parse_models(body);
    if (log_level_ == "debug" || log_level_ == "trace") {
        std::cout << "[OpenAI] " << models.size() << " hosted model(s)" << std::endl;
    }
    return models;
}

bool OpenAiClient::delete_model(const std::string& model_id) {
    std::cerr << "[OpenAI] " << model_id << " is hosted and cannot be deleted" << std::endl;
    return false;
}

} // namespace providers
} // namespace steward
