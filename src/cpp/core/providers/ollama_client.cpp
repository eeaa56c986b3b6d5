#include "steward/providers/ollama_client.h"
#include "steward/error_types.h"
#include <iostream>

namespace steward {
namespace providers {

OllamaClient::OllamaClient(const utils::ProviderConfig& config, const std::string& log_level)
    : config_(config), log_level_(log_level) {
    config_.api_url = utils::normalize_api_url(config_.api_url);
    endpoint_ = utils::HttpEndpoint::parse(config_.api_url);
}

httplib::Client OllamaClient::make_client(int read_timeout_seconds) const {
    return utils::make_http_client(config_, std::chrono::seconds(read_timeout_seconds));
}

bool OllamaClient::is_available() {
    httplib::Client cli = make_client(5);
    auto res = cli.Get(endpoint_.path("/tags"));
    return res && res->status == 200;
}

std::vector<InstalledModel> OllamaClient::parse_tags(const json& tags) {
    std::vector<InstalledModel> models;
    if (!tags.is_object() || !tags.contains("models") || !tags["models"].is_array()) {
        return models;
    }

    for (const auto& entry : tags["models"]) {
        if (!entry.is_object() || !entry.contains("name") || !entry["name"].is_string()) {
            continue;
        }
        InstalledModel model;
        model.name = entry["name"].get<std::string>();
        if (entry.contains("size") && entry["size"].is_number_unsigned()) {
            model.size = entry["size"].get<uint64_t>();
        }
        model.digest = entry.value("digest", "");
        model.modified_at = entry.value("modified_at", "");
        if (entry.contains("details") && entry["details"].is_object()) {
            const json& details = entry["details"];
            model.family = details.value("family", "");
            if (details.contains("families") && details["families"].is_array()) {
                for (const auto& family : details["families"]) {
                    if (family.is_string()) {
                        model.families.push_back(family.get<std::string>());
                    }
                }
            }
            model.parameter_size = details.value("parameter_size", "");
            model.quantization_level = details.value("quantization_level", "");
        }
        models.push_back(model);
    }
    return models;
}

std::vector<InstalledModel> OllamaClient::list_installed() {
    httplib::Client cli = make_client(30);
    auto res = cli.Get(endpoint_.path("/tags"));

    if (!res) {
        throw ProviderException(name(), utils::describe_http_error(res.error(), endpoint_.origin));
    }
    if (res->status != 200) {
        throw ProviderException(name(), "Failed to fetch installed models: " + utils::extract_error_message(*res));
    }

    json tags = json::parse(res->body, nullptr, false);
    if (tags.is_discarded()) {
        throw ProviderException(name(), "Invalid JSON from /tags");
    }

    auto models = parse_tags(tags);
    if (log_level_ == "debug" || log_level_ == "trace") {
        std::cout << "[Ollama] " << models.size() << " installed model(s)" << std::endl;
    }
    return models;
}

bool OllamaClient::delete_model(const std::string& model_id) {
    httplib::Client cli = make_client(60);
    json body = {{"name", model_id}};

    auto res = cli.Delete(endpoint_.path("/delete"), body.dump(), "application/json");
    if (!res) {
        std::cerr << "[Ollama] Failed to delete model " << model_id << ": "
                  << utils::describe_http_error(res.error(), endpoint_.origin) << std::endl;
        return false;
    }
    if (res->status != 200) {
        std::cerr << "[Ollama] Failed to delete model " << model_id << ": "
                  << utils::extract_error_message(*res) << std::endl;
        return false;
    }

    std::cout << "[Ollama] Deleted model: " << model_id << std::endl;
    return true;
}

json OllamaClient::show_model(const std::string& model_id) {
    httplib::Client cli = make_client(30);
    json body = {{"model", model_id}};

    auto res = cli.Post(endpoint_.path("/show"), body.dump(), "application/json");
    if (!res || res->status != 200) {
        std::cerr << "[Ollama] Failed to get details for " << model_id << std::endl;
        return nullptr;
    }

    json details = json::parse(res->body, nullptr, false);
    if (details.is_discarded()) {
        return nullptr;
    }
    return details;
}

} // namespace providers
} // namespace steward
