#include "steward/engines/openai_engine.h"
#include "steward/engines/chat_format.h"
#include "steward/error_types.h"
#include <iostream>

namespace steward {
namespace engines {

OpenAiEngine::OpenAiEngine(const utils::ProviderConfig& config, const std::string& log_level)
    : config_(config), log_level_(log_level) {
    config_.api_url = utils::normalize_api_url(config_.api_url);
    endpoint_ = utils::HttpEndpoint::parse(config_.api_url);
}

json OpenAiEngine::post(const std::string& endpoint, const json& body) {
    httplib::Client cli = utils::make_http_client(config_, std::chrono::seconds(REQUEST_TIMEOUT_SECONDS));

    if (log_level_ == "debug" || log_level_ == "trace") {
        std::cout << "[OpenAIEngine] POST " << endpoint_.path(endpoint) << " " << body.dump() << std::endl;
    }

    auto res = cli.Post(endpoint_.path(endpoint), body.dump(), "application/json");
    if (!res) {
        throw ProviderException("openai", utils::describe_http_error(res.error(), endpoint_.origin));
    }
    if (res->status != 200) {
        throw ProviderException("openai", utils::extract_error_message(*res));
    }

    json parsed = json::parse(res->body, nullptr, false);
    if (parsed.is_discarded()) {
        throw ProviderException("openai", "Invalid JSON response from " + endpoint);
    }
    return parsed;
}

void OpenAiEngine::load(const std::string& model_id, const EngineProgressCallback& progress) {
    if (progress) {
        progress("Connecting to " + model_id + "...");
    }

    httplib::Client cli = utils::make_http_client(config_, std::chrono::seconds(30));
    auto res = cli.Get(endpoint_.path("/models/" + model_id));
    if (!res) {
        throw ProviderException("openai", utils::describe_http_error(res.error(), endpoint_.origin));
    }
    if (res->status != 200) {
        throw ProviderException("openai", "Model '" + model_id + "' is not available: " +
                                utils::extract_error_message(*res));
    }

    std::cout << "[OpenAIEngine] Using hosted model: " << model_id << std::endl;
    model_id_ = model_id;

    if (progress) {
        progress(model_id + " ready");
    }
}

void OpenAiEngine::reload(const std::string& model_id, const EngineProgressCallback& progress) {
    // Nothing is held locally, so switching is just binding the new model
    model_id_.clear();
    load(model_id, progress);
}

void OpenAiEngine::unload() {
    model_id_.clear();
}

json OpenAiEngine::chat(const json& request) {
    if (model_id_.empty()) {
        throw EngineNotLoadedException();
    }

    json body = {
        {"model", model_id_},
        {"messages", chat_messages(request)},
        {"response_format", {{"type", "json_object"}}}
    };
    if (request.contains("options") && request["options"].is_object()) {
        for (const auto& option : request["options"].items()) {
            body[option.key()] = option.value();
        }
    }

    json response = post("/chat/completions", body);
    if (!response.contains("choices") || !response["choices"].is_array() || response["choices"].empty()) {
        throw ProviderException("openai", "Chat response has no choices");
    }
    const json& choice = response["choices"][0];
    json message = choice.is_object() ? choice.value("message", json::object()) : json::object();
    if (!message.contains("content") || !message["content"].is_string()) {
        throw ProviderException("openai", "Chat response has no message content");
    }

    return parse_json_content(message["content"].get<std::string>(), "openai");
}

json OpenAiEngine::embed(const json& request) {
    if (model_id_.empty()) {
        throw EngineNotLoadedException();
    }

    json body = {
        {"model", model_id_},
        {"input", request.contains("input") ? request["input"] : json("")}
    };

    json response = post("/embeddings", body);
    if (!response.contains("data") || !response["data"].is_array() || response["data"].empty() ||
        !response["data"][0].contains("embedding")) {
        throw ProviderException("openai", "Embedding response has no data");
    }
    return response["data"][0]["embedding"];
}

OpenAiEngineFactory::OpenAiEngineFactory(const utils::ProviderConfig& config, const std::string& log_level)
    : config_(config), log_level_(log_level) {
}

std::unique_ptr<IInferenceEngine> OpenAiEngineFactory::create(const std::string& model_id,
                                                              const EngineProgressCallback& progress) {
    auto engine = std::make_unique<OpenAiEngine>(config_, log_level_);
    engine->load(model_id, progress);
    return engine;
}

} // namespace engines
} // namespace steward
