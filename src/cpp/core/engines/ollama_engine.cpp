#include "steward/engines/ollama_engine.h"
#include "steward/engines/chat_format.h"
#include "steward/error_types.h"
#include <iostream>

namespace steward {
namespace engines {

OllamaEngine::OllamaEngine(const utils::ProviderConfig& config,
                           KindResolver resolve_kind,
                           const std::string& log_level)
    : config_(config), resolve_kind_(std::move(resolve_kind)), log_level_(log_level) {
    config_.api_url = utils::normalize_api_url(config_.api_url);
    endpoint_ = utils::HttpEndpoint::parse(config_.api_url);
    if (!resolve_kind_) {
        resolve_kind_ = [](const std::string&) { return ModelKind::Chat; };
    }
}

json OllamaEngine::post(const std::string& endpoint, const json& body, int timeout_seconds) {
    httplib::Client cli = utils::make_http_client(config_, std::chrono::seconds(timeout_seconds));

    if (log_level_ == "debug" || log_level_ == "trace") {
        std::cout << "[OllamaEngine] POST " << endpoint_.path(endpoint) << " " << body.dump() << std::endl;
    }

    auto res = cli.Post(endpoint_.path(endpoint), body.dump(), "application/json");
    if (!res) {
        throw ProviderException("ollama", utils::describe_http_error(res.error(), endpoint_.origin));
    }
    if (res->status != 200) {
        throw ProviderException("ollama", utils::extract_error_message(*res));
    }

    json parsed = json::parse(res->body, nullptr, false);
    if (parsed.is_discarded()) {
        throw ProviderException("ollama", "Invalid JSON response from " + endpoint);
    }
    return parsed;
}

void OllamaEngine::send_keep_alive(const std::string& model_id, ModelKind kind, const json& keep_alive) {
    if (kind == ModelKind::Embedding) {
        post("/embed", {{"model", model_id}, {"input", json::array()}, {"keep_alive", keep_alive}},
             REQUEST_TIMEOUT_SECONDS);
    } else {
        post("/generate", {{"model", model_id}, {"prompt", ""}, {"stream", false}, {"keep_alive", keep_alive}},
             REQUEST_TIMEOUT_SECONDS);
    }
}

void OllamaEngine::load(const std::string& model_id, const EngineProgressCallback& progress) {
    ModelKind kind = resolve_kind_(model_id);

    if (progress) {
        progress("Loading " + model_id + "...");
    }
    std::cout << "[OllamaEngine] Loading " << model_kind_to_string(kind) << " model: " << model_id << std::endl;

    // A negative keep_alive keeps the model resident until it is unloaded
    send_keep_alive(model_id, kind, -1);

    model_id_ = model_id;
    kind_ = kind;

    if (progress) {
        progress(model_id + " ready");
    }
}

void OllamaEngine::reload(const std::string& model_id, const EngineProgressCallback& progress) {
    if (!model_id_.empty()) {
        if (progress) {
            progress("Releasing " + model_id_ + "...");
        }
        send_keep_alive(model_id_, kind_, 0);
        model_id_.clear();
    }
    load(model_id, progress);
}

void OllamaEngine::unload() {
    if (model_id_.empty()) {
        return;
    }
    std::string model_id = model_id_;
    model_id_.clear();
    send_keep_alive(model_id, kind_, 0);
}

json OllamaEngine::parse_json_content(const std::string& content) {
    return engines::parse_json_content(content, "ollama");
}

json OllamaEngine::chat(const json& request) {
    if (model_id_.empty()) {
        throw EngineNotLoadedException();
    }

    json body = {
        {"model", model_id_},
        {"messages", chat_messages(request)},
        {"stream", false},
        {"format", "json"}
    };
    if (request.contains("options")) {
        body["options"] = request["options"];
    }

    json response = post("/chat", body, REQUEST_TIMEOUT_SECONDS);
    if (!response.contains("message") || !response["message"].contains("content") ||
        !response["message"]["content"].is_string()) {
        throw ProviderException("ollama", "Chat response has no message content");
    }

    return parse_json_content(response["message"]["content"].get<std::string>());
}

json OllamaEngine::embed(const json& request) {
    if (model_id_.empty()) {
        throw EngineNotLoadedException();
    }

    json body = {
        {"model", model_id_},
        {"input", request.contains("input") ? request["input"] : json("")}
    };

    json response = post("/embed", body, REQUEST_TIMEOUT_SECONDS);
    if (!response.contains("embeddings") || !response["embeddings"].is_array() ||
        response["embeddings"].empty()) {
        throw ProviderException("ollama", "Embed response has no embeddings");
    }
    return response["embeddings"][0];
}

OllamaEngineFactory::OllamaEngineFactory(const utils::ProviderConfig& config,
                                         IModelRegistry* registry,
                                         const std::string& log_level)
    : config_(config), registry_(registry), log_level_(log_level) {
}

std::unique_ptr<IInferenceEngine> OllamaEngineFactory::create(const std::string& model_id,
                                                              const EngineProgressCallback& progress) {
    IModelRegistry* registry = registry_;
    auto engine = std::make_unique<OllamaEngine>(config_,
        [registry](const std::string& id) {
            if (registry) {
                auto model = registry->find_model(id);
                if (model) {
                    return model->kind;
                }
            }
            return ModelKind::Chat;
        },
        log_level_);

    engine->load(model_id, progress);
    return engine;
}

} // namespace engines
} // namespace steward
