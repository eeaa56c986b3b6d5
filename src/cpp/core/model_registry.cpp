#include "steward/model_registry.h"
#include "steward/error_types.h"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <iostream>

namespace steward {

std::string model_kind_to_string(ModelKind kind) {
    return kind == ModelKind::Embedding ? "embedding" : "chat";
}

ModelKind model_kind_from_string(const std::string& kind) {
    if (kind == "embedding" || kind == "embeddings") {
        return ModelKind::Embedding;
    }
    return ModelKind::Chat;
}

json ModelDescriptor::to_json() const {
    return {
        {"id", id},
        {"name", name},
        {"kind", model_kind_to_string(kind)},
        {"provider", provider},
        {"installed", installed},
        {"hosted", hosted},
        {"details", details},
        {"size", size}
    };
}

std::string normalize_model_tag(const std::string& model_id) {
    // A ':' after the last '/' is a tag separator ("registry:5000/ns/model" has none)
    size_t slash = model_id.rfind('/');
    size_t colon = model_id.find(':', slash == std::string::npos ? 0 : slash);
    if (colon == std::string::npos) {
        return model_id + ":latest";
    }
    return model_id;
}

bool same_model(const std::string& a, const std::string& b) {
    return normalize_model_tag(a) == normalize_model_tag(b);
}

std::optional<ModelDescriptor> IModelRegistry::find_model(const std::string& model_id) {
    for (const auto& model : list_models()) {
        if (same_model(model.id, model_id)) {
            return model;
        }
    }
    return std::nullopt;
}

static std::string to_lower(const std::string& s) {
    std::string lower = s;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower;
}

static bool is_embedding_family(const std::string& family) {
    std::string lower = to_lower(family);
    return lower == "bert" || lower == "nomic-bert" || lower == "embedding";
}

// Embedding models are recognized by name, or by the family the provider
// reports for names that give nothing away ("bge-m3" is a "bert" model)
static ModelKind infer_kind(const std::string& name,
                            const std::string& family = "",
                            const std::vector<std::string>& families = {}) {
    std::string lower = to_lower(name);
    if (lower.find("embed") != std::string::npos ||
        lower.find("minilm") != std::string::npos ||
        lower.find("bert") != std::string::npos) {
        return ModelKind::Embedding;
    }
    if (is_embedding_family(family)) {
        return ModelKind::Embedding;
    }
    for (const auto& f : families) {
        if (is_embedding_family(f)) {
            return ModelKind::Embedding;
        }
    }
    return ModelKind::Chat;
}

ModelRegistry::ModelRegistry(IModelProvider* provider,
                             const std::string& catalog_path,
                             const std::string& log_level)
    : ModelRegistry(provider ? std::vector<IModelProvider*>{provider} : std::vector<IModelProvider*>{},
                    catalog_path, log_level) {
}

ModelRegistry::ModelRegistry(std::vector<IModelProvider*> providers,
                             const std::string& catalog_path,
                             const std::string& log_level)
    : providers_(std::move(providers)), catalog_path_(catalog_path), log_level_(log_level),
      provider_name_(providers_.empty() ? "ollama" : providers_.front()->name()) {
}

json ModelRegistry::builtin_catalog() {
    json catalog = {{"chat", json::array()}, {"embedding", json::array()}};

    for (const char* id : {"llama3", "llama3:8b", "phi3", "mistral", "gemma:2b",
                           "gemma:7b", "neural-chat", "starling-lm", "codellama"}) {
        catalog["chat"].push_back({{"id", id}, {"name", id}, {"details", "Recommended"}});
    }

    catalog["embedding"] = json::array({
        {{"id", "nomic-embed-text"}, {"name", "Nomic Embed Text"}, {"details", "High quality, 768d"}},
        {{"id", "mxbai-embed-large"}, {"name", "Mxbai Embed Large"}, {"details", "State of the art, 1024d"}},
        {{"id", "all-minilm"}, {"name", "All MiniLM"}, {"details", "Small & Fast, 384d"}}
    });

    return catalog;
}

json ModelRegistry::load_catalog() const {
    if (catalog_path_.empty()) {
        return builtin_catalog();
    }

    std::ifstream file(catalog_path_);
    if (!file.is_open()) {
        std::cerr << "[ModelRegistry] Could not open catalog " << catalog_path_
                  << ", using built-in catalog" << std::endl;
        return builtin_catalog();
    }

    json catalog = json::parse(file, nullptr, false);
    if (catalog.is_discarded() || !catalog.is_object()) {
        std::cerr << "[ModelRegistry] Catalog " << catalog_path_
                  << " is not a JSON object, using built-in catalog" << std::endl;
        return builtin_catalog();
    }
    return catalog;
}

void ModelRegistry::build_cache() {
    cache_.clear();

    json catalog = load_catalog();
    for (const char* section : {"chat", "embedding"}) {
        if (!catalog.contains(section) || !catalog[section].is_array()) {
            continue;
        }
        for (const auto& entry : catalog[section]) {
            if (!entry.is_object() || !entry.contains("id") || !entry["id"].is_string()) {
                continue;
            }
            ModelDescriptor model;
            model.id = entry["id"].get<std::string>();
            model.name = entry.value("name", model.id);
            model.details = entry.value("details", "");
            model.kind = model_kind_from_string(section);
            model.provider = entry.value("provider", provider_name_);
            model.hosted = entry.value("hosted", false);
            cache_.push_back(model);
        }
    }

    for (IModelProvider* provider : providers_) {
        std::string provider_name = provider->name();

        std::vector<InstalledModel> installed;
        try {
            installed = provider->list_installed();
        } catch (const std::exception& e) {
            // Still serve the catalog and the other providers
            std::cerr << "[ModelRegistry] Could not list installed models from " << provider_name
                      << ": " << e.what() << std::endl;
            continue;
        }

        for (const auto& inst : installed) {
            ModelDescriptor* existing = find_in_cache(inst.name, provider_name);
            if (existing) {
                existing->installed = true;
                existing->hosted = provider->is_hosted();
                existing->size = inst.size;
                continue;
            }
            ModelDescriptor model;
            model.id = inst.name;
            model.name = inst.name;
            model.kind = infer_kind(inst.name, inst.family, inst.families);
            model.provider = provider_name;
            model.hosted = provider->is_hosted();
            model.installed = true;
            model.size = inst.size;
            if (!inst.parameter_size.empty()) {
                model.details = inst.parameter_size;
                if (!inst.quantization_level.empty()) {
                    model.details += " " + inst.quantization_level;
                }
            }
            cache_.push_back(model);
        }
    }

    cache_valid_ = true;

    int installed_count = 0;
    for (const auto& model : cache_) {
        if (model.installed) {
            installed_count++;
        }
    }
    std::cout << "[ModelRegistry] Cached " << cache_.size() << " models ("
              << installed_count << " installed)" << std::endl;

    if (log_level_ == "debug" || log_level_ == "trace") {
        for (const auto& model : cache_) {
            std::cout << "[ModelRegistry]   " << model.id << " ("
                      << model_kind_to_string(model.kind)
                      << (model.installed ? ", installed" : "") << ")" << std::endl;
        }
    }
}

ModelDescriptor* ModelRegistry::find_in_cache(const std::string& model_id, const std::string& provider) {
    for (auto& model : cache_) {
        if (model.id == model_id && (provider.empty() || model.provider == provider)) {
            return &model;
        }
    }
    for (auto& model : cache_) {
        if (same_model(model.id, model_id) && (provider.empty() || model.provider == provider)) {
            return &model;
        }
    }
    return nullptr;
}

void ModelRegistry::refresh() {
    std::lock_guard<std::mutex> lock(cache_mutex_);
    build_cache();
}

std::vector<ModelDescriptor> ModelRegistry::list_models() {
    std::lock_guard<std::mutex> lock(cache_mutex_);
    if (!cache_valid_) {
        build_cache();
    }
    return cache_;
}

std::vector<ModelDescriptor> ModelRegistry::list_models(ModelKind kind) {
    std::vector<ModelDescriptor> filtered;
    for (const auto& model : list_models()) {
        if (model.kind == kind) {
            filtered.push_back(model);
        }
    }
    return filtered;
}

std::optional<ModelDescriptor> ModelRegistry::find_model(const std::string& model_id) {
    std::lock_guard<std::mutex> lock(cache_mutex_);
    if (!cache_valid_) {
        build_cache();
    }
    ModelDescriptor* model = find_in_cache(model_id);
    if (!model) {
        return std::nullopt;
    }
    return *model;
}

ModelDescriptor ModelRegistry::get_model(const std::string& model_id) {
    auto model = find_model(model_id);
    if (!model) {
        throw ModelNotFoundException(model_id);
    }
    return *model;
}

bool ModelRegistry::is_installed(const std::string& model_id) {
    auto model = find_model(model_id);
    return model && model->installed;
}

void ModelRegistry::mark_installed(const std::string& model_id) {
    std::lock_guard<std::mutex> lock(cache_mutex_);
    if (!cache_valid_) {
        build_cache();
    }

    ModelDescriptor* model = find_in_cache(model_id);
    if (model) {
        model->installed = true;
    } else {
        ModelDescriptor added;
        added.id = model_id;
        added.name = model_id;
        added.kind = infer_kind(model_id);
        added.provider = provider_name_;
        added.installed = true;
        cache_.push_back(added);
    }
    std::cout << "[ModelRegistry] Marked '" << model_id << "' as installed" << std::endl;
}

void ModelRegistry::mark_uninstalled(const std::string& model_id) {
    std::lock_guard<std::mutex> lock(cache_mutex_);
    if (!cache_valid_) {
        build_cache();
    }

    ModelDescriptor* model = find_in_cache(model_id);
    if (model) {
        model->installed = false;
        model->size = 0;
        std::cout << "[ModelRegistry] Marked '" << model_id << "' as not installed" << std::endl;
    }
}

} // namespace steward
