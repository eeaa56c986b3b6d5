#pragma once

#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "model_provider.h"

namespace steward {

using json = nlohmann::json;

enum class ModelKind {
    Chat,
    Embedding
};

std::string model_kind_to_string(ModelKind kind);
ModelKind model_kind_from_string(const std::string& kind);

struct ModelDescriptor {
    std::string id;
    std::string name;           // Display name
    ModelKind kind = ModelKind::Chat;
    std::string provider;
    bool installed = false;
    bool hosted = false;        // Served remotely, never acquired
    std::string details;        // "Recommended", "High quality, 768d", ...
    uint64_t size = 0;          // Bytes on disk, 0 when not installed

    json to_json() const;
};

// "llama3" -> "llama3:latest"; names that already carry a tag are unchanged
std::string normalize_model_tag(const std::string& model_id);

// True if both names refer to the same model once tags are normalized
bool same_model(const std::string& a, const std::string& b);

// Catalog boundary. The lifecycle core only reads it and reports state changes.
class IModelRegistry {
public:
    virtual ~IModelRegistry() = default;

    virtual std::vector<ModelDescriptor> list_models() = 0;
    virtual void mark_installed(const std::string& model_id) = 0;
    virtual void mark_uninstalled(const std::string& model_id) = 0;

    virtual std::optional<ModelDescriptor> find_model(const std::string& model_id);
};

/**
 * Catalog of recommended models merged with what the providers have installed.
 *
 * The catalog comes from a JSON file ({"chat": [...], "embedding": [...]}) or,
 * when no file is configured, from a built-in list. Catalog entries belong to
 * the first provider unless they name another one. Each provider's installed
 * models are matched against entries of that provider; the rest are appended.
 * A provider that cannot be reached is skipped. The merged view is cached
 * until refresh().
 */
class ModelRegistry : public IModelRegistry {
public:
    ModelRegistry(IModelProvider* provider,
                  const std::string& catalog_path = "",
                  const std::string& log_level = "info");

    // Providers are non-owning and must outlive the registry
    ModelRegistry(std::vector<IModelProvider*> providers,
                  const std::string& catalog_path = "",
                  const std::string& log_level = "info");

    // Rebuild the cache from the catalog and the provider's installed list
    void refresh();

    std::vector<ModelDescriptor> list_models() override;
    std::vector<ModelDescriptor> list_models(ModelKind kind);

    // Throws ModelNotFoundException
    ModelDescriptor get_model(const std::string& model_id);

    bool is_installed(const std::string& model_id);

    void mark_installed(const std::string& model_id) override;
    void mark_uninstalled(const std::string& model_id) override;

    std::optional<ModelDescriptor> find_model(const std::string& model_id) override;

    static json builtin_catalog();

private:
    json load_catalog() const;
    void build_cache();
    // Empty provider matches any
    ModelDescriptor* find_in_cache(const std::string& model_id, const std::string& provider = "");

    std::vector<IModelProvider*> providers_;   // Non-owning
    std::string catalog_path_;
    std::string log_level_;
    std::string provider_name_;

    std::mutex cache_mutex_;
    std::vector<ModelDescriptor> cache_;
    bool cache_valid_ = false;
};

} // namespace steward
