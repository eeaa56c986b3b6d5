#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace steward {

// A model as reported by the provider's installed list
struct InstalledModel {
    std::string name;               // Includes the tag, e.g. "llama3:latest"
    uint64_t size = 0;
    std::string digest;
    std::string modified_at;
    std::string family;
    std::vector<std::string> families;
    std::string parameter_size;
    std::string quantization_level;
};

// Backend that hosts models on disk (Ollama and the like) or serves them
// remotely (hosted OpenAI-compatible services)
class IModelProvider {
public:
    virtual ~IModelProvider() = default;

    virtual std::string name() const = 0;

    // Hosted models are always available and are never downloaded or deleted
    virtual bool is_hosted() const { return false; }

    virtual bool is_available() = 0;

    // Throws ProviderException when the provider cannot be reached
    virtual std::vector<InstalledModel> list_installed() = 0;

    // Returns false on failure; never throws. Also used for best-effort cleanup
    // of partially downloaded models.
    virtual bool delete_model(const std::string& model_id) = 0;
};

} // namespace steward
