#pragma once

#include <map>
#include <string>
#include "../inference_engine.h"
#include "../model_registry.h"

namespace steward {
namespace engines {

// Creates engines with the factory of the provider that serves the model,
// as recorded in the registry. Models of unknown providers use the fallback.
class ProviderEngineFactory : public IEngineFactory {
public:
    ProviderEngineFactory(IModelRegistry& registry, IEngineFactory& fallback);

    // Factories are non-owning
    void add(const std::string& provider, IEngineFactory& factory);

    std::unique_ptr<IInferenceEngine> create(const std::string& model_id,
                                             const EngineProgressCallback& progress) override;

private:
    IModelRegistry& registry_;
    IEngineFactory& fallback_;
    std::map<std::string, IEngineFactory*> factories_;
};

} // namespace engines
} // namespace steward
