#include "steward/engines/provider_engine_factory.h"

namespace steward {
namespace engines {

ProviderEngineFactory::ProviderEngineFactory(IModelRegistry& registry, IEngineFactory& fallback)
    : registry_(registry), fallback_(fallback) {
}

void ProviderEngineFactory::add(const std::string& provider, IEngineFactory& factory) {
    factories_[provider] = &factory;
}

std::unique_ptr<IInferenceEngine> ProviderEngineFactory::create(const std::string& model_id,
                                                                const EngineProgressCallback& progress) {
    auto model = registry_.find_model(model_id);
    if (model) {
        auto it = factories_.find(model->provider);
        if (it != factories_.end()) {
            return it->second->create(model_id, progress);
        }
    }
    return fallback_.create(model_id, progress);
}

} // namespace engines
} // namespace steward
