#pragma once

#include <string>
#include <vector>
#include "acquisition_controller.h"
#include "engine_manager.h"
#include "model_provider.h"
#include "model_registry.h"

namespace steward {

/**
 * Front door for callers that just want a usable model: looks the model up,
 * downloads it when missing, then binds the engine to it. Also owns the
 * housekeeping paths (remove, list) that must coordinate with the engine.
 */
class ModelSteward {
public:
    ModelSteward(IModelProvider& provider,
                 ModelRegistry& registry,
                 AcquisitionController& acquisition,
                 EngineLifecycleManager& engine,
                 const std::string& log_level = "info");

    // Acquire if not installed, then activate. Hosted models are never
    // acquired. Throws whatever acquire() or activate() throws.
    void ensure_ready(const std::string& model_id,
                      const AcquisitionProgressCallback& on_progress,
                      CancellationToken& cancel_token,
                      const EngineProgressCallback& on_engine_progress = nullptr);

    // Download without activating. Throws ProviderException for hosted models.
    void pull(const std::string& model_id,
              const AcquisitionProgressCallback& on_progress,
              CancellationToken& cancel_token);

    // Throws DownloadInProgressException while the model is being pulled and
    // ProviderException for hosted models or when the provider refuses the delete
    void remove(const std::string& model_id);

    std::vector<ModelDescriptor> list_models();
    std::vector<ModelDescriptor> list_models(ModelKind kind);

    EngineLifecycleManager& engine() { return engine_; }
    ModelRegistry& registry() { return registry_; }

private:
    IModelProvider& provider_;
    ModelRegistry& registry_;
    AcquisitionController& acquisition_;
    EngineLifecycleManager& engine_;
    std::string log_level_;
};

} // namespace steward
