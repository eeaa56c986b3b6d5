#include "steward/model_steward.h"
#include "steward/error_types.h"
#include <iostream>

namespace steward {

ModelSteward::ModelSteward(IModelProvider& provider,
                           ModelRegistry& registry,
                           AcquisitionController& acquisition,
                           EngineLifecycleManager& engine,
                           const std::string& log_level)
    : provider_(provider), registry_(registry), acquisition_(acquisition),
      engine_(engine), log_level_(log_level) {
}

void ModelSteward::ensure_ready(const std::string& model_id,
                                const AcquisitionProgressCallback& on_progress,
                                CancellationToken& cancel_token,
                                const EngineProgressCallback& on_engine_progress) {
    auto model = registry_.find_model(model_id);

    if (model && model->hosted) {
        std::cout << "[Steward] " << model_id << " is hosted by " << model->provider
                  << ", nothing to download" << std::endl;
    } else if (!model || !model->installed) {
        std::cout << "[Steward] " << model_id << " is not installed, pulling first" << std::endl;
        acquisition_.acquire(model_id, on_progress, cancel_token);
        registry_.mark_installed(model_id);
    } else if (log_level_ == "debug" || log_level_ == "trace") {
        std::cout << "[Steward] " << model_id << " already installed" << std::endl;
    }

    engine_.activate(model_id, on_engine_progress);
}

void ModelSteward::pull(const std::string& model_id,
                        const AcquisitionProgressCallback& on_progress,
                        CancellationToken& cancel_token) {
    auto model = registry_.find_model(model_id);
    if (model && model->hosted) {
        throw ProviderException(model->provider, "'" + model_id + "' is hosted and cannot be downloaded");
    }

    acquisition_.acquire(model_id, on_progress, cancel_token);
    registry_.mark_installed(model_id);
}

void ModelSteward::remove(const std::string& model_id) {
    std::cout << "[Steward] Deleting model: " << model_id << std::endl;

    if (acquisition_.is_acquiring(model_id)) {
        throw DownloadInProgressException(model_id);
    }

    auto model = registry_.find_model(model_id);
    if (model && model->hosted) {
        throw ProviderException(model->provider, "'" + model_id + "' is hosted and cannot be deleted");
    }

    // Release the model before the provider removes its files
    std::string active = engine_.active_model();
    if (!active.empty() && same_model(active, model_id)) {
        std::cout << "[Steward] Model is loaded, unloading before delete: " << model_id << std::endl;
        engine_.shutdown();
    }

    if (!provider_.delete_model(model_id)) {
        throw ProviderException(provider_.name(), "Failed to delete model '" + model_id + "'");
    }

    registry_.mark_uninstalled(model_id);
    std::cout << "[Steward] Deleted model: " << model_id << std::endl;
}

std::vector<ModelDescriptor> ModelSteward::list_models() {
    return registry_.list_models();
}

std::vector<ModelDescriptor> ModelSteward::list_models(ModelKind kind) {
    return registry_.list_models(kind);
}

} // namespace steward
