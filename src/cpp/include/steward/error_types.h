#pragma once

#include <stdexcept>
#include <string>
#include <nlohmann/json.hpp>

namespace steward {

using json = nlohmann::json;

// Base class for all errors that cross a component boundary
class StewardException : public std::runtime_error {
public:
    StewardException(const std::string& message, const std::string& type)
        : std::runtime_error(message), type_(type) {}

    const std::string& type() const { return type_; }

private:
    std::string type_;
};

// The user (or a disconnected client) cancelled an in-flight download
class DownloadCancelledException : public StewardException {
public:
    explicit DownloadCancelledException(const std::string& model_id)
        : StewardException("Download cancelled: " + model_id, "download_cancelled"),
          model_id_(model_id) {}

    const std::string& model_id() const { return model_id_; }

private:
    std::string model_id_;
};

// Every attempt failed with a retryable error; carries the last underlying reason
class RetriesExhaustedException : public StewardException {
public:
    RetriesExhaustedException(const std::string& model_id, int attempts, const std::string& last_reason)
        : StewardException("Failed to pull model '" + model_id + "' after " +
                           std::to_string(attempts) + " attempts: " + last_reason,
                           "retries_exhausted"),
          model_id_(model_id), attempts_(attempts), last_reason_(last_reason) {}

    const std::string& model_id() const { return model_id_; }
    int attempts() const { return attempts_; }
    const std::string& last_reason() const { return last_reason_; }

private:
    std::string model_id_;
    int attempts_;
    std::string last_reason_;
};

// A download of the same model is already running
class DownloadInProgressException : public StewardException {
public:
    explicit DownloadInProgressException(const std::string& model_id)
        : StewardException("A download of '" + model_id + "' is already in progress",
                           "download_in_progress") {}
};

// Engine creation failed (after the reload fallback, if any). The manager is left unloaded.
class EngineCreationException : public StewardException {
public:
    EngineCreationException(const std::string& model_id, const std::string& reason)
        : StewardException("Model '" + model_id + "' failed to load, retry. (" + reason + ")",
                           "engine_creation_failed"),
          model_id_(model_id), reason_(reason) {}

    const std::string& model_id() const { return model_id_; }
    const std::string& reason() const { return reason_; }

private:
    std::string model_id_;
    std::string reason_;
};

class EngineNotLoadedException : public StewardException {
public:
    EngineNotLoadedException()
        : StewardException("No model is active. Activate a model first.", "engine_not_loaded") {}
};

class ModelNotFoundException : public StewardException {
public:
    explicit ModelNotFoundException(const std::string& model_id)
        : StewardException("Model not found: " + model_id, "model_not_found") {}
};

// Failure talking to a model provider (HTTP error, refused operation)
class ProviderException : public StewardException {
public:
    ProviderException(const std::string& provider, const std::string& reason)
        : StewardException("[" + provider + "] " + reason, "provider_error") {}
};

struct ErrorResponse {
    static json from_exception(const StewardException& e) {
        return {
            {"error", {
                {"message", e.what()},
                {"type", e.type()}
            }}
        };
    }
};

} // namespace steward
