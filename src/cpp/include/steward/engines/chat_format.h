#pragma once

#include <string>
#include <nlohmann/json.hpp>

namespace steward {
namespace engines {

using json = nlohmann::json;

// Chat messages for a request: request["messages"] as given, otherwise an
// optional "system" message followed by "prompt" as the user message
json chat_messages(const json& request);

// Parse model output as JSON, falling back to the outermost {...} span.
// Throws ProviderException naming provider.
json parse_json_content(const std::string& content, const std::string& provider);

} // namespace engines
} // namespace steward
