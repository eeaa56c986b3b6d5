#include "steward/engines/chat_format.h"
#include "steward/error_types.h"

namespace steward {
namespace engines {

json chat_messages(const json& request) {
    if (request.contains("messages") && request["messages"].is_array()) {
        return request["messages"];
    }

    json messages = json::array();
    if (request.contains("system")) {
        messages.push_back({{"role", "system"}, {"content", request["system"]}});
    }
    messages.push_back({{"role", "user"}, {"content", request.value("prompt", "")}});
    return messages;
}

json parse_json_content(const std::string& content, const std::string& provider) {
    json parsed = json::parse(content, nullptr, false);
    if (!parsed.is_discarded()) {
        return parsed;
    }

    // Chatty models wrap the object in prose or markdown fences
    size_t open = content.find('{');
    size_t close = content.rfind('}');
    if (open != std::string::npos && close != std::string::npos && close > open) {
        parsed = json::parse(content.substr(open, close - open + 1), nullptr, false);
        if (!parsed.is_discarded()) {
            return parsed;
        }
    }

    throw ProviderException(provider, "Could not parse JSON from model output");
}

} // namespace engines
} // namespace steward
