#include "IpcMessage.h"

#include <cstdint>
#include <random>
#include <utility>

#include <spdlog/fmt/fmt.h>

namespace wvb {

using nlohmann::json;

std::string IpcMessage::Serialize() const {
    json envelope = json::object();
    envelope["type"] = type;
    if (id) {
        envelope["id"] = *id;
    }
    if (!payload.is_null()) {
        envelope["payload"] = payload;
    }
    envelope["isResponse"] = is_response;
    if (error) {
        envelope["error"] = *error;
    }
    return envelope.dump();
}

std::optional<IpcMessage> IpcMessage::Parse(std::string_view raw) {
    const auto envelope = json::parse(raw.begin(), raw.end(), nullptr, false);
    if (envelope.is_discarded() || !envelope.is_object()) {
        return std::nullopt;
    }

    IpcMessage message;
    if (auto it = envelope.find("type"); it != envelope.end() && !it->is_null()) {
        if (!it->is_string()) {
            return std::nullopt;
        }
        message.type = it->get<std::string>();
    }
    if (auto it = envelope.find("id"); it != envelope.end() && !it->is_null()) {
        if (!it->is_string()) {
            return std::nullopt;
        }
        message.id = it->get<std::string>();
    }
    if (auto it = envelope.find("payload"); it != envelope.end()) {
        message.payload = *it;
    }
    if (auto it = envelope.find("isResponse"); it != envelope.end() && !it->is_null()) {
        if (!it->is_boolean()) {
            return std::nullopt;
        }
        message.is_response = it->get<bool>();
    }
    if (auto it = envelope.find("error"); it != envelope.end() && !it->is_null()) {
        if (!it->is_string()) {
            return std::nullopt;
        }
        message.error = it->get<std::string>();
    }

    // A request needs a type to be routed; a response is routed by id.
    if (message.is_response ? !message.id.has_value() : message.type.empty()) {
        return std::nullopt;
    }
    return message;
}

IpcMessage IpcMessage::Notification(std::string type, json payload) {
    IpcMessage message;
    message.type = std::move(type);
    message.payload = std::move(payload);
    return message;
}

IpcMessage IpcMessage::Request(std::string type, json payload, std::string id) {
    IpcMessage message = Notification(std::move(type), std::move(payload));
    message.id = std::move(id);
    return message;
}

IpcMessage IpcMessage::Response(std::string id, json payload) {
    IpcMessage message;
    message.id = std::move(id);
    message.payload = std::move(payload);
    message.is_response = true;
    return message;
}

IpcMessage IpcMessage::ErrorResponse(std::string id, std::string error) {
    IpcMessage message;
    message.id = std::move(id);
    message.is_response = true;
    message.error = std::move(error);
    return message;
}

std::string GenerateCorrelationId() {
    thread_local std::mt19937_64 engine{std::random_device{}()};
    const uint64_t high = engine();
    const uint64_t low = engine();
    return fmt::format("{:016x}{:016x}", high, low);
}

}  // namespace wvb
