/**
 * @file IpcMessage.h
 * @brief Envelope exchanged between host and page over the webview channel.
 *
 * Wire shape:
 *   {"type": string, "id": string?, "payload": any?, "isResponse": bool,
 *    "error": string?}
 * Absent optionals are omitted when writing; isResponse is always written.
 */
#pragma once

#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace wvb {

struct IpcMessage {
    std::string type;
    std::optional<std::string> id;
    /// null means "no payload".
    nlohmann::json payload;
    bool is_response = false;
    std::optional<std::string> error;

    std::string Serialize() const;

    /// @return std::nullopt unless raw is an object matching the wire shape
    static std::optional<IpcMessage> Parse(std::string_view raw);

    static IpcMessage Notification(std::string type, nlohmann::json payload);
    static IpcMessage Request(std::string type, nlohmann::json payload, std::string id);
    static IpcMessage Response(std::string id, nlohmann::json payload);
    static IpcMessage ErrorResponse(std::string id, std::string error);
};

/// 32 lower-case hex digits, unique per call.
std::string GenerateCorrelationId();

}  // namespace wvb
