#include "BridgeError.h"

#include <utility>

#include <spdlog/fmt/fmt.h>

namespace wvb {

const char* ErrorCodeName(ErrorCode code) {
    switch (code) {
        case ErrorCode::kSuccess:
            return "Success";
        case ErrorCode::kInvalidHandle:
            return "InvalidHandle";
        case ErrorCode::kWindowCreationFailed:
            return "WindowCreationFailed";
        case ErrorCode::kWebviewCreationFailed:
            return "WebviewCreationFailed";
        case ErrorCode::kNavigationFailed:
            return "NavigationFailed";
        case ErrorCode::kScriptError:
            return "ScriptError";
        case ErrorCode::kProtocolError:
            return "ProtocolError";
        case ErrorCode::kInvalidParameter:
            return "InvalidParameter";
        case ErrorCode::kNotSupported:
            return "NotSupported";
        case ErrorCode::kEventLoopError:
            return "EventLoopError";
        case ErrorCode::kInvalidState:
            return "InvalidState";
        case ErrorCode::kIpcError:
            return "IpcError";
        case ErrorCode::kUnknown:
            break;
    }
    return "Unknown";
}

ErrorCode ErrorCodeFromResult(wvb_result_t result) {
    switch (result) {
        case WVB_RESULT_OK:
            return ErrorCode::kSuccess;
        case WVB_RESULT_INVALID_ARGUMENT:
            return ErrorCode::kInvalidParameter;
        case WVB_RESULT_INVALID_STATE:
            return ErrorCode::kInvalidState;
        case WVB_RESULT_NOT_SUPPORTED:
            return ErrorCode::kNotSupported;
        case WVB_RESULT_IO_ERROR:
        case WVB_RESULT_INTERNAL_ERROR:
            break;
    }
    return ErrorCode::kUnknown;
}

BridgeError::BridgeError(ErrorCode code, const std::string& message)
    : std::runtime_error(message), code_(code) {}

CreationError::CreationError(ErrorCode code, std::string resource,
                             wvb_result_t native_result, std::string native_message)
    : BridgeError(code, fmt::format("failed to create {}: {} ({})", resource,
                                    native_message.empty() ? "no native error" : native_message,
                                    static_cast<int>(native_result))),
      resource_(std::move(resource)),
      native_result_(native_result),
      native_message_(std::move(native_message)) {}

InitializedError::InitializedError(const std::string& property)
    : BridgeError(ErrorCode::kInvalidState,
                  fmt::format("{} cannot be changed after the window is initialized",
                              property)) {}

NotSupportedError::NotSupportedError(const std::string& message)
    : BridgeError(ErrorCode::kNotSupported, message) {}

IpcError::IpcError(Kind kind, std::string correlation_id, const std::string& message)
    : BridgeError(ErrorCode::kIpcError, message),
      kind_(kind),
      correlation_id_(std::move(correlation_id)) {}

void ThrowIfFailed(wvb_result_t result, const char* what) {
    if (result == WVB_RESULT_OK) {
        return;
    }
    const char* native_message = wvb_get_last_error();
    auto message = fmt::format("{} failed: {}", what,
                               (native_message != nullptr && native_message[0] != '\0')
                                   ? native_message
                                   : "unknown native error");
    if (result == WVB_RESULT_NOT_SUPPORTED) {
        throw NotSupportedError(message);
    }
    throw BridgeError(ErrorCodeFromResult(result), message);
}

}  // namespace wvb
