/**
 * @file BridgeError.h
 * @brief Exception hierarchy raised by the host side of the bridge.
 */
#pragma once

#include <stdexcept>
#include <string>

#include "wvb_native_api.h"

namespace wvb {

enum class ErrorCode {
    kSuccess = 0,
    kInvalidHandle = 1,
    kWindowCreationFailed = 2,
    kWebviewCreationFailed = 3,
    kNavigationFailed = 4,
    kScriptError = 5,
    kProtocolError = 6,
    kInvalidParameter = 7,
    kNotSupported = 8,
    kEventLoopError = 12,
    kInvalidState = 13,
    kIpcError = 14,
    kUnknown = 255,
};

const char* ErrorCodeName(ErrorCode code);

/// Maps a native result code onto the host error taxonomy.
ErrorCode ErrorCodeFromResult(wvb_result_t result);

class BridgeError : public std::runtime_error {
public:
    BridgeError(ErrorCode code, const std::string& message);

    ErrorCode code() const { return code_; }

private:
    ErrorCode code_;
};

/// A native resource could not be created; carries the native last error.
class CreationError : public BridgeError {
public:
    CreationError(ErrorCode code, std::string resource, wvb_result_t native_result,
                  std::string native_message);

    const std::string& resource() const { return resource_; }
    wvb_result_t native_result() const { return native_result_; }
    const std::string& native_message() const { return native_message_; }

private:
    std::string resource_;
    wvb_result_t native_result_;
    std::string native_message_;
};

/// A creation-only property was changed after the window was initialized.
class InitializedError : public BridgeError {
public:
    explicit InitializedError(const std::string& property);
};

class NotSupportedError : public BridgeError {
public:
    explicit NotSupportedError(const std::string& message);
};

class IpcError : public BridgeError {
public:
    enum class Kind {
        kTimeout,
        kRemote,
        kCancelled,
        kTransport,
    };

    IpcError(Kind kind, std::string correlation_id, const std::string& message);

    Kind kind() const { return kind_; }
    const std::string& correlation_id() const { return correlation_id_; }

private:
    Kind kind_;
    std::string correlation_id_;
};

/**
 * Throws BridgeError built from wvb_get_last_error() when result is not
 * WVB_RESULT_OK, NotSupportedError for WVB_RESULT_NOT_SUPPORTED. what names
 * the failed operation.
 */
void ThrowIfFailed(wvb_result_t result, const char* what);

}  // namespace wvb
