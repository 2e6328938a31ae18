/**
 * @file BridgeConfig.h
 * @brief Process-wide bridge options.
 *
 * Options are set by key (see wvb_options.h) or read from the
 * WVB_* environment variables. Application and IpcChannel read the
 * values when they are constructed.
 */
#pragma once

#include <chrono>
#include <string>

#include <spdlog/spdlog.h>

namespace wvb {

/// What the event pump does when a host handler throws.
enum class BoundaryPolicy {
    kLogAndContinue,
    kExit,
};

struct BridgeConfig {
    spdlog::level::level_enum log_level = spdlog::level::info;
    std::chrono::milliseconds pump_timeout{10};
    std::chrono::milliseconds ipc_timeout{30000};
    BoundaryPolicy boundary_policy = BoundaryPolicy::kLogAndContinue;

    /**
     * Apply one option by key.
     *
     * @return false for an unknown key
     * @throws BridgeError(kInvalidParameter) when the value does not parse
     */
    bool SetOption(const std::string& key, const std::string& value);

    /**
     * Apply every WVB_* environment variable that is set.
     * Malformed values are logged and skipped.
     */
    void LoadFromEnvironment();

    /// Push log_level to the named loggers.
    void ApplyLogLevel() const;

    static BridgeConfig& Global();
};

}  // namespace wvb
