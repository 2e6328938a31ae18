#include "BridgeConfig.h"

#include <cstdint>
#include <cstdlib>
#include <limits>

#include "BridgeError.h"
#include "Log.h"
#include "wvb_options.h"

namespace wvb {

namespace {

std::chrono::milliseconds ParseMilliseconds(const std::string& key,
                                            const std::string& value) {
    std::size_t consumed = 0;
    long long parsed = 0;
    try {
        parsed = std::stoll(value, &consumed);
    } catch (const std::logic_error&) {
        consumed = 0;
    }
    if (consumed != value.size() || value.empty() || parsed < 0 ||
        parsed > std::numeric_limits<uint32_t>::max()) {
        throw BridgeError(ErrorCode::kInvalidParameter,
                          key + " expects a non-negative millisecond count, got '" + value + "'");
    }
    return std::chrono::milliseconds(parsed);
}

spdlog::level::level_enum ParseLevel(const std::string& value) {
    const auto level = spdlog::level::from_str(value);
    // from_str maps unknown names to "off"
    if (level == spdlog::level::off && value != "off") {
        throw BridgeError(ErrorCode::kInvalidParameter,
                          "unknown log level '" + value + "'");
    }
    return level;
}

BoundaryPolicy ParsePolicy(const std::string& value) {
    if (value == WVB_BOUNDARY_POLICY_CONTINUE) {
        return BoundaryPolicy::kLogAndContinue;
    }
    if (value == WVB_BOUNDARY_POLICY_EXIT) {
        return BoundaryPolicy::kExit;
    }
    throw BridgeError(ErrorCode::kInvalidParameter,
                      "unknown boundary policy '" + value + "'");
}

}  // namespace

bool BridgeConfig::SetOption(const std::string& key, const std::string& value) {
    if (key == WVB_OPTION_LOG_LEVEL) {
        log_level = ParseLevel(value);
    } else if (key == WVB_OPTION_PUMP_TIMEOUT_MS) {
        pump_timeout = ParseMilliseconds(key, value);
    } else if (key == WVB_OPTION_IPC_TIMEOUT_MS) {
        ipc_timeout = ParseMilliseconds(key, value);
    } else if (key == WVB_OPTION_BOUNDARY_POLICY) {
        boundary_policy = ParsePolicy(value);
    } else {
        return false;
    }
    return true;
}

void BridgeConfig::LoadFromEnvironment() {
    static const struct {
        const char* env;
        const char* key;
    } kOverrides[] = {
        {WVB_ENV_LOG_LEVEL, WVB_OPTION_LOG_LEVEL},
        {WVB_ENV_PUMP_TIMEOUT_MS, WVB_OPTION_PUMP_TIMEOUT_MS},
        {WVB_ENV_IPC_TIMEOUT_MS, WVB_OPTION_IPC_TIMEOUT_MS},
        {WVB_ENV_BOUNDARY_POLICY, WVB_OPTION_BOUNDARY_POLICY},
    };
    for (const auto& entry : kOverrides) {
        const char* value = std::getenv(entry.env);
        if (value == nullptr) {
            continue;
        }
        try {
            SetOption(entry.key, value);
        } catch (const BridgeError& e) {
            log::Get(log::kBridge)->warn("ignoring {}: {}", entry.env, e.what());
        }
    }
}

void BridgeConfig::ApplyLogLevel() const {
    log::SetLevel(log_level);
}

BridgeConfig& BridgeConfig::Global() {
    static BridgeConfig config;
    return config;
}

}  // namespace wvb
