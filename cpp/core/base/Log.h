/**
 * @file Log.h
 * @brief Named spdlog loggers used across the bridge.
 */
#pragma once

#include <memory>

#include <spdlog/spdlog.h>

namespace wvb::log {

inline constexpr const char* kBridge = "bridge";
inline constexpr const char* kIpc = "ipc";
inline constexpr const char* kProtocol = "protocol";
inline constexpr const char* kNative = "native";

/**
 * Create the named loggers once and make "bridge" the default logger.
 * Safe to call from any thread, any number of times.
 */
void EnsureLoggersInitialized();

/**
 * Fetch a named logger, creating it on first use.
 */
std::shared_ptr<spdlog::logger> Get(const char* name);

void SetLevel(spdlog::level::level_enum level);

}  // namespace wvb::log
