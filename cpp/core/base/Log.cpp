/**
 * @file Log.cpp
 * @brief Named spdlog loggers used across the bridge.
 */

#include "Log.h"

#include <mutex>

#include <spdlog/sinks/stdout_color_sinks.h>

namespace wvb::log {

namespace {

std::once_flag g_loggers_init_once;

std::shared_ptr<spdlog::logger> EnsureNamedLogger(const char* name) {
    if (auto logger = spdlog::get(name); logger != nullptr) {
        return logger;
    }
    try {
        return spdlog::stdout_color_mt(name);
    } catch (const spdlog::spdlog_ex&) {
        // Another thread registered it first.
        return spdlog::get(name);
    }
}

}  // namespace

void EnsureLoggersInitialized() {
    std::call_once(g_loggers_init_once, []() {
        auto bridge_logger = EnsureNamedLogger(kBridge);
        EnsureNamedLogger(kIpc);
        EnsureNamedLogger(kProtocol);
        EnsureNamedLogger(kNative);
        if (bridge_logger != nullptr) {
            spdlog::set_default_logger(bridge_logger);
        }
    });
}

std::shared_ptr<spdlog::logger> Get(const char* name) {
    EnsureLoggersInitialized();
    return EnsureNamedLogger(name);
}

void SetLevel(spdlog::level::level_enum level) {
    EnsureLoggersInitialized();
    spdlog::set_level(level);
}

}  // namespace wvb::log
