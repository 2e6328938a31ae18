/**
 * @file EventLoop.h
 * @brief Owns a native event loop and the proxy used to wake it.
 */
#pragma once

#include <string>

#include "interop/NativeHandle.h"

namespace wvb {

class EventLoop {
public:
    explicit EventLoop(CallbackRegistry& registry = CallbackRegistry::Shared());
    ~EventLoop() = default;

    EventLoop(const EventLoop&) = delete;
    EventLoop& operator=(const EventLoop&) = delete;

    wvb_event_loop_t Get() const { return loop_.Get(); }
    const EventLoopHandle& Handle() const { return loop_; }
    wvb_event_loop_proxy_t Proxy() const { return proxy_.Get(); }
    CallbackRegistry& Registry() const { return registry_; }

    /**
     * Ask the loop to exit. Thread-safe.
     * @return false when the loop is already gone or has exited
     */
    bool RequestExit();

    /**
     * Deliver payload as a "user-event" record. Thread-safe.
     * @return false when the loop is already gone or has exited
     */
    bool PostUserEvent(const std::string& payload);

private:
    CallbackRegistry& registry_;
    EventLoopHandle loop_;
    // Declared after loop_ so it is released first.
    EventLoopProxyHandle proxy_;
};

}  // namespace wvb
