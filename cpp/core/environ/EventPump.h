/**
 * @file EventPump.h
 * @brief Cooperative driver of the native event loop.
 *
 * Each PumpOnce() is one native pump step on the calling thread. Records
 * are handed to the host handler synchronously; the handler's ControlFlow
 * is returned to native code. Exceptions thrown by the handler are caught
 * at the boundary, logged and turned into a control flow according to the
 * BoundaryPolicy.
 */
#pragma once

#include <chrono>
#include <functional>
#include <string_view>

#include "base/BridgeConfig.h"
#include "interop/CallbackRegistry.h"
#include "wvb_native_api.h"

namespace wvb {

enum class ControlFlow {
    kPoll,
    kWait,
    kExit,
};

enum class PumpStatus {
    kContinue,
    kExit,
};

class EventPump {
public:
    using EventHandler = std::function<ControlFlow(std::string_view raw_event)>;
    using IdleHook = std::function<void()>;

    EventPump(wvb_event_loop_t loop, CallbackRegistry& registry,
              BoundaryPolicy policy = BoundaryPolicy::kLogAndContinue);

    EventPump(const EventPump&) = delete;
    EventPump& operator=(const EventPump&) = delete;

    /**
     * Run one native pump step.
     *
     * The handler is pinned under the loop handle for the duration of the
     * call. Blocks at most timeout.
     *
     * @throws BridgeError(kEventLoopError) when the native step fails
     */
    PumpStatus PumpOnce(std::chrono::milliseconds timeout, const EventHandler& handler);

    /**
     * Pump until the loop exits, calling idle after every step.
     */
    void Run(const EventHandler& handler, std::chrono::milliseconds timeout,
             const IdleHook& idle = {});

    bool HasExited() const { return exited_; }

    void SetBoundaryPolicy(BoundaryPolicy policy) { policy_ = policy; }
    BoundaryPolicy GetBoundaryPolicy() const { return policy_; }

private:
    struct PumpContext {
        EventHandler handler;
        BoundaryPolicy policy;
    };

    static wvb_control_flow_t OnNativeEvent(const char* event_json, void* user_data);

    wvb_event_loop_t loop_;
    CallbackRegistry& registry_;
    BoundaryPolicy policy_;
    bool exited_ = false;
};

}  // namespace wvb
