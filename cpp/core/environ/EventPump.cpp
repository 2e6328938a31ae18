/**
 * @file EventPump.cpp
 * @brief Native pump step and the exception boundary around host handlers.
 */

#include "EventPump.h"

#include <cstdint>
#include <limits>
#include <memory>
#include <string>

#include "base/BridgeError.h"
#include "base/Log.h"

namespace wvb {

namespace {

wvb_control_flow_t ToNative(ControlFlow flow) {
    switch (flow) {
        case ControlFlow::kPoll:
            return WVB_CONTROL_FLOW_POLL;
        case ControlFlow::kExit:
            return WVB_CONTROL_FLOW_EXIT;
        case ControlFlow::kWait:
            break;
    }
    return WVB_CONTROL_FLOW_WAIT;
}

uint32_t ToTimeoutMs(std::chrono::milliseconds timeout) {
    if (timeout.count() <= 0) {
        return 0;
    }
    if (timeout.count() > std::numeric_limits<uint32_t>::max()) {
        return std::numeric_limits<uint32_t>::max();
    }
    return static_cast<uint32_t>(timeout.count());
}

}  // namespace

EventPump::EventPump(wvb_event_loop_t loop, CallbackRegistry& registry,
                     BoundaryPolicy policy)
    : loop_(loop), registry_(registry), policy_(policy) {}

// ---------------------------------------------------------------------------
// Boundary trampoline. Nothing thrown by host code may reach native frames.
// ---------------------------------------------------------------------------

wvb_control_flow_t EventPump::OnNativeEvent(const char* event_json, void* user_data) {
    auto* context = static_cast<PumpContext*>(user_data);
    try {
        return ToNative(context->handler(event_json != nullptr ? event_json : ""));
    } catch (const std::exception& e) {
        log::Get(log::kBridge)->error("event handler threw: {}", e.what());
    } catch (...) {
        log::Get(log::kBridge)->error("event handler threw a non-standard exception");
    }
    return context->policy == BoundaryPolicy::kExit ? WVB_CONTROL_FLOW_EXIT
                                                    : WVB_CONTROL_FLOW_WAIT;
}

// ---------------------------------------------------------------------------
// Pumping
// ---------------------------------------------------------------------------

PumpStatus EventPump::PumpOnce(std::chrono::milliseconds timeout,
                               const EventHandler& handler) {
    if (exited_) {
        return PumpStatus::kExit;
    }

    auto context = std::make_shared<PumpContext>(PumpContext{handler, policy_});
    void* user_data = registry_.Register(loop_, context);

    wvb_pump_status_t status = WVB_PUMP_STATUS_CONTINUE;
    const auto result =
        wvb_event_loop_pump_events(loop_, ToTimeoutMs(timeout), &EventPump::OnNativeEvent,
                                   user_data, &status);
    registry_.Release(loop_, user_data);

    if (result != WVB_RESULT_OK) {
        const char* message = wvb_get_last_error();
        throw BridgeError(ErrorCode::kEventLoopError,
                          std::string("event loop pump failed: ") +
                              (message != nullptr ? message : ""));
    }
    if (status == WVB_PUMP_STATUS_EXIT) {
        exited_ = true;
        return PumpStatus::kExit;
    }
    return PumpStatus::kContinue;
}

void EventPump::Run(const EventHandler& handler, std::chrono::milliseconds timeout,
                    const IdleHook& idle) {
    log::Get(log::kBridge)->debug("event pump started");
    while (PumpOnce(timeout, handler) == PumpStatus::kContinue) {
        if (idle) {
            idle();
        }
    }
    log::Get(log::kBridge)->debug("event pump finished");
}

}  // namespace wvb
