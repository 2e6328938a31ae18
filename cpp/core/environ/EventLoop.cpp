#include "EventLoop.h"

#include "base/Log.h"

namespace wvb {

EventLoop::EventLoop(CallbackRegistry& registry)
    : registry_(registry),
      loop_(CreateEventLoop(registry)),
      proxy_(CreateEventLoopProxy(loop_)) {}

bool EventLoop::RequestExit() {
    const auto result = wvb_event_loop_proxy_request_exit(proxy_.Get());
    if (result != WVB_RESULT_OK) {
        log::Get(log::kBridge)->debug("exit request not delivered: {}", wvb_get_last_error());
        return false;
    }
    return true;
}

bool EventLoop::PostUserEvent(const std::string& payload) {
    const auto result = wvb_event_loop_proxy_send_user_event(proxy_.Get(), payload.c_str());
    if (result != WVB_RESULT_OK) {
        log::Get(log::kBridge)->warn("user event not delivered: {}", wvb_get_last_error());
        return false;
    }
    return true;
}

}  // namespace wvb
