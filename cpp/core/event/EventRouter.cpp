#include "EventRouter.h"

#include <utility>

#include "base/Log.h"

namespace wvb {

EventRouter::EventRouter(WindowRegistry& windows) : windows_(windows) {}

void EventRouter::SetApplicationHandler(ApplicationHandler handler) {
    application_handler_ = std::move(handler);
}

void EventRouter::SetRemovedHandler(RemovedHandler handler) {
    removed_handler_ = std::move(handler);
}

RouteResult EventRouter::Dispatch(std::string_view raw_event) {
    auto event = DecodeEvent(raw_event);
    if (!event) {
        log::Get(log::kBridge)->warn("dropping malformed event record: {}", raw_event);
        return RouteResult::kMalformed;
    }
    return Dispatch(*event);
}

RouteResult EventRouter::Dispatch(const Event& event) {
    if (IsApplicationEvent(event)) {
        if (application_handler_) {
            application_handler_(event);
        }
        return RouteResult::kApplication;
    }

    const std::string* window_id = WindowIdOf(event);
    if (window_id == nullptr) {
        return RouteResult::kIgnored;
    }

    auto target = windows_.Find(*window_id);
    if (target == nullptr) {
        log::Get(log::kBridge)->debug("{} for unknown window {} ignored",
                                      EventTypeName(event), *window_id);
        return RouteResult::kIgnored;
    }

    target->DispatchEvent(event);

    const bool closing = std::holds_alternative<CloseRequestedEvent>(event) ||
                         std::holds_alternative<DestroyedEvent>(event);
    if (closing && target->ShouldExit() && windows_.Unregister(target->Id())) {
        log::Get(log::kBridge)->debug("window {} closed", target->Id());
        target->Destroy();
        if (removed_handler_) {
            removed_handler_(target);
        }
    }
    return RouteResult::kWindow;
}

}  // namespace wvb
