/**
 * @file EventRouter.h
 * @brief Routes decoded events to the application or to one window.
 *
 * Routing order:
 *   1. application kinds (global-shortcut, user-exit, user-event,
 *      loop-destroyed) go to the application handler;
 *   2. a registered window id forwards to that window;
 *   3. records without a window id are dropped;
 *   4. unknown window ids are dropped (the window is already gone).
 *
 * After a close-requested or destroyed event, a window that reports
 * ShouldExit() is unregistered and destroyed exactly once.
 */
#pragma once

#include <functional>
#include <memory>
#include <string_view>

#include "event/Event.h"
#include "event/WindowRegistry.h"

namespace wvb {

enum class RouteResult {
    kApplication,
    kWindow,
    kIgnored,
    kMalformed,
};

class EventRouter {
public:
    using ApplicationHandler = std::function<void(const Event&)>;
    using RemovedHandler = std::function<void(const std::shared_ptr<EventTarget>&)>;

    explicit EventRouter(WindowRegistry& windows);

    void SetApplicationHandler(ApplicationHandler handler);

    /// Called after a window was unregistered and destroyed.
    void SetRemovedHandler(RemovedHandler handler);

    RouteResult Dispatch(std::string_view raw_event);
    RouteResult Dispatch(const Event& event);

private:
    WindowRegistry& windows_;
    ApplicationHandler application_handler_;
    RemovedHandler removed_handler_;
};

}  // namespace wvb
