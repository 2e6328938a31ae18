/**
 * @file Application.h
 * @brief Owns the event loop and every window; runs the pump.
 *
 * All methods except Quit() and PostUserEvent() must be called on the
 * thread that constructed the Application (the loop thread).
 *
 * Run() returns when Quit() was called, the native loop was destroyed, or
 * the last window closed.
 */
#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "base/BridgeConfig.h"
#include "environ/BridgeWindow.h"
#include "environ/EventLoop.h"
#include "environ/EventPump.h"
#include "environ/GlobalShortcuts.h"
#include "event/EventRouter.h"
#include "event/WindowRegistry.h"

namespace wvb {

class Application {
public:
    using UserEventHandler = std::function<void(const std::string& payload)>;

    explicit Application(const BridgeConfig& config = BridgeConfig::Global(),
                         CallbackRegistry& registry = CallbackRegistry::Shared());
    ~Application();

    Application(const Application&) = delete;
    Application& operator=(const Application&) = delete;

    /// Process-wide instance; nullptr until CreateInstance().
    static Application* GetInstance();
    /**
     * Create the instance on first call: environment options are loaded,
     * the log level applied, and ShutdownInstance() registered to run at
     * exit.
     */
    static Application* CreateInstance();
    static void ShutdownInstance();

    // -----------------------------------------------------------------------
    // Windows
    // -----------------------------------------------------------------------

    /**
     * Create a window. It is initialized right away while Run() is active,
     * otherwise when Run() starts (or InitializePendingWindows()).
     */
    std::shared_ptr<BridgeWindow> CreateWindow(WindowOptions options = {});

    /// Initialize window and start routing its events.
    void InitializeWindow(const std::shared_ptr<BridgeWindow>& window);

    /**
     * Initialize pending windows in creation order.
     *
     * When one fails, it and every window after it stay pending and the
     * error is rethrown, so the caller can fix it and call again.
     * @return the number of windows initialized
     */
    std::size_t InitializePendingWindows();

    std::shared_ptr<BridgeWindow> GetWindow(const std::string& id) const;
    std::vector<std::shared_ptr<BridgeWindow>> Windows() const;
    std::size_t WindowCount() const { return windows_.Size(); }
    std::size_t PendingWindowCount() const { return pending_.size(); }

    /// @return false when no live window has that id or sending failed
    bool SendToWindow(const std::string& id, const std::string& message);

    /**
     * Send message to every live window. Best effort: a failing window is
     * logged and skipped.
     * @return the number of windows the message reached
     */
    std::size_t Broadcast(const std::string& message);

    // -----------------------------------------------------------------------
    // Loop
    // -----------------------------------------------------------------------

    /**
     * Pump until exit, then destroy the remaining windows.
     *
     * @throws BridgeError(kInvalidState) when already running, when the loop
     *         already exited or when there is no window to run
     */
    void Run();

    /// One pump step for hosts that drive their own loop.
    PumpStatus PumpOnce(std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    /// Stop the loop. Thread-safe.
    void Quit();

    /// Deliver payload to OnUserEvent subscribers on the loop thread. Thread-safe.
    bool PostUserEvent(const std::string& payload);

    void OnUserEvent(UserEventHandler handler);

    GlobalShortcuts& Shortcuts() { return shortcuts_; }
    EventRouter& Router() { return router_; }
    const EventLoop& Loop() const { return loop_; }
    const BridgeConfig& Config() const { return config_; }

    bool IsRunning() const { return running_; }
    bool IsQuitRequested() const { return quit_requested_.load(); }
    bool HasExited() const { return pump_.HasExited(); }

private:
    ControlFlow HandleEvent(std::string_view raw_event);
    void HandleApplicationEvent(const Event& event);
    bool ShouldExit() const;
    void RequestLoopExit();
    void ExpireIpcRequests();
    void DestroyAllWindows();

    BridgeConfig config_;
    EventLoop loop_;
    EventPump pump_;
    WindowRegistry windows_;
    EventRouter router_;
    // Declared after loop_ so shortcuts are dropped before the loop.
    GlobalShortcuts shortcuts_;

    std::vector<std::shared_ptr<BridgeWindow>> pending_;
    std::vector<UserEventHandler> user_event_handlers_;

    std::atomic<bool> quit_requested_{false};
    std::atomic<bool> exit_posted_{false};
    bool running_ = false;
    bool had_windows_ = false;
    bool loop_destroyed_ = false;
};

}  // namespace wvb
