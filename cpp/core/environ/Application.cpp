#include "Application.h"

#include <cstdlib>
#include <exception>
#include <memory>
#include <mutex>
#include <utility>
#include <variant>

#include "base/BridgeError.h"
#include "base/Log.h"

namespace wvb {

namespace {

std::mutex g_instance_mutex;
std::unique_ptr<Application> g_instance;
std::once_flag g_exit_hook_once;

void ShutdownInstanceAtExit() {
    Application::ShutdownInstance();
}

}  // namespace

Application* Application::GetInstance() {
    std::lock_guard<std::mutex> guard(g_instance_mutex);
    return g_instance.get();
}

Application* Application::CreateInstance() {
    std::lock_guard<std::mutex> guard(g_instance_mutex);
    if (g_instance == nullptr) {
        BridgeConfig::Global().LoadFromEnvironment();
        BridgeConfig::Global().ApplyLogLevel();
        g_instance = std::make_unique<Application>(BridgeConfig::Global());
        // Registered after the loggers, the callback registry and the native
        // runtime exist, so the hook runs before any of them is torn down.
        std::call_once(g_exit_hook_once, []() {
            if (std::atexit(ShutdownInstanceAtExit) != 0) {
                log::Get(log::kBridge)->warn(
                    "could not install exit hook; call ShutdownInstance() before exit");
            }
        });
    }
    return g_instance.get();
}

void Application::ShutdownInstance() {
    std::unique_ptr<Application> instance;
    {
        std::lock_guard<std::mutex> guard(g_instance_mutex);
        instance = std::move(g_instance);
    }
    instance.reset();
}

Application::Application(const BridgeConfig& config, CallbackRegistry& registry)
    : config_(config),
      loop_(registry),
      pump_(loop_.Get(), registry, config.boundary_policy),
      router_(windows_),
      shortcuts_(loop_.Get()) {
    log::EnsureLoggersInitialized();
    router_.SetApplicationHandler([this](const Event& event) { HandleApplicationEvent(event); });
    router_.SetRemovedHandler([](const std::shared_ptr<EventTarget>& target) {
        log::Get(log::kBridge)->info("window {} removed", target->Id());
    });
}

Application::~Application() {
    DestroyAllWindows();
    pending_.clear();
}

// ---------------------------------------------------------------------------
// Windows
// ---------------------------------------------------------------------------

std::shared_ptr<BridgeWindow> Application::CreateWindow(WindowOptions options) {
    auto window = std::make_shared<BridgeWindow>(std::move(options));
    if (running_) {
        InitializeWindow(window);
    } else {
        pending_.push_back(window);
    }
    return window;
}

void Application::InitializeWindow(const std::shared_ptr<BridgeWindow>& window) {
    if (window == nullptr) {
        throw BridgeError(ErrorCode::kInvalidParameter, "window is null");
    }
    window->Initialize(loop_.Handle());
    if (!windows_.Register(window)) {
        window->Destroy();
        throw BridgeError(ErrorCode::kInvalidState,
                          "window id '" + window->Id() + "' is already registered");
    }
    had_windows_ = true;
    log::Get(log::kBridge)->info("window {} opened: {}", window->Id(), window->Options().title);
}

std::size_t Application::InitializePendingWindows() {
    std::vector<std::shared_ptr<BridgeWindow>> pending;
    pending.swap(pending_);
    std::size_t count = 0;
    for (auto it = pending.begin(); it != pending.end(); ++it) {
        const auto& window = *it;
        if (window->State() != WindowState::kPending) {
            continue;
        }
        try {
            InitializeWindow(window);
        } catch (const std::exception&) {
            // The failed window and the ones after it stay pending for a retry.
            pending_.insert(pending_.begin(), it, pending.end());
            throw;
        }
        ++count;
    }
    return count;
}

std::shared_ptr<BridgeWindow> Application::GetWindow(const std::string& id) const {
    return std::dynamic_pointer_cast<BridgeWindow>(windows_.Find(id));
}

std::vector<std::shared_ptr<BridgeWindow>> Application::Windows() const {
    std::vector<std::shared_ptr<BridgeWindow>> windows;
    for (const auto& target : windows_.Snapshot()) {
        if (auto window = std::dynamic_pointer_cast<BridgeWindow>(target)) {
            windows.push_back(std::move(window));
        }
    }
    return windows;
}

bool Application::SendToWindow(const std::string& id, const std::string& message) {
    auto window = GetWindow(id);
    if (window == nullptr) {
        log::Get(log::kBridge)->debug("no window {} to send to", id);
        return false;
    }
    try {
        window->SendWebMessage(message);
    } catch (const BridgeError& e) {
        log::Get(log::kBridge)->warn("sending to window {} failed: {}", id, e.what());
        return false;
    }
    return true;
}

std::size_t Application::Broadcast(const std::string& message) {
    std::size_t delivered = 0;
    for (const auto& window : Windows()) {
        if (!window->IsInitialized()) {
            continue;
        }
        try {
            window->SendWebMessage(message);
            ++delivered;
        } catch (const BridgeError& e) {
            log::Get(log::kBridge)->warn("broadcast to window {} failed: {}", window->Id(),
                                         e.what());
        }
    }
    return delivered;
}

// ---------------------------------------------------------------------------
// Loop
// ---------------------------------------------------------------------------

void Application::Run() {
    if (running_) {
        throw BridgeError(ErrorCode::kInvalidState, "application is already running");
    }
    if (pump_.HasExited()) {
        throw BridgeError(ErrorCode::kInvalidState, "event loop has already exited");
    }
    InitializePendingWindows();
    if (windows_.Empty()) {
        throw BridgeError(ErrorCode::kInvalidState, "no window to run; create one first");
    }

    running_ = true;
    log::Get(log::kBridge)->info("running with {} window(s)", windows_.Size());
    try {
        pump_.Run([this](std::string_view raw_event) { return HandleEvent(raw_event); },
                  config_.pump_timeout, [this]() {
                      ExpireIpcRequests();
                      if (ShouldExit()) {
                          RequestLoopExit();
                      }
                  });
    } catch (const std::exception&) {
        running_ = false;
        throw;
    }
    running_ = false;

    DestroyAllWindows();
    log::Get(log::kBridge)->info("event loop finished");
}

PumpStatus Application::PumpOnce(std::optional<std::chrono::milliseconds> timeout) {
    const auto status = pump_.PumpOnce(
        timeout.value_or(config_.pump_timeout),
        [this](std::string_view raw_event) { return HandleEvent(raw_event); });
    ExpireIpcRequests();
    return status;
}

void Application::Quit() {
    quit_requested_.store(true);
    RequestLoopExit();
}

void Application::RequestLoopExit() {
    if (exit_posted_.exchange(true)) {
        return;
    }
    if (!loop_.RequestExit()) {
        exit_posted_.store(false);
    }
}

bool Application::PostUserEvent(const std::string& payload) {
    return loop_.PostUserEvent(payload);
}

void Application::OnUserEvent(UserEventHandler handler) {
    user_event_handlers_.push_back(std::move(handler));
}

ControlFlow Application::HandleEvent(std::string_view raw_event) {
    router_.Dispatch(raw_event);
    return ShouldExit() ? ControlFlow::kExit : ControlFlow::kWait;
}

void Application::HandleApplicationEvent(const Event& event) {
    if (const auto* shortcut = std::get_if<GlobalShortcutEvent>(&event)) {
        shortcuts_.Dispatch(shortcut->id);
    } else if (std::holds_alternative<UserExitEvent>(event)) {
        quit_requested_.store(true);
    } else if (const auto* user = std::get_if<UserEvent>(&event)) {
        // Handlers may subscribe more handlers.
        const auto handlers = user_event_handlers_;
        for (const auto& handler : handlers) {
            handler(user->payload);
        }
    } else if (std::holds_alternative<LoopDestroyedEvent>(event)) {
        loop_destroyed_ = true;
        quit_requested_.store(true);
    }
}

bool Application::ShouldExit() const {
    if (quit_requested_.load() || loop_destroyed_) {
        return true;
    }
    return had_windows_ && windows_.Empty() && pending_.empty();
}

void Application::ExpireIpcRequests() {
    const auto now = IpcChannel::Clock::now();
    for (const auto& window : Windows()) {
        window->Ipc().ExpireOverdue(now);
    }
}

void Application::DestroyAllWindows() {
    for (const auto& target : windows_.Snapshot()) {
        if (windows_.Unregister(target->Id())) {
            target->Destroy();
        }
    }
}

}  // namespace wvb
