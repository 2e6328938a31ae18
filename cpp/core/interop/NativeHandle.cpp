#include "NativeHandle.h"

#include <atomic>
#include <cstdlib>
#include <mutex>

#include "base/BridgeError.h"
#include "base/Log.h"

namespace wvb {

namespace {

std::atomic<bool> g_native_available{true};
std::once_flag g_shutdown_hook_once;

void MarkUnavailableAtExit() {
    NativeRuntime::MarkUnavailable();
}

std::string LastNativeError() {
    const char* message = wvb_get_last_error();
    return (message != nullptr) ? message : "";
}

}  // namespace

// ---------------------------------------------------------------------------
// NativeRuntime
// ---------------------------------------------------------------------------

bool NativeRuntime::IsAvailable() {
    return g_native_available.load(std::memory_order_acquire);
}

void NativeRuntime::MarkUnavailable() {
    g_native_available.store(false, std::memory_order_release);
}

void NativeRuntime::MarkAvailable() {
    g_native_available.store(true, std::memory_order_release);
}

void NativeRuntime::InstallShutdownHook() {
    std::call_once(g_shutdown_hook_once, []() {
        if (std::atexit(MarkUnavailableAtExit) != 0) {
            log::Get(log::kBridge)->warn(
                "could not install native shutdown hook; finalizers will keep releasing");
        }
    });
}

namespace detail {

void LogReleaseFailure(const char* kind, wvb_result_t result) {
    log::Get(log::kBridge)->warn("releasing {} failed ({}): {}", kind,
                                 static_cast<int>(result), LastNativeError());
}

}  // namespace detail

// ---------------------------------------------------------------------------
// Creation
// ---------------------------------------------------------------------------

EventLoopHandle CreateEventLoop(CallbackRegistry& registry) {
    NativeRuntime::InstallShutdownHook();

    wvb_event_loop_desc_t desc{};
    desc.struct_size = sizeof(desc);
    desc.api_version = WVB_API_VERSION;

    wvb_event_loop_t loop = nullptr;
    const auto result = wvb_event_loop_create(&desc, &loop);
    if (result != WVB_RESULT_OK || loop == nullptr) {
        throw CreationError(ErrorCode::kEventLoopError, EventLoopTraits::kName, result,
                            LastNativeError());
    }
    return EventLoopHandle(loop, &registry);
}

EventLoopProxyHandle CreateEventLoopProxy(const EventLoopHandle& loop) {
    wvb_event_loop_proxy_t proxy = nullptr;
    const auto result = wvb_event_loop_proxy_create(loop.Get(), &proxy);
    if (result != WVB_RESULT_OK || proxy == nullptr) {
        throw CreationError(ErrorCode::kEventLoopError, EventLoopProxyTraits::kName, result,
                            LastNativeError());
    }
    return EventLoopProxyHandle(proxy, loop.Registry());
}

WindowHandle CreateWindowHandle(const EventLoopHandle& loop,
                                const wvb_window_config_t& config) {
    wvb_window_t window = nullptr;
    const auto result = wvb_window_create(loop.Get(), &config, &window);
    if (result != WVB_RESULT_OK || window == nullptr) {
        throw CreationError(ErrorCode::kWindowCreationFailed, WindowTraits::kName, result,
                            LastNativeError());
    }
    return WindowHandle(window, loop.Registry());
}

WebviewHandle CreateWebviewHandle(const WindowHandle& window,
                                  const wvb_webview_config_t& config) {
    wvb_webview_t webview = nullptr;
    const auto result = wvb_webview_create(window.Get(), &config, &webview);
    if (result != WVB_RESULT_OK || webview == nullptr) {
        throw CreationError(ErrorCode::kWebviewCreationFailed, WebviewTraits::kName, result,
                            LastNativeError());
    }
    return WebviewHandle(webview, window.Registry());
}

std::string QueryWindowId(const WindowHandle& window) {
    const char* id = nullptr;
    ThrowIfFailed(wvb_window_get_id(window.Get(), &id), "wvb_window_get_id");
    return (id != nullptr) ? id : "";
}

}  // namespace wvb
