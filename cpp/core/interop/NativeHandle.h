/**
 * @file NativeHandle.h
 * @brief Owning, move-only wrappers around native resource handles.
 *
 * Exactly one wrapper owns a handle value. Release() is the explicit
 * dispose path and always tears the resource down; the destructor is the
 * finalize path and only calls into the native library while
 * NativeRuntime::IsAvailable(). Both paths drop the callbacks pinned under
 * the handle after the native teardown returned.
 */
#pragma once

#include <string>
#include <utility>

#include "interop/CallbackRegistry.h"
#include "wvb_native_api.h"

namespace wvb {

/**
 * Process-wide availability of the native library.
 *
 * Marked unavailable from an atexit hook (installed on first handle
 * creation) so wrappers destroyed during static teardown never call into a
 * library that may already be unloaded.
 */
class NativeRuntime {
public:
    static bool IsAvailable();
    static void MarkUnavailable();
    static void MarkAvailable();
    static void InstallShutdownHook();
};

namespace detail {

void LogReleaseFailure(const char* kind, wvb_result_t result);

}  // namespace detail

struct EventLoopTraits {
    using native_type = wvb_event_loop_t;
    static constexpr const char* kName = "event loop";
    static wvb_result_t Destroy(native_type handle) { return wvb_event_loop_destroy(handle); }
};

struct EventLoopProxyTraits {
    using native_type = wvb_event_loop_proxy_t;
    static constexpr const char* kName = "event loop proxy";
    static wvb_result_t Destroy(native_type handle) {
        return wvb_event_loop_proxy_destroy(handle);
    }
};

struct WindowTraits {
    using native_type = wvb_window_t;
    static constexpr const char* kName = "window";
    static wvb_result_t Destroy(native_type handle) { return wvb_window_destroy(handle); }
};

struct WebviewTraits {
    using native_type = wvb_webview_t;
    static constexpr const char* kName = "webview";
    static wvb_result_t Destroy(native_type handle) { return wvb_webview_destroy(handle); }
};

template <typename Traits>
class NativeHandle {
public:
    using native_type = typename Traits::native_type;

    NativeHandle() = default;

    explicit NativeHandle(native_type handle,
                          CallbackRegistry* registry = &CallbackRegistry::Shared())
        : handle_(handle), registry_(registry) {}

    ~NativeHandle() { Finalize(); }

    NativeHandle(const NativeHandle&) = delete;
    NativeHandle& operator=(const NativeHandle&) = delete;

    NativeHandle(NativeHandle&& other) noexcept
        : handle_(std::exchange(other.handle_, nullptr)),
          registry_(std::exchange(other.registry_, nullptr)) {}

    NativeHandle& operator=(NativeHandle&& other) noexcept {
        if (this != &other) {
            Finalize();
            handle_ = std::exchange(other.handle_, nullptr);
            registry_ = std::exchange(other.registry_, nullptr);
        }
        return *this;
    }

    native_type Get() const { return handle_; }

    /// Key under which callbacks for this resource are pinned.
    const void* Key() const { return handle_; }

    bool IsInvalid() const { return handle_ == nullptr; }

    CallbackRegistry* Registry() const { return registry_; }

    /**
     * Tear the resource down and drop its pinned callbacks.
     * Idempotent; never throws.
     */
    void Release() noexcept {
        if (IsInvalid()) {
            return;
        }
        auto handle = std::exchange(handle_, nullptr);
        const auto result = Traits::Destroy(handle);
        if (result != WVB_RESULT_OK) {
            detail::LogReleaseFailure(Traits::kName, result);
        }
        Unpin(handle);
    }

private:
    void Finalize() noexcept {
        if (IsInvalid()) {
            return;
        }
        if (NativeRuntime::IsAvailable()) {
            Release();
            return;
        }
        Unpin(std::exchange(handle_, nullptr));
    }

    void Unpin(native_type handle) noexcept {
        if (registry_ != nullptr) {
            registry_->Unregister(handle);
        }
    }

    native_type handle_ = nullptr;
    CallbackRegistry* registry_ = nullptr;
};

using EventLoopHandle = NativeHandle<EventLoopTraits>;
using EventLoopProxyHandle = NativeHandle<EventLoopProxyTraits>;
using WindowHandle = NativeHandle<WindowTraits>;
using WebviewHandle = NativeHandle<WebviewTraits>;

// ---------------------------------------------------------------------------
// Creation. Each throws CreationError carrying wvb_get_last_error().
// ---------------------------------------------------------------------------

EventLoopHandle CreateEventLoop(CallbackRegistry& registry = CallbackRegistry::Shared());

EventLoopProxyHandle CreateEventLoopProxy(const EventLoopHandle& loop);

WindowHandle CreateWindowHandle(const EventLoopHandle& loop, const wvb_window_config_t& config);

WebviewHandle CreateWebviewHandle(const WindowHandle& window,
                                  const wvb_webview_config_t& config);

/// Identifier the native layer uses for window in event records.
std::string QueryWindowId(const WindowHandle& window);

}  // namespace wvb
