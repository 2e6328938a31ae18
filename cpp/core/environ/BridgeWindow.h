/**
 * @file BridgeWindow.h
 * @brief One native window plus its webview, IPC channel and schemes.
 *
 * Lifecycle: kPending -> kInitialized -> kClosing -> kDestroyed.
 * Options are collected while pending; Initialize() creates the native
 * window and webview from them. Creation-only properties throw
 * InitializedError once the window exists.
 *
 * Windows must be owned by std::shared_ptr (see Application::CreateWindow)
 * so native callbacks can reach them through a weak reference.
 */
#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "event/EventTarget.h"
#include "interop/NativeHandle.h"
#include "ipc/IpcChannel.h"
#include "protocol/ProtocolBridge.h"

namespace wvb {

class BridgeWindow;

struct WindowOptions {
    std::string title = "wvbridge";
    /// Start location; url wins over html when both are set.
    std::optional<std::string> url;
    std::optional<std::string> html;
    std::optional<int32_t> x;
    std::optional<int32_t> y;
    uint32_t width = 800;
    uint32_t height = 600;
    /// 0 means unconstrained.
    uint32_t min_width = 0;
    uint32_t min_height = 0;
    uint32_t max_width = 0;
    uint32_t max_height = 0;
    bool resizable = true;
    bool fullscreen = false;
    bool maximized = false;
    bool minimized = false;
    bool visible = true;
    bool transparent = false;
    bool decorations = true;
    bool always_on_top = false;
    bool devtools_enabled = true;
    std::weak_ptr<BridgeWindow> parent;
    /// Disables the parent until this window closes.
    bool modal = false;
};

enum class WindowState {
    kPending,
    kInitialized,
    kClosing,
    kDestroyed,
};

class BridgeWindow : public EventTarget, public std::enable_shared_from_this<BridgeWindow> {
public:
    /// Return false to keep the window open.
    using ClosingHandler = std::function<bool()>;
    using ResizedHandler = std::function<void(uint32_t width, uint32_t height)>;
    using MovedHandler = std::function<void(int32_t x, int32_t y)>;
    using FocusHandler = std::function<void(bool focused)>;
    using WebMessageHandler = std::function<void(const std::string& message)>;
    using DestroyedHandler = std::function<void()>;

    explicit BridgeWindow(WindowOptions options = {});
    ~BridgeWindow() override;

    BridgeWindow(const BridgeWindow&) = delete;
    BridgeWindow& operator=(const BridgeWindow&) = delete;

    /**
     * Create the native window and webview on loop.
     *
     * @throws BridgeError(kInvalidState) when not pending
     * @throws CreationError when the native layer refuses
     */
    void Initialize(const EventLoopHandle& loop);

    // -----------------------------------------------------------------------
    // EventTarget
    // -----------------------------------------------------------------------

    const std::string& Id() const override { return id_; }
    void DispatchEvent(const Event& event) override;
    bool ShouldExit() const override;
    void Destroy() override;

    WindowState State() const { return state_; }
    bool IsInitialized() const { return state_ == WindowState::kInitialized; }
    const WindowOptions& Options() const { return options_; }

    // -----------------------------------------------------------------------
    // Properties. Creation-only setters throw InitializedError afterwards;
    // the others forward to the native window once it exists.
    // -----------------------------------------------------------------------

    BridgeWindow& SetTitle(const std::string& title);
    BridgeWindow& SetSize(uint32_t width, uint32_t height);
    BridgeWindow& SetPosition(int32_t x, int32_t y);
    BridgeWindow& SetVisible(bool visible);
    BridgeWindow& SetMinSize(uint32_t width, uint32_t height);
    BridgeWindow& SetMaxSize(uint32_t width, uint32_t height);
    BridgeWindow& SetResizable(bool resizable);
    BridgeWindow& SetDevToolsEnabled(bool enabled);
    BridgeWindow& SetTransparent(bool transparent);
    BridgeWindow& SetFullscreen(bool fullscreen);
    BridgeWindow& SetDecorations(bool decorations);
    BridgeWindow& SetAlwaysOnTop(bool always_on_top);
    BridgeWindow& SetParent(const std::shared_ptr<BridgeWindow>& parent, bool modal = false);
    BridgeWindow& RegisterCustomScheme(const std::string& scheme, SchemeHandler handler);

    /// Navigate to url (or set the start url while pending).
    BridgeWindow& Load(const std::string& url);
    BridgeWindow& LoadHtml(const std::string& html);

    uint32_t Width() const { return width_; }
    uint32_t Height() const { return height_; }
    int32_t X() const { return x_; }
    int32_t Y() const { return y_; }
    bool IsFocused() const { return focused_; }

    // -----------------------------------------------------------------------
    // Live operations; throw BridgeError(kInvalidState) before Initialize().
    // -----------------------------------------------------------------------

    void SendWebMessage(const std::string& message);
    /// @throws BridgeError(kNavigationFailed) when the webview refuses url
    void Navigate(const std::string& url);
    void EvaluateScript(const std::string& script);
    void Focus();
    /// Same path as the user closing the window: OnClosing may veto.
    void Close();

    void OnClosing(ClosingHandler handler) { closing_handler_ = std::move(handler); }
    void OnResized(ResizedHandler handler) { resized_handler_ = std::move(handler); }
    void OnMoved(MovedHandler handler) { moved_handler_ = std::move(handler); }
    void OnFocusChanged(FocusHandler handler) { focus_handler_ = std::move(handler); }
    void OnWebMessage(WebMessageHandler handler) { web_message_handler_ = std::move(handler); }
    void OnDestroyed(DestroyedHandler handler) { destroyed_handler_ = std::move(handler); }

    IpcChannel& Ipc() { return *ipc_; }
    ProtocolBridge& Protocols() { return *protocols_; }

    wvb_window_t NativeWindow() const { return window_.Get(); }
    wvb_webview_t NativeWebview() const { return webview_.Get(); }

private:
    struct IpcSink {
        std::weak_ptr<BridgeWindow> window;
    };

    static void OnNativeIpc(const char* url, const char* message, void* user_data);

    void HandleWebMessage(const std::string& message);
    void HandleCloseRequested();
    void RestoreModalParent();
    void EnsurePending(const char* property) const;
    void EnsureLive(const char* operation) const;

    WindowOptions options_;
    WindowState state_ = WindowState::kPending;
    std::string id_;

    uint32_t width_;
    uint32_t height_;
    int32_t x_ = 0;
    int32_t y_ = 0;
    bool focused_ = false;

    std::shared_ptr<ProtocolBridge> protocols_;
    std::shared_ptr<IpcChannel> ipc_;
    std::weak_ptr<BridgeWindow> modal_parent_;

    ClosingHandler closing_handler_;
    ResizedHandler resized_handler_;
    MovedHandler moved_handler_;
    FocusHandler focus_handler_;
    WebMessageHandler web_message_handler_;
    DestroyedHandler destroyed_handler_;

    WindowHandle window_;
    // Declared after window_ so it is released first.
    WebviewHandle webview_;
};

}  // namespace wvb
