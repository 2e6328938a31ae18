#include "BridgeWindow.h"

#include <exception>
#include <utility>
#include <variant>
#include <vector>

#include "base/BridgeConfig.h"
#include "base/BridgeError.h"
#include "base/Log.h"

namespace wvb {

BridgeWindow::BridgeWindow(WindowOptions options)
    : options_(std::move(options)),
      width_(options_.width),
      height_(options_.height),
      x_(options_.x.value_or(0)),
      y_(options_.y.value_or(0)),
      protocols_(std::make_shared<ProtocolBridge>()) {
    ipc_ = IpcChannel::Create([this](const std::string& raw) { SendWebMessage(raw); },
                              BridgeConfig::Global().ipc_timeout);
}

BridgeWindow::~BridgeWindow() {
    ipc_->Dispose();
}

void BridgeWindow::Initialize(const EventLoopHandle& loop) {
    if (state_ != WindowState::kPending) {
        throw BridgeError(ErrorCode::kInvalidState, "window is already initialized");
    }

    auto parent = options_.parent.lock();
    if (parent != nullptr && !parent->IsInitialized()) {
        log::Get(log::kBridge)->warn("parent window is not initialized; creating '{}' unowned",
                                     options_.title);
        parent.reset();
    }

    wvb_window_config_t window_config{};
    window_config.struct_size = sizeof(window_config);
    window_config.title_utf8 = options_.title.c_str();
    window_config.has_position = options_.x.has_value() && options_.y.has_value();
    window_config.x = options_.x.value_or(0);
    window_config.y = options_.y.value_or(0);
    window_config.width = options_.width;
    window_config.height = options_.height;
    window_config.min_width = options_.min_width;
    window_config.min_height = options_.min_height;
    window_config.max_width = options_.max_width;
    window_config.max_height = options_.max_height;
    window_config.resizable = options_.resizable;
    window_config.fullscreen = options_.fullscreen;
    window_config.maximized = options_.maximized;
    window_config.minimized = options_.minimized;
    window_config.visible = options_.visible;
    window_config.transparent = options_.transparent;
    window_config.decorations = options_.decorations;
    window_config.always_on_top = options_.always_on_top;
    window_config.parent = (parent != nullptr) ? parent->NativeWindow() : nullptr;
    window_config.modal = (parent != nullptr) && options_.modal;

    window_ = CreateWindowHandle(loop, window_config);

    const auto definitions = protocols_->Definitions();
    wvb_webview_config_t webview_config{};
    webview_config.struct_size = sizeof(webview_config);
    webview_config.url_utf8 = options_.url ? options_.url->c_str() : nullptr;
    webview_config.html_utf8 = options_.html ? options_.html->c_str() : nullptr;
    webview_config.devtools_enabled = options_.devtools_enabled;
    webview_config.transparent = options_.transparent;
    webview_config.protocols = definitions.empty() ? nullptr : definitions.data();
    webview_config.protocol_count = definitions.size();
    webview_config.ipc_handler = &BridgeWindow::OnNativeIpc;

    auto sink = std::make_shared<IpcSink>();
    sink->window = weak_from_this();
    if (sink->window.expired()) {
        log::Get(log::kBridge)->warn(
            "window '{}' is not owned by a shared_ptr; web messages will be dropped",
            options_.title);
    }
    webview_config.ipc_user_data = sink.get();

    try {
        webview_ = CreateWebviewHandle(window_, webview_config);
        id_ = QueryWindowId(window_);
    } catch (const BridgeError&) {
        webview_.Release();
        window_.Release();
        throw;
    }

    // Nothing can call back before the next pump, so pinning now is in time.
    CallbackRegistry& pins = *webview_.Registry();
    pins.Register(webview_.Key(), std::move(sink));
    pins.Register(webview_.Key(), protocols_);

    if (parent != nullptr && options_.modal) {
        const auto result = wvb_window_set_enabled(parent->NativeWindow(), false);
        if (result != WVB_RESULT_OK) {
            log::Get(log::kBridge)->warn("disabling parent of modal window {} failed: {}", id_,
                                         wvb_get_last_error());
        }
        modal_parent_ = parent;
    }

    state_ = WindowState::kInitialized;
    log::Get(log::kBridge)->debug("window {} initialized ({}x{}, {} scheme(s))", id_, width_,
                                  height_, definitions.size());
}

// ---------------------------------------------------------------------------
// Events
// ---------------------------------------------------------------------------

void BridgeWindow::DispatchEvent(const Event& event) {
    if (state_ == WindowState::kDestroyed) {
        return;
    }

    if (std::holds_alternative<CloseRequestedEvent>(event)) {
        HandleCloseRequested();
    } else if (std::holds_alternative<DestroyedEvent>(event)) {
        // The native window is gone; no veto possible.
        state_ = WindowState::kClosing;
        RestoreModalParent();
    } else if (const auto* resized = std::get_if<ResizedEvent>(&event)) {
        width_ = resized->width;
        height_ = resized->height;
        if (resized_handler_) {
            resized_handler_(width_, height_);
        }
    } else if (const auto* moved = std::get_if<MovedEvent>(&event)) {
        x_ = moved->x;
        y_ = moved->y;
        if (moved_handler_) {
            moved_handler_(x_, y_);
        }
    } else if (const auto* focused = std::get_if<FocusedEvent>(&event)) {
        focused_ = focused->focused;
        if (focus_handler_) {
            focus_handler_(focused_);
        }
    } else {
        log::Get(log::kBridge)->trace("window {} ignores {}", id_, EventTypeName(event));
    }
}

void BridgeWindow::HandleCloseRequested() {
    if (state_ != WindowState::kInitialized) {
        return;
    }
    const bool allow = closing_handler_ ? closing_handler_() : true;
    if (!allow) {
        log::Get(log::kBridge)->debug("close of window {} vetoed", id_);
        return;
    }
    state_ = WindowState::kClosing;
    RestoreModalParent();
}

bool BridgeWindow::ShouldExit() const {
    return state_ == WindowState::kClosing;
}

void BridgeWindow::Destroy() {
    if (state_ == WindowState::kDestroyed) {
        return;
    }
    ipc_->Dispose();
    if (!NativeRuntime::IsAvailable()) {
        // Process exit: drop the handles through their finalizers, which only
        // unpin and leave the native records alone.
        webview_ = WebviewHandle();
        window_ = WindowHandle();
        state_ = WindowState::kDestroyed;
        if (destroyed_handler_) {
            destroyed_handler_();
        }
        return;
    }
    RestoreModalParent();
    webview_.Release();
    window_.Release();
    state_ = WindowState::kDestroyed;
    log::Get(log::kBridge)->debug("window {} destroyed", id_);
    if (destroyed_handler_) {
        destroyed_handler_();
    }
}

void BridgeWindow::RestoreModalParent() {
    auto parent = modal_parent_.lock();
    modal_parent_.reset();
    if (parent == nullptr || !parent->IsInitialized()) {
        return;
    }
    const auto result = wvb_window_set_enabled(parent->NativeWindow(), true);
    if (result != WVB_RESULT_OK) {
        log::Get(log::kBridge)->warn("re-enabling window {} failed: {}", parent->Id(),
                                     wvb_get_last_error());
        return;
    }
    try {
        parent->Focus();
    } catch (const BridgeError& e) {
        log::Get(log::kBridge)->warn("focusing window {} failed: {}", parent->Id(), e.what());
    }
}

// ---------------------------------------------------------------------------
// Web messages
// ---------------------------------------------------------------------------

void BridgeWindow::OnNativeIpc(const char* /*url*/, const char* message, void* user_data) {
    auto* sink = static_cast<IpcSink*>(user_data);
    if (sink == nullptr) {
        return;
    }
    auto window = sink->window.lock();
    if (window == nullptr) {
        return;
    }
    try {
        window->HandleWebMessage((message != nullptr) ? message : "");
    } catch (const std::exception& e) {
        log::Get(log::kIpc)->error("web message handler of window {} threw: {}", window->Id(),
                                   e.what());
    } catch (...) {
        log::Get(log::kIpc)->error("web message handler of window {} threw", window->Id());
    }
}

void BridgeWindow::HandleWebMessage(const std::string& message) {
    if (state_ == WindowState::kDestroyed) {
        return;
    }
    if (web_message_handler_) {
        web_message_handler_(message);
    }
    ipc_->HandleIncoming(message);
}

// ---------------------------------------------------------------------------
// Properties
// ---------------------------------------------------------------------------

void BridgeWindow::EnsurePending(const char* property) const {
    if (state_ != WindowState::kPending) {
        throw InitializedError(property);
    }
}

void BridgeWindow::EnsureLive(const char* operation) const {
    if (webview_.IsInvalid()) {
        throw BridgeError(ErrorCode::kInvalidState,
                          std::string(operation) + ": window is not initialized");
    }
}

BridgeWindow& BridgeWindow::SetTitle(const std::string& title) {
    options_.title = title;
    if (!window_.IsInvalid()) {
        ThrowIfFailed(wvb_window_set_title(window_.Get(), title.c_str()), "wvb_window_set_title");
    }
    return *this;
}

BridgeWindow& BridgeWindow::SetSize(uint32_t width, uint32_t height) {
    if (width == 0 || height == 0) {
        throw BridgeError(ErrorCode::kInvalidParameter, "window size must be positive");
    }
    if (window_.IsInvalid()) {
        options_.width = width;
        options_.height = height;
        width_ = width;
        height_ = height;
    } else {
        ThrowIfFailed(wvb_window_set_size(window_.Get(), width, height), "wvb_window_set_size");
    }
    return *this;
}

BridgeWindow& BridgeWindow::SetPosition(int32_t x, int32_t y) {
    if (window_.IsInvalid()) {
        options_.x = x;
        options_.y = y;
        x_ = x;
        y_ = y;
    } else {
        ThrowIfFailed(wvb_window_set_position(window_.Get(), x, y), "wvb_window_set_position");
    }
    return *this;
}

BridgeWindow& BridgeWindow::SetVisible(bool visible) {
    options_.visible = visible;
    if (!window_.IsInvalid()) {
        ThrowIfFailed(wvb_window_set_visible(window_.Get(), visible), "wvb_window_set_visible");
    }
    return *this;
}

BridgeWindow& BridgeWindow::SetMinSize(uint32_t width, uint32_t height) {
    EnsurePending("min size");
    options_.min_width = width;
    options_.min_height = height;
    return *this;
}

BridgeWindow& BridgeWindow::SetMaxSize(uint32_t width, uint32_t height) {
    EnsurePending("max size");
    options_.max_width = width;
    options_.max_height = height;
    return *this;
}

BridgeWindow& BridgeWindow::SetResizable(bool resizable) {
    EnsurePending("resizable");
    options_.resizable = resizable;
    return *this;
}

BridgeWindow& BridgeWindow::SetDevToolsEnabled(bool enabled) {
    EnsurePending("devtools");
    options_.devtools_enabled = enabled;
    return *this;
}

BridgeWindow& BridgeWindow::SetTransparent(bool transparent) {
    EnsurePending("transparent");
    options_.transparent = transparent;
    return *this;
}

BridgeWindow& BridgeWindow::SetFullscreen(bool fullscreen) {
    EnsurePending("fullscreen");
    options_.fullscreen = fullscreen;
    return *this;
}

BridgeWindow& BridgeWindow::SetDecorations(bool decorations) {
    EnsurePending("decorations");
    options_.decorations = decorations;
    return *this;
}

BridgeWindow& BridgeWindow::SetAlwaysOnTop(bool always_on_top) {
    EnsurePending("always on top");
    options_.always_on_top = always_on_top;
    return *this;
}

BridgeWindow& BridgeWindow::SetParent(const std::shared_ptr<BridgeWindow>& parent, bool modal) {
    EnsurePending("parent");
    if (parent.get() == this) {
        throw BridgeError(ErrorCode::kInvalidParameter, "a window cannot be its own parent");
    }
    options_.parent = parent;
    options_.modal = modal;
    return *this;
}

BridgeWindow& BridgeWindow::RegisterCustomScheme(const std::string& scheme,
                                                 SchemeHandler handler) {
    EnsurePending("custom protocol");
    protocols_->RegisterScheme(scheme, std::move(handler));
    return *this;
}

BridgeWindow& BridgeWindow::Load(const std::string& url) {
    if (webview_.IsInvalid()) {
        options_.url = url;
        return *this;
    }
    Navigate(url);
    return *this;
}

BridgeWindow& BridgeWindow::LoadHtml(const std::string& html) {
    if (webview_.IsInvalid()) {
        options_.html = html;
        options_.url.reset();
        return *this;
    }
    ThrowIfFailed(wvb_webview_load_html(webview_.Get(), html.c_str()), "wvb_webview_load_html");
    return *this;
}

// ---------------------------------------------------------------------------
// Live operations
// ---------------------------------------------------------------------------

void BridgeWindow::SendWebMessage(const std::string& message) {
    EnsureLive("SendWebMessage");
    ThrowIfFailed(wvb_webview_send_message(webview_.Get(), message.c_str()),
                  "wvb_webview_send_message");
}

void BridgeWindow::Navigate(const std::string& url) {
    EnsureLive("Navigate");
    const auto result = wvb_webview_navigate(webview_.Get(), url.c_str());
    if (result != WVB_RESULT_OK) {
        throw BridgeError(ErrorCode::kNavigationFailed,
                          "navigating to " + url + " failed: " + wvb_get_last_error());
    }
}

void BridgeWindow::EvaluateScript(const std::string& script) {
    EnsureLive("EvaluateScript");
    const auto result = wvb_webview_evaluate_script(webview_.Get(), script.c_str());
    if (result != WVB_RESULT_OK) {
        throw BridgeError(ErrorCode::kScriptError,
                          std::string("evaluating script failed: ") + wvb_get_last_error());
    }
}

void BridgeWindow::Focus() {
    EnsureLive("Focus");
    ThrowIfFailed(wvb_window_focus(window_.Get()), "wvb_window_focus");
}

void BridgeWindow::Close() {
    if (state_ == WindowState::kClosing || state_ == WindowState::kDestroyed) {
        return;
    }
    EnsureLive("Close");
    ThrowIfFailed(wvb_window_request_close(window_.Get()), "wvb_window_request_close");
}

}  // namespace wvb
