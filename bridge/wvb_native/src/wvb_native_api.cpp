#include "wvb_native_api.h"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <new>
#include <string>
#include <utility>

#include <spdlog/sinks/stdout_color_sinks.h>

#include "native_state.h"

using nlohmann::json;
using namespace wvb::native;

namespace {

std::once_flag g_loggers_init_once;
thread_local std::string g_thread_error;
uint64_t g_next_window_serial = 0;

std::shared_ptr<spdlog::logger> EnsureNamedLogger(const char* name) {
  if (auto logger = spdlog::get(name); logger != nullptr) {
    return logger;
  }
  try {
    return spdlog::stdout_color_mt(name);
  } catch (const spdlog::spdlog_ex&) {
    // The host registered it first.
    return spdlog::get(name);
  }
}

template <typename T>
void TrackLocked(T* handle) {
  LiveHandles<T>().insert(handle);
}

template <typename T>
void UntrackLocked(T* handle) {
  LiveHandles<T>().erase(handle);
}

const char* StringOrEmpty(const char* value) {
  return value != nullptr ? value : "";
}

// Delivers one record and maps an out-of-range return to WAIT.
wvb_control_flow_t Deliver(wvb_event_callback_t callback, void* user_data,
                           const std::string& record) {
  const auto flow = callback(record.c_str(), user_data);
  switch (flow) {
    case WVB_CONTROL_FLOW_POLL:
    case WVB_CONTROL_FLOW_WAIT:
    case WVB_CONTROL_FLOW_EXIT:
      return flow;
  }
  return WVB_CONTROL_FLOW_WAIT;
}

class PumpingGuard {
public:
  explicit PumpingGuard(wvb_event_loop_s* loop) : loop_(loop) {}
  ~PumpingGuard() {
    std::lock_guard<std::recursive_mutex> registry_guard(RegistryMutex());
    loop_->pumping = false;
  }

  PumpingGuard(const PumpingGuard&) = delete;
  PumpingGuard& operator=(const PumpingGuard&) = delete;

private:
  wvb_event_loop_s* loop_;
};

std::string ToLower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return value;
}

std::string Trim(const std::string& value) {
  const auto first = value.find_first_not_of(" \t");
  if (first == std::string::npos) {
    return {};
  }
  const auto last = value.find_last_not_of(" \t");
  return value.substr(first, last - first + 1);
}

bool IsModifierToken(const std::string& token) {
  static const char* const kModifiers[] = {
      "ctrl", "control", "cmdorctrl", "commandorcontrol", "alt", "option",
      "shift", "super", "cmd", "command", "meta"};
  for (const char* modifier : kModifiers) {
    if (token == modifier) {
      return true;
    }
  }
  return false;
}

// Normalizes "CmdOrCtrl + K" to "cmdorctrl+k"; empty when unsupported.
std::string NormalizeAccelerator(const std::string& accelerator) {
  std::vector<std::string> tokens;
  size_t start = 0;
  while (start <= accelerator.size()) {
    const auto plus = accelerator.find('+', start);
    const auto end = (plus == std::string::npos) ? accelerator.size() : plus;
    tokens.push_back(ToLower(Trim(accelerator.substr(start, end - start))));
    if (plus == std::string::npos) {
      break;
    }
    start = plus + 1;
  }
  if (tokens.empty()) {
    return {};
  }
  for (size_t i = 0; i < tokens.size(); ++i) {
    const bool is_key = (i + 1 == tokens.size());
    if (tokens[i].empty() || IsModifierToken(tokens[i]) == is_key) {
      return {};
    }
  }
  std::string normalized;
  for (const auto& token : tokens) {
    if (!normalized.empty()) {
      normalized += '+';
    }
    normalized += token;
  }
  return normalized;
}

void DeliverIpc(wvb_webview_s* webview, const std::string& message) {
  wvb_ipc_handler_t handler = nullptr;
  void* user_data = nullptr;
  std::string url;
  {
    std::lock_guard<std::recursive_mutex> registry_guard(RegistryMutex());
    if (!IsLiveLocked(webview)) {
      Logger()->debug("dropping IPC message for destroyed webview");
      return;
    }
    handler = webview->ipc_handler;
    user_data = webview->ipc_user_data;
    url = webview->url.empty() ? "about:blank" : webview->url;
  }
  if (handler == nullptr) {
    Logger()->debug("webview of {} has no IPC handler", webview->window_id);
    return;
  }
  handler(url.c_str(), message.c_str(), user_data);
}

}  // namespace

// ---------------------------------------------------------------------------
// Shared helpers
// ---------------------------------------------------------------------------

namespace wvb::native {

std::recursive_mutex& RegistryMutex() {
  static std::recursive_mutex mutex;
  return mutex;
}

void SetThreadError(const char* message) {
  g_thread_error = (message != nullptr) ? message : "";
}

void SetThreadError(const std::string& message) {
  g_thread_error = message;
}

wvb_result_t SetThreadErrorAndReturn(wvb_result_t result, const char* message) {
  SetThreadError(message);
  return result;
}

wvb_result_t ValidateThread(std::thread::id owner, const char* kind) {
  if (owner != std::this_thread::get_id()) {
    return SetThreadErrorAndReturn(
        WVB_RESULT_INVALID_STATE,
        (std::string(kind) + " must be used on the thread that created its event loop").c_str());
  }
  return WVB_RESULT_OK;
}

void EnsureNativeLoggersInitialized() {
  std::call_once(g_loggers_init_once, []() { EnsureNamedLogger("native"); });
}

std::shared_ptr<spdlog::logger> Logger() {
  EnsureNativeLoggersInitialized();
  return EnsureNamedLogger("native");
}

void PostItem(wvb_event_loop_s* loop, PendingItem item) {
  {
    std::lock_guard<std::mutex> queue_guard(loop->queue_mutex);
    loop->queue.push_back(std::move(item));
  }
  loop->queue_cv.notify_one();
}

void PostEvent(wvb_event_loop_s* loop, const json& record) {
  if (loop == nullptr) {
    return;
  }
  PendingItem item;
  item.event_json = record.dump();
  PostItem(loop, std::move(item));
}

json WindowEventRecord(const char* type, const std::string& window_id) {
  return json{{"type", type}, {"window_id", window_id}};
}

char* DuplicateString(const std::string& value) {
  auto* copy = static_cast<char*>(std::malloc(value.size() + 1));
  if (copy == nullptr) {
    return nullptr;
  }
  std::memcpy(copy, value.c_str(), value.size() + 1);
  return copy;
}

}  // namespace wvb::native

// ---------------------------------------------------------------------------
// Version / errors
// ---------------------------------------------------------------------------

wvb_result_t wvb_get_runtime_api_version(uint32_t* out_api_version) {
  if (out_api_version == nullptr) {
    return SetThreadErrorAndReturn(WVB_RESULT_INVALID_ARGUMENT,
                                   "out_api_version is null");
  }
  *out_api_version = WVB_API_VERSION;
  SetThreadError(nullptr);
  return WVB_RESULT_OK;
}

const char* wvb_get_last_error(void) {
  return g_thread_error.c_str();
}

void wvb_string_free(char* value) {
  std::free(value);
}

// ---------------------------------------------------------------------------
// Event loop
// ---------------------------------------------------------------------------

wvb_result_t wvb_event_loop_create(const wvb_event_loop_desc_t* desc,
                                   wvb_event_loop_t* out_loop) {
  if (desc == nullptr || out_loop == nullptr) {
    return SetThreadErrorAndReturn(
        WVB_RESULT_INVALID_ARGUMENT,
        "wvb_event_loop_create requires non-null desc and out_loop");
  }
  if (desc->struct_size < sizeof(wvb_event_loop_desc_t)) {
    return SetThreadErrorAndReturn(WVB_RESULT_INVALID_ARGUMENT,
                                   "wvb_event_loop_desc_t.struct_size is too small");
  }
  const uint32_t expected_major = (WVB_API_VERSION >> 24u) & 0xFFu;
  const uint32_t caller_major = (desc->api_version >> 24u) & 0xFFu;
  if (caller_major != expected_major) {
    return SetThreadErrorAndReturn(WVB_RESULT_NOT_SUPPORTED,
                                   "unsupported bridge API major version");
  }

  EnsureNativeLoggersInitialized();

  auto* impl = new (std::nothrow) wvb_event_loop_s();
  if (impl == nullptr) {
    *out_loop = nullptr;
    return SetThreadErrorAndReturn(WVB_RESULT_INTERNAL_ERROR,
                                   "failed to allocate event loop");
  }
  impl->owner_thread = std::this_thread::get_id();
  {
    std::lock_guard<std::recursive_mutex> registry_guard(RegistryMutex());
    TrackLocked(impl);
  }

  Logger()->debug("event loop {} created", static_cast<void*>(impl));
  *out_loop = impl;
  SetThreadError(nullptr);
  return WVB_RESULT_OK;
}

wvb_result_t wvb_event_loop_destroy(wvb_event_loop_t loop) {
  if (loop == nullptr) {
    SetThreadError(nullptr);
    return WVB_RESULT_OK;
  }

  {
    std::lock_guard<std::recursive_mutex> registry_guard(RegistryMutex());
    auto result = ValidateHandleLocked(loop, "event loop");
    if (result != WVB_RESULT_OK) {
      return result;
    }
    result = ValidateThread(loop->owner_thread, "event loop");
    if (result != WVB_RESULT_OK) {
      return result;
    }
    if (loop->pumping) {
      return SetThreadErrorAndReturn(WVB_RESULT_INVALID_STATE,
                                     "event loop cannot be destroyed while pumping");
    }

    for (auto* window : loop->windows) {
      window->loop = nullptr;
    }
    for (auto* proxy : loop->proxies) {
      proxy->loop = nullptr;
    }
    UntrackLocked(loop);
  }

  Logger()->debug("event loop {} destroyed", static_cast<void*>(loop));
  delete loop;
  SetThreadError(nullptr);
  return WVB_RESULT_OK;
}

wvb_result_t wvb_event_loop_pump_events(wvb_event_loop_t loop,
                                        uint32_t timeout_ms,
                                        wvb_event_callback_t callback,
                                        void* user_data,
                                        wvb_pump_status_t* out_status) {
  if (callback == nullptr || out_status == nullptr) {
    return SetThreadErrorAndReturn(
        WVB_RESULT_INVALID_ARGUMENT,
        "wvb_event_loop_pump_events requires non-null callback and out_status");
  }

  {
    std::lock_guard<std::recursive_mutex> registry_guard(RegistryMutex());
    auto result = ValidateHandleLocked(loop, "event loop");
    if (result != WVB_RESULT_OK) {
      return result;
    }
    result = ValidateThread(loop->owner_thread, "event loop");
    if (result != WVB_RESULT_OK) {
      return result;
    }
    if (loop->pumping) {
      return SetThreadErrorAndReturn(WVB_RESULT_INVALID_STATE,
                                     "event loop is already being pumped");
    }
    if (loop->exited) {
      *out_status = WVB_PUMP_STATUS_EXIT;
      SetThreadError(nullptr);
      return WVB_RESULT_OK;
    }
    loop->pumping = true;
  }
  PumpingGuard pumping_guard(loop);

  std::deque<PendingItem> items;
  bool waited = false;
  {
    std::unique_lock<std::mutex> queue_lock(loop->queue_mutex);
    if (loop->queue.empty() && loop->control_flow == WVB_CONTROL_FLOW_WAIT &&
        timeout_ms > 0) {
      waited = true;
      loop->queue_cv.wait_for(queue_lock, std::chrono::milliseconds(timeout_ms),
                              [loop]() { return !loop->queue.empty(); });
    }
    items.swap(loop->queue);
  }

  if (items.empty()) {
    *out_status = WVB_PUMP_STATUS_CONTINUE;
    SetThreadError(nullptr);
    return WVB_RESULT_OK;
  }

  const json new_events{{"type", "new-events"},
                        {"cause", waited ? "WaitCancelled" : "Poll"}};
  auto flow = Deliver(callback, user_data, new_events.dump());

  while (flow != WVB_CONTROL_FLOW_EXIT && !items.empty()) {
    auto item = std::move(items.front());
    items.pop_front();
    if (!item.event_json.empty()) {
      flow = Deliver(callback, user_data, item.event_json);
    } else if (item.task) {
      item.task();
    }
  }

  if (flow != WVB_CONTROL_FLOW_EXIT) {
    flow = Deliver(callback, user_data, json{{"type", "main-events-cleared"}}.dump());
  }

  if (flow == WVB_CONTROL_FLOW_EXIT) {
    if (!items.empty()) {
      Logger()->debug("event loop exiting with {} undelivered items", items.size());
    }
    Deliver(callback, user_data, json{{"type", "loop-destroyed"}}.dump());
    {
      std::lock_guard<std::recursive_mutex> registry_guard(RegistryMutex());
      loop->exited = true;
      loop->control_flow = flow;
    }
    *out_status = WVB_PUMP_STATUS_EXIT;
  } else {
    std::lock_guard<std::recursive_mutex> registry_guard(RegistryMutex());
    loop->control_flow = flow;
    *out_status = WVB_PUMP_STATUS_CONTINUE;
  }

  SetThreadError(nullptr);
  return WVB_RESULT_OK;
}

// ---------------------------------------------------------------------------
// Event loop proxy
// ---------------------------------------------------------------------------

wvb_result_t wvb_event_loop_proxy_create(wvb_event_loop_t loop,
                                         wvb_event_loop_proxy_t* out_proxy) {
  if (out_proxy == nullptr) {
    return SetThreadErrorAndReturn(WVB_RESULT_INVALID_ARGUMENT, "out_proxy is null");
  }

  std::lock_guard<std::recursive_mutex> registry_guard(RegistryMutex());
  auto result = ValidateHandleLocked(loop, "event loop");
  if (result != WVB_RESULT_OK) {
    return result;
  }

  auto* impl = new (std::nothrow) wvb_event_loop_proxy_s();
  if (impl == nullptr) {
    *out_proxy = nullptr;
    return SetThreadErrorAndReturn(WVB_RESULT_INTERNAL_ERROR,
                                   "failed to allocate event loop proxy");
  }
  impl->loop = loop;
  loop->proxies.insert(impl);
  TrackLocked(impl);

  *out_proxy = impl;
  SetThreadError(nullptr);
  return WVB_RESULT_OK;
}

wvb_result_t wvb_event_loop_proxy_destroy(wvb_event_loop_proxy_t proxy) {
  if (proxy == nullptr) {
    SetThreadError(nullptr);
    return WVB_RESULT_OK;
  }

  {
    std::lock_guard<std::recursive_mutex> registry_guard(RegistryMutex());
    auto result = ValidateHandleLocked(proxy, "event loop proxy");
    if (result != WVB_RESULT_OK) {
      return result;
    }
    if (proxy->loop != nullptr) {
      proxy->loop->proxies.erase(proxy);
    }
    UntrackLocked(proxy);
  }

  delete proxy;
  SetThreadError(nullptr);
  return WVB_RESULT_OK;
}

namespace {

wvb_result_t PostThroughProxy(wvb_event_loop_proxy_t proxy, const json& record) {
  std::lock_guard<std::recursive_mutex> registry_guard(RegistryMutex());
  auto result = ValidateHandleLocked(proxy, "event loop proxy");
  if (result != WVB_RESULT_OK) {
    return result;
  }
  if (proxy->loop == nullptr) {
    return SetThreadErrorAndReturn(WVB_RESULT_INVALID_STATE,
                                   "event loop of this proxy is destroyed");
  }
  if (proxy->loop->exited) {
    return SetThreadErrorAndReturn(WVB_RESULT_INVALID_STATE,
                                   "event loop has already exited");
  }
  PostEvent(proxy->loop, record);
  SetThreadError(nullptr);
  return WVB_RESULT_OK;
}

}  // namespace

wvb_result_t wvb_event_loop_proxy_request_exit(wvb_event_loop_proxy_t proxy) {
  return PostThroughProxy(proxy, json{{"type", "user-exit"}});
}

wvb_result_t wvb_event_loop_proxy_send_user_event(wvb_event_loop_proxy_t proxy,
                                                  const char* payload_utf8) {
  return PostThroughProxy(
      proxy, json{{"type", "user-event"}, {"payload", StringOrEmpty(payload_utf8)}});
}

// ---------------------------------------------------------------------------
// Window
// ---------------------------------------------------------------------------

namespace {

// Validates a window for a loop-thread operation.
wvb_result_t ValidateWindowLocked(wvb_window_t window) {
  auto result = ValidateHandleLocked(window, "window");
  if (result != WVB_RESULT_OK) {
    return result;
  }
  return ValidateThread(window->owner_thread, "window");
}

}  // namespace

wvb_result_t wvb_window_create(wvb_event_loop_t loop,
                               const wvb_window_config_t* config,
                               wvb_window_t* out_window) {
  if (config == nullptr || out_window == nullptr) {
    return SetThreadErrorAndReturn(
        WVB_RESULT_INVALID_ARGUMENT,
        "wvb_window_create requires non-null config and out_window");
  }
  if (config->struct_size < sizeof(wvb_window_config_t)) {
    return SetThreadErrorAndReturn(WVB_RESULT_INVALID_ARGUMENT,
                                   "wvb_window_config_t.struct_size is too small");
  }
  if (config->width == 0 || config->height == 0) {
    return SetThreadErrorAndReturn(WVB_RESULT_INVALID_ARGUMENT,
                                   "window width and height must be greater than zero");
  }

  std::lock_guard<std::recursive_mutex> registry_guard(RegistryMutex());
  auto result = ValidateHandleLocked(loop, "event loop");
  if (result != WVB_RESULT_OK) {
    return result;
  }
  result = ValidateThread(loop->owner_thread, "event loop");
  if (result != WVB_RESULT_OK) {
    return result;
  }
  if (loop->exited) {
    return SetThreadErrorAndReturn(WVB_RESULT_INVALID_STATE,
                                   "event loop has already exited");
  }
  if (config->parent != nullptr && !IsLiveLocked(config->parent)) {
    return SetThreadErrorAndReturn(WVB_RESULT_INVALID_ARGUMENT,
                                   "parent window is invalid or already destroyed");
  }

  auto* impl = new (std::nothrow) wvb_window_s();
  if (impl == nullptr) {
    *out_window = nullptr;
    return SetThreadErrorAndReturn(WVB_RESULT_INTERNAL_ERROR,
                                   "failed to allocate window");
  }
  impl->loop = loop;
  impl->owner_thread = loop->owner_thread;
  impl->id = "window-" + std::to_string(++g_next_window_serial);
  impl->title = StringOrEmpty(config->title_utf8);
  impl->width = config->width;
  impl->height = config->height;
  if (config->has_position) {
    impl->x = config->x;
    impl->y = config->y;
  }
  impl->min_width = config->min_width;
  impl->min_height = config->min_height;
  impl->max_width = config->max_width;
  impl->max_height = config->max_height;
  impl->resizable = config->resizable;
  impl->fullscreen = config->fullscreen;
  impl->maximized = config->maximized;
  impl->minimized = config->minimized;
  impl->visible = config->visible;
  impl->transparent = config->transparent;
  impl->decorations = config->decorations;
  impl->always_on_top = config->always_on_top;
  impl->parent = config->parent;
  impl->modal = config->modal;

  loop->windows.insert(impl);
  TrackLocked(impl);

  Logger()->debug("window {} created ({}x{})", impl->id, impl->width, impl->height);
  *out_window = impl;
  SetThreadError(nullptr);
  return WVB_RESULT_OK;
}

wvb_result_t wvb_window_destroy(wvb_window_t window) {
  if (window == nullptr) {
    SetThreadError(nullptr);
    return WVB_RESULT_OK;
  }

  {
    std::lock_guard<std::recursive_mutex> registry_guard(RegistryMutex());
    auto result = ValidateWindowLocked(window);
    if (result != WVB_RESULT_OK) {
      return result;
    }

    if (window->webview != nullptr) {
      window->webview->window = nullptr;
    }
    for (auto* other : LiveHandles<wvb_window_s>()) {
      if (other->parent == window) {
        other->parent = nullptr;
      }
    }
    if (window->loop != nullptr) {
      window->loop->windows.erase(window);
      if (!window->loop->exited) {
        PostEvent(window->loop, WindowEventRecord("window-destroyed", window->id));
      }
    }
    UntrackLocked(window);
  }

  Logger()->debug("window {} destroyed", window->id);
  delete window;
  SetThreadError(nullptr);
  return WVB_RESULT_OK;
}

wvb_result_t wvb_window_get_id(wvb_window_t window, const char** out_id_utf8) {
  if (out_id_utf8 == nullptr) {
    return SetThreadErrorAndReturn(WVB_RESULT_INVALID_ARGUMENT, "out_id_utf8 is null");
  }
  std::lock_guard<std::recursive_mutex> registry_guard(RegistryMutex());
  auto result = ValidateHandleLocked(window, "window");
  if (result != WVB_RESULT_OK) {
    return result;
  }
  *out_id_utf8 = window->id.c_str();
  SetThreadError(nullptr);
  return WVB_RESULT_OK;
}

wvb_result_t wvb_window_set_title(wvb_window_t window, const char* title_utf8) {
  std::lock_guard<std::recursive_mutex> registry_guard(RegistryMutex());
  auto result = ValidateWindowLocked(window);
  if (result != WVB_RESULT_OK) {
    return result;
  }
  window->title = StringOrEmpty(title_utf8);
  SetThreadError(nullptr);
  return WVB_RESULT_OK;
}

wvb_result_t wvb_window_set_size(wvb_window_t window, uint32_t width,
                                 uint32_t height) {
  if (width == 0 || height == 0) {
    return SetThreadErrorAndReturn(WVB_RESULT_INVALID_ARGUMENT,
                                   "width and height must be greater than zero");
  }
  std::lock_guard<std::recursive_mutex> registry_guard(RegistryMutex());
  auto result = ValidateWindowLocked(window);
  if (result != WVB_RESULT_OK) {
    return result;
  }
  if (window->min_width > 0) {
    width = std::max(width, window->min_width);
  }
  if (window->min_height > 0) {
    height = std::max(height, window->min_height);
  }
  if (window->max_width > 0) {
    width = std::min(width, window->max_width);
  }
  if (window->max_height > 0) {
    height = std::min(height, window->max_height);
  }
  window->width = width;
  window->height = height;
  auto record = WindowEventRecord("window-resized", window->id);
  record["size"] = json{{"width", width}, {"height", height}};
  PostEvent(window->loop, record);
  SetThreadError(nullptr);
  return WVB_RESULT_OK;
}

wvb_result_t wvb_window_set_position(wvb_window_t window, int32_t x, int32_t y) {
  std::lock_guard<std::recursive_mutex> registry_guard(RegistryMutex());
  auto result = ValidateWindowLocked(window);
  if (result != WVB_RESULT_OK) {
    return result;
  }
  window->x = x;
  window->y = y;
  auto record = WindowEventRecord("window-moved", window->id);
  record["position"] = json{{"x", x}, {"y", y}};
  PostEvent(window->loop, record);
  SetThreadError(nullptr);
  return WVB_RESULT_OK;
}

wvb_result_t wvb_window_set_visible(wvb_window_t window, bool visible) {
  std::lock_guard<std::recursive_mutex> registry_guard(RegistryMutex());
  auto result = ValidateWindowLocked(window);
  if (result != WVB_RESULT_OK) {
    return result;
  }
  window->visible = visible;
  SetThreadError(nullptr);
  return WVB_RESULT_OK;
}

wvb_result_t wvb_window_set_enabled(wvb_window_t window, bool enabled) {
  std::lock_guard<std::recursive_mutex> registry_guard(RegistryMutex());
  auto result = ValidateWindowLocked(window);
  if (result != WVB_RESULT_OK) {
    return result;
  }
  window->enabled = enabled;
  SetThreadError(nullptr);
  return WVB_RESULT_OK;
}

wvb_result_t wvb_window_focus(wvb_window_t window) {
  std::lock_guard<std::recursive_mutex> registry_guard(RegistryMutex());
  auto result = ValidateWindowLocked(window);
  if (result != WVB_RESULT_OK) {
    return result;
  }
  if (!window->focused) {
    window->focused = true;
    auto record = WindowEventRecord("window-focused", window->id);
    record["isFocused"] = true;
    PostEvent(window->loop, record);
  }
  SetThreadError(nullptr);
  return WVB_RESULT_OK;
}

wvb_result_t wvb_window_request_close(wvb_window_t window) {
  std::lock_guard<std::recursive_mutex> registry_guard(RegistryMutex());
  auto result = ValidateWindowLocked(window);
  if (result != WVB_RESULT_OK) {
    return result;
  }
  PostEvent(window->loop, WindowEventRecord("window-close-requested", window->id));
  SetThreadError(nullptr);
  return WVB_RESULT_OK;
}

// ---------------------------------------------------------------------------
// Webview
// ---------------------------------------------------------------------------

namespace {

wvb_result_t ValidateWebviewLocked(wvb_webview_t webview) {
  auto result = ValidateHandleLocked(webview, "webview");
  if (result != WVB_RESULT_OK) {
    return result;
  }
  return ValidateThread(webview->owner_thread, "webview");
}

}  // namespace

wvb_result_t wvb_webview_create(wvb_window_t window,
                                const wvb_webview_config_t* config,
                                wvb_webview_t* out_webview) {
  if (config == nullptr || out_webview == nullptr) {
    return SetThreadErrorAndReturn(
        WVB_RESULT_INVALID_ARGUMENT,
        "wvb_webview_create requires non-null config and out_webview");
  }
  if (config->struct_size < sizeof(wvb_webview_config_t)) {
    return SetThreadErrorAndReturn(WVB_RESULT_INVALID_ARGUMENT,
                                   "wvb_webview_config_t.struct_size is too small");
  }
  if (config->protocol_count > 0 && config->protocols == nullptr) {
    return SetThreadErrorAndReturn(WVB_RESULT_INVALID_ARGUMENT,
                                   "protocols is null but protocol_count is not zero");
  }

  std::lock_guard<std::recursive_mutex> registry_guard(RegistryMutex());
  auto result = ValidateWindowLocked(window);
  if (result != WVB_RESULT_OK) {
    return result;
  }
  if (window->webview != nullptr) {
    return SetThreadErrorAndReturn(WVB_RESULT_INVALID_STATE,
                                   "window already hosts a webview");
  }

  std::vector<ProtocolEntry> protocols;
  for (size_t i = 0; i < config->protocol_count; ++i) {
    const auto& definition = config->protocols[i];
    if (definition.scheme_utf8 == nullptr || definition.scheme_utf8[0] == '\0' ||
        definition.handler == nullptr) {
      return SetThreadErrorAndReturn(WVB_RESULT_INVALID_ARGUMENT,
                                     "protocol definition needs a scheme and a handler");
    }
    const std::string scheme = ToLower(definition.scheme_utf8);
    for (const auto& existing : protocols) {
      if (existing.scheme == scheme) {
        return SetThreadErrorAndReturn(WVB_RESULT_INVALID_ARGUMENT,
                                       "protocol scheme registered twice");
      }
    }
    protocols.push_back(ProtocolEntry{scheme, definition.handler, definition.user_data});
  }

  auto* impl = new (std::nothrow) wvb_webview_s();
  if (impl == nullptr) {
    *out_webview = nullptr;
    return SetThreadErrorAndReturn(WVB_RESULT_INTERNAL_ERROR,
                                   "failed to allocate webview");
  }
  impl->window = window;
  impl->owner_thread = window->owner_thread;
  impl->window_id = window->id;
  impl->url = StringOrEmpty(config->url_utf8);
  if (impl->url.empty()) {
    impl->html = StringOrEmpty(config->html_utf8);
  }
  impl->devtools_enabled = config->devtools_enabled;
  impl->transparent = config->transparent;
  impl->protocols = std::move(protocols);
  impl->ipc_handler = config->ipc_handler;
  impl->ipc_user_data = config->ipc_user_data;

  window->webview = impl;
  TrackLocked(impl);

  Logger()->debug("webview for {} created with {} custom protocol(s)", impl->window_id,
                  impl->protocols.size());
  *out_webview = impl;
  SetThreadError(nullptr);
  return WVB_RESULT_OK;
}

wvb_result_t wvb_webview_destroy(wvb_webview_t webview) {
  if (webview == nullptr) {
    SetThreadError(nullptr);
    return WVB_RESULT_OK;
  }

  {
    std::lock_guard<std::recursive_mutex> registry_guard(RegistryMutex());
    auto result = ValidateWebviewLocked(webview);
    if (result != WVB_RESULT_OK) {
      return result;
    }
    if (webview->window != nullptr) {
      webview->window->webview = nullptr;
    }
    UntrackLocked(webview);
  }

  delete webview;
  SetThreadError(nullptr);
  return WVB_RESULT_OK;
}

wvb_result_t wvb_webview_send_message(wvb_webview_t webview,
                                      const char* message_utf8) {
  if (message_utf8 == nullptr) {
    return SetThreadErrorAndReturn(WVB_RESULT_INVALID_ARGUMENT, "message is null");
  }
  std::lock_guard<std::recursive_mutex> registry_guard(RegistryMutex());
  auto result = ValidateWebviewLocked(webview);
  if (result != WVB_RESULT_OK) {
    return result;
  }
  webview->outgoing_messages.emplace_back(message_utf8);
  SetThreadError(nullptr);
  return WVB_RESULT_OK;
}

wvb_result_t wvb_webview_evaluate_script(wvb_webview_t webview,
                                         const char* script_utf8) {
  if (script_utf8 == nullptr) {
    return SetThreadErrorAndReturn(WVB_RESULT_INVALID_ARGUMENT, "script is null");
  }
  std::lock_guard<std::recursive_mutex> registry_guard(RegistryMutex());
  auto result = ValidateWebviewLocked(webview);
  if (result != WVB_RESULT_OK) {
    return result;
  }
  webview->evaluated_scripts.emplace_back(script_utf8);
  SetThreadError(nullptr);
  return WVB_RESULT_OK;
}

wvb_result_t wvb_webview_navigate(wvb_webview_t webview, const char* url_utf8) {
  if (url_utf8 == nullptr || url_utf8[0] == '\0') {
    return SetThreadErrorAndReturn(WVB_RESULT_INVALID_ARGUMENT, "url is empty");
  }
  std::lock_guard<std::recursive_mutex> registry_guard(RegistryMutex());
  auto result = ValidateWebviewLocked(webview);
  if (result != WVB_RESULT_OK) {
    return result;
  }
  webview->url = url_utf8;
  webview->html.clear();
  SetThreadError(nullptr);
  return WVB_RESULT_OK;
}

wvb_result_t wvb_webview_load_html(wvb_webview_t webview, const char* html_utf8) {
  if (html_utf8 == nullptr) {
    return SetThreadErrorAndReturn(WVB_RESULT_INVALID_ARGUMENT, "html is null");
  }
  std::lock_guard<std::recursive_mutex> registry_guard(RegistryMutex());
  auto result = ValidateWebviewLocked(webview);
  if (result != WVB_RESULT_OK) {
    return result;
  }
  webview->html = html_utf8;
  webview->url.clear();
  SetThreadError(nullptr);
  return WVB_RESULT_OK;
}

// ---------------------------------------------------------------------------
// Global shortcuts
// ---------------------------------------------------------------------------

wvb_result_t wvb_global_shortcut_register(wvb_event_loop_t loop,
                                          const char* accelerator_utf8,
                                          uint32_t* out_id) {
  if (accelerator_utf8 == nullptr || out_id == nullptr) {
    return SetThreadErrorAndReturn(
        WVB_RESULT_INVALID_ARGUMENT,
        "wvb_global_shortcut_register requires non-null accelerator and out_id");
  }
  const auto normalized = NormalizeAccelerator(accelerator_utf8);
  if (normalized.empty()) {
    return SetThreadErrorAndReturn(
        WVB_RESULT_NOT_SUPPORTED,
        (std::string("unsupported accelerator: ") + accelerator_utf8).c_str());
  }

  std::lock_guard<std::recursive_mutex> registry_guard(RegistryMutex());
  auto result = ValidateHandleLocked(loop, "event loop");
  if (result != WVB_RESULT_OK) {
    return result;
  }
  result = ValidateThread(loop->owner_thread, "event loop");
  if (result != WVB_RESULT_OK) {
    return result;
  }
  for (const auto& entry : loop->shortcuts) {
    if (entry.second == normalized) {
      return SetThreadErrorAndReturn(
          WVB_RESULT_INVALID_STATE,
          (std::string("accelerator already registered: ") + accelerator_utf8).c_str());
    }
  }

  const uint32_t id = loop->next_shortcut_id++;
  loop->shortcuts.emplace(id, normalized);
  Logger()->debug("global shortcut {} registered as {}", normalized, id);
  *out_id = id;
  SetThreadError(nullptr);
  return WVB_RESULT_OK;
}

wvb_result_t wvb_global_shortcut_unregister(wvb_event_loop_t loop, uint32_t id) {
  std::lock_guard<std::recursive_mutex> registry_guard(RegistryMutex());
  auto result = ValidateHandleLocked(loop, "event loop");
  if (result != WVB_RESULT_OK) {
    return result;
  }
  result = ValidateThread(loop->owner_thread, "event loop");
  if (result != WVB_RESULT_OK) {
    return result;
  }
  if (loop->shortcuts.erase(id) == 0) {
    return SetThreadErrorAndReturn(WVB_RESULT_INVALID_ARGUMENT,
                                   "global shortcut id is not registered");
  }
  SetThreadError(nullptr);
  return WVB_RESULT_OK;
}

// ---------------------------------------------------------------------------
// Internal entry used by the headless backend
// ---------------------------------------------------------------------------

namespace wvb::native {

void QueueIpcDelivery(wvb_webview_s* webview, std::string message) {
  auto* loop = (webview->window != nullptr) ? webview->window->loop : nullptr;
  if (loop == nullptr) {
    Logger()->debug("dropping IPC message for detached webview");
    return;
  }
  PendingItem item;
  item.task = [webview, message = std::move(message)]() { DeliverIpc(webview, message); };
  PostItem(loop, std::move(item));
}

}  // namespace wvb::native
