/**
* @file native_state.h
* @brief Handle layouts and shared helpers of the headless native runtime.
*
* Every entry point validates handles against the live sets below while
* holding RegistryMutex(). The per-loop queue has its own mutex so proxies
* can post from other threads while the loop thread waits.
*/
#pragma once

#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_set>
#include <vector>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "wvb_native_api.h"

namespace wvb::native {

struct PendingItem {
  // Delivered to the pump callback when non-empty.
  std::string event_json;
  // Runs on the loop thread otherwise.
  std::function<void()> task;
};

struct ProtocolEntry {
  std::string scheme;
  wvb_protocol_handler_t handler = nullptr;
  void* user_data = nullptr;
};

}  // namespace wvb::native

struct wvb_event_loop_s {
  std::thread::id owner_thread;
  std::mutex queue_mutex;
  std::condition_variable queue_cv;
  std::deque<wvb::native::PendingItem> queue;
  wvb_control_flow_t control_flow = WVB_CONTROL_FLOW_WAIT;
  bool pumping = false;
  bool exited = false;
  std::unordered_set<wvb_window_s*> windows;
  std::unordered_set<wvb_event_loop_proxy_s*> proxies;
  std::map<uint32_t, std::string> shortcuts;
  uint32_t next_shortcut_id = 1;
};

struct wvb_event_loop_proxy_s {
  wvb_event_loop_s* loop = nullptr;
};

struct wvb_window_s {
  wvb_event_loop_s* loop = nullptr;
  std::thread::id owner_thread;
  std::string id;
  std::string title;
  uint32_t width = 800;
  uint32_t height = 600;
  int32_t x = 0;
  int32_t y = 0;
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
  bool enabled = true;
  bool focused = false;
  wvb_window_s* parent = nullptr;
  bool modal = false;
  wvb_webview_s* webview = nullptr;
};

struct wvb_webview_s {
  wvb_window_s* window = nullptr;
  std::thread::id owner_thread;
  std::string window_id;
  std::string url;
  std::string html;
  bool devtools_enabled = true;
  bool transparent = false;
  std::vector<wvb::native::ProtocolEntry> protocols;
  wvb_ipc_handler_t ipc_handler = nullptr;
  void* ipc_user_data = nullptr;
  std::deque<std::string> outgoing_messages;
  std::deque<std::string> evaluated_scripts;
};

namespace wvb::native {

std::recursive_mutex& RegistryMutex();

template <typename T>
std::unordered_set<T*>& LiveHandles() {
  static std::unordered_set<T*> handles;
  return handles;
}

template <typename T>
bool IsLiveLocked(T* handle) {
  auto& handles = LiveHandles<T>();
  return handles.find(handle) != handles.end();
}

void SetThreadError(const char* message);
void SetThreadError(const std::string& message);
wvb_result_t SetThreadErrorAndReturn(wvb_result_t result, const char* message);

template <typename T>
wvb_result_t ValidateHandleLocked(T* handle, const char* kind) {
  if (handle == nullptr) {
    return SetThreadErrorAndReturn(WVB_RESULT_INVALID_ARGUMENT,
                                   (std::string(kind) + " handle is null").c_str());
  }
  if (!IsLiveLocked(handle)) {
    return SetThreadErrorAndReturn(
        WVB_RESULT_INVALID_ARGUMENT,
        (std::string(kind) + " handle is invalid or already destroyed").c_str());
  }
  return WVB_RESULT_OK;
}

wvb_result_t ValidateThread(std::thread::id owner, const char* kind);

void EnsureNativeLoggersInitialized();
std::shared_ptr<spdlog::logger> Logger();

void PostItem(wvb_event_loop_s* loop, PendingItem item);
void PostEvent(wvb_event_loop_s* loop, const nlohmann::json& record);
nlohmann::json WindowEventRecord(const char* type, const std::string& window_id);

char* DuplicateString(const std::string& value);

// Runs the webview's IPC handler during the next pump of its loop.
void QueueIpcDelivery(wvb_webview_s* webview, std::string message);

}  // namespace wvb::native
