#include "wvb_headless.h"

#include <cstdlib>
#include <cstring>
#include <string>
#include <utility>

#include "native_state.h"

using nlohmann::json;
using namespace wvb::native;

namespace {

std::string SchemeOf(const std::string& url) {
  const auto colon = url.find(':');
  if (colon == std::string::npos || colon == 0) {
    return {};
  }
  std::string scheme = url.substr(0, colon);
  for (auto& c : scheme) {
    if (c >= 'A' && c <= 'Z') {
      c = static_cast<char>(c - 'A' + 'a');
    }
  }
  return scheme;
}

void ResetResponse(wvb_headless_response_t* response) {
  const uint32_t struct_size = response->struct_size;
  std::memset(response, 0, sizeof(*response));
  response->struct_size = struct_size;
}

void MarkNotFound(wvb_headless_response_t* response) {
  response->handled = false;
  response->status = 404;
}

// Copies the handler's response so the handler buffers can be freed at once.
bool CopyResponse(const wvb_protocol_response_t& source,
                  wvb_headless_response_t* target) {
  target->handled = true;
  target->status = source.status != 0 ? source.status : 200;

  target->mime_type_utf8 = DuplicateString(
      source.mime_type_utf8 != nullptr ? source.mime_type_utf8 : "application/octet-stream");

  std::string headers;
  for (size_t i = 0; i < source.header_count; ++i) {
    const auto& header = source.headers[i];
    if (header.name_utf8 == nullptr) {
      continue;
    }
    headers += header.name_utf8;
    headers += ": ";
    headers += (header.value_utf8 != nullptr) ? header.value_utf8 : "";
    headers += "\r\n";
  }
  target->headers_utf8 = DuplicateString(headers);

  if (source.body_len > 0 && source.body != nullptr) {
    target->body = static_cast<uint8_t*>(std::malloc(source.body_len));
    if (target->body == nullptr) {
      return false;
    }
    std::memcpy(target->body, source.body, source.body_len);
    target->body_len = source.body_len;
  }
  return target->mime_type_utf8 != nullptr && target->headers_utf8 != nullptr;
}

wvb_result_t PopFront(wvb_webview_t webview,
                      std::deque<std::string> wvb_webview_s::*queue,
                      char** out_value) {
  if (out_value == nullptr) {
    return SetThreadErrorAndReturn(WVB_RESULT_INVALID_ARGUMENT, "out pointer is null");
  }
  *out_value = nullptr;
  std::lock_guard<std::recursive_mutex> registry_guard(RegistryMutex());
  auto result = ValidateHandleLocked(webview, "webview");
  if (result != WVB_RESULT_OK) {
    return result;
  }
  auto& entries = webview->*queue;
  if (!entries.empty()) {
    *out_value = DuplicateString(entries.front());
    entries.pop_front();
    if (*out_value == nullptr) {
      return SetThreadErrorAndReturn(WVB_RESULT_INTERNAL_ERROR,
                                     "failed to allocate message copy");
    }
  }
  SetThreadError(nullptr);
  return WVB_RESULT_OK;
}

wvb_result_t ValidateWindowForHook(wvb_window_t window) {
  auto result = ValidateHandleLocked(window, "window");
  if (result != WVB_RESULT_OK) {
    return result;
  }
  return ValidateThread(window->owner_thread, "window");
}

}  // namespace

wvb_result_t wvb_headless_window_resize(wvb_window_t window, uint32_t width,
                                        uint32_t height) {
  if (width == 0 || height == 0) {
    return SetThreadErrorAndReturn(WVB_RESULT_INVALID_ARGUMENT,
                                   "width and height must be greater than zero");
  }
  std::lock_guard<std::recursive_mutex> registry_guard(RegistryMutex());
  auto result = ValidateWindowForHook(window);
  if (result != WVB_RESULT_OK) {
    return result;
  }
  if (!window->resizable) {
    return SetThreadErrorAndReturn(WVB_RESULT_INVALID_STATE,
                                   "window is not resizable by the user");
  }
  window->width = width;
  window->height = height;
  auto record = WindowEventRecord("window-resized", window->id);
  record["size"] = json{{"width", width}, {"height", height}};
  PostEvent(window->loop, record);
  SetThreadError(nullptr);
  return WVB_RESULT_OK;
}

wvb_result_t wvb_headless_window_move(wvb_window_t window, int32_t x, int32_t y) {
  std::lock_guard<std::recursive_mutex> registry_guard(RegistryMutex());
  auto result = ValidateWindowForHook(window);
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

wvb_result_t wvb_headless_window_set_focus(wvb_window_t window, bool focused) {
  std::lock_guard<std::recursive_mutex> registry_guard(RegistryMutex());
  auto result = ValidateWindowForHook(window);
  if (result != WVB_RESULT_OK) {
    return result;
  }
  window->focused = focused;
  auto record = WindowEventRecord("window-focused", window->id);
  record["isFocused"] = focused;
  PostEvent(window->loop, record);
  SetThreadError(nullptr);
  return WVB_RESULT_OK;
}

wvb_result_t wvb_headless_window_get_state(wvb_window_t window,
                                           wvb_headless_window_state_t* out_state) {
  if (out_state == nullptr) {
    return SetThreadErrorAndReturn(WVB_RESULT_INVALID_ARGUMENT, "out_state is null");
  }
  if (out_state->struct_size < sizeof(wvb_headless_window_state_t)) {
    return SetThreadErrorAndReturn(
        WVB_RESULT_INVALID_ARGUMENT,
        "wvb_headless_window_state_t.struct_size is too small");
  }
  std::lock_guard<std::recursive_mutex> registry_guard(RegistryMutex());
  auto result = ValidateHandleLocked(window, "window");
  if (result != WVB_RESULT_OK) {
    return result;
  }
  out_state->width = window->width;
  out_state->height = window->height;
  out_state->x = window->x;
  out_state->y = window->y;
  out_state->visible = window->visible;
  out_state->enabled = window->enabled;
  out_state->focused = window->focused;
  out_state->resizable = window->resizable;
  SetThreadError(nullptr);
  return WVB_RESULT_OK;
}

wvb_result_t wvb_headless_webview_post_ipc(wvb_webview_t webview,
                                           const char* message_utf8) {
  if (message_utf8 == nullptr) {
    return SetThreadErrorAndReturn(WVB_RESULT_INVALID_ARGUMENT, "message is null");
  }
  std::lock_guard<std::recursive_mutex> registry_guard(RegistryMutex());
  auto result = ValidateHandleLocked(webview, "webview");
  if (result != WVB_RESULT_OK) {
    return result;
  }
  if (webview->window == nullptr || webview->window->loop == nullptr) {
    return SetThreadErrorAndReturn(WVB_RESULT_INVALID_STATE,
                                   "webview is detached from its event loop");
  }
  QueueIpcDelivery(webview, message_utf8);
  SetThreadError(nullptr);
  return WVB_RESULT_OK;
}

wvb_result_t wvb_headless_webview_fetch(wvb_webview_t webview,
                                        const char* url_utf8,
                                        const char* method_utf8,
                                        const uint8_t* body, size_t body_len,
                                        wvb_headless_response_t* out_response) {
  if (url_utf8 == nullptr || out_response == nullptr) {
    return SetThreadErrorAndReturn(
        WVB_RESULT_INVALID_ARGUMENT,
        "wvb_headless_webview_fetch requires non-null url and out_response");
  }
  if (out_response->struct_size < sizeof(wvb_headless_response_t)) {
    return SetThreadErrorAndReturn(WVB_RESULT_INVALID_ARGUMENT,
                                   "wvb_headless_response_t.struct_size is too small");
  }
  ResetResponse(out_response);

  ProtocolEntry protocol;
  std::string window_id;
  {
    std::lock_guard<std::recursive_mutex> registry_guard(RegistryMutex());
    auto result = ValidateHandleLocked(webview, "webview");
    if (result != WVB_RESULT_OK) {
      return result;
    }
    result = ValidateThread(webview->owner_thread, "webview");
    if (result != WVB_RESULT_OK) {
      return result;
    }
    const auto scheme = SchemeOf(url_utf8);
    for (const auto& entry : webview->protocols) {
      if (entry.scheme == scheme) {
        protocol = entry;
        break;
      }
    }
    window_id = webview->window_id;
  }

  if (protocol.handler == nullptr) {
    Logger()->debug("no custom protocol for {}", url_utf8);
    MarkNotFound(out_response);
    SetThreadError(nullptr);
    return WVB_RESULT_OK;
  }

  wvb_protocol_request_t request{};
  request.struct_size = sizeof(request);
  request.url_utf8 = url_utf8;
  request.method_utf8 = (method_utf8 != nullptr) ? method_utf8 : "GET";
  request.headers = nullptr;
  request.header_count = 0;
  request.body = body;
  request.body_len = (body != nullptr) ? body_len : 0;
  request.webview_id_utf8 = window_id.c_str();

  wvb_protocol_response_t response{};
  response.struct_size = sizeof(response);
  if (!protocol.handler(&request, &response, protocol.user_data)) {
    MarkNotFound(out_response);
    SetThreadError(nullptr);
    return WVB_RESULT_OK;
  }

  const bool copied = CopyResponse(response, out_response);
  if (response.free_fn != nullptr) {
    response.free_fn(response.free_user_data);
  }
  if (!copied) {
    wvb_headless_response_free(out_response);
    return SetThreadErrorAndReturn(WVB_RESULT_INTERNAL_ERROR,
                                   "failed to copy protocol response");
  }
  SetThreadError(nullptr);
  return WVB_RESULT_OK;
}

void wvb_headless_response_free(wvb_headless_response_t* response) {
  if (response == nullptr) {
    return;
  }
  std::free(response->mime_type_utf8);
  std::free(response->headers_utf8);
  std::free(response->body);
  response->mime_type_utf8 = nullptr;
  response->headers_utf8 = nullptr;
  response->body = nullptr;
  response->body_len = 0;
}

wvb_result_t wvb_headless_webview_pop_message(wvb_webview_t webview,
                                              char** out_message_utf8) {
  return PopFront(webview, &wvb_webview_s::outgoing_messages, out_message_utf8);
}

wvb_result_t wvb_headless_webview_pop_script(wvb_webview_t webview,
                                             char** out_script_utf8) {
  return PopFront(webview, &wvb_webview_s::evaluated_scripts, out_script_utf8);
}

wvb_result_t wvb_headless_webview_get_url(wvb_webview_t webview,
                                          char** out_url_utf8) {
  if (out_url_utf8 == nullptr) {
    return SetThreadErrorAndReturn(WVB_RESULT_INVALID_ARGUMENT, "out_url_utf8 is null");
  }
  std::lock_guard<std::recursive_mutex> registry_guard(RegistryMutex());
  auto result = ValidateHandleLocked(webview, "webview");
  if (result != WVB_RESULT_OK) {
    return result;
  }
  *out_url_utf8 = DuplicateString(webview->url.empty() ? "about:blank" : webview->url);
  SetThreadError(nullptr);
  return WVB_RESULT_OK;
}

wvb_result_t wvb_headless_trigger_shortcut(wvb_event_loop_t loop, uint32_t id) {
  std::lock_guard<std::recursive_mutex> registry_guard(RegistryMutex());
  auto result = ValidateHandleLocked(loop, "event loop");
  if (result != WVB_RESULT_OK) {
    return result;
  }
  if (loop->shortcuts.find(id) == loop->shortcuts.end()) {
    return SetThreadErrorAndReturn(WVB_RESULT_INVALID_ARGUMENT,
                                   "global shortcut id is not registered");
  }
  PostEvent(loop, json{{"type", "global-shortcut"}, {"id", id}});
  SetThreadError(nullptr);
  return WVB_RESULT_OK;
}
