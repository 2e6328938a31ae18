#ifndef WVBRIDGE_HEADLESS_H_
#define WVBRIDGE_HEADLESS_H_

/*
 * Headless backend hooks.
 *
 * The headless backend renders nothing. These entry points stand in for the
 * OS and the page: they raise the events a real window system or webview
 * engine would raise, and let the embedder observe what the host sent.
 */

#include "wvb_native_api.h"

#if defined(__cplusplus)
extern "C" {
#endif

typedef struct wvb_headless_window_state_t {
  uint32_t struct_size;
  uint32_t width;
  uint32_t height;
  int32_t x;
  int32_t y;
  bool visible;
  bool enabled;
  bool focused;
  bool resizable;
} wvb_headless_window_state_t;

/* Owned copy of a protocol response; release with wvb_headless_response_free. */
typedef struct wvb_headless_response_t {
  uint32_t struct_size;
  bool handled;
  uint16_t status;
  char* mime_type_utf8;
  /* "Name: value\r\n" lines. */
  char* headers_utf8;
  uint8_t* body;
  size_t body_len;
} wvb_headless_response_t;

/*
 * Simulates the user resizing the window; queues "window-resized".
 */
WVB_API_EXPORT wvb_result_t wvb_headless_window_resize(wvb_window_t window,
                                                       uint32_t width,
                                                       uint32_t height);

/* Simulates the user moving the window; queues "window-moved". */
WVB_API_EXPORT wvb_result_t wvb_headless_window_move(wvb_window_t window,
                                                     int32_t x, int32_t y);

/* Simulates focus gain or loss; queues "window-focused". */
WVB_API_EXPORT wvb_result_t wvb_headless_window_set_focus(wvb_window_t window,
                                                          bool focused);

/*
 * out_state->struct_size must be initialized by caller.
 */
WVB_API_EXPORT wvb_result_t wvb_headless_window_get_state(
    wvb_window_t window, wvb_headless_window_state_t* out_state);

/*
 * Simulates the page posting a message to the host. The webview's IPC
 * handler runs during the next pump on the loop thread. Thread-safe.
 */
WVB_API_EXPORT wvb_result_t wvb_headless_webview_post_ipc(
    wvb_webview_t webview, const char* message_utf8);

/*
 * Simulates the page fetching url. The matching protocol handler runs
 * synchronously. When no scheme matches or the handler declines,
 * out_response->handled is false and status is 404.
 * out_response->struct_size must be initialized by caller.
 */
WVB_API_EXPORT wvb_result_t wvb_headless_webview_fetch(
    wvb_webview_t webview, const char* url_utf8, const char* method_utf8,
    const uint8_t* body, size_t body_len,
    wvb_headless_response_t* out_response);

/* Releases the buffers of a fetched response. Passing null is a no-op. */
WVB_API_EXPORT void wvb_headless_response_free(
    wvb_headless_response_t* response);

/*
 * Pops the oldest host-to-script message. *out_message_utf8 is null when
 * the outbox is empty; otherwise release it with wvb_string_free.
 */
WVB_API_EXPORT wvb_result_t wvb_headless_webview_pop_message(
    wvb_webview_t webview, char** out_message_utf8);

/* Same as wvb_headless_webview_pop_message for evaluated scripts. */
WVB_API_EXPORT wvb_result_t wvb_headless_webview_pop_script(
    wvb_webview_t webview, char** out_script_utf8);

/*
 * Returns the current location of the webview, or "about:blank" when
 * inline HTML is loaded. Release with wvb_string_free.
 */
WVB_API_EXPORT wvb_result_t wvb_headless_webview_get_url(
    wvb_webview_t webview, char** out_url_utf8);

/* Simulates a hotkey press; queues "global-shortcut". Thread-safe. */
WVB_API_EXPORT wvb_result_t wvb_headless_trigger_shortcut(wvb_event_loop_t loop,
                                                          uint32_t id);

#if defined(__cplusplus)
}  /* extern "C" */
#endif

#endif  /* WVBRIDGE_HEADLESS_H_ */
