#ifndef WVBRIDGE_NATIVE_API_H_
#define WVBRIDGE_NATIVE_API_H_

#include <stdbool.h>
#include <stddef.h>
#include <stdint.h>

/* Export macro for shared-library builds. */
#if defined(_WIN32)
#if defined(WVB_API_BUILD_SHARED)
#define WVB_API_EXPORT __declspec(dllexport)
#elif defined(WVB_API_USE_SHARED)
#define WVB_API_EXPORT __declspec(dllimport)
#else
#define WVB_API_EXPORT
#endif
#else
#if defined(__GNUC__) && __GNUC__ >= 4
#define WVB_API_EXPORT __attribute__((visibility("default")))
#else
#define WVB_API_EXPORT
#endif
#endif

#if defined(__cplusplus)
extern "C" {
#endif

/* ABI version: major(8bit), minor(8bit), patch(16bit). */
#define WVB_API_VERSION 0x01000000u
#define WVB_API_MAKE_VERSION(major, minor, patch) \
  ((((uint32_t)(major)&0xFFu) << 24u) | (((uint32_t)(minor)&0xFFu) << 16u) | \
   ((uint32_t)(patch)&0xFFFFu))

typedef struct wvb_event_loop_s* wvb_event_loop_t;
typedef struct wvb_event_loop_proxy_s* wvb_event_loop_proxy_t;
typedef struct wvb_window_s* wvb_window_t;
typedef struct wvb_webview_s* wvb_webview_t;

typedef enum wvb_result_t {
  WVB_RESULT_OK = 0,
  WVB_RESULT_INVALID_ARGUMENT = -1,
  WVB_RESULT_INVALID_STATE = -2,
  WVB_RESULT_NOT_SUPPORTED = -3,
  WVB_RESULT_IO_ERROR = -4,
  WVB_RESULT_INTERNAL_ERROR = -5
} wvb_result_t;

typedef enum wvb_control_flow_t {
  WVB_CONTROL_FLOW_POLL = 0,
  WVB_CONTROL_FLOW_WAIT = 1,
  WVB_CONTROL_FLOW_EXIT = 2
} wvb_control_flow_t;

typedef enum wvb_pump_status_t {
  WVB_PUMP_STATUS_CONTINUE = 0,
  WVB_PUMP_STATUS_EXIT = 1
} wvb_pump_status_t;

/*
 * Receives one event record as a UTF-8 JSON object.
 * event_json is only valid for the duration of the call.
 */
typedef wvb_control_flow_t (*wvb_event_callback_t)(const char* event_json,
                                                   void* user_data);

/* Releases a response handed back by a protocol handler. */
typedef void (*wvb_free_fn_t)(void* free_user_data);

typedef struct wvb_event_loop_desc_t {
  uint32_t struct_size;
  uint32_t api_version;
  void* user_data;
  uint64_t reserved_u64[4];
  void* reserved_ptr[4];
} wvb_event_loop_desc_t;

typedef struct wvb_window_config_t {
  uint32_t struct_size;
  const char* title_utf8;
  int32_t x;
  int32_t y;
  bool has_position;
  uint32_t width;
  uint32_t height;
  /* 0 means unconstrained. */
  uint32_t min_width;
  uint32_t min_height;
  uint32_t max_width;
  uint32_t max_height;
  bool resizable;
  bool fullscreen;
  bool maximized;
  bool minimized;
  bool visible;
  bool transparent;
  bool decorations;
  bool always_on_top;
  /* Optional owner window; may be null. */
  wvb_window_t parent;
  bool modal;
  uint64_t reserved_u64[2];
  void* reserved_ptr[2];
} wvb_window_config_t;

typedef struct wvb_protocol_header_t {
  const char* name_utf8;
  const char* value_utf8;
} wvb_protocol_header_t;

/* Borrowed views, valid only for the duration of the handler call. */
typedef struct wvb_protocol_request_t {
  uint32_t struct_size;
  const char* url_utf8;
  const char* method_utf8;
  const wvb_protocol_header_t* headers;
  size_t header_count;
  const uint8_t* body;
  size_t body_len;
  const char* webview_id_utf8;
} wvb_protocol_request_t;

/*
 * Filled in by a protocol handler that accepts the request.
 * All pointers stay owned by the handler until free_fn(free_user_data)
 * is invoked, which the runtime does exactly once per accepted response.
 */
typedef struct wvb_protocol_response_t {
  uint32_t struct_size;
  uint16_t status;
  const wvb_protocol_header_t* headers;
  size_t header_count;
  const uint8_t* body;
  size_t body_len;
  const char* mime_type_utf8;
  wvb_free_fn_t free_fn;
  void* free_user_data;
} wvb_protocol_response_t;

/*
 * Returns true when out_response was filled in. Returning false transfers
 * no ownership and free_fn is never called.
 */
typedef bool (*wvb_protocol_handler_t)(const wvb_protocol_request_t* request,
                                       wvb_protocol_response_t* out_response,
                                       void* user_data);

typedef struct wvb_protocol_definition_t {
  const char* scheme_utf8;
  wvb_protocol_handler_t handler;
  void* user_data;
} wvb_protocol_definition_t;

/* Script-to-host message. url and message are valid only for the call. */
typedef void (*wvb_ipc_handler_t)(const char* url_utf8,
                                  const char* message_utf8,
                                  void* user_data);

typedef struct wvb_webview_config_t {
  uint32_t struct_size;
  /* Start location; url wins when both are set. */
  const char* url_utf8;
  const char* html_utf8;
  bool devtools_enabled;
  bool transparent;
  const wvb_protocol_definition_t* protocols;
  size_t protocol_count;
  wvb_ipc_handler_t ipc_handler;
  void* ipc_user_data;
  uint64_t reserved_u64[2];
  void* reserved_ptr[2];
} wvb_webview_config_t;

/*
 * Returns runtime API version in out_api_version.
 * out_api_version must be non-null.
 */
WVB_API_EXPORT wvb_result_t wvb_get_runtime_api_version(
    uint32_t* out_api_version);

/*
 * Creates an event loop bound to the calling thread.
 * desc and out_loop must be non-null.
 * out_loop is set only when WVB_RESULT_OK is returned.
 */
WVB_API_EXPORT wvb_result_t wvb_event_loop_create(
    const wvb_event_loop_desc_t* desc, wvb_event_loop_t* out_loop);

/*
 * Destroys the event loop. Windows and proxies created from it are
 * detached and stay valid handles until destroyed themselves.
 * Idempotent: passing a null handle returns WVB_RESULT_OK.
 * Fails with WVB_RESULT_INVALID_STATE while the loop is being pumped.
 */
WVB_API_EXPORT wvb_result_t wvb_event_loop_destroy(wvb_event_loop_t loop);

/*
 * Runs one cooperative step of the loop.
 * Blocks at most timeout_ms waiting for work when the previous step asked
 * for WVB_CONTROL_FLOW_WAIT; never blocks after WVB_CONTROL_FLOW_POLL.
 * callback is invoked synchronously on the calling thread for every event
 * record; returning WVB_CONTROL_FLOW_EXIT stops the loop, after which a
 * final "loop-destroyed" record is delivered and out_status is
 * WVB_PUMP_STATUS_EXIT. Re-entrant calls fail with WVB_RESULT_INVALID_STATE.
 */
WVB_API_EXPORT wvb_result_t wvb_event_loop_pump_events(
    wvb_event_loop_t loop, uint32_t timeout_ms, wvb_event_callback_t callback,
    void* user_data, wvb_pump_status_t* out_status);

/*
 * Creates a proxy usable from any thread to wake the loop.
 */
WVB_API_EXPORT wvb_result_t wvb_event_loop_proxy_create(
    wvb_event_loop_t loop, wvb_event_loop_proxy_t* out_proxy);

/*
 * Idempotent: passing a null handle returns WVB_RESULT_OK.
 */
WVB_API_EXPORT wvb_result_t wvb_event_loop_proxy_destroy(
    wvb_event_loop_proxy_t proxy);

/*
 * Queues a "user-exit" record. Thread-safe.
 */
WVB_API_EXPORT wvb_result_t wvb_event_loop_proxy_request_exit(
    wvb_event_loop_proxy_t proxy);

/*
 * Queues a "user-event" record carrying payload_utf8. Thread-safe.
 */
WVB_API_EXPORT wvb_result_t wvb_event_loop_proxy_send_user_event(
    wvb_event_loop_proxy_t proxy, const char* payload_utf8);

/*
 * Creates a window on the loop. Must be called on the loop thread.
 * config->struct_size must be initialized by caller.
 */
WVB_API_EXPORT wvb_result_t wvb_window_create(wvb_event_loop_t loop,
                                              const wvb_window_config_t* config,
                                              wvb_window_t* out_window);

/*
 * Destroys the window and queues a "window-destroyed" record.
 * Idempotent: passing a null handle returns WVB_RESULT_OK.
 */
WVB_API_EXPORT wvb_result_t wvb_window_destroy(wvb_window_t window);

/*
 * Returns the window identifier used in event records.
 * The returned pointer remains valid until the window is destroyed.
 */
WVB_API_EXPORT wvb_result_t wvb_window_get_id(wvb_window_t window,
                                              const char** out_id_utf8);

WVB_API_EXPORT wvb_result_t wvb_window_set_title(wvb_window_t window,
                                                 const char* title_utf8);

/*
 * width and height must be greater than zero.
 * Queues a "window-resized" record.
 */
WVB_API_EXPORT wvb_result_t wvb_window_set_size(wvb_window_t window,
                                                uint32_t width,
                                                uint32_t height);

/* Queues a "window-moved" record. */
WVB_API_EXPORT wvb_result_t wvb_window_set_position(wvb_window_t window,
                                                    int32_t x, int32_t y);

WVB_API_EXPORT wvb_result_t wvb_window_set_visible(wvb_window_t window,
                                                   bool visible);

/* Disabled windows ignore user input; used for modal owners. */
WVB_API_EXPORT wvb_result_t wvb_window_set_enabled(wvb_window_t window,
                                                   bool enabled);

/* Queues a "window-focused" record. */
WVB_API_EXPORT wvb_result_t wvb_window_focus(wvb_window_t window);

/*
 * Asks the window to close the same way the user would; queues a
 * "window-close-requested" record. The window stays alive until destroyed.
 */
WVB_API_EXPORT wvb_result_t wvb_window_request_close(wvb_window_t window);

/*
 * Creates the webview hosted by window. At most one webview per window.
 * Scheme strings in config->protocols are copied.
 */
WVB_API_EXPORT wvb_result_t wvb_webview_create(
    wvb_window_t window, const wvb_webview_config_t* config,
    wvb_webview_t* out_webview);

/*
 * Idempotent: passing a null handle returns WVB_RESULT_OK.
 */
WVB_API_EXPORT wvb_result_t wvb_webview_destroy(wvb_webview_t webview);

/* Delivers a host-to-script message. */
WVB_API_EXPORT wvb_result_t wvb_webview_send_message(wvb_webview_t webview,
                                                     const char* message_utf8);

WVB_API_EXPORT wvb_result_t wvb_webview_evaluate_script(
    wvb_webview_t webview, const char* script_utf8);

WVB_API_EXPORT wvb_result_t wvb_webview_navigate(wvb_webview_t webview,
                                                 const char* url_utf8);

WVB_API_EXPORT wvb_result_t wvb_webview_load_html(wvb_webview_t webview,
                                                  const char* html_utf8);

/*
 * Registers a process-wide hotkey such as "CmdOrCtrl+Shift+K".
 * Presses are delivered as {"type":"global-shortcut","id":N} records.
 * Returns WVB_RESULT_NOT_SUPPORTED for accelerators the backend cannot map
 * and WVB_RESULT_INVALID_STATE when the accelerator is already taken.
 */
WVB_API_EXPORT wvb_result_t wvb_global_shortcut_register(
    wvb_event_loop_t loop, const char* accelerator_utf8, uint32_t* out_id);

WVB_API_EXPORT wvb_result_t wvb_global_shortcut_unregister(
    wvb_event_loop_t loop, uint32_t id);

/*
 * Returns last error message recorded on the calling thread as UTF-8.
 * The returned pointer remains valid until the next API call on the
 * same thread. Returns empty string when no error is recorded.
 */
WVB_API_EXPORT const char* wvb_get_last_error(void);

/*
 * Frees a string allocated by the runtime.
 * Passing null is a no-op.
 */
WVB_API_EXPORT void wvb_string_free(char* value);

#if defined(__cplusplus)
}  /* extern "C" */
#endif

#endif  /* WVBRIDGE_NATIVE_API_H_ */
