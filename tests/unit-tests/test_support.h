#pragma once

#include <chrono>
#include <string>
#include <vector>

#include "wvb_headless.h"
#include "wvb_native_api.h"

namespace wvb::test {

/// Drain the messages a webview was sent by the host.
inline std::vector<std::string> PopMessages(wvb_webview_t webview) {
    std::vector<std::string> messages;
    for (;;) {
        char* message = nullptr;
        if (wvb_headless_webview_pop_message(webview, &message) != WVB_RESULT_OK ||
            message == nullptr) {
            break;
        }
        messages.emplace_back(message);
        wvb_string_free(message);
    }
    return messages;
}

inline std::string PopScript(wvb_webview_t webview) {
    char* script = nullptr;
    if (wvb_headless_webview_pop_script(webview, &script) != WVB_RESULT_OK ||
        script == nullptr) {
        return {};
    }
    std::string result(script);
    wvb_string_free(script);
    return result;
}

inline std::string CurrentUrl(wvb_webview_t webview) {
    char* url = nullptr;
    if (wvb_headless_webview_get_url(webview, &url) != WVB_RESULT_OK || url == nullptr) {
        return {};
    }
    std::string result(url);
    wvb_string_free(url);
    return result;
}

inline wvb_headless_window_state_t WindowState(wvb_window_t window) {
    wvb_headless_window_state_t state{};
    state.struct_size = sizeof(state);
    wvb_headless_window_get_state(window, &state);
    return state;
}

inline constexpr std::chrono::milliseconds kNoWait{0};

}  // namespace wvb::test
