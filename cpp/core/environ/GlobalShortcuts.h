/**
 * @file GlobalShortcuts.h
 * @brief Process-wide hotkeys bound to host callbacks.
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>

#include "wvb_native_api.h"

namespace wvb {

class GlobalShortcuts {
public:
    using Callback = std::function<void()>;

    explicit GlobalShortcuts(wvb_event_loop_t loop);
    ~GlobalShortcuts();

    GlobalShortcuts(const GlobalShortcuts&) = delete;
    GlobalShortcuts& operator=(const GlobalShortcuts&) = delete;

    /**
     * Bind accelerator (e.g. "CmdOrCtrl+Shift+K") to callback.
     * @return the shortcut id, or 0 when the backend refused it
     */
    uint32_t Register(const std::string& accelerator, Callback callback);

    bool Unregister(uint32_t id);
    void UnregisterAll();

    /// Run the callback bound to id; false when none is.
    bool Dispatch(uint32_t id);

    std::size_t Count() const;
    std::optional<std::string> AcceleratorOf(uint32_t id) const;

private:
    struct Entry {
        std::string accelerator;
        Callback callback;
    };

    wvb_event_loop_t loop_;
    mutable std::mutex mutex_;
    std::map<uint32_t, Entry> entries_;
};

}  // namespace wvb
