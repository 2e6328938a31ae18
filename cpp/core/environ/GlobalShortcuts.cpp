#include "GlobalShortcuts.h"

#include <utility>
#include <vector>

#include "base/Log.h"
#include "interop/NativeHandle.h"

namespace wvb {

GlobalShortcuts::GlobalShortcuts(wvb_event_loop_t loop) : loop_(loop) {}

GlobalShortcuts::~GlobalShortcuts() {
    if (NativeRuntime::IsAvailable()) {
        UnregisterAll();
    }
}

uint32_t GlobalShortcuts::Register(const std::string& accelerator, Callback callback) {
    uint32_t id = 0;
    const auto result = wvb_global_shortcut_register(loop_, accelerator.c_str(), &id);
    if (result != WVB_RESULT_OK) {
        log::Get(log::kBridge)->warn("global shortcut '{}' not registered ({}): {}", accelerator,
                                     static_cast<int>(result), wvb_get_last_error());
        return 0;
    }

    std::lock_guard<std::mutex> guard(mutex_);
    entries_[id] = Entry{accelerator, std::move(callback)};
    return id;
}

bool GlobalShortcuts::Unregister(uint32_t id) {
    {
        std::lock_guard<std::mutex> guard(mutex_);
        if (entries_.erase(id) == 0) {
            return false;
        }
    }
    const auto result = wvb_global_shortcut_unregister(loop_, id);
    if (result != WVB_RESULT_OK) {
        log::Get(log::kBridge)->warn("unregistering global shortcut {} failed: {}", id,
                                     wvb_get_last_error());
    }
    return true;
}

void GlobalShortcuts::UnregisterAll() {
    std::vector<uint32_t> ids;
    {
        std::lock_guard<std::mutex> guard(mutex_);
        for (const auto& entry : entries_) {
            ids.push_back(entry.first);
        }
    }
    for (const auto id : ids) {
        Unregister(id);
    }
}

bool GlobalShortcuts::Dispatch(uint32_t id) {
    Callback callback;
    {
        std::lock_guard<std::mutex> guard(mutex_);
        auto it = entries_.find(id);
        if (it == entries_.end()) {
            log::Get(log::kBridge)->debug("global shortcut {} has no binding", id);
            return false;
        }
        callback = it->second.callback;
    }
    if (callback) {
        callback();
    }
    return true;
}

std::size_t GlobalShortcuts::Count() const {
    std::lock_guard<std::mutex> guard(mutex_);
    return entries_.size();
}

std::optional<std::string> GlobalShortcuts::AcceleratorOf(uint32_t id) const {
    std::lock_guard<std::mutex> guard(mutex_);
    auto it = entries_.find(id);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second.accelerator;
}

}  // namespace wvb
