/**
 * @file WindowRegistry.h
 * @brief Live event targets keyed by window identifier.
 *
 * Handlers may register or remove windows while a broadcast or a routed
 * event is in flight; iterate Snapshot() rather than the map itself.
 */
#pragma once

#include <cstddef>
#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "event/EventTarget.h"

namespace wvb {

class WindowRegistry {
public:
    /// @return false when the id is empty or already registered
    bool Register(std::shared_ptr<EventTarget> target);

    /// @return true only for the call that actually removed the entry
    bool Unregister(const std::string& id);

    std::shared_ptr<EventTarget> Find(const std::string& id) const;

    std::vector<std::shared_ptr<EventTarget>> Snapshot() const;

    std::size_t Size() const;
    bool Empty() const { return Size() == 0; }

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<EventTarget>> targets_;
};

}  // namespace wvb
