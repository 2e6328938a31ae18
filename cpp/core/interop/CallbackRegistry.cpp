#include "CallbackRegistry.h"

#include <algorithm>
#include <utility>

#include "base/Log.h"

namespace wvb {

// ---------------------------------------------------------------------------
// Set lookup
// ---------------------------------------------------------------------------

std::shared_ptr<CallbackRegistry::CallbackSet> CallbackRegistry::FindSet(
    OwnerKey owner) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = sets_.find(owner);
    return (it != sets_.end()) ? it->second : nullptr;
}

std::shared_ptr<CallbackRegistry::CallbackSet> CallbackRegistry::FindOrCreateSet(
    OwnerKey owner) {
    if (auto set = FindSet(owner)) {
        return set;
    }
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto [it, inserted] = sets_.try_emplace(owner, nullptr);
    if (inserted) {
        it->second = std::make_shared<CallbackSet>();
    }
    return it->second;
}

// ---------------------------------------------------------------------------
// Pin / release
// ---------------------------------------------------------------------------

void CallbackRegistry::Pin(OwnerKey owner, std::shared_ptr<void> callback) {
    // A set grabbed just before a concurrent Unregister is marked released;
    // retry so the entry lands in the owner's fresh set.
    for (;;) {
        auto set = FindOrCreateSet(owner);
        std::lock_guard<std::mutex> guard(set->mutex);
        if (set->released) {
            continue;
        }
        set->entries.push_back(std::move(callback));
        return;
    }
}

bool CallbackRegistry::Release(OwnerKey owner, const void* user_data) {
    auto set = FindSet(owner);
    if (set == nullptr) {
        return false;
    }
    std::shared_ptr<void> released;
    {
        std::lock_guard<std::mutex> guard(set->mutex);
        auto it = std::find_if(set->entries.begin(), set->entries.end(),
                               [user_data](const std::shared_ptr<void>& entry) {
                                   return entry.get() == user_data;
                               });
        if (it == set->entries.end()) {
            return false;
        }
        released = std::move(*it);
        set->entries.erase(it);
    }
    return true;
}

std::size_t CallbackRegistry::Unregister(OwnerKey owner) {
    std::shared_ptr<CallbackSet> set;
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto it = sets_.find(owner);
        if (it == sets_.end()) {
            return 0;
        }
        set = std::move(it->second);
        sets_.erase(it);
    }

    std::vector<std::shared_ptr<void>> entries;
    {
        std::lock_guard<std::mutex> guard(set->mutex);
        set->released = true;
        entries.swap(set->entries);
    }
    const auto count = entries.size();
    // Destroy outside the locks: a destructor may pin or unregister again.
    entries.clear();
    log::Get(log::kBridge)->trace("released {} callback(s) for {}", count, owner);
    return count;
}

// ---------------------------------------------------------------------------
// Queries
// ---------------------------------------------------------------------------

bool CallbackRegistry::IsPinned(OwnerKey owner) const {
    return PinnedCount(owner) > 0;
}

std::size_t CallbackRegistry::PinnedCount(OwnerKey owner) const {
    auto set = FindSet(owner);
    if (set == nullptr) {
        return 0;
    }
    std::lock_guard<std::mutex> guard(set->mutex);
    return set->entries.size();
}

std::size_t CallbackRegistry::OwnerCount() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return sets_.size();
}

CallbackRegistry& CallbackRegistry::Shared() {
    static CallbackRegistry registry;
    return registry;
}

}  // namespace wvb
