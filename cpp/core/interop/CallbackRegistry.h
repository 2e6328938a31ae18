/**
 * @file CallbackRegistry.h
 * @brief Keeps host callbacks alive while native code holds their user_data.
 *
 * Native code only sees a raw function pointer plus a void* user_data. The
 * object behind that user_data is pinned here under the handle of the
 * native resource that may call it, and is released when that resource is
 * torn down (see NativeHandle::Release).
 */
#pragma once

#include <cstddef>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <unordered_map>
#include <vector>

namespace wvb {

class CallbackRegistry {
public:
    using OwnerKey = const void*;

    CallbackRegistry() = default;
    ~CallbackRegistry() = default;

    CallbackRegistry(const CallbackRegistry&) = delete;
    CallbackRegistry& operator=(const CallbackRegistry&) = delete;

    /**
     * Pin callback under owner and return the pointer to hand to native code
     * as user_data. The object stays alive until Release or Unregister.
     */
    template <typename T>
    void* Register(OwnerKey owner, std::shared_ptr<T> callback) {
        void* user_data = callback.get();
        Pin(owner, std::shared_ptr<void>(std::move(callback)));
        return user_data;
    }

    /**
     * Pin a type-erased object under owner.
     */
    void Pin(OwnerKey owner, std::shared_ptr<void> callback);

    /**
     * Drop the single entry whose user_data is given.
     * @return false when no such entry is pinned under owner
     */
    bool Release(OwnerKey owner, const void* user_data);

    /**
     * Drop every entry pinned under owner. Each entry is released exactly
     * once; a second call for the same owner returns 0.
     */
    std::size_t Unregister(OwnerKey owner);

    bool IsPinned(OwnerKey owner) const;
    std::size_t PinnedCount(OwnerKey owner) const;
    std::size_t OwnerCount() const;

    /// Registry used by the handle wrappers unless told otherwise.
    static CallbackRegistry& Shared();

private:
    struct CallbackSet {
        std::mutex mutex;
        std::vector<std::shared_ptr<void>> entries;
        bool released = false;
    };

    std::shared_ptr<CallbackSet> FindSet(OwnerKey owner) const;
    std::shared_ptr<CallbackSet> FindOrCreateSet(OwnerKey owner);

    mutable std::shared_mutex mutex_;
    std::unordered_map<OwnerKey, std::shared_ptr<CallbackSet>> sets_;
};

}  // namespace wvb
