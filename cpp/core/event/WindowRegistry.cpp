#include "WindowRegistry.h"

#include <mutex>
#include <utility>

namespace wvb {

bool WindowRegistry::Register(std::shared_ptr<EventTarget> target) {
    if (target == nullptr || target->Id().empty()) {
        return false;
    }
    std::unique_lock<std::shared_mutex> lock(mutex_);
    const std::string id = target->Id();
    return targets_.emplace(id, std::move(target)).second;
}

bool WindowRegistry::Unregister(const std::string& id) {
    std::shared_ptr<EventTarget> removed;
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto it = targets_.find(id);
        if (it == targets_.end()) {
            return false;
        }
        removed = std::move(it->second);
        targets_.erase(it);
    }
    return true;
}

std::shared_ptr<EventTarget> WindowRegistry::Find(const std::string& id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = targets_.find(id);
    return (it != targets_.end()) ? it->second : nullptr;
}

std::vector<std::shared_ptr<EventTarget>> WindowRegistry::Snapshot() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<std::shared_ptr<EventTarget>> snapshot;
    snapshot.reserve(targets_.size());
    for (const auto& entry : targets_) {
        snapshot.push_back(entry.second);
    }
    return snapshot;
}

std::size_t WindowRegistry::Size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return targets_.size();
}

}  // namespace wvb
