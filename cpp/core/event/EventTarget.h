/**
 * @file EventTarget.h
 * @brief Window-side receiver of routed events.
 */
#pragma once

#include <string>

#include "event/Event.h"

namespace wvb {

class EventTarget {
public:
    virtual ~EventTarget() = default;

    /// Routing key; empty until the native window exists.
    virtual const std::string& Id() const = 0;

    virtual void DispatchEvent(const Event& event) = 0;

    /// True once the target accepted a close or lost its native window.
    virtual bool ShouldExit() const = 0;

    /// Release native resources. Idempotent.
    virtual void Destroy() = 0;
};

}  // namespace wvb
