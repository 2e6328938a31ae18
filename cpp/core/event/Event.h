/**
 * @file Event.h
 * @brief Closed set of event kinds decoded from native event records.
 *
 * Records arrive as JSON objects with a "type" string and, for window
 * events, a "window_id" string. They are decoded once, before the native
 * callback returns, into the Event variant below. Kinds this build does not
 * know decode to UnknownEvent.
 */
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace wvb {

struct CloseRequestedEvent {
    std::string window_id;
};

struct DestroyedEvent {
    std::string window_id;
};

struct ResizedEvent {
    std::string window_id;
    uint32_t width = 0;
    uint32_t height = 0;
};

struct MovedEvent {
    std::string window_id;
    int32_t x = 0;
    int32_t y = 0;
};

struct FocusedEvent {
    std::string window_id;
    bool focused = false;
};

struct GlobalShortcutEvent {
    uint32_t id = 0;
};

struct UserExitEvent {};

struct UserEvent {
    std::string payload;
};

struct LoopDestroyedEvent {};

/// Loop bookkeeping and input noise the bridge accepts but does not act on.
struct InformationalEvent {
    std::string type;
    std::optional<std::string> window_id;
};

struct UnknownEvent {
    std::string type;
    std::optional<std::string> window_id;
};

using Event = std::variant<CloseRequestedEvent, DestroyedEvent, ResizedEvent, MovedEvent,
                           FocusedEvent, GlobalShortcutEvent, UserExitEvent, UserEvent,
                           LoopDestroyedEvent, InformationalEvent, UnknownEvent>;

/**
 * Decode one native event record.
 *
 * @return std::nullopt when raw is not a JSON object with a string "type".
 *         A known type with missing or mistyped fields decodes to
 *         UnknownEvent.
 */
std::optional<Event> DecodeEvent(std::string_view raw);

/// The addressed window, or nullptr for loop-level events.
const std::string* WindowIdOf(const Event& event);

/// Events routed to the application regardless of any window id.
bool IsApplicationEvent(const Event& event);

/// The record type string the event was decoded from.
std::string EventTypeName(const Event& event);

}  // namespace wvb
