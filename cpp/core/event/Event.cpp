#include "Event.h"

#include <type_traits>

#include <nlohmann/json.hpp>

namespace wvb {

namespace {

using nlohmann::json;

constexpr const char* kInformationalTypes[] = {
    "new-events",
    "main-events-cleared",
    "redraw-events-cleared",
    "window-redraw-requested",
    "window-cursor-moved",
    "window-cursor-entered",
    "window-cursor-left",
    "window-modifiers-changed",
    "window-scale-factor-changed",
    "window-keyboard-input",
    "window-ime-text",
    "suspended",
    "resumed",
};

bool IsInformational(const std::string& type) {
    for (const char* known : kInformationalTypes) {
        if (type == known) {
            return true;
        }
    }
    return false;
}

std::optional<std::string> OptionalWindowId(const json& record) {
    auto it = record.find("window_id");
    if (it == record.end() || !it->is_string()) {
        return std::nullopt;
    }
    return it->get<std::string>();
}

// Decodes a known type; throws json::exception on missing or mistyped fields.
std::optional<Event> DecodeKnown(const std::string& type, const json& record) {
    if (type == "window-close-requested") {
        return CloseRequestedEvent{record.at("window_id").get<std::string>()};
    }
    if (type == "window-destroyed") {
        return DestroyedEvent{record.at("window_id").get<std::string>()};
    }
    if (type == "window-resized") {
        const auto& size = record.at("size");
        return ResizedEvent{record.at("window_id").get<std::string>(),
                            size.at("width").get<uint32_t>(),
                            size.at("height").get<uint32_t>()};
    }
    if (type == "window-moved") {
        const auto& position = record.at("position");
        return MovedEvent{record.at("window_id").get<std::string>(),
                          position.at("x").get<int32_t>(), position.at("y").get<int32_t>()};
    }
    if (type == "window-focused") {
        return FocusedEvent{record.at("window_id").get<std::string>(),
                            record.at("isFocused").get<bool>()};
    }
    if (type == "global-shortcut") {
        return GlobalShortcutEvent{record.at("id").get<uint32_t>()};
    }
    if (type == "user-exit") {
        return UserExitEvent{};
    }
    if (type == "user-event") {
        const auto& payload = record.at("payload");
        return UserEvent{payload.is_string() ? payload.get<std::string>() : payload.dump()};
    }
    if (type == "loop-destroyed") {
        return LoopDestroyedEvent{};
    }
    if (IsInformational(type)) {
        return InformationalEvent{type, OptionalWindowId(record)};
    }
    return std::nullopt;
}

}  // namespace

std::optional<Event> DecodeEvent(std::string_view raw) {
    const auto record = json::parse(raw.begin(), raw.end(), nullptr, false);
    if (record.is_discarded() || !record.is_object()) {
        return std::nullopt;
    }
    auto type_it = record.find("type");
    if (type_it == record.end() || !type_it->is_string()) {
        return std::nullopt;
    }
    const auto type = type_it->get<std::string>();

    try {
        if (auto event = DecodeKnown(type, record)) {
            return event;
        }
    } catch (const json::exception&) {
        // Fall through: a malformed known kind is treated like an unknown one.
    }
    return UnknownEvent{type, OptionalWindowId(record)};
}

const std::string* WindowIdOf(const Event& event) {
    return std::visit(
        [](const auto& e) -> const std::string* {
            using T = std::decay_t<decltype(e)>;
            if constexpr (std::is_same_v<T, InformationalEvent> ||
                          std::is_same_v<T, UnknownEvent>) {
                return e.window_id ? &*e.window_id : nullptr;
            } else if constexpr (std::is_same_v<T, CloseRequestedEvent> ||
                                 std::is_same_v<T, DestroyedEvent> ||
                                 std::is_same_v<T, ResizedEvent> ||
                                 std::is_same_v<T, MovedEvent> ||
                                 std::is_same_v<T, FocusedEvent>) {
                return &e.window_id;
            } else {
                return nullptr;
            }
        },
        event);
}

bool IsApplicationEvent(const Event& event) {
    return std::holds_alternative<GlobalShortcutEvent>(event) ||
           std::holds_alternative<UserExitEvent>(event) ||
           std::holds_alternative<UserEvent>(event) ||
           std::holds_alternative<LoopDestroyedEvent>(event);
}

std::string EventTypeName(const Event& event) {
    return std::visit(
        [](const auto& e) -> std::string {
            using T = std::decay_t<decltype(e)>;
            if constexpr (std::is_same_v<T, CloseRequestedEvent>) {
                return "window-close-requested";
            } else if constexpr (std::is_same_v<T, DestroyedEvent>) {
                return "window-destroyed";
            } else if constexpr (std::is_same_v<T, ResizedEvent>) {
                return "window-resized";
            } else if constexpr (std::is_same_v<T, MovedEvent>) {
                return "window-moved";
            } else if constexpr (std::is_same_v<T, FocusedEvent>) {
                return "window-focused";
            } else if constexpr (std::is_same_v<T, GlobalShortcutEvent>) {
                return "global-shortcut";
            } else if constexpr (std::is_same_v<T, UserExitEvent>) {
                return "user-exit";
            } else if constexpr (std::is_same_v<T, UserEvent>) {
                return "user-event";
            } else if constexpr (std::is_same_v<T, LoopDestroyedEvent>) {
                return "loop-destroyed";
            } else {
                return e.type;
            }
        },
        event);
}

}  // namespace wvb
