#pragma once

/// @file event.hpp
/// @brief Semantic events and handler slots

#include "types.hpp"

#include <array>
#include <functional>
#include <string>
#include <variant>

namespace arbor_ui {

// =============================================================================
// Payloads
// =============================================================================

/// Pointer position data (mousemove, click, drag)
struct PointerPayload {
    Point position;
    Point delta;   // Movement since the previous drag event
    Point origin;  // Press origin for drags
    PointerButton button = PointerButton::Left;
};

/// Key data (keydown, keyup)
struct KeyPayload {
    Key key = Key::Unknown;
    std::uint32_t modifiers = 0;
    std::string text;  // Text produced by the key, if any
};

/// New content of an editable node (input)
struct InputPayload {
    std::string value;
};

/// Current selected text (select)
struct SelectPayload {
    std::string text;
};

/// New geometry (layout)
struct LayoutPayload {
    Rect rect;
    Size content_size;
    std::uint64_t generation = 0;
};

using EventPayload = std::variant<
    std::monostate,
    PointerPayload,
    KeyPayload,
    InputPayload,
    SelectPayload,
    LayoutPayload>;

// =============================================================================
// Event
// =============================================================================

enum class EventPhase : std::uint8_t {
    Capture,
    Target,
    Bubble,
};

/// Semantic event as seen by a handler
struct Event {
    EventKind kind = EventKind::Click;
    NodeId target;
    NodeId current_target;
    EventPhase phase = EventPhase::Target;
    EventPayload payload;

    /// Stop delivery to handlers further along the path
    void stop_propagation() { m_stopped = true; }
    [[nodiscard]] bool propagation_stopped() const { return m_stopped; }

    [[nodiscard]] const PointerPayload* pointer() const { return std::get_if<PointerPayload>(&payload); }
    [[nodiscard]] const KeyPayload* key() const { return std::get_if<KeyPayload>(&payload); }
    [[nodiscard]] const InputPayload* input() const { return std::get_if<InputPayload>(&payload); }
    [[nodiscard]] const SelectPayload* selection() const { return std::get_if<SelectPayload>(&payload); }
    [[nodiscard]] const LayoutPayload* layout() const { return std::get_if<LayoutPayload>(&payload); }

private:
    bool m_stopped = false;
};

using EventHandler = std::function<void(Event&)>;

/// Handlers registered for one event kind
struct HandlerSlot {
    EventHandler bubble;
    EventHandler capture;

    [[nodiscard]] bool empty() const { return !bubble && !capture; }
};

using HandlerTable = std::array<HandlerSlot, EVENT_KIND_COUNT>;

} // namespace arbor_ui
