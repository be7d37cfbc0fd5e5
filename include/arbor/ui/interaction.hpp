#pragma once

/// @file interaction.hpp
/// @brief Focus, hover, press and drag state of one tree instance

#include "types.hpp"

#include <optional>

namespace arbor_ui {

/// Drag in progress
struct DragState {
    NodeId node;
    Point start;
    Point last;
};

/// Scrollbar thumb held by the pointer
struct ScrollbarDrag {
    NodeId node;
    ScrollAxis axis = ScrollAxis::Vertical;
    float grab = 0.0f;  // Pointer distance from the thumb start along the axis
};

/// Interaction state owned per tree instance; mutated by the EventDispatcher
struct InteractionState {
    std::optional<NodeId> focused;
    std::optional<NodeId> hovered;
    std::optional<NodeId> pressed;
    Point press_origin;
    std::optional<DragState> dragging;
    std::optional<ScrollbarDrag> scrollbar_drag;

    Point pointer;                    // Last known pointer position
    bool threshold_exceeded = false;  // Pointer left the press origin during this press
    bool selecting = false;           // Press started a text selection gesture
    std::uint32_t modifiers = 0;      // KeyMod bits

    /// End the current press without events
    void end_press() {
        pressed.reset();
        dragging.reset();
        scrollbar_drag.reset();
        threshold_exceeded = false;
        selecting = false;
    }

    /// Drop every reference to a destroyed node. Returns true if any existed.
    bool forget(NodeId id) {
        bool changed = false;
        if (focused == id) {
            focused.reset();
            changed = true;
        }
        if (hovered == id) {
            hovered.reset();
            changed = true;
        }
        if (pressed == id || (dragging && dragging->node == id) ||
            (scrollbar_drag && scrollbar_drag->node == id)) {
            end_press();
            changed = true;
        }
        return changed;
    }
};

} // namespace arbor_ui
