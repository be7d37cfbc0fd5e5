#pragma once

/// @file dispatcher.hpp
/// @brief Raw input to semantic event translation and delivery

#include "event.hpp"
#include "input.hpp"
#include "interaction.hpp"
#include "selection.hpp"
#include "types.hpp"

#include <functional>
#include <optional>
#include <string>

namespace arbor_ui {

class NodeTree;
class TextMetrics;
struct LayoutReport;

/// Input tuning
struct DispatchConfig {
    float drag_threshold = 4.0f;       // Pointer travel before a press becomes a drag
    float scroll_line_height = 30.0f;  // Pixels per wheel line
};

/// Drives the focus/drag/hover state machine and the selection from raw input
/// and delivers semantic events to node handlers.
///
/// Delivery snapshots the path from the root to the target before any
/// handler runs: capture handlers root to target, then bubble handlers target
/// to root. Focus, blur and layout reach the target only.
class EventDispatcher {
public:
    EventDispatcher(
        NodeTree& tree,
        InteractionState& state,
        SelectionManager& selection,
        const TextMetrics& metrics,
        DispatchConfig config = {});

    // Non-copyable
    EventDispatcher(const EventDispatcher&) = delete;
    EventDispatcher& operator=(const EventDispatcher&) = delete;

    // -------------------------------------------------------------------------
    // Raw input
    // -------------------------------------------------------------------------

    void handle(const RawInput& raw);

    void pointer_move(Point position);
    void pointer_down(Point position, PointerButton button = PointerButton::Left);
    void pointer_up(Point position, PointerButton button = PointerButton::Left);
    void key_down(Key key, const std::string& text = {});
    void key_up(Key key);
    void text_input(const std::string& text);
    void scroll(Point delta, bool pixels = false);
    void set_modifiers(std::uint32_t modifiers);
    void window_focus_lost();

    // -------------------------------------------------------------------------
    // Focus
    // -------------------------------------------------------------------------

    /// Move focus, firing blur on the old holder then focus on the new one.
    /// Returns false when the node cannot take focus.
    bool set_focus(NodeId id);

    /// Clear focus, firing blur on the old holder
    void clear_focus();

    // -------------------------------------------------------------------------
    // Tree notifications
    // -------------------------------------------------------------------------

    /// Fire onlayout for every node whose geometry changed
    void dispatch_layout(const LayoutReport& report);

    /// A node was destroyed: drop references without firing events
    void forget(NodeId id);

    /// A text run's content was replaced: clear a selection touching it
    void invalidate_text(NodeId id);

    /// Deliver one semantic event. Returns the number of handlers invoked.
    std::size_t dispatch(EventKind kind, NodeId target, EventPayload payload = {});

    [[nodiscard]] bool is_dispatching() const { return m_depth > 0; }

    [[nodiscard]] const DispatchConfig& config() const { return m_config; }
    void set_config(const DispatchConfig& config) { m_config = config; }

private:
    [[nodiscard]] bool can_focus(NodeId id) const;
    [[nodiscard]] std::optional<NodeId> focus_target(NodeId hit) const;
    [[nodiscard]] std::optional<NodeId> edit_target(NodeId focused) const;
    [[nodiscard]] std::optional<TextPosition> text_position(NodeId run, Point position) const;
    [[nodiscard]] std::optional<TextPosition> text_position_at(Point position) const;

    /// Move a scrollbar's node so its thumb starts at the given track position
    void scroll_thumb_to(NodeId node, ScrollAxis axis, float thumb_start);

    /// Run a selection mutation and fire onselect if the selected text changed
    void change_selection(const std::function<void()>& mutate);

    /// Apply an editing key or committed text to the focused editable node
    void edit(NodeId focused, Key key, const std::string& text);

    NodeTree& m_tree;
    InteractionState& m_state;
    SelectionManager& m_selection;
    const TextMetrics& m_metrics;
    DispatchConfig m_config;
    int m_depth = 0;
};

} // namespace arbor_ui
