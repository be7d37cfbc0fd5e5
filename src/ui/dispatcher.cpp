/// @file dispatcher.cpp
/// @brief EventDispatcher implementation

#include <arbor/ui/dispatcher.hpp>
#include <arbor/ui/hit_test.hpp>
#include <arbor/ui/layout.hpp>
#include <arbor/ui/text.hpp>
#include <arbor/ui/tree.hpp>
#include <arbor/core/log.hpp>

#include <algorithm>
#include <vector>

namespace arbor_ui {

namespace {

/// Keeps the dispatch depth balanced when a handler throws
struct DepthGuard {
    explicit DepthGuard(int& depth) : m_depth(depth) { ++m_depth; }
    ~DepthGuard() { --m_depth; }

    DepthGuard(const DepthGuard&) = delete;
    DepthGuard& operator=(const DepthGuard&) = delete;

private:
    int& m_depth;
};

/// Single ASCII control character (backspace, delete, escape...)
bool is_control_text(const std::string& text) {
    if (text.size() != 1) {
        return false;
    }
    auto c = static_cast<unsigned char>(text[0]);
    return c < 0x20 || c == 0x7F;
}

} // anonymous namespace

EventDispatcher::EventDispatcher(
    NodeTree& tree,
    InteractionState& state,
    SelectionManager& selection,
    const TextMetrics& metrics,
    DispatchConfig config)
    : m_tree(tree)
    , m_state(state)
    , m_selection(selection)
    , m_metrics(metrics)
    , m_config(config)
{
}

// =============================================================================
// Delivery
// =============================================================================

std::size_t EventDispatcher::dispatch(EventKind kind, NodeId target, EventPayload payload) {
    if (!m_tree.contains(target)) {
        return 0;
    }

    struct Step {
        NodeId node;
        EventPhase phase;
        EventHandler handler;
    };

    const auto index = static_cast<std::size_t>(kind);
    std::vector<Step> steps;
    auto path = event_bubbles(kind) ? m_tree.path_to(target) : std::vector<NodeId>{target};

    for (std::size_t i = 0; i + 1 < path.size(); ++i) {
        const auto& slot = m_tree.find(path[i])->handlers[index];
        if (slot.capture) {
            steps.push_back({path[i], EventPhase::Capture, slot.capture});
        }
    }
    const auto& own = m_tree.find(target)->handlers[index];
    if (own.capture) {
        steps.push_back({target, EventPhase::Target, own.capture});
    }
    if (own.bubble) {
        steps.push_back({target, EventPhase::Target, own.bubble});
    }
    for (std::size_t i = path.size() - 1; i-- > 0;) {
        const auto& slot = m_tree.find(path[i])->handlers[index];
        if (slot.bubble) {
            steps.push_back({path[i], EventPhase::Bubble, slot.bubble});
        }
    }

    Event event;
    event.kind = kind;
    event.target = target;
    event.payload = std::move(payload);

    std::size_t invoked = 0;
    {
        DepthGuard guard(m_depth);
        for (auto& step : steps) {
            event.current_target = step.node;
            event.phase = step.phase;
            step.handler(event);
            ++invoked;
            if (event.propagation_stopped()) {
                break;
            }
        }
    }

    arbor_core::input_logger()->trace("{} on {} ({} handlers)", event_kind_name(kind), target.value, invoked);
    return invoked;
}

void EventDispatcher::handle(const RawInput& raw) {
    std::visit([this](const auto& e) {
        using T = std::decay_t<decltype(e)>;
        if constexpr (std::is_same_v<T, input::PointerMove>) {
            pointer_move(e.position);
        } else if constexpr (std::is_same_v<T, input::PointerDown>) {
            pointer_down(e.position, e.button);
        } else if constexpr (std::is_same_v<T, input::PointerUp>) {
            pointer_up(e.position, e.button);
        } else if constexpr (std::is_same_v<T, input::KeyDown>) {
            key_down(e.key, e.text);
        } else if constexpr (std::is_same_v<T, input::KeyUp>) {
            key_up(e.key);
        } else if constexpr (std::is_same_v<T, input::TextInput>) {
            text_input(e.text);
        } else if constexpr (std::is_same_v<T, input::Scroll>) {
            scroll(e.delta, e.pixels);
        } else if constexpr (std::is_same_v<T, input::ModifiersChanged>) {
            set_modifiers(e.modifiers);
        } else if constexpr (std::is_same_v<T, input::WindowFocusLost>) {
            window_focus_lost();
        }
    }, raw);
}

// =============================================================================
// Pointer
// =============================================================================

void EventDispatcher::pointer_move(Point position) {
    Point previous = m_state.pointer;
    m_state.pointer = position;

    auto hit = HitTester(m_tree).hit_test(position);
    m_state.hovered = hit;
    if (hit) {
        PointerPayload payload;
        payload.position = position;
        payload.delta = position - previous;
        dispatch(EventKind::MouseMove, *hit, payload);
    }

    if (m_state.scrollbar_drag) {
        const ScrollbarDrag& drag = *m_state.scrollbar_drag;
        float along = drag.axis == ScrollAxis::Vertical ? position.y : position.x;
        scroll_thumb_to(drag.node, drag.axis, along - drag.grab);
        return;
    }

    if (!m_state.pressed) {
        return;
    }

    if (!m_state.threshold_exceeded) {
        if ((position - m_state.press_origin).length() <= m_config.drag_threshold) {
            return;
        }
        m_state.threshold_exceeded = true;
        if (!m_state.selecting) {
            m_state.dragging = DragState{*m_state.pressed, m_state.press_origin, m_state.press_origin};
            arbor_core::input_logger()->debug("Drag started on {}", m_state.pressed->value);
        }
    }

    if (m_state.selecting) {
        if (auto cursor = text_position_at(position)) {
            change_selection([this, &cursor] { m_selection.set_cursor(*cursor); });
        }
        return;
    }

    if (m_state.dragging) {
        PointerPayload payload;
        payload.position = position;
        payload.delta = position - m_state.dragging->last;
        payload.origin = m_state.dragging->start;
        m_state.dragging->last = position;
        dispatch(EventKind::Drag, m_state.dragging->node, payload);
    }
}

void EventDispatcher::pointer_down(Point position, PointerButton button) {
    m_state.pointer = position;
    if (button != PointerButton::Left) {
        return;
    }

    HitTester hit_tester(m_tree);
    m_state.end_press();

    // Scrollbar presses scroll only: no focus, selection or click
    if (auto bar = hit_tester.scrollbar_at(position)) {
        const bool vertical = bar->axis == ScrollAxis::Vertical;
        float along = vertical ? position.y : position.x;
        float thumb_start = vertical ? bar->thumb.y : bar->thumb.x;
        float thumb_length = vertical ? bar->thumb.height : bar->thumb.width;

        if (!bar->thumb.contains(position)) {
            // Track press: jump so the thumb centers on the pointer
            thumb_start = along - thumb_length * 0.5f;
            scroll_thumb_to(bar->node, bar->axis, thumb_start);
            if (auto moved = hit_tester.scrollbar(bar->node, bar->axis)) {
                thumb_start = vertical ? moved->thumb.y : moved->thumb.x;
            }
        }
        m_state.scrollbar_drag = ScrollbarDrag{bar->node, bar->axis, along - thumb_start};
        arbor_core::input_logger()->debug("Scrollbar grabbed on {}", bar->node.value);
        return;
    }

    auto hit = hit_tester.hit_test(position);
    m_state.pressed = hit;
    m_state.press_origin = position;

    if (hit) {
        if (auto target = focus_target(*hit)) {
            set_focus(*target);
        }
    }

    const Node* node = hit ? m_tree.find(*hit) : nullptr;
    if (node && node->is_text()) {
        if (auto anchor = text_position(*hit, position)) {
            m_state.selecting = true;
            change_selection([this, &anchor] { m_selection.set_anchor(*anchor); });
            return;
        }
    }
    if (m_selection.mode() != SelectionMode::None) {
        change_selection([this] { m_selection.clear(); });
    }
}

void EventDispatcher::pointer_up(Point position, PointerButton button) {
    m_state.pointer = position;
    if (button != PointerButton::Left) {
        return;
    }

    if (m_state.scrollbar_drag) {
        m_state.end_press();
        return;
    }

    auto pressed = m_state.pressed;
    bool moved = m_state.threshold_exceeded;
    Point origin = m_state.press_origin;
    m_state.end_press();

    if (!pressed || moved) {
        return;
    }

    auto hit = HitTester(m_tree).hit_test(position);
    if (hit && m_tree.is_ancestor_or_self(*pressed, *hit)) {
        PointerPayload payload;
        payload.position = position;
        payload.origin = origin;
        payload.button = button;
        dispatch(EventKind::Click, *pressed, payload);
    }
}

void EventDispatcher::scroll(Point delta, bool pixels) {
    auto container = HitTester(m_tree).scroll_container_at(m_state.pointer);
    if (!container) {
        return;
    }

    Point offset = m_tree.find(*container)->scroll;
    if (pixels) {
        offset = offset + delta;
    } else if (has_mod(m_state.modifiers, KeyMod::Shift)) {
        offset.x -= delta.y * m_config.scroll_line_height;
    } else {
        offset.x -= delta.x * m_config.scroll_line_height;
        offset.y -= delta.y * m_config.scroll_line_height;
    }
    m_tree.set_scroll(*container, offset);
}

void EventDispatcher::scroll_thumb_to(NodeId node, ScrollAxis axis, float thumb_start) {
    auto bar = HitTester(m_tree).scrollbar(node, axis);
    if (!bar) {
        // Content no longer overflows on this axis
        m_state.scrollbar_drag.reset();
        return;
    }

    Point offset = m_tree.find(node)->scroll;
    if (axis == ScrollAxis::Vertical) {
        offset.y = (thumb_start - bar->track.y) * bar->scroll_per_pixel;
    } else {
        offset.x = (thumb_start - bar->track.x) * bar->scroll_per_pixel;
    }
    m_tree.set_scroll(node, offset);
}

// =============================================================================
// Keyboard
// =============================================================================

void EventDispatcher::key_down(Key key, const std::string& text) {
    if (!m_state.focused) {
        return;
    }
    NodeId focused = *m_state.focused;
    edit(focused, key, text);

    KeyPayload payload;
    payload.key = key;
    payload.modifiers = m_state.modifiers;
    payload.text = text;
    dispatch(EventKind::KeyDown, focused, std::move(payload));
}

void EventDispatcher::key_up(Key key) {
    if (!m_state.focused) {
        return;
    }
    KeyPayload payload;
    payload.key = key;
    payload.modifiers = m_state.modifiers;
    dispatch(EventKind::KeyUp, *m_state.focused, std::move(payload));
}

void EventDispatcher::text_input(const std::string& text) {
    if (m_state.focused && !text.empty()) {
        edit(*m_state.focused, Key::Unknown, text);
    }
}

void EventDispatcher::set_modifiers(std::uint32_t modifiers) {
    m_state.modifiers = modifiers;
}

void EventDispatcher::window_focus_lost() {
    m_state.end_press();
    m_state.modifiers = 0;
    clear_focus();
}

void EventDispatcher::edit(NodeId focused, Key key, const std::string& text) {
    const Node* holder = m_tree.find(focused);
    if (!holder || !holder->editable) {
        return;
    }
    auto run = edit_target(focused);
    if (!run) {
        return;
    }

    const std::string content = m_tree.find(*run)->text;
    const std::size_t length = utf8::length(content);

    // A selection outside the run collapses to the end of the content
    std::size_t anchor = length;
    std::size_t cursor = length;
    const auto& sel_anchor = m_selection.anchor();
    const auto& sel_cursor = m_selection.cursor();
    if (sel_anchor && sel_cursor && sel_anchor->node == *run && sel_cursor->node == *run) {
        anchor = std::min(sel_anchor->offset, length);
        cursor = std::min(sel_cursor->offset, length);
    }
    const std::size_t begin = std::min(anchor, cursor);
    const std::size_t end = std::max(anchor, cursor);
    const bool shift = has_mod(m_state.modifiers, KeyMod::Shift);
    const bool command = has_mod(m_state.modifiers, KeyMod::Control) || has_mod(m_state.modifiers, KeyMod::Super);

    std::optional<std::string> updated;
    auto replace = [&](std::size_t from, std::size_t to, const std::string& insert) {
        updated = utf8::substr(content, 0, from) + insert + utf8::substr(content, to, length);
        anchor = cursor = from + utf8::length(insert);
    };

    if (!text.empty() && !command && !is_control_text(text)) {
        replace(begin, end, text);
    } else {
        switch (key) {
            case Key::Backspace:
                if (begin != end) {
                    replace(begin, end, {});
                } else if (begin > 0) {
                    replace(begin - 1, begin, {});
                }
                break;
            case Key::Delete:
                if (begin != end) {
                    replace(begin, end, {});
                } else if (end < length) {
                    replace(begin, end + 1, {});
                }
                break;
            case Key::Left:
                if (shift) {
                    cursor = cursor > 0 ? cursor - 1 : 0;
                } else {
                    anchor = cursor = begin != end ? begin : (cursor > 0 ? cursor - 1 : 0);
                }
                break;
            case Key::Right:
                if (shift) {
                    cursor = std::min(cursor + 1, length);
                } else {
                    anchor = cursor = begin != end ? end : std::min(cursor + 1, length);
                }
                break;
            case Key::Home:
                cursor = 0;
                if (!shift) {
                    anchor = 0;
                }
                break;
            case Key::End:
                cursor = length;
                if (!shift) {
                    anchor = length;
                }
                break;
            case Key::A:
                if (!command) {
                    return;
                }
                anchor = 0;
                cursor = length;
                break;
            default:
                return;
        }
    }

    if (updated) {
        m_tree.set_text(*run, *updated);
        dispatch(EventKind::Input, focused, InputPayload{*updated});
    }

    NodeId run_id = *run;
    change_selection([&] {
        m_selection.set(TextPosition{run_id, anchor}, TextPosition{run_id, cursor});
    });
}

// =============================================================================
// Focus
// =============================================================================

bool EventDispatcher::can_focus(NodeId id) const {
    const Node* node = m_tree.find(id);
    if (!node) {
        return false;
    }
    return node->editable || (node->focusable && !node->is_text());
}

std::optional<NodeId> EventDispatcher::focus_target(NodeId hit) const {
    for (const Node* node = m_tree.find(hit); node; node = m_tree.find(node->parent)) {
        if (can_focus(node->id)) {
            return node->id;
        }
    }
    return std::nullopt;
}

bool EventDispatcher::set_focus(NodeId id) {
    if (!can_focus(id)) {
        return false;
    }
    if (m_state.focused == id) {
        return true;
    }

    if (m_state.focused) {
        NodeId previous = *m_state.focused;
        m_state.focused.reset();
        dispatch(EventKind::Blur, previous);

        // A blur handler moved focus elsewhere; that transition wins
        if (m_state.focused) {
            return true;
        }
    }

    m_state.focused = id;
    arbor_core::input_logger()->debug("Focus -> {}", id.value);
    dispatch(EventKind::Focus, id);
    return true;
}

void EventDispatcher::clear_focus() {
    if (!m_state.focused) {
        return;
    }
    NodeId previous = *m_state.focused;
    m_state.focused.reset();
    dispatch(EventKind::Blur, previous);
}

// =============================================================================
// Selection
// =============================================================================

std::optional<NodeId> EventDispatcher::edit_target(NodeId focused) const {
    std::vector<NodeId> stack{focused};
    while (!stack.empty()) {
        NodeId id = stack.back();
        stack.pop_back();
        const Node* node = m_tree.find(id);
        if (!node) {
            continue;
        }
        if (node->is_text()) {
            return id;
        }
        for (auto it = node->children.rbegin(); it != node->children.rend(); ++it) {
            stack.push_back(*it);
        }
    }
    return std::nullopt;
}

std::optional<TextPosition> EventDispatcher::text_position(NodeId run, Point position) const {
    const Node* node = m_tree.find(run);
    auto rect = HitTester(m_tree).screen_rect(run);
    if (!node || !node->is_text() || !rect) {
        return std::nullopt;
    }
    Point local = rect->clamp(position) - rect->position();
    return TextPosition{run, m_metrics.offset_at(node->text, rect->width, local)};
}

std::optional<TextPosition> EventDispatcher::text_position_at(Point position) const {
    HitTester hits(m_tree);
    auto hit = hits.hit_test(position);
    if (hit && m_tree.find(*hit)->is_text()) {
        return text_position(*hit, position);
    }
    if (auto nearest = hits.nearest_text_run(position)) {
        return text_position(*nearest, position);
    }
    return std::nullopt;
}

void EventDispatcher::change_selection(const std::function<void()>& mutate) {
    std::string before = m_selection.selected_text(m_tree);
    std::optional<NodeId> previous_anchor;
    if (m_selection.anchor()) {
        previous_anchor = m_selection.anchor()->node;
    }

    mutate();

    std::string after = m_selection.selected_text(m_tree);
    if (after == before) {
        return;
    }
    NodeId target = m_selection.anchor() ? m_selection.anchor()->node : previous_anchor.value_or(NodeId{});
    dispatch(EventKind::Select, target, SelectPayload{std::move(after)});
}

// =============================================================================
// Tree Notifications
// =============================================================================

void EventDispatcher::dispatch_layout(const LayoutReport& report) {
    for (NodeId id : report.changed) {
        const Node* node = m_tree.find(id);
        if (!node || !node->has_handler(EventKind::Layout)) {
            continue;
        }
        LayoutPayload payload;
        payload.rect = node->rect;
        payload.content_size = node->content_size;
        payload.generation = report.generation;
        dispatch(EventKind::Layout, id, payload);
    }
}

void EventDispatcher::forget(NodeId id) {
    if (m_state.forget(id)) {
        arbor_core::input_logger()->debug("Dropped interaction state for destroyed node {}", id.value);
    }
    if (m_selection.references(id)) {
        m_selection.clear();
    }
}

void EventDispatcher::invalidate_text(NodeId id) {
    if (m_selection.references(id)) {
        m_selection.clear();
    }
}

} // namespace arbor_ui
