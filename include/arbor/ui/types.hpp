#pragma once

/// @file types.hpp
/// @brief Core types for arbor_ui

#include "fwd.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>

namespace arbor_ui {

// =============================================================================
// Geometry
// =============================================================================

/// 2D point
struct Point {
    float x = 0.0f;
    float y = 0.0f;

    constexpr Point() = default;
    constexpr Point(float x_, float y_) : x(x_), y(y_) {}

    constexpr Point operator+(const Point& other) const { return {x + other.x, y + other.y}; }
    constexpr Point operator-(const Point& other) const { return {x - other.x, y - other.y}; }
    constexpr Point operator*(float s) const { return {x * s, y * s}; }
    constexpr bool operator==(const Point& other) const = default;

    [[nodiscard]] float length() const { return std::sqrt(x * x + y * y); }
};

/// 2D size
struct Size {
    float width = 0.0f;
    float height = 0.0f;

    constexpr Size() = default;
    constexpr Size(float w, float h) : width(w), height(h) {}

    constexpr bool operator==(const Size& other) const = default;

    [[nodiscard]] constexpr float area() const { return width * height; }
    [[nodiscard]] constexpr bool is_empty() const { return width <= 0.0f || height <= 0.0f; }
};

/// Axis-aligned rectangle
struct Rect {
    float x = 0.0f;
    float y = 0.0f;
    float width = 0.0f;
    float height = 0.0f;

    constexpr Rect() = default;
    constexpr Rect(float x_, float y_, float w, float h) : x(x_), y(y_), width(w), height(h) {}
    constexpr Rect(Point pos, Size size) : x(pos.x), y(pos.y), width(size.width), height(size.height) {}

    constexpr bool operator==(const Rect& other) const = default;

    [[nodiscard]] constexpr Point position() const { return {x, y}; }
    [[nodiscard]] constexpr Size size() const { return {width, height}; }

    [[nodiscard]] constexpr float left() const { return x; }
    [[nodiscard]] constexpr float right() const { return x + width; }
    [[nodiscard]] constexpr float top() const { return y; }
    [[nodiscard]] constexpr float bottom() const { return y + height; }

    [[nodiscard]] constexpr bool is_empty() const { return width <= 0.0f || height <= 0.0f; }

    [[nodiscard]] constexpr bool contains(Point p) const {
        return p.x >= x && p.x <= x + width && p.y >= y && p.y <= y + height;
    }

    [[nodiscard]] constexpr bool intersects(const Rect& other) const {
        return !(right() < other.left() || left() > other.right() ||
                 bottom() < other.top() || top() > other.bottom());
    }

    /// Overlapping region; zero-sized when the rects do not overlap
    [[nodiscard]] constexpr Rect intersection(const Rect& other) const {
        float x0 = std::max(left(), other.left());
        float y0 = std::max(top(), other.top());
        float x1 = std::min(right(), other.right());
        float y1 = std::min(bottom(), other.bottom());
        return {x0, y0, std::max(0.0f, x1 - x0), std::max(0.0f, y1 - y0)};
    }

    [[nodiscard]] constexpr Rect translated(Point offset) const {
        return {x + offset.x, y + offset.y, width, height};
    }

    /// Distance from a point to the nearest point of the rect (0 inside)
    [[nodiscard]] float distance_to(Point p) const {
        float dx = std::max({left() - p.x, 0.0f, p.x - right()});
        float dy = std::max({top() - p.y, 0.0f, p.y - bottom()});
        return std::sqrt(dx * dx + dy * dy);
    }

    /// Clamp a point into the rect
    [[nodiscard]] constexpr Point clamp(Point p) const {
        return {std::clamp(p.x, left(), right()), std::clamp(p.y, top(), bottom())};
    }
};

// =============================================================================
// Node Identity
// =============================================================================

namespace detail {

constexpr std::uint64_t FNV_OFFSET_BASIS = 0xcbf29ce484222325ULL;
constexpr std::uint64_t FNV_PRIME = 0x100000001b3ULL;

[[nodiscard]] constexpr std::uint64_t fnv1a_hash(std::string_view str) noexcept {
    std::uint64_t hash = FNV_OFFSET_BASIS;
    for (char c : str) {
        hash ^= static_cast<std::uint64_t>(static_cast<unsigned char>(c));
        hash *= FNV_PRIME;
    }
    return hash;
}

} // namespace detail

/// Stable node identity assigned by the description layer
struct NodeId {
    std::uint64_t value = 0;  // 0 is null

    constexpr NodeId() = default;
    constexpr explicit NodeId(std::uint64_t v) : value(v) {}

    /// Create id from a readable key (FNV-1a)
    [[nodiscard]] static constexpr NodeId from_name(std::string_view name) noexcept {
        std::uint64_t hash = detail::fnv1a_hash(name);
        return NodeId(hash == 0 ? 1 : hash);
    }

    [[nodiscard]] constexpr bool is_null() const noexcept { return value == 0; }
    [[nodiscard]] constexpr bool is_valid() const noexcept { return value != 0; }

    constexpr bool operator==(const NodeId& other) const = default;
    constexpr bool operator<(const NodeId& other) const { return value < other.value; }
};

/// Kind of node in the retained tree
enum class NodeKind : std::uint8_t {
    Container,
    Text,
    Image,
};

[[nodiscard]] inline const char* node_kind_name(NodeKind kind) {
    switch (kind) {
        case NodeKind::Container: return "container";
        case NodeKind::Text: return "text";
        case NodeKind::Image: return "image";
        default: return "unknown";
    }
}

// =============================================================================
// Event Kinds
// =============================================================================

/// Semantic events delivered to node handlers
enum class EventKind : std::uint8_t {
    Focus,
    Blur,
    Drag,
    Input,
    KeyDown,
    KeyUp,
    Click,
    MouseMove,
    Layout,
    Select,
    Count
};

constexpr std::size_t EVENT_KIND_COUNT = static_cast<std::size_t>(EventKind::Count);

[[nodiscard]] inline const char* event_kind_name(EventKind kind) {
    switch (kind) {
        case EventKind::Focus: return "onfocus";
        case EventKind::Blur: return "onblur";
        case EventKind::Drag: return "ondrag";
        case EventKind::Input: return "oninput";
        case EventKind::KeyDown: return "onkeydown";
        case EventKind::KeyUp: return "onkeyup";
        case EventKind::Click: return "onclick";
        case EventKind::MouseMove: return "onmousemove";
        case EventKind::Layout: return "onlayout";
        case EventKind::Select: return "onselect";
        default: return "unknown";
    }
}

/// Focus, blur and layout are delivered to their target only
[[nodiscard]] constexpr bool event_bubbles(EventKind kind) {
    return kind != EventKind::Focus && kind != EventKind::Blur && kind != EventKind::Layout;
}

// =============================================================================
// Raw Input Codes
// =============================================================================

/// Keyboard key codes (GLFW numbering)
enum class Key : std::uint32_t {
    Unknown = 0,
    Space = 32,
    Apostrophe = 39, Comma = 44, Minus = 45, Period = 46, Slash = 47,
    Num0 = 48, Num1, Num2, Num3, Num4, Num5, Num6, Num7, Num8, Num9 = 57,
    Semicolon = 59, Equal = 61,
    A = 65, B, C, D, E, F, G, H, I, J, K, L, M, N, O, P, Q, R, S, T, U, V, W, X, Y, Z = 90,
    Escape = 256, Enter = 257, Tab = 258, Backspace = 259,
    Insert = 260, Delete = 261, Right = 262, Left = 263, Down = 264, Up = 265,
    PageUp = 266, PageDown = 267, Home = 268, End = 269,
    LeftShift = 340, LeftControl = 341, LeftAlt = 342, LeftSuper = 343,
    RightShift = 344, RightControl = 345, RightAlt = 346, RightSuper = 347,
};

/// Key modifier flags
enum class KeyMod : std::uint32_t {
    None = 0,
    Shift = 1 << 0,
    Control = 1 << 1,
    Alt = 1 << 2,
    Super = 1 << 3,
};

[[nodiscard]] constexpr bool has_mod(std::uint32_t mods, KeyMod mod) {
    return (mods & static_cast<std::uint32_t>(mod)) != 0;
}

/// Pointer buttons
enum class PointerButton : std::uint8_t {
    Left,
    Right,
    Middle,
};

enum class ScrollAxis : std::uint8_t {
    Horizontal,
    Vertical,
};

} // namespace arbor_ui

template<>
struct std::hash<arbor_ui::NodeId> {
    std::size_t operator()(const arbor_ui::NodeId& id) const noexcept {
        return std::hash<std::uint64_t>{}(id.value);
    }
};
