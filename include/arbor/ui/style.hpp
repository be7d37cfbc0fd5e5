#pragma once

/// @file style.hpp
/// @brief Resolved node style and the style resolver interface

#include "types.hpp"

#include <string>

namespace arbor_ui {

// =============================================================================
// Style Values
// =============================================================================

/// Length that may be automatic, absolute or relative to the parent
struct Dimension {
    enum class Unit : std::uint8_t { Auto, Points, Percent };

    Unit unit = Unit::Auto;
    float value = 0.0f;

    [[nodiscard]] static constexpr Dimension automatic() { return {Unit::Auto, 0.0f}; }
    [[nodiscard]] static constexpr Dimension points(float v) { return {Unit::Points, v}; }
    [[nodiscard]] static constexpr Dimension percent(float v) { return {Unit::Percent, v}; }

    [[nodiscard]] constexpr bool is_auto() const { return unit == Unit::Auto; }

    constexpr bool operator==(const Dimension& other) const = default;
};

/// Per-edge values (margin, padding, border)
struct Edges {
    float top = 0.0f;
    float right = 0.0f;
    float bottom = 0.0f;
    float left = 0.0f;

    [[nodiscard]] static constexpr Edges all(float v) { return {v, v, v, v}; }
    [[nodiscard]] static constexpr Edges symmetric(float vertical, float horizontal) {
        return {vertical, horizontal, vertical, horizontal};
    }

    constexpr bool operator==(const Edges& other) const = default;
};

enum class Display : std::uint8_t { Flex, None };
enum class PositionType : std::uint8_t { Relative, Absolute };
enum class FlexDirection : std::uint8_t { Row, Column, RowReverse, ColumnReverse };
enum class FlexWrap : std::uint8_t { NoWrap, Wrap };
enum class Justify : std::uint8_t { Start, Center, End, SpaceBetween, SpaceAround, SpaceEvenly };
enum class Align : std::uint8_t { Auto, Start, Center, End, Stretch };
enum class Overflow : std::uint8_t { Visible, Hidden, Scroll };

// =============================================================================
// Style
// =============================================================================

/// Resolved style: the constraints handed to the layout engine
struct Style {
    Display display = Display::Flex;
    PositionType position = PositionType::Relative;
    FlexDirection flex_direction = FlexDirection::Row;
    FlexWrap flex_wrap = FlexWrap::NoWrap;
    Justify justify_content = Justify::Start;
    Align align_items = Align::Stretch;
    Align align_self = Align::Auto;

    float flex_grow = 0.0f;
    float flex_shrink = 1.0f;
    Dimension flex_basis;

    Dimension width;
    Dimension height;
    Dimension min_width;
    Dimension min_height;
    Dimension max_width;
    Dimension max_height;

    Edges margin;
    Edges padding;
    Edges border;
    Edges inset;  // Used with PositionType::Absolute

    float gap = 0.0f;
    Overflow overflow = Overflow::Visible;
    float scrollbar_width = 10.0f;  // Used with Overflow::Scroll; 0 hides the bars

    bool operator==(const Style& other) const = default;

    /// Content outside the border box is clipped
    [[nodiscard]] bool clips() const { return overflow != Overflow::Visible; }

    /// Draggable scrollbars are shown where content overflows
    [[nodiscard]] bool has_scrollbars() const { return overflow == Overflow::Scroll && scrollbar_width > 0.0f; }
};

// =============================================================================
// StyleResolver
// =============================================================================

/// Resolves a class string to a style. Must be a pure function of the string.
class StyleResolver {
public:
    virtual ~StyleResolver() = default;

    [[nodiscard]] virtual Style resolve(const std::string& class_string) const = 0;
};

/// Resolver that ignores classes and returns the default style
class DefaultStyleResolver : public StyleResolver {
public:
    [[nodiscard]] Style resolve(const std::string&) const override { return Style{}; }
};

} // namespace arbor_ui
