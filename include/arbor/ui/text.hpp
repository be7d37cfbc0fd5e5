#pragma once

/// @file text.hpp
/// @brief Text measurement interface and fixed-advance implementation

#include "types.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace arbor_ui {

// =============================================================================
// UTF-8 Helpers
// =============================================================================

namespace utf8 {

/// Number of code points in a UTF-8 string
[[nodiscard]] std::size_t length(std::string_view text);

/// Byte offset of the given code point index (clamped to the end)
[[nodiscard]] std::size_t byte_offset(std::string_view text, std::size_t char_offset);

/// Substring by code point range [begin, end)
[[nodiscard]] std::string substr(std::string_view text, std::size_t begin, std::size_t end);

} // namespace utf8

// =============================================================================
// TextMetrics
// =============================================================================

/// Font metrics collaborator. Implementations must be pure.
class TextMetrics {
public:
    virtual ~TextMetrics() = default;

    /// Size of the text laid out within an optional available width.
    /// No width means max-content (no wrapping).
    [[nodiscard]] virtual Size measure(std::string_view text, std::optional<float> available_width) const = 0;

    /// Character offset nearest a point local to the text's box
    [[nodiscard]] virtual std::size_t offset_at(
        std::string_view text, float box_width, Point local) const = 0;
};

/// Metrics for a fixed-advance bitmap font.
///
/// Lines break on '\n' and wrap at the character that would overflow the
/// available width. Offsets count code points.
class MonospaceTextMetrics : public TextMetrics {
public:
    static constexpr float GLYPH_WIDTH = 8.0f;
    static constexpr float GLYPH_HEIGHT = 16.0f;

    explicit MonospaceTextMetrics(float advance = GLYPH_WIDTH, float line_height = GLYPH_HEIGHT);

    [[nodiscard]] Size measure(std::string_view text, std::optional<float> available_width) const override;

    [[nodiscard]] std::size_t offset_at(std::string_view text, float box_width, Point local) const override;

    [[nodiscard]] float advance() const { return m_advance; }
    [[nodiscard]] float line_height() const { return m_line_height; }

private:
    struct Line {
        std::size_t begin = 0;   // Code point offset
        std::size_t length = 0;  // Code points
    };

    [[nodiscard]] std::vector<Line> break_lines(std::string_view text, std::optional<float> available_width) const;

    float m_advance;
    float m_line_height;
};

} // namespace arbor_ui
