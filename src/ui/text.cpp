/// @file text.cpp
/// @brief UTF-8 helpers and fixed-advance text metrics

#include <arbor/ui/text.hpp>

#include <algorithm>
#include <cmath>

namespace arbor_ui {

// =============================================================================
// UTF-8
// =============================================================================

namespace utf8 {

namespace {

bool is_continuation(char c) {
    return (static_cast<unsigned char>(c) & 0xC0) == 0x80;
}

} // anonymous namespace

std::size_t length(std::string_view text) {
    return static_cast<std::size_t>(std::count_if(text.begin(), text.end(),
        [](char c) { return !is_continuation(c); }));
}

std::size_t byte_offset(std::string_view text, std::size_t char_offset) {
    std::size_t chars = 0;
    for (std::size_t i = 0; i < text.size(); ++i) {
        if (!is_continuation(text[i])) {
            if (chars == char_offset) {
                return i;
            }
            ++chars;
        }
    }
    return text.size();
}

std::string substr(std::string_view text, std::size_t begin, std::size_t end) {
    if (end <= begin) {
        return {};
    }
    std::size_t b = byte_offset(text, begin);
    std::size_t e = byte_offset(text, end);
    return std::string(text.substr(b, e - b));
}

} // namespace utf8

// =============================================================================
// MonospaceTextMetrics
// =============================================================================

MonospaceTextMetrics::MonospaceTextMetrics(float advance, float line_height)
    : m_advance(advance)
    , m_line_height(line_height)
{
}

std::vector<MonospaceTextMetrics::Line> MonospaceTextMetrics::break_lines(
    std::string_view text, std::optional<float> available_width) const
{
    std::size_t per_line = 0;  // 0 = unlimited
    if (available_width && std::isfinite(*available_width) && m_advance > 0.0f) {
        float columns = std::floor(std::max(0.0f, *available_width) / m_advance);
        // Wider than the text in bytes: nothing can wrap
        if (columns < static_cast<float>(text.size())) {
            per_line = std::max<std::size_t>(1, static_cast<std::size_t>(columns));
        }
    }

    std::vector<Line> lines;
    Line current;
    std::size_t offset = 0;
    for (std::size_t i = 0; i < text.size(); ++i) {
        if ((static_cast<unsigned char>(text[i]) & 0xC0) == 0x80) {
            continue;
        }
        if (text[i] == '\n') {
            lines.push_back(current);
            current = Line{offset + 1, 0};
        } else {
            if (per_line != 0 && current.length == per_line) {
                lines.push_back(current);
                current = Line{offset, 0};
            }
            ++current.length;
        }
        ++offset;
    }
    lines.push_back(current);
    return lines;
}

Size MonospaceTextMetrics::measure(std::string_view text, std::optional<float> available_width) const {
    auto lines = break_lines(text, available_width);
    std::size_t widest = 0;
    for (const auto& line : lines) {
        widest = std::max(widest, line.length);
    }
    return {static_cast<float>(widest) * m_advance, static_cast<float>(lines.size()) * m_line_height};
}

std::size_t MonospaceTextMetrics::offset_at(std::string_view text, float box_width, Point local) const {
    auto lines = break_lines(text, box_width);

    float row = m_line_height > 0.0f && std::isfinite(local.y) ? std::floor(local.y / m_line_height) : 0.0f;
    auto index = static_cast<std::size_t>(std::clamp(row, 0.0f, static_cast<float>(lines.size() - 1)));
    const Line& line = lines[index];

    float column = m_advance > 0.0f && std::isfinite(local.x) ? std::round(local.x / m_advance) : 0.0f;
    auto col = static_cast<std::size_t>(std::clamp(column, 0.0f, static_cast<float>(line.length)));
    return line.begin + col;
}

} // namespace arbor_ui
