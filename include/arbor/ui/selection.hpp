#pragma once

/// @file selection.hpp
/// @brief Text selection across text runs

#include "types.hpp"

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace arbor_ui {

class NodeTree;

/// Character position inside a text run
struct TextPosition {
    NodeId node;
    std::size_t offset = 0;  // Code points

    bool operator==(const TextPosition& other) const = default;
};

enum class SelectionMode : std::uint8_t {
    None,
    Collapsed,
    Range,
};

/// Anchor/cursor pair over text runs.
///
/// Endpoints may sit in different runs; the selected text always follows
/// document order regardless of which endpoint comes first.
class SelectionManager {
public:
    /// Start a selection; the cursor collapses onto the anchor
    void set_anchor(TextPosition anchor);

    /// Move the cursor. Starts a collapsed selection when there is no anchor.
    void set_cursor(TextPosition cursor);

    void set(TextPosition anchor, TextPosition cursor);

    void clear();

    [[nodiscard]] SelectionMode mode() const;
    [[nodiscard]] const std::optional<TextPosition>& anchor() const { return m_anchor; }
    [[nodiscard]] const std::optional<TextPosition>& cursor() const { return m_cursor; }

    /// True when either endpoint lies in the node
    [[nodiscard]] bool references(NodeId id) const;

    /// Selected text in document order; empty when mode() is None
    [[nodiscard]] std::string selected_text(const NodeTree& tree) const;

    /// Selected [begin, end) offsets inside one run, if the selection covers it
    [[nodiscard]] std::optional<std::pair<std::size_t, std::size_t>> range_in(
        const NodeTree& tree, NodeId id) const;

private:
    struct Span {
        std::size_t first_run;
        std::size_t first_offset;
        std::size_t last_run;
        std::size_t last_offset;
    };

    /// Endpoints ordered by document position over `runs`
    [[nodiscard]] std::optional<Span> normalized(const std::vector<NodeId>& runs) const;

    std::optional<TextPosition> m_anchor;
    std::optional<TextPosition> m_cursor;
};

} // namespace arbor_ui
