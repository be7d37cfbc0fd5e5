#pragma once

/// @file layout.hpp
/// @brief Layout engine interface and the adapter that feeds it from a NodeTree

#include "style.hpp"
#include "types.hpp"

#include <arbor/core/error.hpp>

#include <cstdint>
#include <functional>
#include <limits>
#include <optional>
#include <vector>

namespace arbor_ui {

class NodeTree;
class TextMetrics;

// =============================================================================
// Engine Interface
// =============================================================================

/// Intrinsic size of a leaf given an available width (none = max-content)
using MeasureFunc = std::function<Size(std::optional<float> available_width)>;

/// One box handed to the layout engine
struct LayoutBox {
    static constexpr std::size_t NO_PARENT = std::numeric_limits<std::size_t>::max();

    NodeId id;
    Style style;
    std::size_t parent = NO_PARENT;
    std::vector<std::size_t> children;  // Indices into LayoutInput::boxes
    MeasureFunc measure;                // Set for text runs and images
};

/// Boxes in pre-order; boxes[0] is the root
struct LayoutInput {
    std::vector<LayoutBox> boxes;

    [[nodiscard]] bool empty() const { return boxes.empty(); }
};

/// Solved geometry for one box
struct LayoutOutput {
    Rect rect;          // Border box relative to the parent's border box
    Size content_size;  // Extent of the content, at least the box size for leaves
};

/// External constraint solver
class LayoutEngine {
public:
    virtual ~LayoutEngine() = default;

    /// Solve the whole input. The result holds one output per box, same order.
    [[nodiscard]] virtual arbor_core::Result<std::vector<LayoutOutput>> solve(
        const LayoutInput& input, Size available) = 0;
};

// =============================================================================
// LayoutAdapter
// =============================================================================

/// Outcome of one layout pass
struct LayoutReport {
    std::uint64_t generation = 0;
    std::vector<NodeId> changed;  // Rect or content size changed, document order
    std::size_t clamped = 0;      // Boxes with unusable geometry
};

/// Synchronizes a NodeTree with a LayoutEngine
class LayoutAdapter {
public:
    LayoutAdapter(LayoutEngine& engine, const TextMetrics& metrics);

    // Non-copyable
    LayoutAdapter(const LayoutAdapter&) = delete;
    LayoutAdapter& operator=(const LayoutAdapter&) = delete;

    /// Build engine input for the current tree
    [[nodiscard]] LayoutInput build_input(const NodeTree& tree) const;

    /// Solve and write geometry with a new generation.
    /// On engine failure the previous geometry and generation are kept.
    [[nodiscard]] arbor_core::Result<LayoutReport> compute_layout(NodeTree& tree, Size available);

private:
    LayoutEngine& m_engine;
    const TextMetrics& m_metrics;
};

} // namespace arbor_ui
