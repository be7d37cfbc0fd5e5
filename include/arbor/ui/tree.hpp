#pragma once

/// @file tree.hpp
/// @brief Retained node tree and reconciliation

#include "node.hpp"

#include <arbor/core/error.hpp>

#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

namespace arbor_ui {

// =============================================================================
// Reconciliation Output
// =============================================================================

/// Single tree edit produced by reconciliation
struct TreeEdit {
    enum class Kind : std::uint8_t {
        Insert,
        Remove,
        Move,
        UpdateAttributes,
    };

    Kind kind = Kind::Insert;
    NodeId node;
    NodeId parent;          // Destination parent (Insert, Move)
    std::size_t index = 0;  // Destination index among the parent's children
};

/// Image source set, changed or removed (empty src) on a node
struct ImageSourceChange {
    NodeId node;
    std::string src;
};

/// Summary of one reconciliation pass
struct ReconcileReport {
    std::vector<TreeEdit> edits;
    std::vector<NodeId> removed;
    std::vector<NodeId> replaced_text;
    std::vector<ImageSourceChange> image_changes;
    std::size_t restyled = 0;
    bool deferred = false;  // Queued for the next frame instead of applied

    [[nodiscard]] bool empty() const { return edits.empty(); }
    [[nodiscard]] std::size_t count(TreeEdit::Kind kind) const;
};

// =============================================================================
// NodeTree
// =============================================================================

/// Arena of nodes indexed by stable id.
///
/// Parents are stored as ids (lookup only), children as ordered id lists.
/// Geometry is valid only when a node's layout_generation equals generation().
class NodeTree {
public:
    NodeTree() = default;

    // Non-copyable
    NodeTree(const NodeTree&) = delete;
    NodeTree& operator=(const NodeTree&) = delete;

    /// Bring the tree in line with a description.
    /// On error nothing is applied and the previous tree is kept.
    [[nodiscard]] arbor_core::Result<ReconcileReport> reconcile(
        const NodeDesc& root, const StyleResolver& styles);

    // -------------------------------------------------------------------------
    // Lookup
    // -------------------------------------------------------------------------

    [[nodiscard]] const Node* find(NodeId id) const;
    [[nodiscard]] Node* find(NodeId id);
    [[nodiscard]] bool contains(NodeId id) const { return m_nodes.count(id) != 0; }
    [[nodiscard]] NodeId root() const { return m_root; }
    [[nodiscard]] std::size_t size() const { return m_nodes.size(); }
    [[nodiscard]] bool empty() const { return m_nodes.empty(); }

    /// Ids in pre-order (document order)
    [[nodiscard]] std::vector<NodeId> document_order() const;

    /// Text runs in document order
    [[nodiscard]] std::vector<NodeId> text_runs() const;

    /// Ids from the root down to and including the node
    [[nodiscard]] std::vector<NodeId> path_to(NodeId id) const;

    [[nodiscard]] bool is_ancestor_or_self(NodeId ancestor, NodeId node) const;

    // -------------------------------------------------------------------------
    // Geometry
    // -------------------------------------------------------------------------

    [[nodiscard]] std::uint64_t generation() const { return m_generation; }
    std::uint64_t advance_generation() { return ++m_generation; }

    [[nodiscard]] bool has_valid_geometry(const Node& node) const {
        return node.has_layout && node.layout_generation == m_generation;
    }

    /// Set a scroll offset, clamped to the node's scroll range
    bool set_scroll(NodeId id, Point offset);

    /// Re-clamp every scroll offset against current content sizes
    void clamp_scrolls();

    [[nodiscard]] bool layout_dirty() const { return m_layout_dirty; }
    void mark_layout_dirty() { m_layout_dirty = true; }
    void clear_layout_dirty() { m_layout_dirty = false; }

    // -------------------------------------------------------------------------
    // In-place mutation
    // -------------------------------------------------------------------------

    /// Replace a text run's content (editing)
    bool set_text(NodeId id, std::string text);

    /// Apply a decoded image to an image node
    bool set_image(NodeId id, Size intrinsic, std::shared_ptr<const arbor_asset::DecodedImage> image);

    /// Record a failed image load on an image node
    bool set_image_error(NodeId id, std::string message);

    /// Register a handler outside of reconciliation (replaced on the next pass)
    bool set_handler(NodeId id, EventKind kind, EventHandler handler, bool capture = false);

private:
    std::unordered_map<NodeId, Node> m_nodes;
    NodeId m_root;
    std::uint64_t m_generation = 0;
    bool m_layout_dirty = false;
};

} // namespace arbor_ui
