#pragma once

/// @file node.hpp
/// @brief Node descriptions and retained nodes

#include "event.hpp"
#include "style.hpp"
#include "types.hpp"

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace arbor_asset {
struct DecodedImage;
}

namespace arbor_ui {

using Attributes = std::map<std::string, std::string>;

/// Attribute forwarded to the style resolver
inline constexpr const char* ATTR_CLASS = "class";

/// Attribute forwarded to the image loader
inline constexpr const char* ATTR_SRC = "src";

// =============================================================================
// NodeDesc
// =============================================================================

/// Declared node produced by the description layer
struct NodeDesc {
    NodeId id;
    NodeKind kind = NodeKind::Container;
    Attributes attributes;
    std::string text;
    bool focusable = false;
    bool editable = false;
    bool clip_to_bounds = false;
    std::vector<NodeDesc> children;
    HandlerTable handlers;

    [[nodiscard]] static NodeDesc container(NodeId id, std::vector<NodeDesc> children = {});
    [[nodiscard]] static NodeDesc text_run(NodeId id, std::string text);
    [[nodiscard]] static NodeDesc image(NodeId id, std::string src);

    // Builder methods
    NodeDesc& with_class(std::string class_string);
    NodeDesc& with_attribute(std::string key, std::string value);
    NodeDesc& with_child(NodeDesc child);
    NodeDesc& with_focusable(bool value = true);
    NodeDesc& with_editable(bool value = true);
    NodeDesc& with_clip(bool value = true);
    NodeDesc& on(EventKind kind, EventHandler handler);
    NodeDesc& on_capture(EventKind kind, EventHandler handler);

    [[nodiscard]] const std::string* attribute(const std::string& key) const;
};

// =============================================================================
// Node
// =============================================================================

/// Retained node owned by a NodeTree
struct Node {
    NodeId id;
    NodeKind kind = NodeKind::Container;
    NodeId parent;  // Null for the root
    std::vector<NodeId> children;

    Attributes attributes;
    std::string text;
    Style style;

    bool focusable = false;
    bool editable = false;
    bool clip_to_bounds = false;

    // Geometry, written by the layout adapter
    Rect rect;  // Border box, root space, unscrolled
    Size content_size;
    Point scroll;
    std::uint64_t layout_generation = 0;
    bool has_layout = false;

    HandlerTable handlers;

    // Image state
    std::optional<Size> intrinsic_size;
    std::shared_ptr<const arbor_asset::DecodedImage> image;
    std::optional<std::string> image_error;

    [[nodiscard]] bool is_text() const { return kind == NodeKind::Text; }
    [[nodiscard]] bool is_image() const { return kind == NodeKind::Image; }
    [[nodiscard]] bool is_root() const { return parent.is_null(); }

    /// Declared clipping or a clipping overflow style
    [[nodiscard]] bool clips() const { return clip_to_bounds || style.clips(); }

    [[nodiscard]] const std::string* attribute(const std::string& key) const;

    [[nodiscard]] bool has_handler(EventKind kind) const {
        return !handlers[static_cast<std::size_t>(kind)].empty();
    }

    /// Largest scroll offset allowed by content and border box sizes
    [[nodiscard]] Point max_scroll() const {
        return {std::max(0.0f, content_size.width - rect.width),
                std::max(0.0f, content_size.height - rect.height)};
    }
};

} // namespace arbor_ui
