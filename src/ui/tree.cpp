/// @file tree.cpp
/// @brief NodeTree reconciliation and mutation

#include <arbor/ui/tree.hpp>
#include <arbor/core/log.hpp>

#include <algorithm>

namespace arbor_ui {

using arbor_core::Err;
using arbor_core::Ok;
using arbor_core::ReconcileError;

namespace {

// =============================================================================
// Description Indexing
// =============================================================================

struct Declared {
    const NodeDesc* desc = nullptr;
    NodeId parent;
    std::size_t index = 0;
};

using DeclaredMap = std::unordered_map<NodeId, Declared>;

/// Validate a description and index it by id. `order` receives ids in pre-order.
arbor_core::Result<void> index_description(
    const NodeDesc& root, DeclaredMap& declared, std::vector<NodeId>& order)
{
    std::vector<Declared> stack;
    stack.push_back({&root, NodeId{}, 0});

    while (!stack.empty()) {
        Declared current = stack.back();
        stack.pop_back();
        const NodeDesc& desc = *current.desc;

        if (desc.id.is_null()) {
            std::string parent = current.parent.is_null()
                ? std::string("<root>") : std::to_string(current.parent.value);
            return Err(ReconcileError::invalid_id(parent));
        }
        if (!declared.emplace(desc.id, current).second) {
            return Err(ReconcileError::duplicate_id(desc.id.value));
        }
        if (desc.kind != NodeKind::Container && !desc.children.empty()) {
            return Err(ReconcileError::children_not_allowed(desc.id.value, node_kind_name(desc.kind)));
        }

        order.push_back(desc.id);
        for (std::size_t i = desc.children.size(); i-- > 0;) {
            stack.push_back({&desc.children[i], desc.id, i});
        }
    }

    return Ok();
}

/// Mark the members of one longest strictly increasing subsequence
std::vector<bool> longest_increasing_run(const std::vector<std::size_t>& values) {
    std::vector<std::size_t> tails;
    std::vector<std::ptrdiff_t> prev(values.size(), -1);

    for (std::size_t i = 0; i < values.size(); ++i) {
        auto it = std::lower_bound(tails.begin(), tails.end(), values[i],
            [&values](std::size_t idx, std::size_t v) { return values[idx] < v; });
        auto len = static_cast<std::size_t>(it - tails.begin());
        if (len > 0) {
            prev[i] = static_cast<std::ptrdiff_t>(tails[len - 1]);
        }
        if (it == tails.end()) {
            tails.push_back(i);
        } else {
            *it = i;
        }
    }

    std::vector<bool> keep(values.size(), false);
    if (tails.empty()) {
        return keep;
    }
    for (auto i = static_cast<std::ptrdiff_t>(tails.back()); i >= 0; i = prev[static_cast<std::size_t>(i)]) {
        keep[static_cast<std::size_t>(i)] = true;
    }
    return keep;
}

bool differs(const Node& node, const NodeDesc& desc) {
    return node.attributes != desc.attributes
        || node.text != desc.text
        || node.focusable != desc.focusable
        || node.editable != desc.editable
        || node.clip_to_bounds != desc.clip_to_bounds;
}

std::string class_of(const Attributes& attributes) {
    auto it = attributes.find(ATTR_CLASS);
    return it != attributes.end() ? it->second : std::string{};
}

std::string src_of(const Attributes& attributes) {
    auto it = attributes.find(ATTR_SRC);
    return it != attributes.end() ? it->second : std::string{};
}

} // anonymous namespace

// =============================================================================
// ReconcileReport
// =============================================================================

std::size_t ReconcileReport::count(TreeEdit::Kind kind) const {
    return static_cast<std::size_t>(std::count_if(edits.begin(), edits.end(),
        [kind](const TreeEdit& edit) { return edit.kind == kind; }));
}

// =============================================================================
// Reconciliation
// =============================================================================

arbor_core::Result<ReconcileReport> NodeTree::reconcile(const NodeDesc& root, const StyleResolver& styles) {
    DeclaredMap declared;
    std::vector<NodeId> order;
    if (auto valid = index_description(root, declared, order); !valid) {
        arbor_core::tree_logger()->warn("Rejected description: {}", valid.error().message());
        return Err<ReconcileReport>(valid.error());
    }

    ReconcileReport report;

    // A node survives when its id is declared again with the same kind
    auto retained = [&](NodeId id) -> const Node* {
        auto it = m_nodes.find(id);
        if (it == m_nodes.end()) {
            return nullptr;
        }
        auto d = declared.find(id);
        if (d == declared.end() || d->second.desc->kind != it->second.kind) {
            return nullptr;
        }
        return &it->second;
    };

    // -------------------------------------------------------------------------
    // Plan edits against the current tree
    // -------------------------------------------------------------------------

    for (NodeId id : document_order()) {
        if (!retained(id)) {
            report.removed.push_back(id);
            report.edits.push_back({TreeEdit::Kind::Remove, id, {}, 0});
        }
    }

    if (const Node* old_root = retained(root.id); !old_root) {
        report.edits.push_back({TreeEdit::Kind::Insert, root.id, {}, 0});
    } else if (!old_root->is_root()) {
        report.edits.push_back({TreeEdit::Kind::Move, root.id, {}, 0});
    }

    for (NodeId id : order) {
        const Declared& entry = declared.at(id);
        const NodeDesc& desc = *entry.desc;
        const Node* old = retained(id);

        if (old && differs(*old, desc)) {
            report.edits.push_back({TreeEdit::Kind::UpdateAttributes, id, entry.parent, entry.index});
        }

        // Children already under this node keep their place when they form the
        // longest run of increasing old positions; everything else moves.
        std::vector<std::size_t> old_positions;
        std::vector<std::size_t> candidates;
        if (old) {
            std::unordered_map<NodeId, std::size_t> position;
            for (std::size_t i = 0; i < old->children.size(); ++i) {
                position.emplace(old->children[i], i);
            }
            for (std::size_t i = 0; i < desc.children.size(); ++i) {
                const Node* child = retained(desc.children[i].id);
                if (child && child->parent == id) {
                    old_positions.push_back(position.at(desc.children[i].id));
                    candidates.push_back(i);
                }
            }
        }

        std::vector<bool> stays(desc.children.size(), false);
        auto keep = longest_increasing_run(old_positions);
        for (std::size_t k = 0; k < keep.size(); ++k) {
            if (keep[k]) {
                stays[candidates[k]] = true;
            }
        }

        for (std::size_t i = 0; i < desc.children.size(); ++i) {
            if (stays[i]) {
                continue;
            }
            NodeId child = desc.children[i].id;
            auto kind = retained(child) ? TreeEdit::Kind::Move : TreeEdit::Kind::Insert;
            report.edits.push_back({kind, child, id, i});
        }
    }

    // -------------------------------------------------------------------------
    // Apply
    // -------------------------------------------------------------------------

    for (NodeId id : report.removed) {
        m_nodes.erase(id);
    }

    for (NodeId id : order) {
        const Declared& entry = declared.at(id);
        const NodeDesc& desc = *entry.desc;
        auto [it, inserted] = m_nodes.try_emplace(id);
        Node& node = it->second;

        if (inserted) {
            node.id = id;
            node.kind = desc.kind;
            node.attributes = desc.attributes;
            node.text = desc.text;
            node.style = styles.resolve(class_of(desc.attributes));
            ++report.restyled;

            if (node.is_image()) {
                std::string src = src_of(desc.attributes);
                if (!src.empty()) {
                    report.image_changes.push_back({id, std::move(src)});
                }
            }
        } else {
            if (node.attributes != desc.attributes) {
                node.style = styles.resolve(class_of(desc.attributes));
                ++report.restyled;

                std::string src = src_of(desc.attributes);
                if (node.is_image() && src != src_of(node.attributes)) {
                    node.intrinsic_size.reset();
                    node.image.reset();
                    node.image_error.reset();
                    report.image_changes.push_back({id, std::move(src)});
                }
                node.attributes = desc.attributes;
            }
            if (node.text != desc.text) {
                node.text = desc.text;
                if (node.is_text()) {
                    report.replaced_text.push_back(id);
                }
            }
        }

        node.focusable = desc.focusable;
        node.editable = desc.editable;
        node.clip_to_bounds = desc.clip_to_bounds;
        node.parent = entry.parent;
        node.children.clear();
        for (const auto& child : desc.children) {
            node.children.push_back(child.id);
        }
        node.handlers = desc.handlers;
    }

    m_root = root.id;

    if (!report.edits.empty()) {
        m_layout_dirty = true;
        arbor_core::tree_logger()->debug(
            "Reconciled {} nodes: {} inserted, {} removed, {} moved, {} updated",
            m_nodes.size(),
            report.count(TreeEdit::Kind::Insert),
            report.count(TreeEdit::Kind::Remove),
            report.count(TreeEdit::Kind::Move),
            report.count(TreeEdit::Kind::UpdateAttributes));
    }

    return Ok(std::move(report));
}

// =============================================================================
// Lookup
// =============================================================================

const Node* NodeTree::find(NodeId id) const {
    auto it = m_nodes.find(id);
    return it != m_nodes.end() ? &it->second : nullptr;
}

Node* NodeTree::find(NodeId id) {
    auto it = m_nodes.find(id);
    return it != m_nodes.end() ? &it->second : nullptr;
}

std::vector<NodeId> NodeTree::document_order() const {
    std::vector<NodeId> order;
    if (m_root.is_null()) {
        return order;
    }
    order.reserve(m_nodes.size());

    std::vector<NodeId> stack{m_root};
    while (!stack.empty()) {
        NodeId id = stack.back();
        stack.pop_back();
        const Node* node = find(id);
        if (!node) {
            continue;
        }
        order.push_back(id);
        for (auto it = node->children.rbegin(); it != node->children.rend(); ++it) {
            stack.push_back(*it);
        }
    }
    return order;
}

std::vector<NodeId> NodeTree::text_runs() const {
    std::vector<NodeId> runs;
    for (NodeId id : document_order()) {
        if (find(id)->is_text()) {
            runs.push_back(id);
        }
    }
    return runs;
}

std::vector<NodeId> NodeTree::path_to(NodeId id) const {
    std::vector<NodeId> path;
    for (const Node* node = find(id); node; node = find(node->parent)) {
        path.push_back(node->id);
    }
    std::reverse(path.begin(), path.end());
    return path;
}

bool NodeTree::is_ancestor_or_self(NodeId ancestor, NodeId node) const {
    for (const Node* current = find(node); current; current = find(current->parent)) {
        if (current->id == ancestor) {
            return true;
        }
    }
    return false;
}

// =============================================================================
// Geometry
// =============================================================================

bool NodeTree::set_scroll(NodeId id, Point offset) {
    Node* node = find(id);
    if (!node) {
        return false;
    }
    Point max = node->max_scroll();
    Point clamped{std::clamp(offset.x, 0.0f, max.x), std::clamp(offset.y, 0.0f, max.y)};
    if (clamped == node->scroll) {
        return false;
    }
    node->scroll = clamped;
    return true;
}

void NodeTree::clamp_scrolls() {
    for (auto& [id, node] : m_nodes) {
        Point max = node.max_scroll();
        node.scroll.x = std::clamp(node.scroll.x, 0.0f, max.x);
        node.scroll.y = std::clamp(node.scroll.y, 0.0f, max.y);
    }
}

// =============================================================================
// In-place Mutation
// =============================================================================

bool NodeTree::set_text(NodeId id, std::string text) {
    Node* node = find(id);
    if (!node || !node->is_text() || node->text == text) {
        return false;
    }
    node->text = std::move(text);
    m_layout_dirty = true;
    return true;
}

bool NodeTree::set_image(NodeId id, Size intrinsic, std::shared_ptr<const arbor_asset::DecodedImage> image) {
    Node* node = find(id);
    if (!node || !node->is_image()) {
        return false;
    }
    node->intrinsic_size = intrinsic;
    node->image = std::move(image);
    node->image_error.reset();
    m_layout_dirty = true;
    return true;
}

bool NodeTree::set_image_error(NodeId id, std::string message) {
    Node* node = find(id);
    if (!node || !node->is_image()) {
        return false;
    }
    node->image_error = std::move(message);
    return true;
}

bool NodeTree::set_handler(NodeId id, EventKind kind, EventHandler handler, bool capture) {
    Node* node = find(id);
    if (!node) {
        return false;
    }
    auto& slot = node->handlers[static_cast<std::size_t>(kind)];
    (capture ? slot.capture : slot.bubble) = std::move(handler);
    return true;
}

} // namespace arbor_ui
