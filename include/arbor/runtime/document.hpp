#pragma once

/// @file document.hpp
/// @brief Retained document: tree, layout, input and image loading in one frame loop

#include "config.hpp"

#include <arbor/asset/image.hpp>
#include <arbor/core/error.hpp>
#include <arbor/ui/dispatcher.hpp>
#include <arbor/ui/input.hpp>
#include <arbor/ui/interaction.hpp>
#include <arbor/ui/layout.hpp>
#include <arbor/ui/selection.hpp>
#include <arbor/ui/style.hpp>
#include <arbor/ui/text.hpp>
#include <arbor/ui/tree.hpp>

#include <memory>
#include <optional>
#include <unordered_map>

namespace arbor_runtime {

/// Pluggable services a Document runs on
struct DocumentServices {
    std::shared_ptr<arbor_ui::LayoutEngine> layout;          // Required
    std::shared_ptr<const arbor_ui::StyleResolver> styles;   // DefaultStyleResolver when null
    std::shared_ptr<const arbor_ui::TextMetrics> text;       // Monospace metrics from config when null
    std::shared_ptr<arbor_asset::ImageDecoder> images;       // Image nodes report an error when null
};

// =============================================================================
// Document
// =============================================================================

/// Owns one node tree and drives it through the frame lifecycle:
/// apply a deferred description, take decoded images, lay out, fire onlayout.
///
/// Single threaded. Only image decoding runs elsewhere; its results are
/// applied inside frame().
class Document {
    // Only create() can name this, so only create() can construct
    struct CreateToken {
        explicit CreateToken() = default;
    };

public:
    [[nodiscard]] static arbor_core::Result<std::unique_ptr<Document>> create(
        DocumentServices services, const RuntimeConfig& config = {});

    Document(CreateToken, DocumentServices services, const RuntimeConfig& config);

    ~Document();

    // Non-copyable
    Document(const Document&) = delete;
    Document& operator=(const Document&) = delete;

    // -------------------------------------------------------------------------
    // Frame lifecycle
    // -------------------------------------------------------------------------

    /// Reconcile against a new description. While an event handler is running
    /// the description is queued for the next frame and the report is marked
    /// deferred. A newer description replaces a queued one.
    [[nodiscard]] arbor_core::Result<arbor_ui::ReconcileReport> update(arbor_ui::NodeDesc description);

    /// Run one frame at the given viewport size. Layout is skipped when
    /// nothing changed since the previous frame.
    [[nodiscard]] arbor_core::Result<arbor_ui::LayoutReport> frame(arbor_ui::Size available);

    /// Route raw input through the dispatcher
    void handle_input(const arbor_ui::RawInput& raw);

    /// Block until every outstanding decode finished. Results still need a frame.
    void wait_for_images();

    // -------------------------------------------------------------------------
    // Queries
    // -------------------------------------------------------------------------

    [[nodiscard]] std::optional<arbor_ui::NodeId> hit_test(arbor_ui::Point point) const;
    [[nodiscard]] std::string selected_text() const { return m_selection.selected_text(m_tree); }

    [[nodiscard]] bool has_pending_update() const { return m_pending.has_value(); }
    [[nodiscard]] std::size_t pending_images() const { return m_image_handles.size(); }

    /// Error of the last queued description that failed to apply, if any
    [[nodiscard]] const std::optional<arbor_core::Error>& deferred_error() const { return m_deferred_error; }

    [[nodiscard]] arbor_ui::NodeTree& tree() { return m_tree; }
    [[nodiscard]] const arbor_ui::NodeTree& tree() const { return m_tree; }
    [[nodiscard]] const arbor_ui::InteractionState& interaction() const { return m_state; }
    [[nodiscard]] const arbor_ui::SelectionManager& selection() const { return m_selection; }
    [[nodiscard]] arbor_ui::EventDispatcher& dispatcher() { return m_dispatcher; }
    [[nodiscard]] const RuntimeConfig& config() const { return m_config; }

private:
    arbor_core::Result<arbor_ui::ReconcileReport> apply(const arbor_ui::NodeDesc& description);
    void apply_report(const arbor_ui::ReconcileReport& report);
    void request_image(arbor_ui::NodeId node, const std::string& src);
    void drop_image_request(arbor_ui::NodeId node);
    void drain_images();

    DocumentServices m_services;
    RuntimeConfig m_config;

    arbor_ui::NodeTree m_tree;
    arbor_ui::InteractionState m_state;
    arbor_ui::SelectionManager m_selection;
    arbor_ui::LayoutAdapter m_layout;
    arbor_ui::EventDispatcher m_dispatcher;

    std::unique_ptr<arbor_asset::ImageLoader> m_images;
    std::unordered_map<arbor_ui::NodeId, arbor_asset::ImageHandle> m_image_handles;
    std::unordered_map<std::uint64_t, arbor_ui::NodeId> m_image_requests;

    std::optional<arbor_ui::NodeDesc> m_pending;
    std::optional<arbor_core::Error> m_deferred_error;
    std::optional<arbor_ui::Size> m_last_available;
};

} // namespace arbor_runtime
