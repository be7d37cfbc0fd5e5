/// @file document.cpp
/// @brief Document frame loop

#include <arbor/runtime/document.hpp>
#include <arbor/core/log.hpp>
#include <arbor/ui/hit_test.hpp>

namespace arbor_runtime {

using arbor_core::Err;
using arbor_core::Ok;
using arbor_ui::NodeId;

// =============================================================================
// Construction
// =============================================================================

arbor_core::Result<std::unique_ptr<Document>> Document::create(
    DocumentServices services, const RuntimeConfig& config)
{
    if (!services.layout) {
        return Err<std::unique_ptr<Document>>(
            arbor_core::Error(arbor_core::ErrorCode::InvalidArgument, "Document requires a layout engine"));
    }
    if (!services.styles) {
        services.styles = std::make_shared<arbor_ui::DefaultStyleResolver>();
    }
    if (!services.text) {
        services.text = std::make_shared<arbor_ui::MonospaceTextMetrics>(
            config.text.glyph_advance, config.text.line_height);
    }
    return Ok(std::make_unique<Document>(CreateToken{}, std::move(services), config));
}

Document::Document(CreateToken, DocumentServices services, const RuntimeConfig& config)
    : m_services(std::move(services))
    , m_config(config)
    , m_layout(*m_services.layout, *m_services.text)
    , m_dispatcher(m_tree, m_state, m_selection, *m_services.text, config.dispatch_config())
{
    if (m_services.images) {
        m_images = std::make_unique<arbor_asset::ImageLoader>(m_services.images, config.images.decode_threads);
    }
    arbor_core::runtime_logger()->debug("Document created (image decoding {})",
                                        m_images ? "enabled" : "disabled");
}

Document::~Document() {
    // Cancel before the loader joins its workers so queued decodes are skipped
    m_image_handles.clear();
    m_images.reset();
}

// =============================================================================
// Frame lifecycle
// =============================================================================

arbor_core::Result<arbor_ui::ReconcileReport> Document::update(arbor_ui::NodeDesc description) {
    if (m_dispatcher.is_dispatching()) {
        m_pending = std::move(description);
        arbor_core::runtime_logger()->debug("Update during dispatch queued for the next frame");
        arbor_ui::ReconcileReport report;
        report.deferred = true;
        return Ok(std::move(report));
    }
    m_pending.reset();
    return apply(description);
}

arbor_core::Result<arbor_ui::LayoutReport> Document::frame(arbor_ui::Size available) {
    ARBOR_LOG_SCOPE("Document::frame");

    if (m_pending) {
        arbor_ui::NodeDesc description = std::move(*m_pending);
        m_pending.reset();
        auto applied = apply(description);
        if (applied) {
            m_deferred_error.reset();
        } else {
            // The previous tree stays in place; the frame carries on with it
            m_deferred_error = applied.error();
        }
    }

    drain_images();

    if (!m_tree.layout_dirty() && m_last_available == available) {
        arbor_ui::LayoutReport unchanged;
        unchanged.generation = m_tree.generation();
        return Ok(std::move(unchanged));
    }

    auto report = m_layout.compute_layout(m_tree, available);
    if (!report) {
        return report;
    }
    m_last_available = available;
    m_dispatcher.dispatch_layout(*report);
    return report;
}

void Document::handle_input(const arbor_ui::RawInput& raw) {
    m_dispatcher.handle(raw);
}

void Document::wait_for_images() {
    if (m_images) {
        m_images->wait_idle();
    }
}

std::optional<NodeId> Document::hit_test(arbor_ui::Point point) const {
    return arbor_ui::HitTester(m_tree).hit_test(point);
}

// =============================================================================
// Reconciliation
// =============================================================================

arbor_core::Result<arbor_ui::ReconcileReport> Document::apply(const arbor_ui::NodeDesc& description) {
    auto report = m_tree.reconcile(description, *m_services.styles);
    if (!report) {
        return report;
    }
    apply_report(*report);
    return report;
}

void Document::apply_report(const arbor_ui::ReconcileReport& report) {
    for (NodeId id : report.removed) {
        m_dispatcher.forget(id);
        drop_image_request(id);
    }
    for (NodeId id : report.replaced_text) {
        m_dispatcher.invalidate_text(id);
    }
    for (const auto& change : report.image_changes) {
        drop_image_request(change.node);
        if (!change.src.empty()) {
            request_image(change.node, change.src);
        }
    }
}

// =============================================================================
// Images
// =============================================================================

void Document::request_image(NodeId node, const std::string& src) {
    if (!m_images) {
        arbor_core::asset_logger()->warn("Image '{}' on node {} not loaded: no decoder configured", src, node.value);
        m_tree.set_image_error(node, "no image decoder configured");
        return;
    }
    auto handle = m_images->request(src);
    m_image_requests[handle.id()] = node;
    m_image_handles[node] = std::move(handle);
}

void Document::drop_image_request(NodeId node) {
    auto it = m_image_handles.find(node);
    if (it == m_image_handles.end()) {
        return;
    }
    m_image_requests.erase(it->second.id());
    m_image_handles.erase(it);  // Cancels
}

void Document::drain_images() {
    if (!m_images) {
        return;
    }

    for (auto& completion : m_images->drain()) {
        auto request = m_image_requests.find(completion.request);
        if (request == m_image_requests.end()) {
            continue;
        }
        NodeId node = request->second;
        m_image_requests.erase(request);

        auto handle = m_image_handles.find(node);
        if (handle == m_image_handles.end() || handle->second.id() != completion.request) {
            continue;
        }
        m_image_handles.erase(handle);

        if (!m_tree.contains(node)) {
            arbor_core::asset_logger()->trace("Discarding image '{}' for destroyed node {}", completion.src, node.value);
            continue;
        }

        if (completion.result) {
            const auto& image = *completion.result;
            arbor_core::asset_logger()->debug("Image '{}' ready ({}x{}) for node {}",
                                              completion.src, image->width, image->height, node.value);
            m_tree.set_image(node,
                             arbor_ui::Size{static_cast<float>(image->width), static_cast<float>(image->height)},
                             image);
        } else {
            arbor_core::asset_logger()->warn("Image '{}' failed: {}", completion.src,
                                             arbor_core::build_error_chain(completion.result.error()));
            m_tree.set_image_error(node, completion.result.error().message());
        }
    }
}

} // namespace arbor_runtime
