/// @file layout.cpp
/// @brief LayoutAdapter implementation

#include <arbor/ui/layout.hpp>
#include <arbor/ui/text.hpp>
#include <arbor/ui/tree.hpp>
#include <arbor/core/log.hpp>

#include <cmath>

namespace arbor_ui {

using arbor_core::Err;
using arbor_core::LayoutError;
using arbor_core::Ok;

namespace {

bool is_usable(const LayoutOutput& out) {
    const float values[] = {
        out.rect.x, out.rect.y, out.rect.width, out.rect.height,
        out.content_size.width, out.content_size.height,
    };
    for (float v : values) {
        if (!std::isfinite(v)) {
            return false;
        }
    }
    return out.rect.width >= 0.0f && out.rect.height >= 0.0f
        && out.content_size.width >= 0.0f && out.content_size.height >= 0.0f;
}

/// Zero-sized box at the parent origin unless the position itself is usable
LayoutOutput clamp_to_zero(const LayoutOutput& out) {
    LayoutOutput clamped;
    clamped.rect.x = std::isfinite(out.rect.x) ? out.rect.x : 0.0f;
    clamped.rect.y = std::isfinite(out.rect.y) ? out.rect.y : 0.0f;
    return clamped;
}

} // anonymous namespace

LayoutAdapter::LayoutAdapter(LayoutEngine& engine, const TextMetrics& metrics)
    : m_engine(engine)
    , m_metrics(metrics)
{
}

LayoutInput LayoutAdapter::build_input(const NodeTree& tree) const {
    LayoutInput input;
    if (tree.empty()) {
        return input;
    }
    input.boxes.reserve(tree.size());

    struct Pending {
        NodeId id;
        std::size_t parent;
    };
    std::vector<Pending> stack;
    stack.push_back({tree.root(), LayoutBox::NO_PARENT});

    while (!stack.empty()) {
        Pending current = stack.back();
        stack.pop_back();
        const Node* node = tree.find(current.id);
        if (!node) {
            continue;
        }

        std::size_t index = input.boxes.size();
        LayoutBox box;
        box.id = node->id;
        box.style = node->style;
        box.parent = current.parent;

        if (node->is_text()) {
            const TextMetrics* metrics = &m_metrics;
            box.measure = [metrics, text = node->text](std::optional<float> width) {
                return metrics->measure(text, width);
            };
        } else if (node->is_image()) {
            Size intrinsic = node->intrinsic_size.value_or(Size{});
            box.measure = [intrinsic](std::optional<float>) { return intrinsic; };
        }

        input.boxes.push_back(std::move(box));
        if (current.parent != LayoutBox::NO_PARENT) {
            input.boxes[current.parent].children.push_back(index);
        }

        for (auto it = node->children.rbegin(); it != node->children.rend(); ++it) {
            stack.push_back({*it, index});
        }
    }

    return input;
}

arbor_core::Result<LayoutReport> LayoutAdapter::compute_layout(NodeTree& tree, Size available) {
    auto logger = arbor_core::layout_logger();
    LayoutReport report;
    report.generation = tree.generation();

    LayoutInput input = build_input(tree);
    if (input.empty()) {
        tree.clear_layout_dirty();
        return Ok(std::move(report));
    }

    auto solved = m_engine.solve(input, available);
    if (!solved) {
        logger->error("Layout solve failed: {}", arbor_core::build_error_chain(solved.error()));
        return Err<LayoutReport>(solved.error());
    }

    const auto& outputs = *solved;
    if (outputs.size() != input.boxes.size()) {
        arbor_core::Error error = LayoutError::missing_output(input.boxes.size(), outputs.size());
        logger->error("Layout solve failed: {}", error.message());
        return Err<LayoutReport>(std::move(error));
    }

    std::uint64_t generation = tree.advance_generation();
    std::vector<Point> origins(input.boxes.size());

    for (std::size_t i = 0; i < input.boxes.size(); ++i) {
        const LayoutBox& box = input.boxes[i];
        LayoutOutput out = outputs[i];

        if (!is_usable(out)) {
            ++report.clamped;
            logger->warn("{}; clamped to zero size", LayoutError::non_finite(box.id.value).message);
            out = clamp_to_zero(out);
        }

        Point parent_origin = box.parent == LayoutBox::NO_PARENT ? Point{} : origins[box.parent];
        Rect rect = out.rect.translated(parent_origin);
        origins[i] = rect.position();

        Node* node = tree.find(box.id);
        bool changed = !node->has_layout || node->rect != rect || node->content_size != out.content_size;
        node->rect = rect;
        node->content_size = out.content_size;
        node->layout_generation = generation;
        node->has_layout = true;

        if (changed) {
            report.changed.push_back(box.id);
        }
    }

    tree.clamp_scrolls();
    tree.clear_layout_dirty();

    report.generation = generation;
    logger->trace("Layout generation {}: {} boxes, {} changed, {} clamped",
        generation, input.boxes.size(), report.changed.size(), report.clamped);

    return Ok(std::move(report));
}

} // namespace arbor_ui
