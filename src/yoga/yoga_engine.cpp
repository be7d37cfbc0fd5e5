/// @file yoga_engine.cpp
/// @brief Yoga layout engine

#include <arbor/yoga/yoga_engine.hpp>
#include <arbor/core/log.hpp>

#include <yoga/Yoga.h>

#include <algorithm>
#include <cmath>
#include <memory>

namespace arbor_yoga {

using arbor_core::Err;
using arbor_core::Ok;
using namespace arbor_ui;

namespace {

// =============================================================================
// Style Conversion
// =============================================================================

YGFlexDirection to_yoga(FlexDirection direction) {
    switch (direction) {
        case FlexDirection::Row: return YGFlexDirectionRow;
        case FlexDirection::Column: return YGFlexDirectionColumn;
        case FlexDirection::RowReverse: return YGFlexDirectionRowReverse;
        case FlexDirection::ColumnReverse: return YGFlexDirectionColumnReverse;
    }
    return YGFlexDirectionRow;
}

YGJustify to_yoga(Justify justify) {
    switch (justify) {
        case Justify::Start: return YGJustifyFlexStart;
        case Justify::Center: return YGJustifyCenter;
        case Justify::End: return YGJustifyFlexEnd;
        case Justify::SpaceBetween: return YGJustifySpaceBetween;
        case Justify::SpaceAround: return YGJustifySpaceAround;
        case Justify::SpaceEvenly: return YGJustifySpaceEvenly;
    }
    return YGJustifyFlexStart;
}

YGAlign to_yoga(Align align) {
    switch (align) {
        case Align::Auto: return YGAlignAuto;
        case Align::Start: return YGAlignFlexStart;
        case Align::Center: return YGAlignCenter;
        case Align::End: return YGAlignFlexEnd;
        case Align::Stretch: return YGAlignStretch;
    }
    return YGAlignAuto;
}

YGOverflow to_yoga(Overflow overflow) {
    switch (overflow) {
        case Overflow::Visible: return YGOverflowVisible;
        case Overflow::Hidden: return YGOverflowHidden;
        case Overflow::Scroll: return YGOverflowScroll;
    }
    return YGOverflowVisible;
}

template<typename Points, typename Percent, typename Auto>
void apply_dimension(const Dimension& value, Points points, Percent percent, Auto automatic) {
    switch (value.unit) {
        case Dimension::Unit::Points: points(value.value); break;
        case Dimension::Unit::Percent: percent(value.value); break;
        case Dimension::Unit::Auto: automatic(); break;
    }
}

template<typename Setter>
void apply_edges(YGNodeRef node, const Edges& edges, Setter set) {
    set(node, YGEdgeTop, edges.top);
    set(node, YGEdgeRight, edges.right);
    set(node, YGEdgeBottom, edges.bottom);
    set(node, YGEdgeLeft, edges.left);
}

void apply_style(YGNodeRef node, const Style& style) {
    YGNodeStyleSetDisplay(node, style.display == Display::None ? YGDisplayNone : YGDisplayFlex);
    YGNodeStyleSetPositionType(node, style.position == PositionType::Absolute
                                         ? YGPositionTypeAbsolute : YGPositionTypeRelative);
    YGNodeStyleSetFlexDirection(node, to_yoga(style.flex_direction));
    YGNodeStyleSetFlexWrap(node, style.flex_wrap == FlexWrap::Wrap ? YGWrapWrap : YGWrapNoWrap);
    YGNodeStyleSetJustifyContent(node, to_yoga(style.justify_content));
    YGNodeStyleSetAlignItems(node, to_yoga(style.align_items));
    YGNodeStyleSetAlignSelf(node, to_yoga(style.align_self));
    YGNodeStyleSetOverflow(node, to_yoga(style.overflow));

    YGNodeStyleSetFlexGrow(node, style.flex_grow);
    YGNodeStyleSetFlexShrink(node, style.flex_shrink);
    apply_dimension(style.flex_basis,
        [&](float v) { YGNodeStyleSetFlexBasis(node, v); },
        [&](float v) { YGNodeStyleSetFlexBasisPercent(node, v); },
        [&] { YGNodeStyleSetFlexBasisAuto(node); });

    apply_dimension(style.width,
        [&](float v) { YGNodeStyleSetWidth(node, v); },
        [&](float v) { YGNodeStyleSetWidthPercent(node, v); },
        [&] { YGNodeStyleSetWidthAuto(node); });
    apply_dimension(style.height,
        [&](float v) { YGNodeStyleSetHeight(node, v); },
        [&](float v) { YGNodeStyleSetHeightPercent(node, v); },
        [&] { YGNodeStyleSetHeightAuto(node); });
    apply_dimension(style.min_width,
        [&](float v) { YGNodeStyleSetMinWidth(node, v); },
        [&](float v) { YGNodeStyleSetMinWidthPercent(node, v); },
        [] {});
    apply_dimension(style.min_height,
        [&](float v) { YGNodeStyleSetMinHeight(node, v); },
        [&](float v) { YGNodeStyleSetMinHeightPercent(node, v); },
        [] {});
    apply_dimension(style.max_width,
        [&](float v) { YGNodeStyleSetMaxWidth(node, v); },
        [&](float v) { YGNodeStyleSetMaxWidthPercent(node, v); },
        [] {});
    apply_dimension(style.max_height,
        [&](float v) { YGNodeStyleSetMaxHeight(node, v); },
        [&](float v) { YGNodeStyleSetMaxHeightPercent(node, v); },
        [] {});

    apply_edges(node, style.margin, YGNodeStyleSetMargin);
    apply_edges(node, style.padding, YGNodeStyleSetPadding);
    apply_edges(node, style.border, YGNodeStyleSetBorder);
    if (style.position == PositionType::Absolute) {
        apply_edges(node, style.inset, YGNodeStyleSetPosition);
    }
    YGNodeStyleSetGap(node, YGGutterAll, style.gap);
}

// =============================================================================
// Measurement
// =============================================================================

YGSize measure_leaf(YGNodeConstRef node, float width, YGMeasureMode width_mode,
                    float height, YGMeasureMode height_mode) {
    const auto* measure = static_cast<const MeasureFunc*>(YGNodeGetContext(node));
    std::optional<float> available;
    if (width_mode != YGMeasureModeUndefined) {
        available = width;
    }
    Size size = (*measure)(available);

    if (width_mode == YGMeasureModeExactly) {
        size.width = width;
    } else if (width_mode == YGMeasureModeAtMost) {
        size.width = std::min(size.width, width);
    }
    if (height_mode == YGMeasureModeExactly) {
        size.height = height;
    } else if (height_mode == YGMeasureModeAtMost) {
        size.height = std::min(size.height, height);
    }
    return YGSize{size.width, size.height};
}

struct NodeFree {
    void operator()(YGNodeRef node) const { YGNodeFreeRecursive(node); }
};

Size content_extent(YGNodeConstRef node) {
    float width = YGNodeLayoutGetWidth(node);
    float height = YGNodeLayoutGetHeight(node);
    float right = 0.0f;
    float bottom = 0.0f;
    std::size_t count = YGNodeGetChildCount(node);
    for (std::size_t i = 0; i < count; ++i) {
        YGNodeConstRef child = YGNodeGetChild(const_cast<YGNodeRef>(node), i);
        right = std::max(right, YGNodeLayoutGetLeft(child) + YGNodeLayoutGetWidth(child)
                                    + YGNodeLayoutGetMargin(child, YGEdgeRight));
        bottom = std::max(bottom, YGNodeLayoutGetTop(child) + YGNodeLayoutGetHeight(child)
                                      + YGNodeLayoutGetMargin(child, YGEdgeBottom));
    }
    if (count > 0) {
        right += YGNodeLayoutGetPadding(node, YGEdgeRight) + YGNodeLayoutGetBorder(node, YGEdgeRight);
        bottom += YGNodeLayoutGetPadding(node, YGEdgeBottom) + YGNodeLayoutGetBorder(node, YGEdgeBottom);
    }
    return {std::max(width, right), std::max(height, bottom)};
}

} // anonymous namespace

// =============================================================================
// YogaLayoutEngine
// =============================================================================

YogaLayoutEngine::YogaLayoutEngine()
    : m_config(YGConfigNew())
{
    arbor_core::layout_logger()->debug("Yoga layout engine created");
}

YogaLayoutEngine::~YogaLayoutEngine() {
    if (m_config != nullptr) {
        YGConfigFree(m_config);
        m_config = nullptr;
    }
}

arbor_core::Result<std::vector<LayoutOutput>> YogaLayoutEngine::solve(const LayoutInput& input, Size available) {
    if (input.empty()) {
        return Ok(std::vector<LayoutOutput>{});
    }
    if (m_config == nullptr) {
        return Err<std::vector<LayoutOutput>>(arbor_core::LayoutError::engine_failure("Yoga config unavailable"));
    }

    std::vector<YGNodeRef> nodes;
    nodes.reserve(input.boxes.size());
    std::unique_ptr<YGNode, NodeFree> root;

    for (std::size_t i = 0; i < input.boxes.size(); ++i) {
        const LayoutBox& box = input.boxes[i];
        if ((i == 0) != (box.parent == LayoutBox::NO_PARENT) || (i > 0 && box.parent >= i)) {
            return Err<std::vector<LayoutOutput>>(
                arbor_core::LayoutError::engine_failure("boxes are not in pre-order"));
        }

        YGNodeRef node = YGNodeNewWithConfig(m_config);
        apply_style(node, box.style);
        if (box.measure && box.children.empty()) {
            YGNodeSetContext(node, const_cast<MeasureFunc*>(&box.measure));
            YGNodeSetMeasureFunc(node, measure_leaf);
        }

        if (i == 0) {
            root.reset(node);
        } else {
            YGNodeRef parent = nodes[box.parent];
            YGNodeInsertChild(parent, node, YGNodeGetChildCount(parent));
        }
        nodes.push_back(node);
    }

    YGNodeCalculateLayout(root.get(), available.width, available.height, YGDirectionLTR);

    std::vector<LayoutOutput> outputs(input.boxes.size());
    for (std::size_t i = 0; i < nodes.size(); ++i) {
        YGNodeRef node = nodes[i];
        outputs[i].rect = Rect{YGNodeLayoutGetLeft(node), YGNodeLayoutGetTop(node),
                               YGNodeLayoutGetWidth(node), YGNodeLayoutGetHeight(node)};
        outputs[i].content_size = content_extent(node);
    }

    arbor_core::layout_logger()->trace("Yoga solved {} boxes at {}x{}", nodes.size(), available.width, available.height);
    return Ok(std::move(outputs));
}

} // namespace arbor_yoga
