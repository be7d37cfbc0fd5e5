/// @file test_layout.cpp
/// @brief Tests for the layout adapter

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <arbor/ui/dispatcher.hpp>
#include <arbor/ui/interaction.hpp>
#include <arbor/ui/layout.hpp>
#include <arbor/ui/selection.hpp>
#include <arbor/ui/text.hpp>
#include <arbor/ui/tree.hpp>

#include "../support/scripted_layout_engine.hpp"

#include <cmath>

using namespace arbor_ui;
using arbor_test::ScriptedLayoutEngine;
using Catch::Approx;

namespace {

NodeId id(const char* name) {
    return NodeId::from_name(name);
}

struct LayoutFixture {
    NodeTree tree;
    DefaultStyleResolver styles;
    MonospaceTextMetrics metrics;
    ScriptedLayoutEngine engine;
    LayoutAdapter adapter{engine, metrics};

    LayoutFixture() {
        auto desc = NodeDesc::container(id("root"), {
            NodeDesc::container(id("panel"), {NodeDesc::text_run(id("label"), "Hello")}),
            NodeDesc::image(id("logo"), "logo.png"),
        });
        REQUIRE(tree.reconcile(desc, styles));
        engine.place(id("panel"), Rect{10.0f, 20.0f, 200.0f, 100.0f});
        engine.place(id("label"), Rect{5.0f, 5.0f, 40.0f, 16.0f});
    }
};

} // anonymous namespace

TEST_CASE("LayoutAdapter builds engine input", "[ui][layout]") {
    LayoutFixture f;
    LayoutInput input = f.adapter.build_input(f.tree);

    REQUIRE(input.boxes.size() == 4);
    REQUIRE(input.boxes[0].id == id("root"));
    REQUIRE(input.boxes[0].parent == LayoutBox::NO_PARENT);
    REQUIRE(input.boxes[0].children == std::vector<std::size_t>{1, 3});
    REQUIRE(input.boxes[1].id == id("panel"));
    REQUIRE(input.boxes[2].id == id("label"));
    REQUIRE(input.boxes[2].parent == 1);
    REQUIRE(input.boxes[3].id == id("logo"));

    SECTION("Text runs measure through the metrics") {
        REQUIRE(input.boxes[2].measure);
        Size size = input.boxes[2].measure(std::nullopt);
        REQUIRE(size.width == Approx(40.0f));
        REQUIRE(size.height == Approx(16.0f));

        // Wrapped at three glyphs per line
        Size wrapped = input.boxes[2].measure(24.0f);
        REQUIRE(wrapped.width == Approx(24.0f));
        REQUIRE(wrapped.height == Approx(32.0f));
    }

    SECTION("Images measure to zero until decoded") {
        REQUIRE(input.boxes[3].measure);
        REQUIRE(input.boxes[3].measure(std::nullopt) == Size{});

        REQUIRE(f.tree.set_image(id("logo"), Size{64.0f, 32.0f}, nullptr));
        LayoutInput again = f.adapter.build_input(f.tree);
        REQUIRE(again.boxes[3].measure(100.0f) == Size{64.0f, 32.0f});
    }

    SECTION("Containers have no measure") {
        REQUIRE_FALSE(input.boxes[1].measure);
    }
}

TEST_CASE("LayoutAdapter writes geometry", "[ui][layout]") {
    LayoutFixture f;

    auto report = f.adapter.compute_layout(f.tree, Size{800.0f, 600.0f});
    REQUIRE(report);
    REQUIRE(report->generation == 1);
    REQUIRE(report->changed.size() == 4);
    REQUIRE(report->clamped == 0);
    REQUIRE_FALSE(f.tree.layout_dirty());

    SECTION("Rects are accumulated into root space") {
        const Node* label = f.tree.find(id("label"));
        REQUIRE(label->rect == Rect{15.0f, 25.0f, 40.0f, 16.0f});
        REQUIRE(f.tree.find(id("root"))->rect == Rect{0.0f, 0.0f, 800.0f, 600.0f});
    }

    SECTION("Every node carries the new generation") {
        for (NodeId node : f.tree.document_order()) {
            REQUIRE(f.tree.find(node)->layout_generation == report->generation);
            REQUIRE(f.tree.has_valid_geometry(*f.tree.find(node)));
        }
    }

    SECTION("Unchanged geometry is not reported again") {
        auto second = f.adapter.compute_layout(f.tree, Size{800.0f, 600.0f});
        REQUIRE(second);
        REQUIRE(second->generation == 2);
        REQUIRE(second->changed.empty());
    }

    SECTION("Only moved boxes are reported") {
        f.engine.place(id("panel"), Rect{10.0f, 40.0f, 200.0f, 100.0f});
        auto second = f.adapter.compute_layout(f.tree, Size{800.0f, 600.0f});
        REQUIRE(second);
        // The label keeps its parent-relative offset but moves in root space
        REQUIRE(second->changed == std::vector<NodeId>{id("panel"), id("label")});
    }
}

TEST_CASE("LayoutAdapter engine failures", "[ui][layout]") {
    LayoutFixture f;
    REQUIRE(f.adapter.compute_layout(f.tree, Size{800.0f, 600.0f}));
    Rect before = f.tree.find(id("panel"))->rect;
    f.tree.mark_layout_dirty();

    SECTION("Failed solve keeps previous geometry") {
        f.engine.fail_with("constraint cycle");
        auto report = f.adapter.compute_layout(f.tree, Size{400.0f, 300.0f});
        REQUIRE(report.is_err());
        REQUIRE(report.error().is<arbor_core::LayoutError>());
        REQUIRE(f.tree.generation() == 1);
        REQUIRE(f.tree.find(id("panel"))->rect == before);
        REQUIRE(f.tree.layout_dirty());
    }

    SECTION("Short output is rejected") {
        f.engine.drop_last_box(true);
        auto report = f.adapter.compute_layout(f.tree, Size{400.0f, 300.0f});
        REQUIRE(report.is_err());
        REQUIRE(report.error().as<arbor_core::LayoutError>()->kind
                == arbor_core::LayoutError::Kind::MissingOutput);
        REQUIRE(f.tree.generation() == 1);
    }

    SECTION("Non-finite boxes are clamped to zero size") {
        f.engine.poison(id("panel"));
        auto report = f.adapter.compute_layout(f.tree, Size{800.0f, 600.0f});
        REQUIRE(report);
        REQUIRE(report->clamped == 1);

        const Node* panel = f.tree.find(id("panel"));
        REQUIRE(panel->rect.width == 0.0f);
        REQUIRE(panel->rect.height == 0.0f);
        REQUIRE(panel->rect.x == 10.0f);
        REQUIRE(std::isfinite(panel->content_size.width));
    }
}

TEST_CASE("LayoutAdapter clamps scroll offsets", "[ui][layout]") {
    LayoutFixture f;
    f.engine.place(id("panel"), Rect{0.0f, 0.0f, 100.0f, 100.0f}, Size{100.0f, 400.0f});
    REQUIRE(f.adapter.compute_layout(f.tree, Size{800.0f, 600.0f}));
    REQUIRE(f.tree.set_scroll(id("panel"), Point{0.0f, 250.0f}));

    f.engine.place(id("panel"), Rect{0.0f, 0.0f, 100.0f, 100.0f}, Size{100.0f, 150.0f});
    REQUIRE(f.adapter.compute_layout(f.tree, Size{800.0f, 600.0f}));
    REQUIRE(f.tree.find(id("panel"))->scroll.y == 50.0f);
}

TEST_CASE("onlayout fires once per changed node", "[ui][layout]") {
    LayoutFixture f;
    InteractionState state;
    SelectionManager selection;
    EventDispatcher dispatcher(f.tree, state, selection, f.metrics);

    int panel_events = 0;
    std::uint64_t last_generation = 0;
    REQUIRE(f.tree.set_handler(id("panel"), EventKind::Layout, [&](Event& event) {
        ++panel_events;
        last_generation = event.layout()->generation;
    }));

    // onlayout does not bubble: the root handler never sees the panel
    int root_events = 0;
    REQUIRE(f.tree.set_handler(id("root"), EventKind::Layout, [&](Event& event) {
        REQUIRE(event.target == id("root"));
        ++root_events;
    }));

    auto first = f.adapter.compute_layout(f.tree, Size{800.0f, 600.0f});
    REQUIRE(first);
    dispatcher.dispatch_layout(*first);
    REQUIRE(panel_events == 1);
    REQUIRE(root_events == 1);
    REQUIRE(last_generation == first->generation);

    auto second = f.adapter.compute_layout(f.tree, Size{800.0f, 600.0f});
    REQUIRE(second);
    dispatcher.dispatch_layout(*second);
    REQUIRE(panel_events == 1);

    f.engine.place(id("panel"), Rect{10.0f, 20.0f, 300.0f, 100.0f});
    auto third = f.adapter.compute_layout(f.tree, Size{800.0f, 600.0f});
    REQUIRE(third);
    dispatcher.dispatch_layout(*third);
    REQUIRE(panel_events == 2);
    REQUIRE(last_generation == 3);
    REQUIRE(root_events == 1);
}
