/// @file test_scrollbar.cpp
/// @brief Tests for scrollbar geometry and thumb dragging

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <arbor/ui/dispatcher.hpp>
#include <arbor/ui/hit_test.hpp>
#include <arbor/ui/layout.hpp>
#include <arbor/ui/text.hpp>
#include <arbor/ui/tree.hpp>

#include "../support/scripted_layout_engine.hpp"

using namespace arbor_ui;
using arbor_test::ScriptedLayoutEngine;
using Catch::Approx;

namespace {

NodeId id(const char* name) {
    return NodeId::from_name(name);
}

/// "scroll" gives Overflow::Scroll, "hidden" gives Overflow::Hidden
class OverflowStyles : public StyleResolver {
public:
    Style resolve(const std::string& class_string) const override {
        Style style;
        if (class_string == "scroll") {
            style.overflow = Overflow::Scroll;
        } else if (class_string == "hidden") {
            style.overflow = Overflow::Hidden;
        }
        return style;
    }
};

//  root (0,0 800x600)
//  ├── list    scroll (100,100 100x200), content 100x800
//  │   └── item       (0,0 100x800)
//  ├── wide    scroll (300,100 100x100), content 400x400
//  └── hidden  hidden (500,100 100x100), content 100x400
struct ScrollFixture {
    NodeTree tree;
    OverflowStyles styles;
    MonospaceTextMetrics metrics;
    ScriptedLayoutEngine engine;
    LayoutAdapter adapter{engine, metrics};
    InteractionState state;
    SelectionManager selection;
    EventDispatcher dispatcher{tree, state, selection, metrics};

    int clicks = 0;
    int drags = 0;

    ScrollFixture() {
        auto desc = NodeDesc::container(id("root"), {
            NodeDesc::container(id("list"), {NodeDesc::container(id("item")).with_focusable()}).with_class("scroll"),
            NodeDesc::container(id("wide")).with_class("scroll"),
            NodeDesc::container(id("hidden")).with_class("hidden"),
        });
        REQUIRE(tree.reconcile(desc, styles));

        for (const char* name : {"list", "item"}) {
            REQUIRE(tree.set_handler(id(name), EventKind::Click, [this](Event& event) {
                if (event.current_target == event.target) {
                    ++clicks;
                }
            }));
            REQUIRE(tree.set_handler(id(name), EventKind::Drag, [this](Event& event) {
                if (event.current_target == event.target) {
                    ++drags;
                }
            }));
        }

        engine.place(id("list"), Rect{100.0f, 100.0f, 100.0f, 200.0f}, Size{100.0f, 800.0f});
        engine.place(id("item"), Rect{0.0f, 0.0f, 100.0f, 800.0f});
        engine.place(id("wide"), Rect{300.0f, 100.0f, 100.0f, 100.0f}, Size{400.0f, 400.0f});
        engine.place(id("hidden"), Rect{500.0f, 100.0f, 100.0f, 100.0f}, Size{100.0f, 400.0f});
        REQUIRE(adapter.compute_layout(tree, Size{800.0f, 600.0f}));
    }

    [[nodiscard]] float scroll_y(const char* name) const {
        return tree.find(id(name))->scroll.y;
    }
};

} // anonymous namespace

TEST_CASE("Scrollbar geometry", "[ui][hit_test][scrollbar]") {
    ScrollFixture f;
    HitTester tester(f.tree);

    SECTION("Vertical bar along the right edge") {
        auto bar = tester.scrollbar(id("list"), ScrollAxis::Vertical);
        REQUIRE(bar.has_value());
        REQUIRE(bar->track == Rect{190.0f, 100.0f, 10.0f, 200.0f});
        REQUIRE(bar->thumb == Rect{190.0f, 100.0f, 10.0f, 50.0f});
        REQUIRE(bar->scroll_per_pixel == Approx(4.0f));
    }

    SECTION("Thumb follows the scroll offset") {
        REQUIRE(f.tree.set_scroll(id("list"), Point{0.0f, 300.0f}));
        auto bar = tester.scrollbar(id("list"), ScrollAxis::Vertical);
        REQUIRE(bar->thumb.y == Approx(175.0f));
    }

    SECTION("No bar on an axis without overflow") {
        REQUIRE_FALSE(tester.scrollbar(id("list"), ScrollAxis::Horizontal).has_value());
    }

    SECTION("Clipping alone does not add bars") {
        REQUIRE_FALSE(tester.scrollbar(id("hidden"), ScrollAxis::Vertical).has_value());
        REQUIRE_FALSE(tester.scrollbar(id("item"), ScrollAxis::Vertical).has_value());
    }

    SECTION("Both bars leave the corner free") {
        auto vertical = tester.scrollbar(id("wide"), ScrollAxis::Vertical);
        auto horizontal = tester.scrollbar(id("wide"), ScrollAxis::Horizontal);
        REQUIRE(vertical->track == Rect{390.0f, 100.0f, 10.0f, 90.0f});
        REQUIRE(horizontal->track == Rect{300.0f, 190.0f, 90.0f, 10.0f});
    }

    SECTION("Zero width hides the bars") {
        f.tree.find(id("list"))->style.scrollbar_width = 0.0f;
        REQUIRE_FALSE(tester.scrollbar(id("list"), ScrollAxis::Vertical).has_value());
    }

    SECTION("Lookup by point") {
        auto bar = tester.scrollbar_at(Point{195.0f, 120.0f});
        REQUIRE(bar.has_value());
        REQUIRE(bar->node == id("list"));
        REQUIRE(bar->axis == ScrollAxis::Vertical);

        auto bottom = tester.scrollbar_at(Point{320.0f, 195.0f});
        REQUIRE(bottom.has_value());
        REQUIRE(bottom->axis == ScrollAxis::Horizontal);

        REQUIRE_FALSE(tester.scrollbar_at(Point{150.0f, 120.0f}).has_value());
        REQUIRE_FALSE(tester.scrollbar_at(Point{700.0f, 500.0f}).has_value());
    }
}

TEST_CASE("Scrollbar thumb dragging", "[ui][dispatcher][scrollbar]") {
    ScrollFixture f;

    SECTION("Dragging the thumb scrolls proportionally and clamps") {
        f.dispatcher.pointer_down(Point{195.0f, 110.0f});
        REQUIRE(f.state.scrollbar_drag.has_value());

        f.dispatcher.pointer_move(Point{195.0f, 135.0f});
        REQUIRE(f.scroll_y("list") == Approx(100.0f));

        f.dispatcher.pointer_move(Point{195.0f, 1000.0f});
        REQUIRE(f.scroll_y("list") == Approx(600.0f));

        f.dispatcher.pointer_move(Point{195.0f, 110.0f});
        REQUIRE(f.scroll_y("list") == Approx(0.0f));

        f.dispatcher.pointer_up(Point{195.0f, 110.0f});
        REQUIRE_FALSE(f.state.scrollbar_drag.has_value());
        REQUIRE(f.clicks == 0);
        REQUIRE(f.drags == 0);
        REQUIRE_FALSE(f.state.focused.has_value());
    }

    SECTION("Pressing the track jumps then keeps the thumb grabbed") {
        f.dispatcher.pointer_down(Point{195.0f, 250.0f});
        REQUIRE(f.scroll_y("list") == Approx(500.0f));

        f.dispatcher.pointer_move(Point{195.0f, 260.0f});
        REQUIRE(f.scroll_y("list") == Approx(540.0f));

        f.dispatcher.pointer_up(Point{195.0f, 260.0f});
        REQUIRE(f.clicks == 0);
    }

    SECTION("Moves after release no longer scroll") {
        f.dispatcher.pointer_down(Point{195.0f, 110.0f});
        f.dispatcher.pointer_up(Point{195.0f, 110.0f});
        f.dispatcher.pointer_move(Point{195.0f, 200.0f});
        REQUIRE(f.scroll_y("list") == Approx(0.0f));
    }

    SECTION("Presses beside the bar keep their normal meaning") {
        f.dispatcher.pointer_down(Point{150.0f, 120.0f});
        f.dispatcher.pointer_up(Point{150.0f, 120.0f});
        REQUIRE(f.clicks == 1);
        REQUIRE(f.state.focused == id("item"));
        REQUIRE(f.scroll_y("list") == Approx(0.0f));
    }

    SECTION("Wheel and thumb share the clamp") {
        f.dispatcher.pointer_move(Point{150.0f, 150.0f});
        f.dispatcher.scroll(Point{0.0f, -1.0f});
        REQUIRE(f.scroll_y("list") == Approx(30.0f));

        auto bar = HitTester(f.tree).scrollbar(id("list"), ScrollAxis::Vertical);
        REQUIRE(bar->thumb.y == Approx(107.5f));
    }

    SECTION("Losing window focus releases the thumb") {
        f.dispatcher.pointer_down(Point{195.0f, 110.0f});
        f.dispatcher.window_focus_lost();
        REQUIRE_FALSE(f.state.scrollbar_drag.has_value());
    }

    SECTION("Destroying the node releases the thumb") {
        f.dispatcher.pointer_down(Point{195.0f, 110.0f});
        f.dispatcher.forget(id("list"));
        REQUIRE_FALSE(f.state.scrollbar_drag.has_value());
    }

    SECTION("Content that stops overflowing releases the thumb") {
        f.dispatcher.pointer_down(Point{195.0f, 110.0f});
        f.engine.place(id("list"), Rect{100.0f, 100.0f, 100.0f, 200.0f}, Size{100.0f, 200.0f});
        f.engine.place(id("item"), Rect{0.0f, 0.0f, 100.0f, 200.0f});
        f.tree.mark_layout_dirty();
        REQUIRE(f.adapter.compute_layout(f.tree, Size{800.0f, 600.0f}));

        f.dispatcher.pointer_move(Point{195.0f, 150.0f});
        REQUIRE_FALSE(f.state.scrollbar_drag.has_value());
        REQUIRE(f.scroll_y("list") == Approx(0.0f));
    }
}
