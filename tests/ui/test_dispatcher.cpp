/// @file test_dispatcher.cpp
/// @brief Tests for event dispatch and the interaction state machine

#include <catch2/catch_test_macros.hpp>

#include <arbor/ui/dispatcher.hpp>
#include <arbor/ui/interaction.hpp>
#include <arbor/ui/layout.hpp>
#include <arbor/ui/selection.hpp>
#include <arbor/ui/text.hpp>
#include <arbor/ui/tree.hpp>

#include "../support/scripted_layout_engine.hpp"

#include <algorithm>
#include <map>
#include <string>
#include <vector>

using namespace arbor_ui;
using arbor_test::ScriptedLayoutEngine;

namespace {

NodeId id(const char* name) {
    return NodeId::from_name(name);
}

const char* const NAMES[] = {
    "root", "a", "b", "draggable", "hello", "world", "field", "field.text", "scroller", "row",
};

//  root (0,0 800x600)
//  ├── a          focusable (10,10 100x30)
//  ├── b          focusable (10,50 100x30)
//  ├── draggable  (200,10 100x100)
//  ├── hello      text "Hello" (0,200 40x16)
//  ├── world      text "World" (0,220 40x16)
//  ├── field      editable (300,300 200x20)
//  │   └── field.text  text "abc" (0,0 24x16)
//  └── scroller   clipped (500,0 100x100), content 100x400
//      └── row    (0,0 100x400)
struct DispatchFixture {
    NodeTree tree;
    DefaultStyleResolver styles;
    MonospaceTextMetrics metrics;
    ScriptedLayoutEngine engine;
    LayoutAdapter adapter{engine, metrics};
    InteractionState state;
    SelectionManager selection;
    EventDispatcher dispatcher{tree, state, selection, metrics};

    std::map<NodeId, std::string> names;
    std::vector<std::string> log;
    std::vector<Event> events;
    int mouse_moves = 0;

    DispatchFixture() {
        for (const char* name : NAMES) {
            names[id(name)] = name;
        }

        auto desc = NodeDesc::container(id("root"), {
            NodeDesc::container(id("a")).with_focusable(),
            NodeDesc::container(id("b")).with_focusable(),
            NodeDesc::container(id("draggable")),
            NodeDesc::text_run(id("hello"), "Hello"),
            NodeDesc::text_run(id("world"), "World"),
            NodeDesc::container(id("field"), {NodeDesc::text_run(id("field.text"), "abc")}).with_editable(),
            NodeDesc::container(id("scroller"), {NodeDesc::container(id("row"))}).with_clip(),
        });
        REQUIRE(tree.reconcile(desc, styles));

        for (const char* name : NAMES) {
            for (std::size_t i = 0; i < EVENT_KIND_COUNT; ++i) {
                REQUIRE(tree.set_handler(id(name), static_cast<EventKind>(i), [this](Event& event) {
                    record(event);
                }));
            }
        }

        engine.place(id("a"), Rect{10.0f, 10.0f, 100.0f, 30.0f});
        engine.place(id("b"), Rect{10.0f, 50.0f, 100.0f, 30.0f});
        engine.place(id("draggable"), Rect{200.0f, 10.0f, 100.0f, 100.0f});
        engine.place(id("hello"), Rect{0.0f, 200.0f, 40.0f, 16.0f});
        engine.place(id("world"), Rect{0.0f, 220.0f, 40.0f, 16.0f});
        engine.place(id("field"), Rect{300.0f, 300.0f, 200.0f, 20.0f});
        engine.place(id("field.text"), Rect{0.0f, 0.0f, 24.0f, 16.0f});
        engine.place(id("scroller"), Rect{500.0f, 0.0f, 100.0f, 100.0f}, Size{100.0f, 400.0f});
        engine.place(id("row"), Rect{0.0f, 0.0f, 100.0f, 400.0f});
        REQUIRE(adapter.compute_layout(tree, Size{800.0f, 600.0f}));
    }

    /// Log each event once, at its target
    void record(Event& event) {
        if (event.current_target != event.target) {
            return;
        }
        if (event.kind == EventKind::MouseMove) {
            ++mouse_moves;
            return;
        }
        log.push_back(std::string(event_kind_name(event.kind)) + " " + names[event.target]);
        events.push_back(event);
    }

    void click(Point p) {
        dispatcher.pointer_down(p);
        dispatcher.pointer_up(p);
    }

    [[nodiscard]] std::size_t count(const std::string& entry) const {
        return static_cast<std::size_t>(std::count(log.begin(), log.end(), entry));
    }
};

} // anonymous namespace

TEST_CASE("Focus moves with pointer presses", "[ui][dispatcher][focus]") {
    DispatchFixture f;

    f.click(Point{20.0f, 20.0f});
    REQUIRE(f.state.focused == id("a"));

    f.click(Point{20.0f, 60.0f});
    REQUIRE(f.state.focused == id("b"));

    REQUIRE(f.log == std::vector<std::string>{
        "onfocus a", "onclick a",
        "onblur a", "onfocus b", "onclick b",
    });

    SECTION("Pressing a non-focusable area keeps focus") {
        f.click(Point{700.0f, 500.0f});
        REQUIRE(f.state.focused == id("b"));
        REQUIRE(f.count("onblur b") == 0);
    }

    SECTION("Text runs do not take focus") {
        REQUIRE_FALSE(f.dispatcher.set_focus(id("hello")));
        REQUIRE(f.state.focused == id("b"));
    }

    SECTION("Programmatic focus and clear") {
        REQUIRE(f.dispatcher.set_focus(id("a")));
        f.dispatcher.clear_focus();
        REQUIRE_FALSE(f.state.focused.has_value());
        REQUIRE(f.log.back() == "onblur a");
    }

    SECTION("Only the left button presses") {
        f.dispatcher.pointer_down(Point{20.0f, 20.0f}, PointerButton::Right);
        REQUIRE(f.state.focused == id("b"));
        REQUIRE_FALSE(f.state.pressed.has_value());
    }
}

TEST_CASE("Blur handler may redirect focus", "[ui][dispatcher][focus]") {
    DispatchFixture f;
    REQUIRE(f.dispatcher.set_focus(id("a")));

    REQUIRE(f.tree.set_handler(id("a"), EventKind::Blur, [&f](Event&) {
        f.log.push_back("onblur a");
        REQUIRE(f.dispatcher.set_focus(id("field")));
    }));

    REQUIRE(f.dispatcher.set_focus(id("b")));
    REQUIRE(f.state.focused == id("field"));
    REQUIRE(f.count("onfocus b") == 0);
    REQUIRE(f.count("onblur b") == 0);
    REQUIRE(f.count("onfocus field") == 1);

    SECTION("Blur and focus stay paired") {
        std::vector<std::string> transitions;
        for (const auto& entry : f.log) {
            if (entry.rfind("onfocus", 0) == 0 || entry.rfind("onblur", 0) == 0) {
                transitions.push_back(entry);
            }
        }
        REQUIRE(transitions == std::vector<std::string>{"onfocus a", "onblur a", "onfocus field"});
    }

    SECTION("Leaving the redirected node blurs it once") {
        REQUIRE(f.dispatcher.set_focus(id("b")));
        REQUIRE(f.state.focused == id("b"));
        REQUIRE(f.count("onblur field") == 1);
        REQUIRE(f.count("onfocus b") == 1);
    }
}

TEST_CASE("Click and drag are exclusive", "[ui][dispatcher][drag]") {
    DispatchFixture f;

    SECTION("Small movement still clicks") {
        f.dispatcher.pointer_down(Point{210.0f, 20.0f});
        f.dispatcher.pointer_move(Point{212.0f, 21.0f});
        f.dispatcher.pointer_up(Point{212.0f, 21.0f});

        REQUIRE(f.count("onclick draggable") == 1);
        REQUIRE(f.count("ondrag draggable") == 0);
    }

    SECTION("Crossing the threshold drags instead") {
        f.dispatcher.pointer_down(Point{210.0f, 20.0f});
        f.dispatcher.pointer_move(Point{220.0f, 20.0f});
        REQUIRE(f.state.dragging.has_value());
        f.dispatcher.pointer_move(Point{230.0f, 25.0f});
        f.dispatcher.pointer_up(Point{230.0f, 25.0f});

        REQUIRE(f.count("ondrag draggable") == 2);
        REQUIRE(f.count("onclick draggable") == 0);
        REQUIRE_FALSE(f.state.dragging.has_value());

        const PointerPayload* first = f.events[0].pointer();
        REQUIRE(first != nullptr);
        REQUIRE(first->delta == Point{10.0f, 0.0f});
        REQUIRE(first->origin == Point{210.0f, 20.0f});
        REQUIRE(f.events[1].pointer()->delta == Point{10.0f, 5.0f});
    }

    SECTION("Drag continues outside the pressed node") {
        f.dispatcher.pointer_down(Point{210.0f, 20.0f});
        f.dispatcher.pointer_move(Point{700.0f, 500.0f});
        REQUIRE(f.count("ondrag draggable") == 1);
    }

    SECTION("Release outside the pressed node does not click") {
        f.dispatcher.pointer_down(Point{210.0f, 20.0f});
        f.dispatcher.pointer_up(Point{20.0f, 20.0f});
        REQUIRE(f.count("onclick draggable") == 0);
        REQUIRE(f.count("onclick a") == 0);
    }

    SECTION("Configured threshold") {
        f.dispatcher.set_config(DispatchConfig{20.0f, 30.0f});
        f.dispatcher.pointer_down(Point{210.0f, 20.0f});
        f.dispatcher.pointer_move(Point{220.0f, 20.0f});
        f.dispatcher.pointer_up(Point{220.0f, 20.0f});
        REQUIRE(f.count("ondrag draggable") == 0);
        REQUIRE(f.count("onclick draggable") == 1);
    }
}

TEST_CASE("Pointer moves update hover", "[ui][dispatcher]") {
    DispatchFixture f;

    f.dispatcher.pointer_move(Point{250.0f, 50.0f});
    REQUIRE(f.state.hovered == id("draggable"));
    f.dispatcher.pointer_move(Point{20.0f, 20.0f});
    REQUIRE(f.state.hovered == id("a"));
    f.dispatcher.pointer_move(Point{900.0f, 900.0f});
    REQUIRE_FALSE(f.state.hovered.has_value());

    REQUIRE(f.mouse_moves == 2);
}

TEST_CASE("Selection across text runs", "[ui][dispatcher][selection]") {
    DispatchFixture f;

    // Press after the "H" of Hello, drag to after the "Wor" of World
    f.dispatcher.pointer_down(Point{8.0f, 204.0f});
    REQUIRE(f.selection.mode() == SelectionMode::Collapsed);
    f.dispatcher.pointer_move(Point{24.0f, 224.0f});
    f.dispatcher.pointer_up(Point{24.0f, 224.0f});

    REQUIRE(f.selection.selected_text(f.tree) == "elloWor");
    REQUIRE(f.count("onselect hello") == 1);
    REQUIRE(f.events.back().selection()->text == "elloWor");
    // A selection gesture is not a drag
    REQUIRE(f.count("ondrag hello") == 0);
    REQUIRE(f.count("onclick hello") == 0);

    SECTION("Moving after release changes nothing") {
        f.dispatcher.pointer_move(Point{40.0f, 204.0f});
        REQUIRE(f.selection.selected_text(f.tree) == "elloWor");
        REQUIRE(f.count("onselect hello") == 1);
    }

    SECTION("Pressing elsewhere clears it") {
        f.click(Point{700.0f, 500.0f});
        REQUIRE(f.selection.mode() == SelectionMode::None);
        REQUIRE(f.count("onselect hello") == 2);
        REQUIRE(f.events.back().kind == EventKind::Click);
    }

    SECTION("Dragging between runs in the gap uses the nearest run") {
        f.dispatcher.pointer_down(Point{8.0f, 204.0f});
        f.dispatcher.pointer_move(Point{100.0f, 204.0f});
        REQUIRE(f.selection.selected_text(f.tree) == "ello");
    }

    SECTION("Replaced text clears the selection") {
        f.dispatcher.invalidate_text(id("world"));
        REQUIRE(f.selection.mode() == SelectionMode::None);
    }
}

TEST_CASE("Editing the focused node", "[ui][dispatcher][input]") {
    DispatchFixture f;

    // Caret after the "a"
    f.click(Point{310.0f, 305.0f});
    REQUIRE(f.state.focused == id("field"));
    REQUIRE(f.selection.cursor() == TextPosition{id("field.text"), 1});

    f.dispatcher.text_input("X");
    REQUIRE(f.tree.find(id("field.text"))->text == "aXbc");
    REQUIRE(f.log.back() == "oninput field");
    REQUIRE(f.events.back().input()->value == "aXbc");

    SECTION("Input fires before keydown") {
        f.log.clear();
        f.dispatcher.key_down(Key::Backspace);
        REQUIRE(f.tree.find(id("field.text"))->text == "abc");
        REQUIRE(f.log == std::vector<std::string>{"oninput field", "onkeydown field"});
    }

    SECTION("Caret movement and deletion") {
        f.dispatcher.key_down(Key::End);
        f.dispatcher.key_down(Key::Backspace);
        REQUIRE(f.tree.find(id("field.text"))->text == "aXb");

        f.dispatcher.key_down(Key::Home);
        f.dispatcher.key_down(Key::Delete);
        REQUIRE(f.tree.find(id("field.text"))->text == "Xb");

        f.dispatcher.key_down(Key::Right);
        f.dispatcher.text_input("y");
        REQUIRE(f.tree.find(id("field.text"))->text == "Xyb");
    }

    SECTION("Select all then type replaces the content") {
        f.dispatcher.set_modifiers(static_cast<std::uint32_t>(KeyMod::Control));
        f.dispatcher.key_down(Key::A, "a");
        REQUIRE(f.selection.selected_text(f.tree) == "aXbc");
        REQUIRE(f.count("onselect field.text") == 1);

        f.dispatcher.set_modifiers(0);
        f.dispatcher.text_input("Z");
        REQUIRE(f.tree.find(id("field.text"))->text == "Z");
    }

    SECTION("Shift extends the selection") {
        f.dispatcher.set_modifiers(static_cast<std::uint32_t>(KeyMod::Shift));
        f.dispatcher.key_down(Key::Left);
        f.dispatcher.key_down(Key::Left);
        REQUIRE(f.selection.selected_text(f.tree) == "aX");
        f.dispatcher.key_down(Key::Backspace);
        REQUIRE(f.tree.find(id("field.text"))->text == "bc");
    }

    SECTION("Key events carry modifiers") {
        f.dispatcher.set_modifiers(static_cast<std::uint32_t>(KeyMod::Alt));
        f.dispatcher.key_up(Key::Q);
        REQUIRE(f.log.back() == "onkeyup field");
        REQUIRE(has_mod(f.events.back().key()->modifiers, KeyMod::Alt));
    }
}

TEST_CASE("Keys without focus are dropped", "[ui][dispatcher][input]") {
    DispatchFixture f;

    f.dispatcher.key_down(Key::A, "a");
    f.dispatcher.text_input("hi");
    f.dispatcher.key_up(Key::A);
    REQUIRE(f.log.empty());

    SECTION("Non-editable focus holders get keys but no edits") {
        REQUIRE(f.dispatcher.set_focus(id("a")));
        f.dispatcher.key_down(Key::Backspace);
        REQUIRE(f.log.back() == "onkeydown a");
        REQUIRE(f.count("oninput a") == 0);
    }
}

TEST_CASE("Wheel scrolling", "[ui][dispatcher][scroll]") {
    DispatchFixture f;
    f.dispatcher.pointer_move(Point{550.0f, 50.0f});
    const Node* scroller = f.tree.find(id("scroller"));

    f.dispatcher.scroll(Point{0.0f, -1.0f});
    REQUIRE(scroller->scroll.y == 30.0f);

    f.dispatcher.scroll(Point{0.0f, 15.0f}, true);
    REQUIRE(scroller->scroll.y == 45.0f);

    // Shift turns vertical wheel motion horizontal; there is no horizontal room
    f.dispatcher.set_modifiers(static_cast<std::uint32_t>(KeyMod::Shift));
    f.dispatcher.scroll(Point{0.0f, -1.0f});
    REQUIRE(scroller->scroll == Point{0.0f, 45.0f});

    f.dispatcher.set_modifiers(0);
    f.dispatcher.scroll(Point{0.0f, -100.0f});
    REQUIRE(scroller->scroll.y == 300.0f);

    SECTION("Outside any scroll container nothing moves") {
        f.dispatcher.pointer_move(Point{20.0f, 20.0f});
        f.dispatcher.scroll(Point{0.0f, 5.0f});
        REQUIRE(scroller->scroll.y == 300.0f);
    }
}

TEST_CASE("Window focus loss resets interaction", "[ui][dispatcher][focus]") {
    DispatchFixture f;
    f.dispatcher.pointer_down(Point{20.0f, 20.0f});
    f.dispatcher.set_modifiers(static_cast<std::uint32_t>(KeyMod::Shift));

    f.dispatcher.window_focus_lost();
    REQUIRE_FALSE(f.state.focused.has_value());
    REQUIRE_FALSE(f.state.pressed.has_value());
    REQUIRE(f.state.modifiers == 0);
    REQUIRE(f.log.back() == "onblur a");

    f.dispatcher.pointer_up(Point{20.0f, 20.0f});
    REQUIRE(f.count("onclick a") == 0);
}

TEST_CASE("Destroyed nodes are forgotten silently", "[ui][dispatcher]") {
    DispatchFixture f;
    f.click(Point{20.0f, 20.0f});
    f.dispatcher.pointer_down(Point{20.0f, 20.0f});
    f.log.clear();

    f.dispatcher.forget(id("a"));
    REQUIRE_FALSE(f.state.focused.has_value());
    REQUIRE_FALSE(f.state.pressed.has_value());
    REQUIRE(f.log.empty());
}

TEST_CASE("Event propagation", "[ui][dispatcher][events]") {
    NodeTree tree;
    DefaultStyleResolver styles;
    MonospaceTextMetrics metrics;
    InteractionState state;
    SelectionManager selection;
    EventDispatcher dispatcher(tree, state, selection, metrics);
    std::vector<std::string> order;

    auto desc = NodeDesc::container(NodeId::from_name("outer"), {
        NodeDesc::container(NodeId::from_name("inner"))
            .on(EventKind::Click, [&order](Event& e) {
                REQUIRE(e.phase == EventPhase::Target);
                order.push_back("inner");
            }),
    });
    desc.on_capture(EventKind::Click, [&order](Event& e) {
        REQUIRE(e.phase == EventPhase::Capture);
        order.push_back("outer capture");
    });
    desc.on(EventKind::Click, [&order](Event& e) {
        REQUIRE(e.phase == EventPhase::Bubble);
        REQUIRE(e.target == NodeId::from_name("inner"));
        REQUIRE(e.current_target == NodeId::from_name("outer"));
        order.push_back("outer");
    });
    desc.on(EventKind::Focus, [&order](Event&) { order.push_back("outer focus"); });
    REQUIRE(tree.reconcile(desc, styles));
    NodeId inner = NodeId::from_name("inner");

    SECTION("Capture, target, bubble") {
        REQUIRE(dispatcher.dispatch(EventKind::Click, inner) == 3);
        REQUIRE(order == std::vector<std::string>{"outer capture", "inner", "outer"});
    }

    SECTION("stop_propagation ends delivery") {
        REQUIRE(tree.set_handler(inner, EventKind::Click, [&order](Event& e) {
            order.push_back("inner");
            e.stop_propagation();
        }));
        REQUIRE(dispatcher.dispatch(EventKind::Click, inner) == 2);
        REQUIRE(order == std::vector<std::string>{"outer capture", "inner"});
    }

    SECTION("Focus does not bubble") {
        REQUIRE(dispatcher.dispatch(EventKind::Focus, inner) == 0);
        REQUIRE(order.empty());
    }

    SECTION("Handlers are fixed when delivery starts") {
        REQUIRE(tree.set_handler(inner, EventKind::Click, [&](Event&) {
            order.push_back("inner");
            REQUIRE(dispatcher.is_dispatching());
            tree.set_handler(NodeId::from_name("outer"), EventKind::Click, nullptr);
        }));
        REQUIRE(dispatcher.dispatch(EventKind::Click, inner) == 3);
        REQUIRE(order.back() == "outer");

        order.clear();
        REQUIRE(dispatcher.dispatch(EventKind::Click, inner) == 2);
        REQUIRE_FALSE(dispatcher.is_dispatching());
    }

    SECTION("Unknown targets are ignored") {
        REQUIRE(dispatcher.dispatch(EventKind::Click, NodeId::from_name("nobody")) == 0);
    }
}

TEST_CASE("Raw input routing", "[ui][dispatcher]") {
    DispatchFixture f;

    f.dispatcher.handle(input::PointerMove{Point{20.0f, 20.0f}});
    f.dispatcher.handle(input::PointerDown{Point{20.0f, 20.0f}, PointerButton::Left});
    f.dispatcher.handle(input::PointerUp{Point{20.0f, 20.0f}, PointerButton::Left});
    f.dispatcher.handle(input::ModifiersChanged{static_cast<std::uint32_t>(KeyMod::Control)});
    f.dispatcher.handle(input::KeyDown{Key::Enter, {}});
    f.dispatcher.handle(input::KeyUp{Key::Enter});

    REQUIRE(f.mouse_moves == 1);
    REQUIRE(f.log == std::vector<std::string>{"onfocus a", "onclick a", "onkeydown a", "onkeyup a"});
    REQUIRE(f.state.modifiers == static_cast<std::uint32_t>(KeyMod::Control));

    f.dispatcher.handle(input::WindowFocusLost{});
    REQUIRE(f.log.back() == "onblur a");
}
