/// @file arbor_replay.cpp
/// @brief Replays a scripted input session against a JSON description
///
/// Usage: arbor_replay <description.json> <script.json> [--config=<file>]
///
/// Script format:
/// @code
/// {
///   "viewport": { "width": 800, "height": 600 },
///   "steps": [
///     { "type": "frame" },
///     { "type": "move", "x": 10, "y": 20 },
///     { "type": "down", "x": 10, "y": 20, "button": "left" },
///     { "type": "up", "x": 10, "y": 20 },
///     { "type": "key_down", "key": "backspace" },
///     { "type": "key_up", "key": 259 },
///     { "type": "text", "text": "hi" },
///     { "type": "scroll", "dx": 0, "dy": -1, "pixels": false },
///     { "type": "modifiers", "shift": true, "control": false },
///     { "type": "window_blur" },
///     { "type": "resize", "width": 1024, "height": 768 }
///   ]
/// }
/// @endcode
/// Every semantic event is logged with the node name from the description.

#include <arbor/core/log.hpp>
#include <arbor/runtime/config.hpp>
#include <arbor/runtime/description.hpp>
#include <arbor/runtime/document.hpp>
#include <arbor/yoga/yoga_engine.hpp>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <fstream>
#include <map>
#include <string>
#include <vector>

using namespace arbor_ui;

namespace {

// =============================================================================
// Names
// =============================================================================

void collect_names(const nlohmann::json& node, std::map<NodeId, std::string>& names) {
    if (!node.is_object()) {
        return;
    }
    if (node.contains("id") && node["id"].is_string()) {
        auto name = node["id"].get<std::string>();
        names[NodeId::from_name(name)] = name;
    }
    if (node.contains("children") && node["children"].is_array()) {
        for (const auto& child : node["children"]) {
            collect_names(child, names);
        }
    }
}

std::string describe_payload(const Event& event) {
    return std::visit([](const auto& payload) -> std::string {
        using T = std::decay_t<decltype(payload)>;
        if constexpr (std::is_same_v<T, PointerPayload>) {
            return fmt::format("pos=({}, {}) delta=({}, {})",
                               payload.position.x, payload.position.y, payload.delta.x, payload.delta.y);
        } else if constexpr (std::is_same_v<T, KeyPayload>) {
            return fmt::format("key={} mods={}", static_cast<std::uint32_t>(payload.key), payload.modifiers);
        } else if constexpr (std::is_same_v<T, InputPayload>) {
            return fmt::format("value=\"{}\"", payload.value);
        } else if constexpr (std::is_same_v<T, SelectPayload>) {
            return fmt::format("text=\"{}\"", payload.text);
        } else if constexpr (std::is_same_v<T, LayoutPayload>) {
            return fmt::format("rect=({}, {}, {}, {}) gen={}", payload.rect.x, payload.rect.y,
                               payload.rect.width, payload.rect.height, payload.generation);
        } else {
            return {};
        }
    }, event.payload);
}

/// Attach a logging handler for every event kind to every node
void attach_loggers(NodeDesc& desc, const std::map<NodeId, std::string>& names) {
    for (std::size_t i = 0; i < EVENT_KIND_COUNT; ++i) {
        auto kind = static_cast<EventKind>(i);
        desc.on(kind, [&names](Event& event) {
            if (event.current_target != event.target) {
                return;
            }
            auto it = names.find(event.target);
            std::string name = it != names.end() ? it->second : std::to_string(event.target.value);
            spdlog::info("{} -> {} {}", event_kind_name(event.kind), name, describe_payload(event));
        });
    }
    for (auto& child : desc.children) {
        attach_loggers(child, names);
    }
}

// =============================================================================
// Script
// =============================================================================

Key parse_key(const nlohmann::json& value) {
    if (value.is_number_unsigned()) {
        return static_cast<Key>(value.get<std::uint32_t>());
    }
    static const std::map<std::string, Key> named = {
        {"backspace", Key::Backspace}, {"delete", Key::Delete}, {"enter", Key::Enter},
        {"escape", Key::Escape}, {"tab", Key::Tab}, {"left", Key::Left}, {"right", Key::Right},
        {"up", Key::Up}, {"down", Key::Down}, {"home", Key::Home}, {"end", Key::End},
        {"space", Key::Space},
    };
    auto name = value.get<std::string>();
    if (auto it = named.find(name); it != named.end()) {
        return it->second;
    }
    if (name.size() == 1 && name[0] >= 'a' && name[0] <= 'z') {
        return static_cast<Key>(static_cast<std::uint32_t>(Key::A) + (name[0] - 'a'));
    }
    return Key::Unknown;
}

PointerButton parse_button(const nlohmann::json& step) {
    std::string button = step.value("button", std::string("left"));
    if (button == "right") return PointerButton::Right;
    if (button == "middle") return PointerButton::Middle;
    return PointerButton::Left;
}

arbor_core::Result<void> run_step(arbor_runtime::Document& document, const nlohmann::json& step, Size& viewport) {
    std::string type = step.value("type", std::string());
    Point position{step.value("x", 0.0f), step.value("y", 0.0f)};

    if (type == "frame" || type == "resize") {
        if (type == "resize") {
            viewport = Size{step.value("width", viewport.width), step.value("height", viewport.height)};
        }
        document.wait_for_images();
        auto report = document.frame(viewport);
        if (!report) {
            return arbor_core::Err(report.error());
        }
        spdlog::info("frame: generation {} ({} boxes changed)", report->generation, report->changed.size());
    } else if (type == "move") {
        document.handle_input(input::PointerMove{position});
    } else if (type == "down") {
        document.handle_input(input::PointerDown{position, parse_button(step)});
    } else if (type == "up") {
        document.handle_input(input::PointerUp{position, parse_button(step)});
    } else if (type == "key_down") {
        document.handle_input(input::KeyDown{parse_key(step.at("key")), step.value("text", std::string())});
    } else if (type == "key_up") {
        document.handle_input(input::KeyUp{parse_key(step.at("key"))});
    } else if (type == "text") {
        document.handle_input(input::TextInput{step.value("text", std::string())});
    } else if (type == "scroll") {
        document.handle_input(input::Scroll{Point{step.value("dx", 0.0f), step.value("dy", 0.0f)},
                                            step.value("pixels", false)});
    } else if (type == "modifiers") {
        std::uint32_t mods = 0;
        if (step.value("shift", false)) mods |= static_cast<std::uint32_t>(KeyMod::Shift);
        if (step.value("control", false)) mods |= static_cast<std::uint32_t>(KeyMod::Control);
        if (step.value("alt", false)) mods |= static_cast<std::uint32_t>(KeyMod::Alt);
        if (step.value("super", false)) mods |= static_cast<std::uint32_t>(KeyMod::Super);
        document.handle_input(input::ModifiersChanged{mods});
    } else if (type == "window_blur") {
        document.handle_input(input::WindowFocusLost{});
    } else {
        return arbor_core::Err("unknown step type '" + type + "'");
    }
    return arbor_core::Ok();
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    std::vector<std::string> positional;
    std::string config_path;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg.starts_with("--config=")) {
            config_path = arg.substr(9);
        } else {
            positional.push_back(std::move(arg));
        }
    }
    if (positional.size() != 2) {
        spdlog::error("usage: arbor_replay <description.json> <script.json> [--config=<file>]");
        return 2;
    }

    arbor_runtime::RuntimeConfig config;
    if (!config_path.empty()) {
        auto loaded = arbor_runtime::load_runtime_config(config_path);
        if (!loaded) {
            spdlog::error("{}", arbor_core::build_error_chain(loaded.error()));
            return 1;
        }
        config = std::move(*loaded);
    }
    arbor_core::configure_logging(config.log_config());

    // Names come from the raw JSON; the description loader keeps only hashed ids
    nlohmann::json description_json;
    nlohmann::json script;
    try {
        std::ifstream description_file(positional[0]);
        description_file >> description_json;
        std::ifstream script_file(positional[1]);
        script_file >> script;
    } catch (const nlohmann::json::exception& e) {
        spdlog::error("Failed to read input: {}", e.what());
        return 1;
    }

    auto description = arbor_runtime::parse_description(description_json.dump());
    if (!description) {
        spdlog::error("{}", arbor_core::build_error_chain(description.error()));
        return 1;
    }
    std::map<NodeId, std::string> names;
    collect_names(description_json, names);
    attach_loggers(*description, names);

    arbor_runtime::DocumentServices services;
    services.layout = std::make_shared<arbor_yoga::YogaLayoutEngine>();
    auto document = arbor_runtime::Document::create(std::move(services), config);
    if (!document) {
        spdlog::error("{}", arbor_core::build_error_chain(document.error()));
        return 1;
    }

    auto& doc = **document;
    if (auto applied = doc.update(std::move(*description)); !applied) {
        spdlog::error("{}", arbor_core::build_error_chain(applied.error()));
        return 1;
    }

    Size viewport{800.0f, 600.0f};
    if (script.contains("viewport")) {
        viewport = Size{script["viewport"].value("width", 800.0f), script["viewport"].value("height", 600.0f)};
    }

    const auto steps = script.value("steps", nlohmann::json::array());
    for (std::size_t i = 0; i < steps.size(); ++i) {
        arbor_core::Result<void> result = arbor_core::Ok();
        try {
            result = run_step(doc, steps[i], viewport);
        } catch (const nlohmann::json::exception& e) {
            result = arbor_core::Err(arbor_core::Error(arbor_core::ErrorCode::ParseError, e.what()));
        }
        if (!result) {
            spdlog::error("step {}: {}", i, result.error().message());
            arbor_core::shutdown_logging();
            return 1;
        }
    }

    if (auto selected = doc.selected_text(); !selected.empty()) {
        spdlog::info("selection: \"{}\"", selected);
    }
    arbor_core::shutdown_logging();
    return 0;
}
