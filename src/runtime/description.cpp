/// @file description.cpp
/// @brief JSON description loader

#include <arbor/runtime/description.hpp>
#include <arbor/core/log.hpp>

#include <nlohmann/json.hpp>

#include <fstream>
#include <sstream>

namespace arbor_runtime {

using arbor_core::Err;
using arbor_core::ErrorCode;
using arbor_core::Ok;
using arbor_ui::NodeDesc;

namespace {

// Descriptions nest this deep at most; deeper input is rejected instead of
// exhausting the stack.
constexpr std::size_t MAX_DEPTH = 256;

arbor_core::Result<NodeDesc> fail(const std::string& path, const std::string& message) {
    return Err<NodeDesc>(arbor_core::Error(ErrorCode::ParseError, path + ": " + message));
}

arbor_core::Result<arbor_ui::NodeId> parse_id(const nlohmann::json& value) {
    if (value.is_string()) {
        auto name = value.get<std::string>();
        if (name.empty()) {
            return Err<arbor_ui::NodeId>(arbor_core::Error(ErrorCode::ParseError, "empty id"));
        }
        return Ok(arbor_ui::NodeId::from_name(name));
    }
    if (value.is_number_unsigned() && value.get<std::uint64_t>() != 0) {
        return Ok(arbor_ui::NodeId(value.get<std::uint64_t>()));
    }
    return Err<arbor_ui::NodeId>(arbor_core::Error(ErrorCode::ParseError, "id must be a name or a positive integer"));
}

bool read_flag(const nlohmann::json& j, const char* key, bool& out) {
    if (!j.contains(key)) {
        return true;
    }
    if (!j[key].is_boolean()) {
        return false;
    }
    out = j[key].get<bool>();
    return true;
}

arbor_core::Result<NodeDesc> parse_node(const nlohmann::json& j, const std::string& path, std::size_t depth) {
    if (depth > MAX_DEPTH) {
        return fail(path, "nesting too deep");
    }
    if (!j.is_object()) {
        return fail(path, "expected an object");
    }
    if (!j.contains("id")) {
        return fail(path, "missing 'id'");
    }

    NodeDesc desc;
    auto id = parse_id(j["id"]);
    if (!id) {
        return fail(path, id.error().message());
    }
    desc.id = *id;

    std::string kind = "container";
    if (j.contains("kind")) {
        if (!j["kind"].is_string()) {
            return fail(path, "'kind' must be a string");
        }
        kind = j["kind"].get<std::string>();
    }
    if (kind == "container") {
        desc.kind = arbor_ui::NodeKind::Container;
    } else if (kind == "text") {
        desc.kind = arbor_ui::NodeKind::Text;
    } else if (kind == "image") {
        desc.kind = arbor_ui::NodeKind::Image;
    } else {
        return fail(path, "unknown kind '" + kind + "'");
    }

    if (j.contains("attributes")) {
        const auto& attrs = j["attributes"];
        if (!attrs.is_object()) {
            return fail(path, "'attributes' must be an object");
        }
        for (auto it = attrs.begin(); it != attrs.end(); ++it) {
            desc.attributes[it.key()] = it.value().is_string() ? it.value().get<std::string>() : it.value().dump();
        }
    }

    if (j.contains("text")) {
        if (!j["text"].is_string()) {
            return fail(path, "'text' must be a string");
        }
        desc.text = j["text"].get<std::string>();
    }

    if (!read_flag(j, "focusable", desc.focusable)) {
        return fail(path, "'focusable' must be a boolean");
    }
    if (!read_flag(j, "editable", desc.editable)) {
        return fail(path, "'editable' must be a boolean");
    }
    if (!read_flag(j, "clip", desc.clip_to_bounds)) {
        return fail(path, "'clip' must be a boolean");
    }

    if (j.contains("children")) {
        const auto& children = j["children"];
        if (!children.is_array()) {
            return fail(path, "'children' must be an array");
        }
        desc.children.reserve(children.size());
        for (std::size_t i = 0; i < children.size(); ++i) {
            auto child = parse_node(children[i], path + ".children[" + std::to_string(i) + "]", depth + 1);
            if (!child) {
                return child;
            }
            desc.children.push_back(std::move(*child));
        }
    }

    return Ok(std::move(desc));
}

} // anonymous namespace

arbor_core::Result<NodeDesc> parse_description(const std::string& json_text) {
    nlohmann::json root;
    try {
        root = nlohmann::json::parse(json_text);
    } catch (const nlohmann::json::parse_error& e) {
        return Err<NodeDesc>(arbor_core::Error(ErrorCode::ParseError, e.what()));
    }
    return parse_node(root, "root", 0);
}

arbor_core::Result<NodeDesc> load_description(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        return Err<NodeDesc>(arbor_core::Error(ErrorCode::IOError, "Failed to open " + path.string()));
    }
    std::stringstream buffer;
    buffer << file.rdbuf();

    auto desc = parse_description(buffer.str());
    if (!desc) {
        arbor_core::runtime_logger()->warn("Description {} rejected: {}", path.string(), desc.error().message());
        desc.error().with_context("file", path.string());
    }
    return desc;
}

} // namespace arbor_runtime
