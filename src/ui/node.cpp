/// @file node.cpp
/// @brief NodeDesc builders and attribute lookup

#include <arbor/ui/node.hpp>

namespace arbor_ui {

NodeDesc NodeDesc::container(NodeId id, std::vector<NodeDesc> children) {
    NodeDesc desc;
    desc.id = id;
    desc.kind = NodeKind::Container;
    desc.children = std::move(children);
    return desc;
}

NodeDesc NodeDesc::text_run(NodeId id, std::string text) {
    NodeDesc desc;
    desc.id = id;
    desc.kind = NodeKind::Text;
    desc.text = std::move(text);
    return desc;
}

NodeDesc NodeDesc::image(NodeId id, std::string src) {
    NodeDesc desc;
    desc.id = id;
    desc.kind = NodeKind::Image;
    desc.attributes[ATTR_SRC] = std::move(src);
    return desc;
}

NodeDesc& NodeDesc::with_class(std::string class_string) {
    attributes[ATTR_CLASS] = std::move(class_string);
    return *this;
}

NodeDesc& NodeDesc::with_attribute(std::string key, std::string value) {
    attributes[std::move(key)] = std::move(value);
    return *this;
}

NodeDesc& NodeDesc::with_child(NodeDesc child) {
    children.push_back(std::move(child));
    return *this;
}

NodeDesc& NodeDesc::with_focusable(bool value) {
    focusable = value;
    return *this;
}

NodeDesc& NodeDesc::with_editable(bool value) {
    editable = value;
    return *this;
}

NodeDesc& NodeDesc::with_clip(bool value) {
    clip_to_bounds = value;
    return *this;
}

NodeDesc& NodeDesc::on(EventKind kind, EventHandler handler) {
    handlers[static_cast<std::size_t>(kind)].bubble = std::move(handler);
    return *this;
}

NodeDesc& NodeDesc::on_capture(EventKind kind, EventHandler handler) {
    handlers[static_cast<std::size_t>(kind)].capture = std::move(handler);
    return *this;
}

const std::string* NodeDesc::attribute(const std::string& key) const {
    auto it = attributes.find(key);
    return it != attributes.end() ? &it->second : nullptr;
}

const std::string* Node::attribute(const std::string& key) const {
    auto it = attributes.find(key);
    return it != attributes.end() ? &it->second : nullptr;
}

} // namespace arbor_ui
