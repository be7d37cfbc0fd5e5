/// @file selection.cpp
/// @brief SelectionManager implementation

#include <arbor/ui/selection.hpp>
#include <arbor/ui/text.hpp>
#include <arbor/ui/tree.hpp>

#include <algorithm>

namespace arbor_ui {

void SelectionManager::set_anchor(TextPosition anchor) {
    m_anchor = anchor;
    m_cursor = anchor;
}

void SelectionManager::set_cursor(TextPosition cursor) {
    if (!m_anchor) {
        m_anchor = cursor;
    }
    m_cursor = cursor;
}

void SelectionManager::set(TextPosition anchor, TextPosition cursor) {
    m_anchor = anchor;
    m_cursor = cursor;
}

void SelectionManager::clear() {
    m_anchor.reset();
    m_cursor.reset();
}

SelectionMode SelectionManager::mode() const {
    if (!m_anchor) {
        return SelectionMode::None;
    }
    if (!m_cursor || *m_cursor == *m_anchor) {
        return SelectionMode::Collapsed;
    }
    return SelectionMode::Range;
}

bool SelectionManager::references(NodeId id) const {
    return (m_anchor && m_anchor->node == id) || (m_cursor && m_cursor->node == id);
}

std::optional<SelectionManager::Span> SelectionManager::normalized(const std::vector<NodeId>& runs) const {
    if (!m_anchor) {
        return std::nullopt;
    }
    TextPosition cursor = m_cursor.value_or(*m_anchor);

    auto anchor_it = std::find(runs.begin(), runs.end(), m_anchor->node);
    auto cursor_it = std::find(runs.begin(), runs.end(), cursor.node);
    if (anchor_it == runs.end() || cursor_it == runs.end()) {
        return std::nullopt;
    }

    auto a = std::make_pair(static_cast<std::size_t>(anchor_it - runs.begin()), m_anchor->offset);
    auto c = std::make_pair(static_cast<std::size_t>(cursor_it - runs.begin()), cursor.offset);
    if (c < a) {
        std::swap(a, c);
    }
    return Span{a.first, a.second, c.first, c.second};
}

std::string SelectionManager::selected_text(const NodeTree& tree) const {
    auto runs = tree.text_runs();
    auto span = normalized(runs);
    if (!span) {
        return {};
    }

    std::string text;
    for (std::size_t i = span->first_run; i <= span->last_run; ++i) {
        const std::string& content = tree.find(runs[i])->text;
        std::size_t length = utf8::length(content);
        std::size_t begin = i == span->first_run ? std::min(span->first_offset, length) : 0;
        std::size_t end = i == span->last_run ? std::min(span->last_offset, length) : length;
        text += utf8::substr(content, begin, end);
    }
    return text;
}

std::optional<std::pair<std::size_t, std::size_t>> SelectionManager::range_in(
    const NodeTree& tree, NodeId id) const
{
    auto runs = tree.text_runs();
    auto span = normalized(runs);
    auto it = std::find(runs.begin(), runs.end(), id);
    if (!span || it == runs.end()) {
        return std::nullopt;
    }

    auto index = static_cast<std::size_t>(it - runs.begin());
    if (index < span->first_run || index > span->last_run) {
        return std::nullopt;
    }

    std::size_t length = utf8::length(tree.find(id)->text);
    std::size_t begin = index == span->first_run ? std::min(span->first_offset, length) : 0;
    std::size_t end = index == span->last_run ? std::min(span->last_offset, length) : length;
    return std::make_pair(begin, end);
}

} // namespace arbor_ui
