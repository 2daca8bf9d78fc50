#include "folio/layout/layout_node.hpp"
#include <cmath>
#include <limits>

namespace folio::layout {

// ============================================================================
// LayoutNode
// ============================================================================

LayoutNode* LayoutNode::append_child(std::unique_ptr<LayoutNode> child) {
    child->m_parent = this;
    child->m_index = m_children.size();
    LayoutNode* raw = child.get();
    m_children.push_back(std::move(child));
    for (LayoutNode* node = this; node; node = node->m_parent) {
        node->m_size.reset();
    }
    return raw;
}

usize LayoutNode::size() const {
    if (!m_size) {
        m_size = compute_size();
    }
    return *m_size;
}

usize LayoutNode::compute_size() const {
    usize size = 0;
    for (const auto& child : m_children) {
        size += child->size();
    }
    return size;
}

usize LayoutNode::boundary_end() const {
    usize node_size = size();
    return node_size == 0 ? 0 : node_size - 1;
}

LayoutNode* LayoutNode::previous_sibling() const {
    if (!m_parent || m_index == 0) {
        return nullptr;
    }
    return m_parent->m_children[m_index - 1].get();
}

LayoutNode* LayoutNode::next_sibling() const {
    if (!m_parent || m_index + 1 >= m_parent->m_children.size()) {
        return nullptr;
    }
    return m_parent->m_children[m_index + 1].get();
}

LayoutNode* LayoutNode::previous_cross_parent_sibling() const {
    if (LayoutNode* sibling = previous_sibling()) {
        return sibling;
    }
    if (!m_parent) {
        return nullptr;
    }
    LayoutNode* uncle = m_parent->previous_cross_parent_sibling();
    while (uncle && uncle->m_children.empty()) {
        uncle = uncle->previous_cross_parent_sibling();
    }
    return uncle ? uncle->m_children.back().get() : nullptr;
}

LayoutNode* LayoutNode::next_cross_parent_sibling() const {
    if (LayoutNode* sibling = next_sibling()) {
        return sibling;
    }
    if (!m_parent) {
        return nullptr;
    }
    LayoutNode* uncle = m_parent->next_cross_parent_sibling();
    while (uncle && uncle->m_children.empty()) {
        uncle = uncle->next_cross_parent_sibling();
    }
    return uncle ? uncle->m_children.front().get() : nullptr;
}

// ============================================================================
// WordLayout
// ============================================================================

WordLayout::WordLayout(String id, String type, String text, model::TextStyle style,
                       std::vector<f32> advances, usize size, usize trimmed_size)
    : LayoutNode(std::move(id), std::move(type))
    , m_text(std::move(text))
    , m_style(std::move(style))
    , m_advances(std::move(advances))
    , m_word_size(size)
    , m_trimmed_size(trimmed_size) {}

f32 WordLayout::caret_x(usize position) const {
    f32 x = 0;
    usize end = std::min(position, m_advances.size());
    for (usize i = 0; i < end; ++i) {
        x += m_advances[i];
    }
    return x;
}

// ============================================================================
// LineLayout
// ============================================================================

const WordLayout& LineLayout::word(usize index) const {
    return static_cast<const WordLayout&>(*children()[index]);
}

f32 LineLayout::caret_x(usize position) const {
    usize cumulated = 0;
    for (const auto& child : children()) {
        const auto& w = static_cast<const WordLayout&>(*child);
        if (position < cumulated + w.size()) {
            return w.rect().x + w.caret_x(position - cumulated);
        }
        cumulated += w.size();
    }
    return width();
}

usize LineLayout::convert_coordinates_to_position(f32 x) const {
    usize best = 0;
    f32 best_distance = std::numeric_limits<f32>::max();
    usize position = 0;
    for (const auto& child : children()) {
        const auto& w = static_cast<const WordLayout&>(*child);
        f32 caret = w.rect().x;
        for (usize i = 0; i < w.size(); ++i, ++position) {
            f32 distance = std::fabs(caret - x);
            if (distance < best_distance) {
                best_distance = distance;
                best = position;
            }
            if (i < w.advances().size()) {
                caret += w.advances()[i];
            }
        }
    }
    return best;
}

// ============================================================================
// PageLayout
// ============================================================================

const LineLayout& PageLayout::line(usize index) const {
    return static_cast<const LineLayout&>(*children()[index]);
}

std::optional<usize> PageLayout::line_at(f32 y) const {
    if (children().empty()) {
        return std::nullopt;
    }
    for (usize i = 0; i < children().size(); ++i) {
        if (y < children()[i]->rect().bottom()) {
            return i;
        }
    }
    return children().size() - 1;
}

// ============================================================================
// DocLayout
// ============================================================================

const PageLayout& DocLayout::page(usize index) const {
    return static_cast<const PageLayout&>(*children()[index]);
}

usize DocLayout::page_start(usize index) const {
    usize start = 0;
    for (usize i = 0; i < index && i < children().size(); ++i) {
        start += children()[i]->size();
    }
    return start;
}

} // namespace folio::layout
