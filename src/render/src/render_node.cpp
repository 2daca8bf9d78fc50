#include "folio/render/render_node.hpp"

namespace folio::render {

// ============================================================================
// RenderNode
// ============================================================================

std::optional<usize> RenderNode::child_index(const RenderNode& child) const {
    for (usize i = 0; i < m_children.size(); ++i) {
        if (m_children[i].get() == &child) {
            return i;
        }
    }
    return std::nullopt;
}

RenderNode* RenderNode::append_child(std::unique_ptr<RenderNode> child) {
    child->m_parent = this;
    RenderNode* raw = child.get();
    m_children.push_back(std::move(child));
    clear_cache();
    return raw;
}

EditorResult<RenderNode*> RenderNode::insert_child(std::unique_ptr<RenderNode> child, usize index) {
    if (index > m_children.size()) {
        StringBuilder sb;
        sb.append("render insert_child: index ").append(static_cast<u64>(index))
          .append(" exceeds child count of ").append(m_id);
        return out_of_range(sb.build());
    }
    child->m_parent = this;
    RenderNode* raw = child.get();
    m_children.insert(m_children.begin() + static_cast<isize>(index), std::move(child));
    clear_cache();
    return raw;
}

EditorResult<std::unique_ptr<RenderNode>> RenderNode::delete_child(const RenderNode& child) {
    auto index = child_index(child);
    if (!index) {
        StringBuilder sb;
        sb.append("render delete_child: ").append(child.id())
          .append(" is not a child of ").append(m_id);
        return structural_violation(sb.build());
    }
    std::unique_ptr<RenderNode> removed = std::move(m_children[*index]);
    m_children.erase(m_children.begin() + static_cast<isize>(*index));
    removed->m_parent = nullptr;
    clear_cache();
    return removed;
}

std::vector<std::unique_ptr<RenderNode>> RenderNode::take_children() {
    std::vector<std::unique_ptr<RenderNode>> taken = std::move(m_children);
    m_children.clear();
    for (auto& child : taken) {
        child->m_parent = nullptr;
    }
    clear_cache();
    return taken;
}

void RenderNode::clear_children() {
    m_children.clear();
    clear_cache();
}

usize RenderNode::selectable_size() const {
    if (!m_selectable_size) {
        m_selectable_size = compute_selectable_size();
    }
    return *m_selectable_size;
}

usize RenderNode::model_size() const {
    if (!m_model_size) {
        m_model_size = compute_model_size();
    }
    return *m_model_size;
}

void RenderNode::clear_cache() {
    for (RenderNode* node = this; node; node = node->m_parent) {
        node->m_selectable_size.reset();
        node->m_model_size.reset();
    }
}

usize RenderNode::compute_selectable_size() const {
    usize size = 0;
    for (const auto& child : m_children) {
        size += child->selectable_size();
    }
    return size;
}

usize RenderNode::compute_model_size() const {
    usize size = has_delimiters() ? 2 : 0;
    for (const auto& child : m_children) {
        size += child->model_size();
    }
    return size;
}

usize RenderNode::selectable_start() const {
    usize start = 0;
    const RenderNode* node = this;
    while (const RenderNode* parent = node->m_parent) {
        for (const auto& sibling : parent->m_children) {
            if (sibling.get() == node) {
                break;
            }
            start += sibling->selectable_size();
        }
        node = parent;
    }
    return start;
}

EditorResult<usize> RenderNode::convert_selectable_offset_to_model_offset(usize offset) const {
    usize cumulated_selectable = 0;
    usize cumulated_model = has_delimiters() ? 1 : 0;
    for (const auto& child : m_children) {
        usize child_size = child->selectable_size();
        if (offset < cumulated_selectable + child_size) {
            auto child_offset = child->convert_selectable_offset_to_model_offset(offset - cumulated_selectable);
            if (child_offset.is_err()) {
                return make_error(child_offset.error());
            }
            return cumulated_model + child_offset.value();
        }
        cumulated_selectable += child_size;
        cumulated_model += child->model_size();
    }

    StringBuilder sb;
    sb.append("selectable offset ").append(static_cast<u64>(offset))
      .append(" outside ").append(m_id).append(" of size ")
      .append(static_cast<u64>(cumulated_selectable));
    return out_of_range(sb.build());
}

// ============================================================================
// DocRenderNode
// ============================================================================

void DocRenderNode::on_model_updated(const model::Document& doc) {
    m_page = doc.page();
    m_version = doc.version();
}

// ============================================================================
// BlockRenderNode
// ============================================================================

void BlockRenderNode::on_children_updated() {
    auto line_break = std::make_unique<InlineRenderNode>(id() + ":eol", LINE_BREAK_TYPE, false);
    line_break->append_child(AtomicRenderNode::make_line_break(id()));
    append_child(std::move(line_break));
}

// ============================================================================
// InlineRenderNode
// ============================================================================

void InlineRenderNode::set_text(const String& content) {
    clear_children();
    usize index = 0;
    for (auto& word : split_words(content)) {
        StringBuilder sb;
        sb.append(id()).append(':').append(static_cast<u64>(index++));
        append_child(std::make_unique<AtomicRenderNode>(sb.build(), WORD_TYPE, std::move(word), m_style));
    }
}

// ============================================================================
// AtomicRenderNode
// ============================================================================

AtomicRenderNode::AtomicRenderNode(String id, String type, String content, model::TextStyle style)
    : RenderNode(std::move(id), std::move(type))
    , m_content(std::move(content))
    , m_style(std::move(style)) {}

std::unique_ptr<AtomicRenderNode> AtomicRenderNode::make_line_break(const String& block_id) {
    return std::make_unique<AtomicRenderNode>(block_id + ":eol:0", LINE_BREAK_TYPE, String(), model::TextStyle{});
}

usize AtomicRenderNode::trimmed_size() const {
    if (is_line_break()) {
        return 0;
    }
    return m_content.size() - m_content.trailing_whitespace();
}

usize AtomicRenderNode::compute_selectable_size() const {
    return is_line_break() ? 1 : m_content.size();
}

usize AtomicRenderNode::compute_model_size() const {
    return is_line_break() ? 0 : m_content.size();
}

EditorResult<usize> AtomicRenderNode::convert_selectable_offset_to_model_offset(usize offset) const {
    if (offset >= selectable_size()) {
        StringBuilder sb;
        sb.append("selectable offset ").append(static_cast<u64>(offset))
          .append(" outside atomic ").append(id());
        return out_of_range(sb.build());
    }
    // A line break occupies no model span; it sits before the block's closing delimiter
    return is_line_break() ? 0 : offset;
}

std::optional<AtomicHit> find_atomic(const RenderNode& root, usize offset) {
    const RenderNode* node = &root;
    while (node->kind() != RenderKind::Atomic) {
        const RenderNode* next = nullptr;
        usize cumulated = 0;
        for (const auto& child : node->children()) {
            usize size = child->selectable_size();
            if (offset < cumulated + size) {
                next = child.get();
                break;
            }
            cumulated += size;
        }
        if (!next) {
            return std::nullopt;
        }
        node = next;
        offset -= cumulated;
    }
    if (offset >= node->selectable_size()) {
        return std::nullopt;
    }
    return AtomicHit{static_cast<const AtomicRenderNode*>(node), offset};
}

const RenderNode* enclosing(const RenderNode& node, RenderKind kind) {
    for (const RenderNode* current = &node; current; current = current->parent()) {
        if (current->kind() == kind) {
            return current;
        }
    }
    return nullptr;
}

std::vector<String> split_words(const String& text) {
    std::vector<String> words;
    std::string_view view = text.view();
    usize start = 0;
    usize i = 0;
    // Leading whitespace belongs to the first word
    while (i < view.size() && unicode::is_ascii_whitespace(static_cast<unsigned char>(view[i]))) {
        ++i;
    }
    while (i < view.size()) {
        while (i < view.size() && !unicode::is_ascii_whitespace(static_cast<unsigned char>(view[i]))) {
            ++i;
        }
        while (i < view.size() && unicode::is_ascii_whitespace(static_cast<unsigned char>(view[i]))) {
            ++i;
        }
        words.emplace_back(view.substr(start, i - start));
        start = i;
    }
    if (start < view.size()) {
        words.emplace_back(view.substr(start));
    }
    return words;
}

} // namespace folio::render
