#include "folio/cursor/operation.hpp"

namespace folio::cursor {

namespace {

String offset_text(std::string_view name, usize offset) {
    StringBuilder sb;
    sb.append(name).append("(@").append(static_cast<u64>(offset));
    return sb.build();
}

EditorResult<model::Node*> find_node(model::Document& doc, const String& id) {
    model::Node* node = doc.find_by_id(id);
    if (!node) {
        return invalid_argument(String("no node with id ") + id);
    }
    return node;
}

EditorResult<model::Node*> find_block(model::Document& doc, const String& id) {
    auto node = find_node(doc, id);
    if (node.is_err()) {
        return node;
    }
    if (node.value()->kind() != model::NodeKind::Block) {
        return structural_violation(id + " is not a block");
    }
    return node;
}

// Text leaf ending exactly at a child boundary of parent, if any
model::Text* text_ending_at(model::Node& parent, usize inner) {
    model::Text* found = nullptr;
    usize start = 0;
    for (const auto& child : parent.children()) {
        usize end = start + child->model_size();
        if (end == inner && child->type() == model::Text::TYPE) {
            found = static_cast<model::Text*>(child.get());
        }
        if (end > inner) {
            break;
        }
        start = end;
    }
    return found;
}

usize insertion_index(const model::Node& parent, usize inner) {
    usize index = 0;
    usize start = 0;
    for (const auto& child : parent.children()) {
        start += child->model_size();
        if (start > inner) {
            break;
        }
        ++index;
    }
    return index;
}

} // namespace

// ============================================================================
// InsertText
// ============================================================================

EditorResult<std::unique_ptr<Operation>> InsertText::apply(model::Document& doc) const {
    if (m_text.empty()) {
        return invalid_argument("InsertText: empty text");
    }

    auto resolved = model::resolve_offset(doc, m_offset);
    if (resolved.is_err()) {
        return make_error(resolved.error());
    }
    auto [node, local] = resolved.value();

    if (node->is_leaf()) {
        if (node->type() != model::Text::TYPE) {
            return structural_violation(String("InsertText: leaf ") + node->id() + " does not hold text");
        }
        auto inserted = static_cast<model::Text*>(node)->insert_text(local, m_text);
        if (inserted.is_err()) {
            return make_error(inserted.error());
        }
    } else {
        if (node->kind() == model::NodeKind::Root || local == 0) {
            return invalid_argument(offset_text("InsertText: no text position at ", m_offset) + ")");
        }
        usize inner = local - 1;
        if (model::Text* text = text_ending_at(*node, inner)) {
            auto inserted = text->insert_text(text->content().size(), m_text);
            if (inserted.is_err()) {
                return make_error(inserted.error());
            }
        } else {
            auto leaf = std::make_unique<model::Text>(model::generate_id("t"), m_text);
            auto attached = node->insert_child(std::move(leaf), insertion_index(*node, inner));
            if (attached.is_err()) {
                return make_error(attached.error());
            }
        }
    }

    doc.bump_version();
    return std::unique_ptr<Operation>(std::make_unique<DeleteText>(m_offset, m_text.size()));
}

String InsertText::describe() const {
    return offset_text("InsertText", m_offset) + ", \"" + m_text + "\")";
}

// ============================================================================
// DeleteText
// ============================================================================

EditorResult<std::unique_ptr<Operation>> DeleteText::apply(model::Document& doc) const {
    if (m_length == 0) {
        return invalid_argument("DeleteText: empty range");
    }

    auto resolved = model::resolve_offset(doc, m_offset);
    if (resolved.is_err()) {
        return make_error(resolved.error());
    }
    auto [node, local] = resolved.value();
    if (node->type() != model::Text::TYPE) {
        return invalid_argument(offset_text("DeleteText: no text leaf at ", m_offset) + ")");
    }

    auto removed = static_cast<model::Text*>(node)->delete_text(local, m_length);
    if (removed.is_err()) {
        return make_error(removed.error());
    }

    doc.bump_version();
    return std::unique_ptr<Operation>(std::make_unique<InsertText>(m_offset, std::move(removed).value()));
}

String DeleteText::describe() const {
    StringBuilder sb;
    sb.append(offset_text("DeleteText", m_offset)).append(", ").append(static_cast<u64>(m_length)).append(')');
    return sb.build();
}

// ============================================================================
// InsertNode / DeleteNode
// ============================================================================

EditorResult<std::unique_ptr<Operation>> InsertNode::apply(model::Document& doc) const {
    if (!m_subtree) {
        return invalid_argument("InsertNode: empty subtree");
    }
    auto parent = find_node(doc, m_parent_id);
    if (parent.is_err()) {
        return make_error(parent.error());
    }
    auto inserted = parent.value()->insert_child(m_subtree->clone(), m_index);
    if (inserted.is_err()) {
        return make_error(inserted.error());
    }

    doc.bump_version();
    return std::unique_ptr<Operation>(std::make_unique<DeleteNode>(m_parent_id, m_index));
}

String InsertNode::describe() const {
    StringBuilder sb;
    sb.append("InsertNode(").append(m_parent_id).append('[').append(static_cast<u64>(m_index)).append("], ")
      .append(m_subtree ? m_subtree->type() : String("null")).append(')');
    return sb.build();
}

EditorResult<std::unique_ptr<Operation>> DeleteNode::apply(model::Document& doc) const {
    auto parent = find_node(doc, m_parent_id);
    if (parent.is_err()) {
        return make_error(parent.error());
    }
    model::Node& node = *parent.value();
    if (m_index >= node.children().size()) {
        StringBuilder sb;
        sb.append("DeleteNode: index ").append(static_cast<u64>(m_index))
          .append(" outside children of ").append(m_parent_id);
        return out_of_range(sb.build());
    }

    auto removed = node.delete_child(*node.children()[m_index]);
    if (removed.is_err()) {
        return make_error(removed.error());
    }

    doc.bump_version();
    return std::unique_ptr<Operation>(
        std::make_unique<InsertNode>(m_parent_id, m_index, std::move(removed).value()));
}

String DeleteNode::describe() const {
    StringBuilder sb;
    sb.append("DeleteNode(").append(m_parent_id).append('[').append(static_cast<u64>(m_index)).append("])");
    return sb.build();
}

// ============================================================================
// MergeBlock / SplitBlock
// ============================================================================

EditorResult<std::unique_ptr<Operation>> MergeBlock::apply(model::Document& doc) const {
    auto found = find_block(doc, m_block_id);
    if (found.is_err()) {
        return make_error(found.error());
    }
    auto* block = static_cast<model::Paragraph*>(found.value());
    model::Node* parent = block->parent();
    usize index = *parent->child_index(*block);
    if (index == 0) {
        return invalid_argument(String("MergeBlock: ") + m_block_id + " has no preceding block");
    }
    model::Node& previous = *parent->children()[index - 1];
    usize split_at = previous.children().size();
    f32 line_height = block->line_height();

    while (block->has_children()) {
        auto moved = block->delete_child(*block->children().front());
        if (moved.is_err()) {
            return make_error(moved.error());
        }
        auto appended = previous.append_child(std::move(moved).value());
        if (appended.is_err()) {
            return make_error(appended.error());
        }
    }
    auto removed = parent->delete_child(*block);
    if (removed.is_err()) {
        return make_error(removed.error());
    }

    doc.bump_version();
    return std::unique_ptr<Operation>(
        std::make_unique<SplitBlock>(previous.id(), split_at, m_block_id, line_height));
}

String MergeBlock::describe() const {
    return String("MergeBlock(") + m_block_id + ")";
}

EditorResult<std::unique_ptr<Operation>> SplitBlock::apply(model::Document& doc) const {
    auto found = find_block(doc, m_block_id);
    if (found.is_err()) {
        return make_error(found.error());
    }
    model::Node* block = found.value();
    if (m_child_index > block->children().size()) {
        StringBuilder sb;
        sb.append("SplitBlock: child index ").append(static_cast<u64>(m_child_index))
          .append(" outside ").append(m_block_id);
        return out_of_range(sb.build());
    }
    if (doc.find_by_id(m_new_block_id)) {
        return invalid_argument(String("SplitBlock: id ") + m_new_block_id + " already in use");
    }

    auto next = std::make_unique<model::Paragraph>(m_new_block_id);
    next->set_line_height(m_line_height);
    while (block->children().size() > m_child_index) {
        auto moved = block->delete_child(*block->children()[m_child_index]);
        if (moved.is_err()) {
            return make_error(moved.error());
        }
        auto appended = next->append_child(std::move(moved).value());
        if (appended.is_err()) {
            return make_error(appended.error());
        }
    }

    model::Node* parent = block->parent();
    usize index = *parent->child_index(*block);
    auto inserted = parent->insert_child(std::move(next), index + 1);
    if (inserted.is_err()) {
        return make_error(inserted.error());
    }

    doc.bump_version();
    return std::unique_ptr<Operation>(std::make_unique<MergeBlock>(m_new_block_id));
}

String SplitBlock::describe() const {
    StringBuilder sb;
    sb.append("SplitBlock(").append(m_block_id).append(", ").append(static_cast<u64>(m_child_index))
      .append(", ").append(m_new_block_id).append(')');
    return sb.build();
}

} // namespace folio::cursor
