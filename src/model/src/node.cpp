#include "folio/model/node.hpp"
#include "folio/core/logger.hpp"
#include <atomic>

namespace folio::model {

// ============================================================================
// Node
// ============================================================================

std::optional<usize> Node::child_index(const Node& child) const {
    for (usize i = 0; i < m_children.size(); ++i) {
        if (m_children[i].get() == &child) {
            return i;
        }
    }
    return std::nullopt;
}

bool Node::accepts(NodeKind child) const {
    switch (kind()) {
        case NodeKind::Root:
            return child == NodeKind::Block;
        case NodeKind::Block:
        case NodeKind::Branch:
            return child == NodeKind::Branch || child == NodeKind::Leaf;
        case NodeKind::Leaf:
            return false;
    }
    return false;
}

EditorResult<Node*> Node::insert_child(std::unique_ptr<Node> child, usize index) {
    if (!child) {
        return invalid_argument("insert_child: null child");
    }
    if (index > m_children.size()) {
        StringBuilder sb;
        sb.append("insert_child: index ").append(static_cast<u64>(index))
          .append(" exceeds child count ").append(static_cast<u64>(m_children.size()))
          .append(" of ").append(m_id);
        return out_of_range(sb.build());
    }
    if (!accepts(child->kind())) {
        StringBuilder sb;
        sb.append("insert_child: ").append(to_string(kind())).append(' ').append(m_id)
          .append(" cannot hold ").append(to_string(child->kind())).append(' ').append(child->id());
        return structural_violation(sb.build());
    }

    child->m_parent = this;
    Node* raw = child.get();
    m_children.insert(m_children.begin() + static_cast<isize>(index), std::move(child));
    return raw;
}

EditorResult<Node*> Node::append_child(std::unique_ptr<Node> child) {
    return insert_child(std::move(child), m_children.size());
}

EditorResult<std::unique_ptr<Node>> Node::delete_child(const Node& child) {
    auto index = child_index(child);
    if (!index) {
        StringBuilder sb;
        sb.append("delete_child: ").append(child.id()).append(" is not a child of ").append(m_id);
        return structural_violation(sb.build());
    }

    std::unique_ptr<Node> removed = std::move(m_children[*index]);
    m_children.erase(m_children.begin() + static_cast<isize>(*index));
    removed->m_parent = nullptr;
    return removed;
}

usize Node::model_size() const {
    usize size = 2;
    for (const auto& child : m_children) {
        size += child->model_size();
    }
    return size;
}

Node* Node::find_by_id(const String& id) {
    return const_cast<Node*>(std::as_const(*this).find_by_id(id));
}

const Node* Node::find_by_id(const String& id) const {
    if (m_id == id) {
        return this;
    }
    for (const auto& child : m_children) {
        if (const Node* found = child->find_by_id(id)) {
            return found;
        }
    }
    return nullptr;
}

void Node::clone_children_into(Node& target) const {
    for (const auto& child : m_children) {
        auto copy = child->clone();
        copy->m_parent = &target;
        target.m_children.push_back(std::move(copy));
    }
}

// ============================================================================
// Offset resolution
// ============================================================================

EditorResult<ResolvedOffset> resolve_offset(Node& root, usize model_offset) {
    if (model_offset >= root.model_size()) {
        StringBuilder sb;
        sb.append("model offset ").append(static_cast<u64>(model_offset))
          .append(" outside ").append(root.id()).append(" of size ")
          .append(static_cast<u64>(root.model_size()));
        return out_of_range(sb.build());
    }

    Node* node = &root;
    usize offset = model_offset;
    while (!node->is_leaf()) {
        // Opening delimiter
        if (offset == 0) {
            break;
        }
        usize inner = offset - 1;
        usize cumulated = 0;
        Node* next = nullptr;
        for (const auto& child : node->children()) {
            usize size = child->model_size();
            if (inner < cumulated + size) {
                next = child.get();
                break;
            }
            cumulated += size;
        }
        // Closing delimiter
        if (!next) {
            break;
        }
        node = next;
        offset = inner - cumulated;
    }
    return ResolvedOffset{node, offset};
}

String generate_id(std::string_view prefix) {
    static std::atomic<u64> counter{0};
    StringBuilder sb;
    sb.append(prefix).append('-').append(static_cast<u64>(++counter));
    return sb.build();
}

} // namespace folio::model
