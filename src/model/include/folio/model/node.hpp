#pragma once

#include "folio/core/types.hpp"
#include "folio/core/string.hpp"
#include "folio/core/error.hpp"
#include <memory>
#include <vector>

namespace folio::model {

// ============================================================================
// Node kinds
// ============================================================================

enum class NodeKind : u8 {
    Root,    // Document; exactly one per tree
    Block,   // Paragraph-level container, children are branches or leaves
    Branch,  // Inline container (styled span)
    Leaf,    // Atomic content (a text run)
};

[[nodiscard]] constexpr const char* to_string(NodeKind kind) {
    switch (kind) {
        case NodeKind::Root: return "Root";
        case NodeKind::Block: return "Block";
        case NodeKind::Branch: return "Branch";
        case NodeKind::Leaf: return "Leaf";
    }
    return "Unknown";
}

// ============================================================================
// Text style carried by branches and leaves
// ============================================================================

struct TextStyle {
    String font_family;
    f32 font_size{0};  // 0 = editor default
    bool bold{false};
    bool italic{false};
    bool underline{false};
    bool strikethrough{false};
    Color color{Color::black()};

    [[nodiscard]] bool operator==(const TextStyle& other) const {
        return font_family == other.font_family &&
               font_size == other.font_size &&
               bold == other.bold &&
               italic == other.italic &&
               underline == other.underline &&
               strikethrough == other.strikethrough &&
               color == other.color;
    }
};

// ============================================================================
// Node - Base class for all model nodes
// ============================================================================

class Node {
public:
    virtual ~Node() = default;

    Node(const Node&) = delete;
    Node& operator=(const Node&) = delete;

    // Identity
    [[nodiscard]] const String& id() const { return m_id; }
    [[nodiscard]] virtual const String& type() const = 0;
    [[nodiscard]] virtual NodeKind kind() const = 0;

    // Tree structure
    [[nodiscard]] Node* parent() const { return m_parent; }
    [[nodiscard]] const std::vector<std::unique_ptr<Node>>& children() const { return m_children; }
    [[nodiscard]] bool has_children() const { return !m_children.empty(); }
    [[nodiscard]] std::optional<usize> child_index(const Node& child) const;

    // Tree manipulation
    EditorResult<Node*> insert_child(std::unique_ptr<Node> child, usize index);
    EditorResult<Node*> append_child(std::unique_ptr<Node> child);
    EditorResult<std::unique_ptr<Node>> delete_child(const Node& child);

    // Structural nodes span 2 delimiters plus their children; leaves their content
    [[nodiscard]] virtual usize model_size() const;

    [[nodiscard]] Node* find_by_id(const String& id);
    [[nodiscard]] const Node* find_by_id(const String& id) const;

    // Deep copy, ids preserved
    [[nodiscard]] virtual std::unique_ptr<Node> clone() const = 0;

    [[nodiscard]] bool is_leaf() const { return kind() == NodeKind::Leaf; }

protected:
    explicit Node(String id) : m_id(std::move(id)) {}

    void clone_children_into(Node& target) const;

private:
    [[nodiscard]] bool accepts(NodeKind child) const;

    String m_id;
    Node* m_parent{nullptr};
    std::vector<std::unique_ptr<Node>> m_children;
};

// ============================================================================
// Offset resolution
// ============================================================================

struct ResolvedOffset {
    Node* node;
    // Leaf: index into content. Structural: 0 is the opening delimiter,
    // model_size() - 1 the closing one.
    usize offset;
};

/**
 * Walks from root towards the deepest node whose span contains
 * model_offset. Fails with OutOfRange when model_offset >= root.model_size().
 */
[[nodiscard]] EditorResult<ResolvedOffset> resolve_offset(Node& root, usize model_offset);

// Generates "<prefix>-<n>" ids unique within the process
[[nodiscard]] String generate_id(std::string_view prefix);

} // namespace folio::model
