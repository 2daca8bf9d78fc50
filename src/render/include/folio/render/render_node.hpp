#pragma once

#include "folio/core/types.hpp"
#include "folio/core/string.hpp"
#include "folio/core/error.hpp"
#include "folio/model/document.hpp"
#include <memory>
#include <vector>

namespace folio::render {

enum class RenderKind : u8 {
    Doc,
    Block,
    Inline,
    Atomic,
};

// Derived (not mirrored) type tags
inline const String LINE_BREAK_TYPE = "LineBreak";
inline const String WORD_TYPE = "Word";

// ============================================================================
// RenderNode - Base class for the render tree
// ============================================================================

/**
 * @brief Node of the tree derived from the model
 *
 * Besides the model span (model_size) every render node exposes a
 * selectable size: the number of caret positions it contributes. Both are
 * cached; clear_cache() drops the caches of this node and every ancestor.
 */
class RenderNode {
public:
    virtual ~RenderNode() = default;

    RenderNode(const RenderNode&) = delete;
    RenderNode& operator=(const RenderNode&) = delete;

    [[nodiscard]] const String& id() const { return m_id; }
    [[nodiscard]] const String& type() const { return m_type; }
    [[nodiscard]] virtual RenderKind kind() const = 0;

    // Tree structure
    [[nodiscard]] RenderNode* parent() const { return m_parent; }
    [[nodiscard]] const std::vector<std::unique_ptr<RenderNode>>& children() const { return m_children; }
    [[nodiscard]] std::optional<usize> child_index(const RenderNode& child) const;

    RenderNode* append_child(std::unique_ptr<RenderNode> child);
    EditorResult<RenderNode*> insert_child(std::unique_ptr<RenderNode> child, usize index);
    EditorResult<std::unique_ptr<RenderNode>> delete_child(const RenderNode& child);
    std::vector<std::unique_ptr<RenderNode>> take_children();
    void clear_children();

    // Sizes
    [[nodiscard]] usize selectable_size() const;
    [[nodiscard]] usize model_size() const;
    void clear_cache();

    // First selectable position of this node within the whole tree
    [[nodiscard]] usize selectable_start() const;

    /**
     * @brief Maps a caret position local to this node to a model offset
     * local to the mirrored model node
     *
     * Fails with OutOfRange when offset >= selectable_size().
     */
    [[nodiscard]] virtual EditorResult<usize> convert_selectable_offset_to_model_offset(usize offset) const;

    // Called by the reconciler once the children were re-attached
    virtual void on_children_updated() {}

protected:
    RenderNode(String id, String type) : m_id(std::move(id)), m_type(std::move(type)) {}

    [[nodiscard]] virtual usize compute_selectable_size() const;
    [[nodiscard]] virtual usize compute_model_size() const;
    [[nodiscard]] virtual bool has_delimiters() const = 0;

private:
    String m_id;
    String m_type;
    RenderNode* m_parent{nullptr};
    std::vector<std::unique_ptr<RenderNode>> m_children;

    mutable std::optional<usize> m_selectable_size;
    mutable std::optional<usize> m_model_size;
};

// ============================================================================
// DocRenderNode
// ============================================================================

class DocRenderNode : public RenderNode {
public:
    explicit DocRenderNode(String id) : RenderNode(std::move(id), model::Document::TYPE) {}

    [[nodiscard]] RenderKind kind() const override { return RenderKind::Doc; }

    [[nodiscard]] const model::PageGeometry& page() const { return m_page; }
    [[nodiscard]] u64 version() const { return m_version; }

    void on_model_updated(const model::Document& doc);

protected:
    [[nodiscard]] bool has_delimiters() const override { return true; }

private:
    model::PageGeometry m_page;
    u64 m_version{0};
};

// ============================================================================
// BlockRenderNode
// ============================================================================

class BlockRenderNode : public RenderNode {
public:
    BlockRenderNode(String id, String type) : RenderNode(std::move(id), std::move(type)) {}

    [[nodiscard]] RenderKind kind() const override { return RenderKind::Block; }

    // Line height multiplier, 0 = editor default
    [[nodiscard]] f32 line_height() const { return m_line_height; }
    void set_line_height(f32 line_height) { m_line_height = line_height; }

    // Appends the trailing line break every block ends with
    void on_children_updated() override;

protected:
    [[nodiscard]] bool has_delimiters() const override { return true; }

private:
    f32 m_line_height{0};
};

// ============================================================================
// InlineRenderNode
// ============================================================================

/**
 * @brief Inline run inside a block
 *
 * Mirrors either a styled branch (delimited) or a text leaf, in which case
 * its children are the word atomics of the leaf content. The trailing line
 * break of a block is an inline of its own.
 */
class InlineRenderNode : public RenderNode {
public:
    InlineRenderNode(String id, String type, bool delimited)
        : RenderNode(std::move(id), std::move(type)), m_delimited(delimited) {}

    [[nodiscard]] RenderKind kind() const override { return RenderKind::Inline; }

    [[nodiscard]] const model::TextStyle& style() const { return m_style; }
    void set_style(const model::TextStyle& style) { m_style = style; }

    // Rebuilds the word atomics from the leaf content
    void set_text(const String& content);

protected:
    [[nodiscard]] bool has_delimiters() const override { return m_delimited; }

private:
    bool m_delimited;
    model::TextStyle m_style;
};

// ============================================================================
// AtomicRenderNode
// ============================================================================

class AtomicRenderNode : public RenderNode {
public:
    AtomicRenderNode(String id, String type, String content, model::TextStyle style);

    [[nodiscard]] static std::unique_ptr<AtomicRenderNode> make_line_break(const String& block_id);

    [[nodiscard]] RenderKind kind() const override { return RenderKind::Atomic; }

    [[nodiscard]] const String& content() const { return m_content; }
    [[nodiscard]] const model::TextStyle& style() const { return m_style; }
    [[nodiscard]] bool is_line_break() const { return type() == LINE_BREAK_TYPE; }

    // Selectable size without trailing whitespace
    [[nodiscard]] usize trimmed_size() const;

    [[nodiscard]] EditorResult<usize> convert_selectable_offset_to_model_offset(usize offset) const override;

protected:
    [[nodiscard]] usize compute_selectable_size() const override;
    [[nodiscard]] usize compute_model_size() const override;
    [[nodiscard]] bool has_delimiters() const override { return false; }

private:
    String m_content;
    model::TextStyle m_style;
};

struct AtomicHit {
    const AtomicRenderNode* node;
    usize offset;  // Local to node
};

// Atomic holding a selectable offset local to root
[[nodiscard]] std::optional<AtomicHit> find_atomic(const RenderNode& root, usize offset);

// Nearest ancestor (or self) of the given kind
[[nodiscard]] const RenderNode* enclosing(const RenderNode& node, RenderKind kind);

// Splits text into words; each word keeps its trailing whitespace
[[nodiscard]] std::vector<String> split_words(const String& text);

} // namespace folio::render
