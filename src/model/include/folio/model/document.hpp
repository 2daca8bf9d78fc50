#pragma once

#include "node.hpp"
#include "folio/core/config.hpp"

namespace folio::model {

// ============================================================================
// Page geometry
// ============================================================================

struct PageGeometry {
    f32 width{816};
    f32 height{1056};
    f32 padding_top{40};
    f32 padding_bottom{40};
    f32 padding_left{40};
    f32 padding_right{40};

    [[nodiscard]] f32 content_width() const { return width - padding_left - padding_right; }
    [[nodiscard]] f32 content_height() const { return height - padding_top - padding_bottom; }

    [[nodiscard]] static PageGeometry from_config(const EditorConfig& config);

    [[nodiscard]] bool operator==(const PageGeometry& other) const = default;
};

// ============================================================================
// Document - Root of the model tree
// ============================================================================

class Document : public Node {
public:
    static const String TYPE;

    explicit Document(String id);

    [[nodiscard]] const String& type() const override { return TYPE; }
    [[nodiscard]] NodeKind kind() const override { return NodeKind::Root; }
    [[nodiscard]] std::unique_ptr<Node> clone() const override;

    [[nodiscard]] const PageGeometry& page() const { return m_page; }
    void set_page(const PageGeometry& page) { m_page = page; }

    // Bumped by every applied content operation
    [[nodiscard]] u64 version() const { return m_version; }
    void bump_version() { ++m_version; }

    // Paragraph texts joined by '\n' (debugging and tests)
    [[nodiscard]] String content_text() const;

    [[nodiscard]] std::unique_ptr<Document> clone_document() const;

private:
    PageGeometry m_page;
    u64 m_version{0};
};

// ============================================================================
// Paragraph - Block node
// ============================================================================

class Paragraph : public Node {
public:
    static const String TYPE;

    explicit Paragraph(String id);

    [[nodiscard]] const String& type() const override { return TYPE; }
    [[nodiscard]] NodeKind kind() const override { return NodeKind::Block; }
    [[nodiscard]] std::unique_ptr<Node> clone() const override;

    // Line height multiplier, 0 = editor default
    [[nodiscard]] f32 line_height() const { return m_line_height; }
    void set_line_height(f32 line_height) { m_line_height = line_height; }

private:
    f32 m_line_height{0};
};

// ============================================================================
// Span - Styled inline branch
// ============================================================================

class Span : public Node {
public:
    static const String TYPE;

    Span(String id, TextStyle style);

    [[nodiscard]] const String& type() const override { return TYPE; }
    [[nodiscard]] NodeKind kind() const override { return NodeKind::Branch; }
    [[nodiscard]] std::unique_ptr<Node> clone() const override;

    [[nodiscard]] const TextStyle& style() const { return m_style; }
    void set_style(const TextStyle& style) { m_style = style; }

private:
    TextStyle m_style;
};

// ============================================================================
// Text - Leaf holding a run of characters
// ============================================================================

class Text : public Node {
public:
    static const String TYPE;

    Text(String id, String content, TextStyle style = {});

    [[nodiscard]] const String& type() const override { return TYPE; }
    [[nodiscard]] NodeKind kind() const override { return NodeKind::Leaf; }
    [[nodiscard]] std::unique_ptr<Node> clone() const override;

    [[nodiscard]] usize model_size() const override { return m_content.size(); }

    [[nodiscard]] const String& content() const { return m_content; }
    [[nodiscard]] const TextStyle& style() const { return m_style; }
    void set_style(const TextStyle& style) { m_style = style; }

    EditorResult<void> insert_text(usize offset, const String& text);
    EditorResult<String> delete_text(usize offset, usize count);

private:
    String m_content;
    TextStyle m_style;
};

// ============================================================================
// Builders
// ============================================================================

// One paragraph per entry, each holding a single text leaf (none when empty)
[[nodiscard]] EditorResult<std::unique_ptr<Document>> make_document(const std::vector<String>& paragraphs);

// Splits plain text into paragraphs on blank lines
[[nodiscard]] std::vector<String> split_paragraphs(const String& text);

} // namespace folio::model
