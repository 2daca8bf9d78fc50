#include "folio/model/document.hpp"

namespace folio::model {

const String Document::TYPE = "Doc";
const String Paragraph::TYPE = "Paragraph";
const String Span::TYPE = "Span";
const String Text::TYPE = "Text";

PageGeometry PageGeometry::from_config(const EditorConfig& config) {
    PageGeometry page;
    page.width = config.page_width;
    page.height = config.page_height;
    page.padding_top = config.page_padding_top;
    page.padding_bottom = config.page_padding_bottom;
    page.padding_left = config.page_padding_left;
    page.padding_right = config.page_padding_right;
    return page;
}

// ============================================================================
// Document
// ============================================================================

Document::Document(String id) : Node(std::move(id)) {}

std::unique_ptr<Node> Document::clone() const {
    return clone_document();
}

std::unique_ptr<Document> Document::clone_document() const {
    auto copy = std::make_unique<Document>(id());
    copy->m_page = m_page;
    copy->m_version = m_version;
    clone_children_into(*copy);
    return copy;
}

namespace {

void collect_text(const Node& node, StringBuilder& sb) {
    if (node.type() == Text::TYPE) {
        sb.append(static_cast<const Text&>(node).content());
        return;
    }
    for (const auto& child : node.children()) {
        collect_text(*child, sb);
    }
}

} // namespace

String Document::content_text() const {
    StringBuilder sb;
    bool first = true;
    for (const auto& block : children()) {
        if (!first) {
            sb.append('\n');
        }
        first = false;
        collect_text(*block, sb);
    }
    return sb.build();
}

// ============================================================================
// Paragraph
// ============================================================================

Paragraph::Paragraph(String id) : Node(std::move(id)) {}

std::unique_ptr<Node> Paragraph::clone() const {
    auto copy = std::make_unique<Paragraph>(id());
    copy->m_line_height = m_line_height;
    clone_children_into(*copy);
    return copy;
}

// ============================================================================
// Span
// ============================================================================

Span::Span(String id, TextStyle style) : Node(std::move(id)), m_style(std::move(style)) {}

std::unique_ptr<Node> Span::clone() const {
    auto copy = std::make_unique<Span>(id(), m_style);
    clone_children_into(*copy);
    return copy;
}

// ============================================================================
// Text
// ============================================================================

Text::Text(String id, String content, TextStyle style)
    : Node(std::move(id)), m_content(std::move(content)), m_style(std::move(style)) {}

std::unique_ptr<Node> Text::clone() const {
    return std::make_unique<Text>(id(), m_content, m_style);
}

EditorResult<void> Text::insert_text(usize offset, const String& text) {
    if (offset > m_content.size()) {
        StringBuilder sb;
        sb.append("insert_text: offset ").append(static_cast<u64>(offset))
          .append(" past end of ").append(id());
        return out_of_range(sb.build());
    }
    m_content.insert(offset, text);
    return {};
}

EditorResult<String> Text::delete_text(usize offset, usize count) {
    if (offset + count > m_content.size()) {
        StringBuilder sb;
        sb.append("delete_text: range [").append(static_cast<u64>(offset)).append(", ")
          .append(static_cast<u64>(offset + count)).append(") past end of ").append(id());
        return out_of_range(sb.build());
    }
    String removed = m_content.substring(offset, count);
    m_content.erase(offset, count);
    return removed;
}

// ============================================================================
// Builders
// ============================================================================

EditorResult<std::unique_ptr<Document>> make_document(const std::vector<String>& paragraphs) {
    auto doc = std::make_unique<Document>(generate_id("doc"));
    for (const auto& text : paragraphs) {
        auto paragraph = std::make_unique<Paragraph>(generate_id("p"));
        if (!text.empty()) {
            auto text_added = paragraph->append_child(std::make_unique<Text>(generate_id("t"), text));
            if (text_added.is_err()) {
                return make_error(text_added.error());
            }
        }
        auto paragraph_added = doc->append_child(std::move(paragraph));
        if (paragraph_added.is_err()) {
            return make_error(paragraph_added.error());
        }
    }
    return std::move(doc);
}

std::vector<String> split_paragraphs(const String& text) {
    std::vector<String> paragraphs;
    StringBuilder current;
    bool has_current = false;

    for (const auto& raw_line : text.split("\n")) {
        String line = raw_line.trim_end();
        if (line.empty()) {
            if (has_current) {
                paragraphs.push_back(current.build());
                current.clear();
                has_current = false;
            }
            continue;
        }
        if (has_current) {
            current.append(' ');
        }
        current.append(line);
        has_current = true;
    }
    if (has_current) {
        paragraphs.push_back(current.build());
    }
    return paragraphs;
}

} // namespace folio::model
