#pragma once

#include "folio/core/types.hpp"
#include "folio/core/string.hpp"
#include "folio/core/error.hpp"
#include "folio/model/document.hpp"
#include <memory>
#include <vector>

namespace folio::layout {

enum class LayoutKind : u8 {
    Doc,
    Page,
    Line,
    Word,
};

// ============================================================================
// LayoutNode - Base class for the layout tree
// ============================================================================

class LayoutNode {
public:
    virtual ~LayoutNode() = default;

    LayoutNode(const LayoutNode&) = delete;
    LayoutNode& operator=(const LayoutNode&) = delete;

    [[nodiscard]] const String& id() const { return m_id; }
    [[nodiscard]] const String& type() const { return m_type; }
    [[nodiscard]] virtual LayoutKind kind() const = 0;

    // Tree structure
    [[nodiscard]] LayoutNode* parent() const { return m_parent; }
    [[nodiscard]] const std::vector<std::unique_ptr<LayoutNode>>& children() const { return m_children; }
    [[nodiscard]] usize index() const { return m_index; }
    LayoutNode* append_child(std::unique_ptr<LayoutNode> child);

    // Number of caret positions covered
    [[nodiscard]] usize size() const;

    // Geometry relative to the parent
    [[nodiscard]] const RectF& rect() const { return m_rect; }
    void set_rect(const RectF& rect) { m_rect = rect; }

    [[nodiscard]] LayoutNode* previous_sibling() const;
    [[nodiscard]] LayoutNode* next_sibling() const;

    /**
     * @brief Adjacent node at the same depth, possibly under another parent
     *
     * The last word of the previous line for the first word of a line, the
     * last line of the previous page for the first line of a page. Computed
     * on demand by walking up to the common ancestor.
     */
    [[nodiscard]] LayoutNode* previous_cross_parent_sibling() const;
    [[nodiscard]] LayoutNode* next_cross_parent_sibling() const;

    // Last local position a forward boundary search stops at
    [[nodiscard]] virtual usize boundary_end() const;

protected:
    LayoutNode(String id, String type) : m_id(std::move(id)), m_type(std::move(type)) {}

    [[nodiscard]] virtual usize compute_size() const;

private:
    String m_id;
    String m_type;
    LayoutNode* m_parent{nullptr};
    usize m_index{0};
    std::vector<std::unique_ptr<LayoutNode>> m_children;
    RectF m_rect;

    mutable std::optional<usize> m_size;
};

// ============================================================================
// WordLayout - Measured atomic box
// ============================================================================

class WordLayout : public LayoutNode {
public:
    WordLayout(String id, String type, String text, model::TextStyle style,
               std::vector<f32> advances, usize size, usize trimmed_size);

    [[nodiscard]] LayoutKind kind() const override { return LayoutKind::Word; }

    [[nodiscard]] const String& text() const { return m_text; }
    [[nodiscard]] const model::TextStyle& style() const { return m_style; }
    [[nodiscard]] const std::vector<f32>& advances() const { return m_advances; }

    [[nodiscard]] f32 width() const { return rect().width; }
    [[nodiscard]] f32 height() const { return rect().height; }

    // Size without trailing whitespace; 0 for a line break
    [[nodiscard]] usize trimmed_size() const { return m_trimmed_size; }
    [[nodiscard]] usize boundary_end() const override { return m_trimmed_size; }

    // Caret x before local position, relative to the word
    [[nodiscard]] f32 caret_x(usize position) const;

protected:
    [[nodiscard]] usize compute_size() const override { return m_word_size; }

private:
    String m_text;
    model::TextStyle m_style;
    std::vector<f32> m_advances;
    usize m_word_size;
    usize m_trimmed_size;
};

// ============================================================================
// LineLayout
// ============================================================================

class LineLayout : public LayoutNode {
public:
    explicit LineLayout(String id) : LayoutNode(std::move(id), "Line") {}

    [[nodiscard]] LayoutKind kind() const override { return LayoutKind::Line; }

    [[nodiscard]] usize word_count() const { return children().size(); }
    [[nodiscard]] const WordLayout& word(usize index) const;

    [[nodiscard]] f32 width() const { return rect().width; }
    [[nodiscard]] f32 height() const { return rect().height; }

    // Caret x before local position; size() maps to the end of the last word
    [[nodiscard]] f32 caret_x(usize position) const;

    // Nearest caret position to a line-relative x, in [0, size())
    [[nodiscard]] usize convert_coordinates_to_position(f32 x) const;
};

// ============================================================================
// PageLayout
// ============================================================================

class PageLayout : public LayoutNode {
public:
    PageLayout(String id, const model::PageGeometry& geometry)
        : LayoutNode(std::move(id), "Page"), m_geometry(geometry) {}

    [[nodiscard]] LayoutKind kind() const override { return LayoutKind::Page; }

    [[nodiscard]] const model::PageGeometry& geometry() const { return m_geometry; }
    [[nodiscard]] f32 width() const { return m_geometry.width; }
    [[nodiscard]] f32 height() const { return m_geometry.height; }

    [[nodiscard]] usize line_count() const { return children().size(); }
    [[nodiscard]] const LineLayout& line(usize index) const;

    // Line whose vertical span contains y, clamped to the first and last line
    [[nodiscard]] std::optional<usize> line_at(f32 y) const;

private:
    model::PageGeometry m_geometry;
};

// ============================================================================
// DocLayout
// ============================================================================

template<typename Node>
struct PositionLevel {
    const Node* node;
    usize position;  // Local to node
};

/**
 * @brief Page, line and word holding a caret position
 */
struct PositionPath {
    usize page_index{0};
    PositionLevel<PageLayout> page{nullptr, 0};
    PositionLevel<LineLayout> line{nullptr, 0};
    PositionLevel<WordLayout> word{nullptr, 0};

    [[nodiscard]] const PositionLevel<PageLayout>& at_page() const { return page; }
    [[nodiscard]] const PositionLevel<LineLayout>& at_line() const { return line; }
    [[nodiscard]] const PositionLevel<WordLayout>& at_word() const { return word; }
};

enum class SearchOrder : u8 {
    FromHead,  // Ascending from the first page
    FromTail,  // Descending from the last page
};

struct ScreenPosition {
    usize page_index;
    RectF rect;  // Page-local; zero width
};

struct PageRects {
    usize page_index;
    std::vector<RectF> rects;  // Page-local
};

class DocLayout : public LayoutNode {
public:
    DocLayout(String id, const model::PageGeometry& geometry, f32 page_gap)
        : LayoutNode(std::move(id), "Doc"), m_geometry(geometry), m_page_gap(page_gap) {}

    [[nodiscard]] LayoutKind kind() const override { return LayoutKind::Doc; }

    [[nodiscard]] const model::PageGeometry& geometry() const { return m_geometry; }
    [[nodiscard]] f32 page_gap() const { return m_page_gap; }

    [[nodiscard]] usize page_count() const { return children().size(); }
    [[nodiscard]] const PageLayout& page(usize index) const;
    [[nodiscard]] usize page_start(usize index) const;

    // Position description
    [[nodiscard]] EditorResult<PositionPath> describe_position(
        usize offset, SearchOrder order = SearchOrder::FromHead) const;

    // Boundary search; the document edges never move
    [[nodiscard]] EditorResult<usize> word_start(usize offset) const;
    [[nodiscard]] EditorResult<usize> word_end(usize offset) const;
    [[nodiscard]] EditorResult<usize> line_start(usize offset) const;
    [[nodiscard]] EditorResult<usize> line_end(usize offset) const;

    // Position nearest x on the adjacent line; the line edge when there is none
    [[nodiscard]] EditorResult<usize> position_above(usize offset, f32 x) const;
    [[nodiscard]] EditorResult<usize> position_below(usize offset, f32 x) const;

    // Screen mapping
    [[nodiscard]] EditorResult<ScreenPosition> caret_rect(usize offset) const;
    [[nodiscard]] EditorResult<std::vector<PageRects>> screen_rects(usize from, usize to) const;
    [[nodiscard]] EditorResult<usize> resolve_position(usize local_offset, const PageLayout& page) const;
    [[nodiscard]] EditorResult<usize> resolve_point(usize page_index, f32 x, f32 y) const;

private:
    enum class Granularity : u8 { Word, Line };
    enum class Direction : u8 { Backward, Forward };

    [[nodiscard]] EditorResult<usize> boundary(usize offset, Granularity granularity, Direction direction) const;

    model::PageGeometry m_geometry;
    f32 m_page_gap;
};

} // namespace folio::layout
