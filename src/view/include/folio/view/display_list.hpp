#pragma once

#include "folio/core/types.hpp"
#include "folio/core/string.hpp"
#include "folio/core/registry.hpp"
#include "folio/core/config.hpp"
#include "folio/layout/layout_node.hpp"
#include "folio/cursor/cursor.hpp"
#include <functional>
#include <variant>
#include <vector>

namespace folio::view {

// ============================================================================
// Paint Commands
// ============================================================================

// Geometry is page-local except for PaintPageCommand, which places the page
// in the stacked document.

struct PaintPageCommand {
    usize page;
    RectF rect;
    Color background;
};

struct PaintLineCommand {
    usize page;
    RectF rect;
};

struct PaintWordCommand {
    usize page;
    PointF position;  // Top-left of the word box
    String text;
    String font_family;
    f32 font_size;
    bool bold;
    bool italic;
    bool underline;
    Color color;
};

struct PaintSelectionCommand {
    usize page;
    RectF rect;
    Color color;
};

struct PaintCaretCommand {
    usize page;
    RectF rect;
    Color color;
};

using DisplayCommand = std::variant<
    PaintPageCommand,
    PaintLineCommand,
    PaintWordCommand,
    PaintSelectionCommand,
    PaintCaretCommand
>;

// ============================================================================
// Display List
// ============================================================================

class DisplayList {
public:
    DisplayList() = default;

    template<typename T>
    void push(T&& cmd) {
        m_commands.push_back(std::forward<T>(cmd));
    }

    [[nodiscard]] const std::vector<DisplayCommand>& commands() const { return m_commands; }
    [[nodiscard]] usize size() const { return m_commands.size(); }
    [[nodiscard]] bool empty() const { return m_commands.empty(); }

    void clear() { m_commands.clear(); }

    auto begin() const { return m_commands.begin(); }
    auto end() const { return m_commands.end(); }

    template<typename T>
    [[nodiscard]] usize count() const {
        usize n = 0;
        for (const auto& cmd : m_commands) {
            if (std::holds_alternative<T>(cmd)) ++n;
        }
        return n;
    }

private:
    std::vector<DisplayCommand> m_commands;
};

[[nodiscard]] String describe(const DisplayCommand& command);

// ============================================================================
// Paint registry
// ============================================================================

struct PaintContext {
    usize page;
    PointF origin;  // Page-local top-left of the word
    const EditorConfig& config;
};

using PaintFn = std::function<void(const layout::WordLayout&, const PaintContext&, DisplayList&)>;
using PaintRegistry = TypeRegistry<PaintFn>;

// Word paints its text; LineBreak paints nothing
[[nodiscard]] PaintRegistry default_paint_registry();

// ============================================================================
// Display List Builder
// ============================================================================

struct PaintStyle {
    Color page_background{Color::from_rgb(0xFFFFFF)};
    Color selection{Color(0x33, 0x99, 0xFF, 0x66)};
    Color caret{Color::black()};
    f32 caret_width{1.0f};
};

class DisplayListBuilder {
public:
    explicit DisplayListBuilder(PaintRegistry registry = default_paint_registry(), PaintStyle style = {});

    /**
     * @brief Paints pages, lines and words, then the selection or the caret
     *
     * Fails when a word type has no paint entry or the cursor lies outside
     * the layout.
     */
    [[nodiscard]] EditorResult<DisplayList> build(const layout::DocLayout& layout,
                                                 const cursor::Cursor* cursor,
                                                 const EditorConfig& config) const;

private:
    PaintRegistry m_registry;
    PaintStyle m_style;
};

} // namespace folio::view
