#pragma once

#include "cursor.hpp"
#include "transformation.hpp"
#include "folio/core/config.hpp"
#include "folio/render/render_tree.hpp"
#include "folio/layout/layout_engine.hpp"
#include <functional>

namespace folio::cursor {

// ============================================================================
// TransformService - The only path that mutates editor state
// ============================================================================

class TransformService {
public:
    using Listener = std::function<void(const layout::DocLayout&, const std::optional<Cursor>&)>;

    TransformService(std::unique_ptr<model::Document> doc,
                     const text::TextMeasurer& measurer,
                     const EditorConfig& config,
                     CursorService& cursors,
                     render::RenderRegistry render_registry = render::default_render_registry(),
                     layout::BoxRegistry box_registry = layout::default_box_registry());

    // Derives the render and layout trees of the initial document
    [[nodiscard]] EditorResult<void> initialize();

    /**
     * @brief Applies operations, re-derives render and layout, moves the cursor
     *
     * Any failure restores the last good model, render tree and layout. A
     * target outside [0, selectable size) is rejected with OutOfRange.
     * Cursor-only transformations are ignored while no cursor is active.
     */
    [[nodiscard]] EditorResult<void> apply(Transformation transformation);

    [[nodiscard]] const model::Document& document() const { return *m_doc; }
    [[nodiscard]] const render::RenderTree& render_tree() const { return m_render; }
    [[nodiscard]] const layout::DocLayout& layout() const { return *m_layout; }
    [[nodiscard]] usize selectable_size() const { return m_layout ? m_layout->size() : 0; }

    // Line-relative caret x of a position
    [[nodiscard]] EditorResult<f32> caret_x(usize offset) const;

    usize subscribe(Listener listener);
    void unsubscribe(usize handle);

private:
    [[nodiscard]] EditorResult<std::unique_ptr<layout::DocLayout>> derive();
    void rollback(std::unique_ptr<model::Document> snapshot);
    void notify();

    std::unique_ptr<model::Document> m_doc;
    render::RenderTree m_render;
    layout::LayoutEngine m_engine;
    std::unique_ptr<layout::DocLayout> m_layout;
    const EditorConfig& m_config;
    CursorService& m_cursors;

    std::vector<std::pair<usize, Listener>> m_listeners;
    usize m_next_handle{1};
};

} // namespace folio::cursor
