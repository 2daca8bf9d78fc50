#pragma once

#include "commands.hpp"
#include "transform_service.hpp"

namespace folio::cursor {

// ============================================================================
// Editor - Document, derived trees, cursor and commands in one place
// ============================================================================

class Editor {
public:
    Editor(std::unique_ptr<model::Document> doc, const text::TextMeasurer& measurer, EditorConfig config);

    Editor(const Editor&) = delete;
    Editor& operator=(const Editor&) = delete;

    // Derives render and layout trees; must succeed before anything else
    [[nodiscard]] EditorResult<void> initialize();

    // Activates a collapsed cursor at offset if none is active
    [[nodiscard]] EditorResult<void> focus(usize offset = 0);
    void blur() { m_cursors.release_focus(); }

    [[nodiscard]] EditorResult<void> execute(const String& command, const CommandArgs& args = {});
    [[nodiscard]] EditorResult<void> apply(Transformation transformation);

    [[nodiscard]] const model::Document& document() const { return m_transforms.document(); }
    [[nodiscard]] const render::RenderTree& render_tree() const { return m_transforms.render_tree(); }
    [[nodiscard]] const layout::DocLayout& layout() const { return m_transforms.layout(); }
    [[nodiscard]] const std::optional<Cursor>& cursor() const { return m_cursors.cursor(); }
    [[nodiscard]] const EditorConfig& config() const { return m_config; }
    [[nodiscard]] usize selectable_size() const { return m_transforms.selectable_size(); }

    [[nodiscard]] TransformService& transforms() { return m_transforms; }
    [[nodiscard]] CommandRegistry& commands() { return m_commands; }

private:
    EditorConfig m_config;
    CursorService m_cursors;
    TransformService m_transforms;
    CommandRegistry m_commands;
};

} // namespace folio::cursor
