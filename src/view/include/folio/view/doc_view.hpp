#pragma once

#include "view_sink.hpp"
#include "folio/cursor/editor.hpp"

namespace folio::view {

enum class PointerAction : u8 {
    Down,
    Move,
    Up,
};

// Coordinates are local to the page
struct PointerEvent {
    PointerAction action;
    usize page;
    f32 x;
    f32 y;
};

// ============================================================================
// DocView - Paints editor state into a sink and turns pointer input into commands
// ============================================================================

class DocView {
public:
    DocView(cursor::Editor& editor, ViewSink& sink, DisplayListBuilder builder = DisplayListBuilder());
    ~DocView();

    DocView(const DocView&) = delete;
    DocView& operator=(const DocView&) = delete;

    // Builds and presents a display list for the current state
    [[nodiscard]] EditorResult<void> paint();

    /**
     * @brief Down places a collapsed caret (acquiring focus if needed), Move
     * while pressed extends the head, Up extends the head once more and ends
     * the drag.
     */
    [[nodiscard]] EditorResult<void> handle_pointer(const PointerEvent& event);

    [[nodiscard]] bool is_pressed() const { return m_pressed; }

    // Page holding a point in stacked document coordinates
    [[nodiscard]] std::optional<PointerEvent> locate(PointerAction action, f32 x, f32 y) const;

private:
    cursor::Editor& m_editor;
    ViewSink& m_sink;
    DisplayListBuilder m_builder;
    usize m_subscription;
    bool m_pressed{false};
};

} // namespace folio::view
