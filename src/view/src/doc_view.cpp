#include "folio/view/doc_view.hpp"
#include "folio/core/logger.hpp"

namespace folio::view {

DocView::DocView(cursor::Editor& editor, ViewSink& sink, DisplayListBuilder builder)
    : m_editor(editor)
    , m_sink(sink)
    , m_builder(std::move(builder)) {
    m_subscription = m_editor.transforms().subscribe(
        [this](const layout::DocLayout&, const std::optional<cursor::Cursor>&) {
            auto painted = paint();
            if (painted.is_err()) {
                logging::get("view").error(painted.error().describe().view());
            }
        });
}

DocView::~DocView() {
    m_editor.transforms().unsubscribe(m_subscription);
}

EditorResult<void> DocView::paint() {
    const auto& cursor = m_editor.cursor();
    auto list = m_builder.build(m_editor.layout(), cursor ? &*cursor : nullptr, m_editor.config());
    if (list.is_err()) {
        return make_error(list.error());
    }
    m_sink.present(list.value());
    return {};
}

EditorResult<void> DocView::handle_pointer(const PointerEvent& event) {
    if (event.action != PointerAction::Down && !m_pressed) {
        return {};
    }

    auto position = m_editor.layout().resolve_point(event.page, event.x, event.y);
    if (position.is_err()) {
        return make_error(position.error());
    }

    cursor::CommandArgs args;
    args.position = position.value();

    switch (event.action) {
        case PointerAction::Down: {
            m_pressed = true;
            if (!m_editor.cursor()) {
                return m_editor.focus(position.value());
            }
            return m_editor.execute(cursor::commands::MOVE, args);
        }
        case PointerAction::Move:
            return m_editor.execute(cursor::commands::MOVE_HEAD, args);
        case PointerAction::Up:
            m_pressed = false;
            return m_editor.execute(cursor::commands::MOVE_HEAD, args);
    }
    return {};
}

std::optional<PointerEvent> DocView::locate(PointerAction action, f32 x, f32 y) const {
    const auto& layout = m_editor.layout();
    for (usize i = 0; i < layout.page_count(); ++i) {
        const RectF& rect = layout.page(i).rect();
        if (y >= rect.top() && y < rect.bottom()) {
            return PointerEvent{action, i, x - rect.x, y - rect.y};
        }
    }
    return std::nullopt;
}

} // namespace folio::view
