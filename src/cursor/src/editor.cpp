#include "folio/cursor/editor.hpp"
#include "folio/core/logger.hpp"

namespace folio::cursor {

Editor::Editor(std::unique_ptr<model::Document> doc, const text::TextMeasurer& measurer, EditorConfig config)
    : m_config(std::move(config))
    , m_transforms(std::move(doc), measurer, m_config, m_cursors)
    , m_commands("commands") {
    register_default_commands(m_commands);
}

EditorResult<void> Editor::initialize() {
    auto result = m_transforms.initialize();
    if (result.is_ok()) {
        StringBuilder sb;
        sb.append("editor ready: ").append(static_cast<u64>(layout().page_count())).append(" pages, ")
          .append(static_cast<u64>(selectable_size())).append(" positions");
        logging::get("cursor").info(sb.view());
    }
    return result;
}

EditorResult<void> Editor::focus(usize offset) {
    if (m_cursors.has_focus()) {
        return {};
    }
    if (offset >= selectable_size()) {
        StringBuilder sb;
        sb.append("focus: offset ").append(static_cast<u64>(offset))
          .append(" outside document of size ").append(static_cast<u64>(selectable_size()));
        return out_of_range(sb.build());
    }
    m_cursors.acquire_focus(offset);
    return m_transforms.apply(Transformation::move_to(offset));
}

EditorResult<void> Editor::execute(const String& command, const CommandArgs& args) {
    auto handler = m_commands.lookup(command);
    if (handler.is_err()) {
        return make_error(handler.error());
    }
    return (*handler.value())->handle(*this, args);
}

EditorResult<void> Editor::apply(Transformation transformation) {
    return m_transforms.apply(std::move(transformation));
}

} // namespace folio::cursor
