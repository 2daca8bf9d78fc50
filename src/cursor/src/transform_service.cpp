#include "folio/cursor/transform_service.hpp"
#include "folio/core/logger.hpp"

namespace folio::cursor {

TransformService::TransformService(std::unique_ptr<model::Document> doc,
                                   const text::TextMeasurer& measurer,
                                   const EditorConfig& config,
                                   CursorService& cursors,
                                   render::RenderRegistry render_registry,
                                   layout::BoxRegistry box_registry)
    : m_doc(std::move(doc))
    , m_render(std::move(render_registry))
    , m_engine(measurer, std::move(box_registry))
    , m_config(config)
    , m_cursors(cursors) {}

EditorResult<std::unique_ptr<layout::DocLayout>> TransformService::derive() {
    auto synced = m_render.sync(*m_doc);
    if (synced.is_err()) {
        return make_error(synced.error());
    }
    return m_engine.layout(*m_render.root(), m_config);
}

EditorResult<void> TransformService::initialize() {
    auto derived = derive();
    if (derived.is_err()) {
        return make_error(derived.error());
    }
    m_layout = std::move(derived).value();
    notify();
    return {};
}

void TransformService::rollback(std::unique_ptr<model::Document> snapshot) {
    if (!snapshot) {
        return;
    }
    m_doc = std::move(snapshot);
    // The snapshot derived cleanly before, so this only rewinds render ids and caches
    auto synced = m_render.sync(*m_doc);
    if (synced.is_err()) {
        logging::get("cursor").error((String("rollback re-derivation failed: ") + synced.error().describe()).view());
    }
}

EditorResult<void> TransformService::apply(Transformation transformation) {
    if (!m_layout) {
        return invalid_argument("TransformService::apply before initialize");
    }
    if (transformation.operations.empty() && !m_cursors.has_focus()) {
        return {};
    }

    std::unique_ptr<model::Document> snapshot;
    std::unique_ptr<layout::DocLayout> next_layout;

    if (!transformation.operations.empty()) {
        snapshot = m_doc->clone_document();

        for (const auto& operation : transformation.operations) {
            auto applied = operation->apply(*m_doc);
            if (applied.is_err()) {
                logging::get("cursor").warn((String("rejected ") + operation->describe()).view());
                rollback(std::move(snapshot));
                return make_error(applied.error());
            }
            FOLIO_DEBUG_LOG("cursor", (String("applied ") + operation->describe()).view());
        }

        auto derived = derive();
        if (derived.is_err()) {
            rollback(std::move(snapshot));
            return make_error(derived.error());
        }
        next_layout = std::move(derived).value();
    }

    const layout::DocLayout& target_layout = next_layout ? *next_layout : *m_layout;
    usize size = target_layout.size();
    usize anchor = transformation.anchor.value_or(transformation.head);

    if (m_cursors.has_focus() && (transformation.head >= size || anchor >= size)) {
        StringBuilder sb;
        sb.append("cursor target {").append(static_cast<u64>(anchor)).append(", ")
          .append(static_cast<u64>(transformation.head)).append("} outside document of size ")
          .append(static_cast<u64>(size));
        rollback(std::move(snapshot));
        return out_of_range(sb.build());
    }

    if (next_layout) {
        m_layout = std::move(next_layout);
    }

    if (m_cursors.has_focus()) {
        Cursor cursor{anchor, transformation.head, m_cursors.cursor()->left_lock};
        if (!transformation.keep_left_lock) {
            auto x = caret_x(cursor.head);
            if (x.is_ok()) {
                cursor.left_lock = x.value();
            }
        }
        m_cursors.set(cursor);
    }

    notify();
    return {};
}

EditorResult<f32> TransformService::caret_x(usize offset) const {
    auto described = m_layout->describe_position(offset);
    if (described.is_err()) {
        return make_error(described.error());
    }
    const auto& line = described.value().at_line();
    return line.node->caret_x(line.position);
}

void TransformService::notify() {
    for (const auto& [handle, listener] : m_listeners) {
        listener(*m_layout, m_cursors.cursor());
    }
}

usize TransformService::subscribe(Listener listener) {
    usize handle = m_next_handle++;
    m_listeners.emplace_back(handle, std::move(listener));
    return handle;
}

void TransformService::unsubscribe(usize handle) {
    std::erase_if(m_listeners, [handle](const auto& entry) { return entry.first == handle; });
}

} // namespace folio::cursor
