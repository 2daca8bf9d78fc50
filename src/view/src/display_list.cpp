#include "folio/view/display_list.hpp"
#include "folio/core/logger.hpp"
#include "folio/render/render_node.hpp"

namespace folio::view {

namespace {

void append_rect(StringBuilder& sb, const RectF& rect) {
    sb.append('(').append(rect.x).append(", ").append(rect.y).append(", ")
      .append(rect.width).append(" x ").append(rect.height).append(')');
}

} // namespace

String describe(const DisplayCommand& command) {
    StringBuilder sb;
    std::visit([&sb](const auto& cmd) {
        using T = std::decay_t<decltype(cmd)>;
        if constexpr (std::is_same_v<T, PaintPageCommand>) {
            sb.append("page ").append(static_cast<u64>(cmd.page)).append(' ');
            append_rect(sb, cmd.rect);
        } else if constexpr (std::is_same_v<T, PaintLineCommand>) {
            sb.append("  line ");
            append_rect(sb, cmd.rect);
        } else if constexpr (std::is_same_v<T, PaintWordCommand>) {
            sb.append("    word \"").append(cmd.text).append("\" at (")
              .append(cmd.position.x).append(", ").append(cmd.position.y).append(')');
        } else if constexpr (std::is_same_v<T, PaintSelectionCommand>) {
            sb.append("  selection ");
            append_rect(sb, cmd.rect);
        } else if constexpr (std::is_same_v<T, PaintCaretCommand>) {
            sb.append("  caret ");
            append_rect(sb, cmd.rect);
        }
    }, command);
    return sb.build();
}

PaintRegistry default_paint_registry() {
    PaintRegistry registry("paint");

    registry.register_type(render::WORD_TYPE,
        [](const layout::WordLayout& word, const PaintContext& context, DisplayList& list) {
            const auto& style = word.style();
            list.push(PaintWordCommand{
                context.page,
                context.origin,
                word.text(),
                style.font_family.empty() ? String("sans-serif") : style.font_family,
                style.font_size > 0 ? style.font_size : context.config.font_size,
                style.bold,
                style.italic,
                style.underline,
                style.color,
            });
        });

    registry.register_type(render::LINE_BREAK_TYPE,
        [](const layout::WordLayout&, const PaintContext&, DisplayList&) {});

    return registry;
}

DisplayListBuilder::DisplayListBuilder(PaintRegistry registry, PaintStyle style)
    : m_registry(std::move(registry)), m_style(style) {}

EditorResult<DisplayList> DisplayListBuilder::build(const layout::DocLayout& layout,
                                                    const cursor::Cursor* cursor,
                                                    const EditorConfig& config) const {
    DisplayList list;

    for (usize p = 0; p < layout.page_count(); ++p) {
        const layout::PageLayout& page = layout.page(p);
        list.push(PaintPageCommand{p, page.rect(), m_style.page_background});

        for (usize l = 0; l < page.line_count(); ++l) {
            const layout::LineLayout& line = page.line(l);
            list.push(PaintLineCommand{p, line.rect()});

            for (usize w = 0; w < line.word_count(); ++w) {
                const layout::WordLayout& word = line.word(w);
                auto paint = m_registry.lookup(word.type());
                if (paint.is_err()) {
                    return make_error(paint.error());
                }
                PaintContext context{p, PointF(line.rect().x + word.rect().x, line.rect().y), config};
                (*paint.value())(word, context, list);
            }
        }
    }

    if (cursor) {
        if (!cursor->is_collapsed()) {
            auto selection = layout.screen_rects(cursor->from(), cursor->to());
            if (selection.is_err()) {
                return make_error(selection.error());
            }
            for (const auto& page_rects : selection.value()) {
                for (const auto& rect : page_rects.rects) {
                    list.push(PaintSelectionCommand{page_rects.page_index, rect, m_style.selection});
                }
            }
        }

        auto caret = layout.caret_rect(cursor->head);
        if (caret.is_err()) {
            return make_error(caret.error());
        }
        RectF rect = caret.value().rect;
        rect.width = m_style.caret_width;
        list.push(PaintCaretCommand{caret.value().page_index, rect, m_style.caret});
    }

    StringBuilder sb;
    sb.append("display list: ").append(static_cast<u64>(list.size())).append(" commands");
    logging::get("view").trace(sb.view());
    return std::move(list);
}

} // namespace folio::view
