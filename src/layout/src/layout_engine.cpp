#include "folio/layout/layout_engine.hpp"
#include "folio/core/logger.hpp"
#include <numeric>

namespace folio::layout {

// ============================================================================
// Default measurement
// ============================================================================

text::FontDescription font_for(const model::TextStyle& style, const EditorConfig& config) {
    text::FontDescription font;
    if (!style.font_family.empty()) {
        font.family = style.font_family;
    }
    font.size = style.font_size > 0 ? style.font_size : config.font_size;
    font.bold = style.bold;
    font.italic = style.italic;
    return font;
}

BoxRegistry default_box_registry() {
    BoxRegistry registry("layout");

    registry.register_type(render::WORD_TYPE,
        [](const render::AtomicRenderNode& atomic, const MeasureContext& context) {
            auto font = font_for(atomic.style(), context.config);
            return WordMetrics{context.measurer.advances(atomic.content(), font),
                               font.size * context.line_height};
        });

    registry.register_type(render::LINE_BREAK_TYPE,
        [](const render::AtomicRenderNode&, const MeasureContext& context) {
            return WordMetrics{{0.0f}, context.config.font_size * context.line_height};
        });

    return registry;
}

// ============================================================================
// LayoutEngine
// ============================================================================

LayoutEngine::LayoutEngine(const text::TextMeasurer& measurer, BoxRegistry registry)
    : m_measurer(measurer), m_registry(std::move(registry)) {}

EditorResult<void> LayoutEngine::collect_words(const render::RenderNode& node, const MeasureContext& context,
                                               std::vector<std::unique_ptr<WordLayout>>& words) const {
    if (node.kind() != render::RenderKind::Atomic) {
        for (const auto& child : node.children()) {
            auto result = collect_words(*child, context, words);
            if (result.is_err()) {
                return result;
            }
        }
        return {};
    }

    const auto& atomic = static_cast<const render::AtomicRenderNode&>(node);
    auto measure = m_registry.lookup(atomic.type());
    if (measure.is_err()) {
        return make_error(measure.error());
    }

    WordMetrics metrics = (*measure.value())(atomic, context);
    f32 width = std::accumulate(metrics.advances.begin(), metrics.advances.end(), 0.0f);

    auto word = std::make_unique<WordLayout>(atomic.id(), atomic.type(), atomic.content(), atomic.style(),
                                             std::move(metrics.advances), atomic.selectable_size(),
                                             atomic.trimmed_size());
    word->set_rect(RectF(0, 0, width, metrics.height));
    words.push_back(std::move(word));
    return {};
}

std::vector<std::unique_ptr<LineLayout>> LayoutEngine::break_lines(
    std::vector<std::unique_ptr<WordLayout>> words, f32 max_width, const String& block_id) {
    std::vector<std::unique_ptr<LineLayout>> lines;
    std::unique_ptr<LineLayout> current;
    f32 cumulated = 0;
    f32 height = 0;

    auto finish_line = [&]() {
        current->set_rect(RectF(0, 0, cumulated, height));
        lines.push_back(std::move(current));
    };

    for (auto& word : words) {
        f32 width = word->width();
        if (current && !current->children().empty() && cumulated + width > max_width) {
            finish_line();
        }
        if (!current) {
            StringBuilder sb;
            sb.append(block_id).append(":line:").append(static_cast<u64>(lines.size()));
            current = std::make_unique<LineLayout>(sb.build());
            cumulated = 0;
            height = 0;
        }
        word->set_rect(RectF(cumulated, 0, width, word->height()));
        cumulated += width;
        height = std::max(height, word->height());
        current->append_child(std::move(word));
    }
    if (current) {
        finish_line();
    }
    return lines;
}

std::vector<std::unique_ptr<PageLayout>> LayoutEngine::paginate(
    std::vector<std::unique_ptr<LineLayout>> lines, const model::PageGeometry& geometry) {
    std::vector<std::unique_ptr<PageLayout>> pages;
    f32 max_height = geometry.content_height();
    std::unique_ptr<PageLayout> current;
    f32 cumulated = 0;

    auto new_page = [&]() {
        StringBuilder sb;
        sb.append("page:").append(static_cast<u64>(pages.size()));
        current = std::make_unique<PageLayout>(sb.build(), geometry);
        cumulated = 0;
    };

    for (auto& line : lines) {
        f32 height = line->height();
        if (current && !current->children().empty() && cumulated + height > max_height) {
            pages.push_back(std::move(current));
        }
        if (!current) {
            new_page();
        }
        RectF rect = line->rect();
        line->set_rect(RectF(geometry.padding_left, geometry.padding_top + cumulated, rect.width, rect.height));
        cumulated += height;
        current->append_child(std::move(line));
    }

    // An empty document still shows one page
    if (!current) {
        new_page();
    }
    pages.push_back(std::move(current));
    return pages;
}

EditorResult<std::unique_ptr<DocLayout>> LayoutEngine::layout(
    const render::DocRenderNode& doc, const EditorConfig& config) const {
    const model::PageGeometry& geometry = doc.page();

    std::vector<std::unique_ptr<LineLayout>> lines;
    for (const auto& child : doc.children()) {
        f32 line_height = config.line_height;
        if (child->kind() == render::RenderKind::Block) {
            f32 block_line_height = static_cast<const render::BlockRenderNode&>(*child).line_height();
            if (block_line_height > 0) {
                line_height = block_line_height;
            }
        }

        MeasureContext context{m_measurer, config, line_height};
        std::vector<std::unique_ptr<WordLayout>> words;
        auto collected = collect_words(*child, context, words);
        if (collected.is_err()) {
            logging::get("layout").error("layout aborted");
            return make_error(collected.error());
        }

        for (auto& line : break_lines(std::move(words), geometry.content_width(), child->id())) {
            lines.push_back(std::move(line));
        }
    }

    usize line_count = lines.size();
    auto result = std::make_unique<DocLayout>(doc.id(), geometry, config.page_gap);
    for (auto& page : paginate(std::move(lines), geometry)) {
        usize index = result->page_count();
        page->set_rect(RectF(0, static_cast<f32>(index) * (geometry.height + config.page_gap),
                             geometry.width, geometry.height));
        result->append_child(std::move(page));
    }

    StringBuilder sb;
    sb.append("layout: ").append(static_cast<u64>(result->page_count())).append(" pages, ")
      .append(static_cast<u64>(line_count)).append(" lines, size ")
      .append(static_cast<u64>(result->size()));
    logging::get("layout").debug(sb.view());

    return std::move(result);
}

} // namespace folio::layout
