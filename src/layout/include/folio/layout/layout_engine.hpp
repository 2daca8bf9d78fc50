#pragma once

#include "layout_node.hpp"
#include "folio/core/config.hpp"
#include "folio/core/registry.hpp"
#include "folio/render/render_node.hpp"
#include "folio/text/measurer.hpp"
#include <functional>

namespace folio::layout {

// ============================================================================
// Measurement registry
// ============================================================================

struct MeasureContext {
    const text::TextMeasurer& measurer;
    const EditorConfig& config;
    f32 line_height;  // Multiplier in effect for the enclosing block
};

struct WordMetrics {
    std::vector<f32> advances;
    f32 height{0};
};

using MeasureFn = std::function<WordMetrics(const render::AtomicRenderNode&, const MeasureContext&)>;
using BoxRegistry = TypeRegistry<MeasureFn>;

// Word and LineBreak atomics
[[nodiscard]] BoxRegistry default_box_registry();

[[nodiscard]] text::FontDescription font_for(const model::TextStyle& style, const EditorConfig& config);

// ============================================================================
// LayoutEngine - Builds the page/line/word tree from the render tree
// ============================================================================

class LayoutEngine {
public:
    explicit LayoutEngine(const text::TextMeasurer& measurer, BoxRegistry registry = default_box_registry());

    /**
     * @brief Rebuilds the layout tree for a render tree
     *
     * Words are filled greedily into lines of the page content width, a block
     * always starts a new line, and lines are filled greedily into pages of
     * the content height. An empty document yields one empty page.
     */
    [[nodiscard]] EditorResult<std::unique_ptr<DocLayout>> layout(
        const render::DocRenderNode& doc, const EditorConfig& config) const;

    // Greedy width fill; a box wider than max_width sits alone on its line
    [[nodiscard]] static std::vector<std::unique_ptr<LineLayout>> break_lines(
        std::vector<std::unique_ptr<WordLayout>> words, f32 max_width, const String& block_id);

    // Greedy height fill; a page always receives at least one line
    [[nodiscard]] static std::vector<std::unique_ptr<PageLayout>> paginate(
        std::vector<std::unique_ptr<LineLayout>> lines, const model::PageGeometry& geometry);

    [[nodiscard]] const BoxRegistry& registry() const { return m_registry; }

private:
    EditorResult<void> collect_words(const render::RenderNode& node, const MeasureContext& context,
                                     std::vector<std::unique_ptr<WordLayout>>& words) const;

    const text::TextMeasurer& m_measurer;
    BoxRegistry m_registry;
};

} // namespace folio::layout
