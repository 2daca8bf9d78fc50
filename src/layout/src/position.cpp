#include "folio/layout/layout_node.hpp"

namespace folio::layout {

namespace {

struct Located {
    usize index;
    usize position;
};

// Child of parent holding offset, searched from either end
std::optional<Located> locate(const LayoutNode& parent, usize offset, SearchOrder order) {
    const auto& children = parent.children();
    if (order == SearchOrder::FromHead) {
        usize cumulated = 0;
        for (usize i = 0; i < children.size(); ++i) {
            usize size = children[i]->size();
            if (offset < cumulated + size) {
                return Located{i, offset - cumulated};
            }
            cumulated += size;
        }
        return std::nullopt;
    }

    usize cumulated = parent.size();
    for (usize i = children.size(); i-- > 0;) {
        usize size = children[i]->size();
        cumulated -= size;
        if (offset >= cumulated && offset < cumulated + size) {
            return Located{i, offset - cumulated};
        }
    }
    return std::nullopt;
}

Error<EditorError> position_out_of_range(usize offset, usize size) {
    StringBuilder sb;
    sb.append("position ").append(static_cast<u64>(offset))
      .append(" outside layout of size ").append(static_cast<u64>(size));
    return out_of_range(sb.build());
}

usize line_start_in_page(const PageLayout& page, usize line_index) {
    usize start = 0;
    for (usize i = 0; i < line_index; ++i) {
        start += page.line(i).size();
    }
    return start;
}

} // namespace

EditorResult<PositionPath> DocLayout::describe_position(usize offset, SearchOrder order) const {
    if (offset >= size()) {
        return position_out_of_range(offset, size());
    }

    // Sizes are consistent, so each level below must succeed
    PositionPath path;
    auto page_hit = locate(*this, offset, order);
    path.page_index = page_hit->index;
    path.page = {&page(page_hit->index), page_hit->position};

    auto line_hit = locate(*path.page.node, page_hit->position, order);
    path.line = {&path.page.node->line(line_hit->index), line_hit->position};

    auto word_hit = locate(*path.line.node, line_hit->position, order);
    path.word = {&path.line.node->word(word_hit->index), word_hit->position};

    return path;
}

// ============================================================================
// Boundary search
// ============================================================================

EditorResult<usize> DocLayout::boundary(usize offset, Granularity granularity, Direction direction) const {
    auto described = describe_position(offset);
    if (described.is_err()) {
        return make_error(described.error());
    }
    const PositionPath& path = described.value();

    const LayoutNode* node = path.at_word().node;
    usize local = path.at_word().position;
    if (granularity == Granularity::Line) {
        node = path.at_line().node;
        local = path.at_line().position;
    }
    usize node_start = offset - local;

    if (direction == Direction::Backward) {
        if (local > 0) {
            return node_start;
        }
        const LayoutNode* previous = node->previous_cross_parent_sibling();
        if (!previous) {
            return offset;
        }
        return node_start - previous->size();
    }

    usize end = node->boundary_end();
    if (local < end) {
        return node_start + end;
    }
    const LayoutNode* next = node->next_cross_parent_sibling();
    if (!next) {
        return offset;
    }
    return node_start + node->size() + next->boundary_end();
}

EditorResult<usize> DocLayout::word_start(usize offset) const {
    return boundary(offset, Granularity::Word, Direction::Backward);
}

EditorResult<usize> DocLayout::word_end(usize offset) const {
    return boundary(offset, Granularity::Word, Direction::Forward);
}

EditorResult<usize> DocLayout::line_start(usize offset) const {
    return boundary(offset, Granularity::Line, Direction::Backward);
}

EditorResult<usize> DocLayout::line_end(usize offset) const {
    return boundary(offset, Granularity::Line, Direction::Forward);
}

EditorResult<usize> DocLayout::position_above(usize offset, f32 x) const {
    auto described = describe_position(offset);
    if (described.is_err()) {
        return make_error(described.error());
    }
    const auto& line = described.value().at_line();
    usize line_begin = offset - line.position;

    const auto* previous = static_cast<const LineLayout*>(line.node->previous_cross_parent_sibling());
    if (!previous) {
        return line_begin;
    }
    return line_begin - previous->size() + previous->convert_coordinates_to_position(x);
}

EditorResult<usize> DocLayout::position_below(usize offset, f32 x) const {
    auto described = describe_position(offset);
    if (described.is_err()) {
        return make_error(described.error());
    }
    const auto& line = described.value().at_line();
    usize line_begin = offset - line.position;

    const auto* next = static_cast<const LineLayout*>(line.node->next_cross_parent_sibling());
    if (!next) {
        return line_begin + line.node->size() - 1;
    }
    return line_begin + line.node->size() + next->convert_coordinates_to_position(x);
}

// ============================================================================
// Screen mapping
// ============================================================================

EditorResult<ScreenPosition> DocLayout::caret_rect(usize offset) const {
    auto described = describe_position(offset);
    if (described.is_err()) {
        return make_error(described.error());
    }
    const PositionPath& path = described.value();
    const LineLayout& line = *path.at_line().node;

    f32 x = line.rect().x + line.caret_x(path.at_line().position);
    return ScreenPosition{path.page_index, RectF(x, line.rect().y, 0, line.height())};
}

EditorResult<std::vector<PageRects>> DocLayout::screen_rects(usize from, usize to) const {
    if (to > size()) {
        return position_out_of_range(to, size());
    }
    if (from > to) {
        StringBuilder sb;
        sb.append("screen_rects: from ").append(static_cast<u64>(from))
          .append(" is after to ").append(static_cast<u64>(to));
        return invalid_argument(sb.build());
    }

    std::vector<PageRects> result;
    if (from == to) {
        return result;
    }
    usize line_begin = 0;
    for (usize p = 0; p < page_count(); ++p) {
        const PageLayout& current = page(p);
        PageRects page_rects{p, {}};

        for (usize l = 0; l < current.line_count(); ++l) {
            const LineLayout& line = current.line(l);
            usize line_finish = line_begin + line.size();
            if (line_begin < to && line_finish > from) {
                usize a = std::max(from, line_begin) - line_begin;
                usize b = std::min(to, line_finish) - line_begin;
                f32 left = line.caret_x(a);
                f32 right = line.caret_x(b);
                page_rects.rects.emplace_back(line.rect().x + left, line.rect().y, right - left, line.height());
            }
            line_begin = line_finish;
        }

        if (!page_rects.rects.empty()) {
            result.push_back(std::move(page_rects));
        }
        if (line_begin >= to) {
            break;
        }
    }
    return result;
}

EditorResult<usize> DocLayout::resolve_position(usize local_offset, const PageLayout& target) const {
    for (usize i = 0; i < page_count(); ++i) {
        if (&page(i) != &target) {
            continue;
        }
        if (local_offset >= target.size()) {
            return position_out_of_range(local_offset, target.size());
        }
        return page_start(i) + local_offset;
    }
    return invalid_argument(String("resolve_position: page ") + target.id() + " is not part of this layout");
}

EditorResult<usize> DocLayout::resolve_point(usize page_index, f32 x, f32 y) const {
    if (page_index >= page_count()) {
        return position_out_of_range(page_index, page_count());
    }
    const PageLayout& target = page(page_index);
    auto line_index = target.line_at(y);
    if (!line_index) {
        return out_of_range(String("resolve_point: page ") + target.id() + " has no lines");
    }
    const LineLayout& line = target.line(*line_index);
    usize local = line_start_in_page(target, *line_index) +
                  line.convert_coordinates_to_position(x - line.rect().x);
    return resolve_position(local, target);
}

} // namespace folio::layout
