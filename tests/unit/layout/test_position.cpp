#include <gtest/gtest.h>
#include "support/layout_fixture.hpp"

using namespace folio;
using namespace folio::layout;

namespace {

// Three lines at width 6:
//   "Hello "        0..5
//   "world" + eol   6..11
//   "Foo" + eol     12..15
class PositionTest : public folio::testing::LayoutFixture {
protected:
    void SetUp() override {
        LayoutFixture::SetUp();
        build({"Hello world", "Foo"}, 6);
    }

    usize at(EditorResult<usize> result) {
        EXPECT_TRUE(result.is_ok());
        return result.is_ok() ? result.value() : static_cast<usize>(-1);
    }
};

// Same text with two lines per page
class PagedPositionTest : public folio::testing::LayoutFixture {
protected:
    void SetUp() override {
        LayoutFixture::SetUp();
        build({"Hello world", "Foo"}, 6, 20);
    }
};

} // namespace

// ============================================================================
// Position description
// ============================================================================

TEST_F(PositionTest, DescribePosition) {
    auto described = doc_layout->describe_position(8);
    ASSERT_TRUE(described.is_ok());
    const PositionPath& path = described.value();

    EXPECT_EQ(path.page_index, 0u);
    EXPECT_EQ(path.at_page().position, 8u);
    EXPECT_EQ(path.at_line().node, &doc_layout->page(0).line(1));
    EXPECT_EQ(path.at_line().position, 2u);
    EXPECT_EQ(path.at_word().node->text(), String("world"));
    EXPECT_EQ(path.at_word().position, 2u);
}

TEST_F(PositionTest, DescribeLineBreak) {
    auto described = doc_layout->describe_position(11);
    ASSERT_TRUE(described.is_ok());
    EXPECT_EQ(described.value().at_word().node->type(), render::LINE_BREAK_TYPE);
    EXPECT_EQ(described.value().at_word().position, 0u);
}

TEST_F(PositionTest, DescribeOutOfRange) {
    auto described = doc_layout->describe_position(16);
    ASSERT_TRUE(described.is_err());
    EXPECT_EQ(described.error().kind, ErrorKind::OutOfRange);
}

TEST_F(PositionTest, SearchOrdersAgree) {
    for (usize offset = 0; offset < doc_layout->size(); ++offset) {
        auto head = doc_layout->describe_position(offset, SearchOrder::FromHead);
        auto tail = doc_layout->describe_position(offset, SearchOrder::FromTail);
        ASSERT_TRUE(head.is_ok() && tail.is_ok());
        EXPECT_EQ(head.value().at_line().node, tail.value().at_line().node) << "offset " << offset;
        EXPECT_EQ(head.value().at_word().node, tail.value().at_word().node) << "offset " << offset;
        EXPECT_EQ(head.value().at_word().position, tail.value().at_word().position) << "offset " << offset;
    }
}

// ============================================================================
// Boundaries
// ============================================================================

TEST_F(PositionTest, WordStart) {
    EXPECT_EQ(at(doc_layout->word_start(8)), 6u);
    // At a word start the search moves to the previous word
    EXPECT_EQ(at(doc_layout->word_start(6)), 0u);
    EXPECT_EQ(at(doc_layout->word_start(12)), 11u);
    EXPECT_EQ(at(doc_layout->word_start(0)), 0u);
}

TEST_F(PositionTest, WordEnd) {
    // Word ends exclude trailing whitespace
    EXPECT_EQ(at(doc_layout->word_end(0)), 5u);
    EXPECT_EQ(at(doc_layout->word_end(5)), 11u);
    EXPECT_EQ(at(doc_layout->word_end(8)), 11u);
    EXPECT_EQ(at(doc_layout->word_end(11)), 15u);
    EXPECT_EQ(at(doc_layout->word_end(15)), 15u);
}

TEST_F(PositionTest, LineStart) {
    EXPECT_EQ(at(doc_layout->line_start(8)), 6u);
    EXPECT_EQ(at(doc_layout->line_start(6)), 0u);
    EXPECT_EQ(at(doc_layout->line_start(12)), 6u);
    EXPECT_EQ(at(doc_layout->line_start(0)), 0u);
}

TEST_F(PositionTest, LineEnd) {
    EXPECT_EQ(at(doc_layout->line_end(0)), 5u);
    EXPECT_EQ(at(doc_layout->line_end(5)), 11u);
    EXPECT_EQ(at(doc_layout->line_end(8)), 11u);
    EXPECT_EQ(at(doc_layout->line_end(13)), 15u);
    EXPECT_EQ(at(doc_layout->line_end(15)), 15u);
}

TEST_F(PositionTest, BoundaryOutOfRange) {
    EXPECT_TRUE(doc_layout->word_start(16).is_err());
    EXPECT_TRUE(doc_layout->line_end(40).is_err());
}

TEST_F(PositionTest, SingleWordDocument) {
    build({"Hello"}, 50);

    EXPECT_EQ(at(doc_layout->word_end(3)), 5u);
    EXPECT_EQ(at(doc_layout->word_end(5)), 5u);
    EXPECT_EQ(at(doc_layout->word_start(3)), 0u);
}

// ============================================================================
// Vertical movement
// ============================================================================

TEST_F(PositionTest, PositionBelow) {
    EXPECT_EQ(at(doc_layout->position_below(2, 2)), 8u);
    // Past the end of a shorter line lands on its line break
    EXPECT_EQ(at(doc_layout->position_below(4, 100)), 11u);
    // Last line stays on its end
    EXPECT_EQ(at(doc_layout->position_below(13, 1)), 15u);
}

TEST_F(PositionTest, PositionAbove) {
    EXPECT_EQ(at(doc_layout->position_above(8, 2)), 2u);
    EXPECT_EQ(at(doc_layout->position_above(14, 100)), 11u);
    // First line goes to its start
    EXPECT_EQ(at(doc_layout->position_above(3, 3)), 0u);
}

TEST_F(PagedPositionTest, VerticalMovesCrossPages) {
    ASSERT_EQ(doc_layout->page_count(), 2u);

    EXPECT_EQ(doc_layout->position_below(8, 2).value(), 14u);
    EXPECT_EQ(doc_layout->position_above(13, 1).value(), 7u);
    EXPECT_EQ(doc_layout->word_start(12).value(), 11u);
    EXPECT_EQ(doc_layout->line_start(12).value(), 6u);
}

// ============================================================================
// Screen mapping
// ============================================================================

TEST_F(PositionTest, CaretRect) {
    auto caret = doc_layout->caret_rect(8);
    ASSERT_TRUE(caret.is_ok());
    EXPECT_EQ(caret.value().page_index, 0u);
    EXPECT_EQ(caret.value().rect, RectF(2, 10, 0, 10));

    // Line break caret sits after the last word
    EXPECT_EQ(doc_layout->caret_rect(11).value().rect, RectF(5, 10, 0, 10));
}

TEST_F(PositionTest, ScreenRectsSpanLines) {
    auto rects = doc_layout->screen_rects(3, 8);
    ASSERT_TRUE(rects.is_ok());
    ASSERT_EQ(rects.value().size(), 1u);

    const PageRects& page = rects.value()[0];
    EXPECT_EQ(page.page_index, 0u);
    ASSERT_EQ(page.rects.size(), 2u);
    EXPECT_EQ(page.rects[0], RectF(3, 0, 3, 10));
    EXPECT_EQ(page.rects[1], RectF(0, 10, 2, 10));
}

TEST_F(PositionTest, ScreenRectsEdgeCases) {
    auto empty = doc_layout->screen_rects(5, 5);
    ASSERT_TRUE(empty.is_ok());
    EXPECT_TRUE(empty.value().empty());

    auto reversed = doc_layout->screen_rects(8, 3);
    ASSERT_TRUE(reversed.is_err());
    EXPECT_EQ(reversed.error().kind, ErrorKind::InvalidArgument);

    EXPECT_EQ(doc_layout->screen_rects(0, 17).error().kind, ErrorKind::OutOfRange);
    EXPECT_TRUE(doc_layout->screen_rects(0, 16).is_ok());
}

TEST_F(PagedPositionTest, ScreenRectsPerPage) {
    auto rects = doc_layout->screen_rects(8, 14);
    ASSERT_TRUE(rects.is_ok());
    ASSERT_EQ(rects.value().size(), 2u);

    EXPECT_EQ(rects.value()[0].page_index, 0u);
    EXPECT_EQ(rects.value()[0].rects[0], RectF(2, 10, 3, 10));
    EXPECT_EQ(rects.value()[1].page_index, 1u);
    EXPECT_EQ(rects.value()[1].rects[0], RectF(0, 0, 2, 10));
}

TEST_F(PositionTest, ResolvePoint) {
    EXPECT_EQ(at(doc_layout->resolve_point(0, 2.2f, 15)), 8u);
    // Below the last line clamps onto it
    EXPECT_EQ(at(doc_layout->resolve_point(0, 100, 1000)), 15u);
    EXPECT_EQ(at(doc_layout->resolve_point(0, -3, -3)), 0u);
    EXPECT_TRUE(doc_layout->resolve_point(1, 0, 0).is_err());
}

TEST_F(PositionTest, CaretRoundTrip) {
    for (usize offset = 0; offset < doc_layout->size(); ++offset) {
        auto caret = doc_layout->caret_rect(offset);
        ASSERT_TRUE(caret.is_ok());
        const RectF& rect = caret.value().rect;
        auto resolved = doc_layout->resolve_point(caret.value().page_index, rect.x, rect.y + rect.height / 2);
        ASSERT_TRUE(resolved.is_ok());
        EXPECT_EQ(resolved.value(), offset);
    }
}

TEST_F(PagedPositionTest, ResolveOnSecondPage) {
    EXPECT_EQ(doc_layout->page_start(1), 12u);
    EXPECT_EQ(doc_layout->resolve_point(1, 1, 5).value(), 13u);
    EXPECT_EQ(doc_layout->caret_rect(13).value().page_index, 1u);
    EXPECT_EQ(doc_layout->resolve_position(2, doc_layout->page(1)).value(), 14u);
}

TEST_F(PositionTest, ResolvePositionRejectsForeignPage) {
    PageLayout stranger("page:9", doc_layout->geometry());

    EXPECT_EQ(doc_layout->resolve_position(3, doc_layout->page(0)).value(), 3u);
    EXPECT_EQ(doc_layout->resolve_position(3, stranger).error().kind, ErrorKind::InvalidArgument);
    EXPECT_EQ(doc_layout->resolve_position(16, doc_layout->page(0)).error().kind, ErrorKind::OutOfRange);
}
