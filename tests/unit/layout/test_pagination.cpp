#include <gtest/gtest.h>
#include "support/layout_fixture.hpp"

using namespace folio;
using namespace folio::layout;

using PaginationTest = folio::testing::LayoutFixture;

namespace {

std::vector<std::unique_ptr<LineLayout>> make_lines(std::initializer_list<f32> heights) {
    std::vector<std::unique_ptr<LineLayout>> lines;
    for (f32 height : heights) {
        StringBuilder sb;
        sb.append("line:").append(static_cast<u64>(lines.size()));
        auto line = std::make_unique<LineLayout>(sb.build());
        line->set_rect(RectF(0, 0, 10, height));
        lines.push_back(std::move(line));
    }
    return lines;
}

model::PageGeometry geometry(f32 height, f32 padding) {
    model::PageGeometry page;
    page.width = 100;
    page.height = height;
    page.padding_top = padding;
    page.padding_bottom = padding;
    page.padding_left = padding;
    page.padding_right = padding;
    return page;
}

} // namespace

TEST(PaginateTest, FillsPagesGreedily) {
    auto pages = LayoutEngine::paginate(make_lines({10, 10, 10, 10, 10}), geometry(25, 0));

    ASSERT_EQ(pages.size(), 3u);
    EXPECT_EQ(pages[0]->line_count(), 2u);
    EXPECT_EQ(pages[1]->line_count(), 2u);
    EXPECT_EQ(pages[2]->line_count(), 1u);
    EXPECT_EQ(pages[0]->id(), String("page:0"));
    EXPECT_EQ(pages[2]->id(), String("page:2"));
}

TEST(PaginateTest, LinesAreOffsetByPadding) {
    auto pages = LayoutEngine::paginate(make_lines({10, 12}), geometry(100, 5));

    ASSERT_EQ(pages.size(), 1u);
    EXPECT_EQ(pages[0]->line(0).rect(), RectF(5, 5, 10, 10));
    EXPECT_EQ(pages[0]->line(1).rect(), RectF(5, 15, 10, 12));
}

TEST(PaginateTest, OversizedLineGetsOwnPage) {
    auto pages = LayoutEngine::paginate(make_lines({5, 40, 5}), geometry(20, 0));

    ASSERT_EQ(pages.size(), 3u);
    EXPECT_EQ(pages[1]->line_count(), 1u);
    EXPECT_FLOAT_EQ(pages[1]->line(0).rect().y, 0.0f);
}

TEST(PaginateTest, NoLinesStillOnePage) {
    auto pages = LayoutEngine::paginate({}, geometry(100, 0));

    ASSERT_EQ(pages.size(), 1u);
    EXPECT_EQ(pages[0]->line_count(), 0u);
    EXPECT_EQ(pages[0]->size(), 0u);
}

TEST_F(PaginationTest, PagesStackWithGap) {
    build({"a", "b", "c", "d", "e"}, 50, 25);
    config.page_gap = 5;
    relayout();

    ASSERT_EQ(doc_layout->page_count(), 3u);
    EXPECT_FLOAT_EQ(doc_layout->page_gap(), 5.0f);
    EXPECT_EQ(doc_layout->page(1).rect(), RectF(0, 30, 50, 25));
    EXPECT_FLOAT_EQ(doc_layout->page(2).rect().y, 60.0f);
}

TEST_F(PaginationTest, PageStarts) {
    build({"a", "b", "c", "d", "e"}, 50, 25);

    // Each paragraph is "x" plus its line break
    EXPECT_EQ(doc_layout->page(0).size(), 4u);
    EXPECT_EQ(doc_layout->page_start(0), 0u);
    EXPECT_EQ(doc_layout->page_start(1), 4u);
    EXPECT_EQ(doc_layout->page_start(2), 8u);
    EXPECT_EQ(doc_layout->size(), 10u);
}

TEST_F(PaginationTest, PageGeometryComesFromDocument) {
    build({"a"}, 50, 25);

    EXPECT_EQ(doc_layout->geometry(), doc->page());
    EXPECT_FLOAT_EQ(doc_layout->page(0).width(), 50.0f);
    EXPECT_FLOAT_EQ(doc_layout->page(0).height(), 25.0f);
}

TEST_F(PaginationTest, LineAtClampsToEdges) {
    build({"a", "b"}, 50);
    const PageLayout& page = doc_layout->page(0);

    EXPECT_EQ(page.line_at(-5), 0u);
    EXPECT_EQ(page.line_at(5), 0u);
    EXPECT_EQ(page.line_at(10), 1u);
    EXPECT_EQ(page.line_at(500), 1u);
}

TEST_F(PaginationTest, LayoutIsLogged) {
    build({"a", "b", "c"}, 50, 25);
    EXPECT_TRUE(log().contains("[DEBUG] [layout] layout: 2 pages, 3 lines, size 6"));
}
