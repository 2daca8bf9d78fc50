#include <gtest/gtest.h>
#include "folio/model/document.hpp"
#include "support/fixtures.hpp"

using namespace folio;
using namespace folio::model;

namespace {

// doc( p1( t1"Hi" span( t2"you" ) ) p2() )
//  0   1    2..3   4    5..7     8  9  10 11 12
class ResolveOffsetTest : public folio::testing::LogCapture {
protected:
    void SetUp() override {
        LogCapture::SetUp();
        doc = std::make_unique<Document>("doc");
        auto p1 = std::make_unique<Paragraph>("p1");
        ASSERT_TRUE(p1->append_child(std::make_unique<Text>("t1", "Hi")).is_ok());
        auto span = std::make_unique<Span>("s", TextStyle{});
        ASSERT_TRUE(span->append_child(std::make_unique<Text>("t2", "you")).is_ok());
        ASSERT_TRUE(p1->append_child(std::move(span)).is_ok());
        ASSERT_TRUE(doc->append_child(std::move(p1)).is_ok());
        ASSERT_TRUE(doc->append_child(std::make_unique<Paragraph>("p2")).is_ok());
    }

    void expect(usize offset, const char* id, usize local) {
        auto resolved = resolve_offset(*doc, offset);
        ASSERT_TRUE(resolved.is_ok()) << "offset " << offset;
        EXPECT_EQ(resolved.value().node->id(), String(id)) << "offset " << offset;
        EXPECT_EQ(resolved.value().offset, local) << "offset " << offset;
    }

    std::unique_ptr<Document> doc;
};

} // namespace

TEST_F(ResolveOffsetTest, Size) {
    EXPECT_EQ(doc->model_size(), 13u);
}

TEST_F(ResolveOffsetTest, OpeningDelimiters) {
    expect(0, "doc", 0);
    expect(1, "p1", 0);
    expect(4, "s", 0);
    expect(10, "p2", 0);
}

TEST_F(ResolveOffsetTest, LeafContent) {
    expect(2, "t1", 0);
    expect(3, "t1", 1);
    expect(5, "t2", 0);
    expect(7, "t2", 2);
}

TEST_F(ResolveOffsetTest, ClosingDelimiters) {
    expect(8, "s", 4);
    expect(9, "p1", 8);
    expect(11, "p2", 1);
    expect(12, "doc", 12);
}

TEST_F(ResolveOffsetTest, OutOfRange) {
    auto resolved = resolve_offset(*doc, 13);
    ASSERT_TRUE(resolved.is_err());
    EXPECT_EQ(resolved.error().kind, ErrorKind::OutOfRange);
    EXPECT_TRUE(log().contains("model offset 13 outside doc of size 13"));
}
