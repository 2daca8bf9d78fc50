#include <gtest/gtest.h>
#include "support/editor_fixture.hpp"
#include "folio/view/doc_view.hpp"

using namespace folio;
using namespace folio::cursor;
using namespace folio::view;

// Full sessions: commands through the editor, relayout, repaint
class EditingSessionTest : public folio::testing::EditorFixture {
protected:
    RecordingSink sink;
};

TEST_F(EditingSessionTest, TypingReflowsAcrossPages) {
    open({"Hello"}, 10, 20);
    DocView view(*editor, sink);
    ASSERT_TRUE(editor->focus(5).is_ok());
    EXPECT_EQ(editor->layout().page_count(), 1u);

    type(" world foo bar");
    EXPECT_EQ(content(), String("Hello world foo bar"));
    EXPECT_EQ(editor->selectable_size(), 20u);
    EXPECT_EQ(selection(), std::make_pair(usize{19}, usize{19}));

    // Three lines at two lines per page
    EXPECT_EQ(editor->layout().page_count(), 2u);
    const DisplayList& painted = sink.last();
    EXPECT_EQ(painted.count<PaintPageCommand>(), 2u);
    EXPECT_EQ(painted.count<PaintLineCommand>(), 3u);
    ASSERT_TRUE(std::holds_alternative<PaintCaretCommand>(painted.commands().back()));
    EXPECT_EQ(std::get<PaintCaretCommand>(painted.commands().back()).page, 1u);

    run(commands::SELECT_ALL);
    run(commands::DELETE_BACKWARD);
    EXPECT_EQ(content(), String(""));
    EXPECT_EQ(editor->layout().page_count(), 1u);
    EXPECT_EQ(sink.last().count<PaintWordCommand>(), 0u);

    type("Foo");
    EXPECT_EQ(content(), String("Foo"));
    EXPECT_EQ(selection(), std::make_pair(usize{3}, usize{3}));
}

TEST_F(EditingSessionTest, SelectLineByKeyboardAndDelete) {
    open({"alpha beta", "gamma"}, 6);
    ASSERT_TRUE(editor->focus(0).is_ok());

    run(commands::MOVE_FORWARD_BY_LINE);
    EXPECT_EQ(selection(), std::make_pair(usize{6}, usize{6}));
    run(commands::MOVE_HEAD_FORWARD_BY_LINE);
    EXPECT_EQ(selection(), std::make_pair(usize{6}, usize{11}));

    run(commands::DELETE_BACKWARD);
    EXPECT_EQ(content(), String("alpha gamma"));
    EXPECT_EQ(editor->document().children().size(), 1u);
    EXPECT_EQ(editor->selectable_size(), 12u);
    EXPECT_EQ(selection(), std::make_pair(usize{6}, usize{6}));

    run(commands::SELECT_WORD);
    type("delta");
    EXPECT_EQ(content(), String("alpha delta"));
}

TEST_F(EditingSessionTest, PointerSelectionThenTyping) {
    open({"Hello world", "Foo"}, 6);
    DocView view(*editor, sink);

    auto down = view.locate(PointerAction::Down, 0, 12);
    auto up = view.locate(PointerAction::Up, 3, 22);
    ASSERT_TRUE(down && up);
    ASSERT_TRUE(view.handle_pointer(*down).is_ok());
    ASSERT_TRUE(view.handle_pointer(*up).is_ok());
    EXPECT_EQ(selection(), std::make_pair(usize{6}, usize{15}));

    type("there");
    EXPECT_EQ(content(), String("Hello there"));
    EXPECT_EQ(sink.last().count<PaintSelectionCommand>(), 0u);
    EXPECT_EQ(sink.last().count<PaintCaretCommand>(), 1u);
}

TEST_F(EditingSessionTest, RejectedCommandLeavesStateAndLogs) {
    open({"Hello"}, 50);
    DocView view(*editor, sink);
    ASSERT_TRUE(editor->focus(2).is_ok());
    usize presented = sink.presented();

    CommandArgs args;
    args.text = "a\nb";
    auto result = editor->execute(commands::INSERT_TEXT, args);
    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(content(), String("Hello"));
    EXPECT_EQ(selection(), std::make_pair(usize{2}, usize{2}));
    EXPECT_EQ(sink.presented(), presented);
    EXPECT_TRUE(log().contains("[WARN] [error] InvalidArgument"));
}
