#include <gtest/gtest.h>
#include "support/editor_fixture.hpp"

using namespace folio;
using namespace folio::cursor;

using CommandsTest = folio::testing::EditorFixture;

using Selection = std::pair<usize, usize>;

// ============================================================================
// Focus
// ============================================================================

TEST_F(CommandsTest, NoCursorNoMove) {
    open({"Hello"}, 50);

    run(commands::MOVE_FORWARD);
    run(commands::SELECT_ALL);
    type("x");
    EXPECT_FALSE(editor->cursor().has_value());
    EXPECT_EQ(content(), String("Hello"));
}

TEST_F(CommandsTest, Focus) {
    open({"Hello"}, 50);

    EXPECT_EQ(editor->focus(6).error().kind, ErrorKind::OutOfRange);
    ASSERT_TRUE(editor->focus(3).is_ok());
    EXPECT_EQ(selection(), Selection(3, 3));

    // Focusing again keeps the cursor where it is
    ASSERT_TRUE(editor->focus(0).is_ok());
    EXPECT_EQ(selection(), Selection(3, 3));

    editor->blur();
    EXPECT_FALSE(editor->cursor().has_value());
}

TEST_F(CommandsTest, UnknownCommand) {
    open({"Hello"}, 50);

    auto result = editor->execute("cursor.teleport");
    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(result.error().kind, ErrorKind::UnregisteredType);
}

// ============================================================================
// Collapsed moves
// ============================================================================

TEST_F(CommandsTest, MoveForwardByWordStopsAtDocumentEnd) {
    open({"Hello"}, 50);
    ASSERT_TRUE(editor->focus(3).is_ok());

    run(commands::MOVE_FORWARD_BY_WORD);
    EXPECT_EQ(selection(), Selection(5, 5));

    run(commands::MOVE_FORWARD_BY_WORD);
    EXPECT_EQ(selection(), Selection(5, 5));
}

TEST_F(CommandsTest, CharacterMovesClamp) {
    open({"Hello"}, 50);
    ASSERT_TRUE(editor->focus(0).is_ok());

    run(commands::MOVE_BACKWARD);
    EXPECT_EQ(selection(), Selection(0, 0));
    run(commands::MOVE_FORWARD);
    EXPECT_EQ(selection(), Selection(1, 1));
    run(commands::MOVE_TO_DOC_END);
    EXPECT_EQ(selection(), Selection(5, 5));
    run(commands::MOVE_FORWARD);
    EXPECT_EQ(selection(), Selection(5, 5));
    run(commands::MOVE_TO_DOC_START);
    EXPECT_EQ(selection(), Selection(0, 0));
}

TEST_F(CommandsTest, WordAndLineMoves) {
    open({"Hello world", "Foo"}, 6);
    ASSERT_TRUE(editor->focus(8).is_ok());

    run(commands::MOVE_BACKWARD_BY_WORD);
    EXPECT_EQ(selection(), Selection(6, 6));
    run(commands::MOVE_BACKWARD_BY_WORD);
    EXPECT_EQ(selection(), Selection(0, 0));
    run(commands::MOVE_FORWARD_BY_WORD);
    EXPECT_EQ(selection(), Selection(5, 5));

    run(commands::MOVE_TO_LINE_END);
    EXPECT_EQ(selection(), Selection(11, 11));
    run(commands::MOVE_TO_LINE_START);
    EXPECT_EQ(selection(), Selection(6, 6));
}

TEST_F(CommandsTest, MoveClampsPosition) {
    open({"Hello world", "Foo"}, 6);
    ASSERT_TRUE(editor->focus(0).is_ok());

    run_at(commands::MOVE, 100);
    EXPECT_EQ(selection(), Selection(15, 15));

    auto missing = editor->execute(commands::MOVE);
    ASSERT_TRUE(missing.is_err());
    EXPECT_EQ(missing.error().kind, ErrorKind::InvalidArgument);
}

// ============================================================================
// Vertical moves
// ============================================================================

TEST_F(CommandsTest, VerticalMovesKeepColumn) {
    open({"Hello world", "Foo"}, 6);
    ASSERT_TRUE(editor->focus(4).is_ok());

    run(commands::MOVE_FORWARD_BY_LINE);
    EXPECT_EQ(selection(), Selection(10, 10));
    // "Foo" is shorter, the caret lands on its line break
    run(commands::MOVE_FORWARD_BY_LINE);
    EXPECT_EQ(selection(), Selection(15, 15));
    EXPECT_FLOAT_EQ(editor->cursor()->left_lock, 4.0f);

    // Back up, the remembered column wins over the current one
    run(commands::MOVE_BACKWARD_BY_LINE);
    EXPECT_EQ(selection(), Selection(10, 10));
    run(commands::MOVE_BACKWARD_BY_LINE);
    EXPECT_EQ(selection(), Selection(4, 4));
}

TEST_F(CommandsTest, VerticalMovesAtEdges) {
    open({"Hello world", "Foo"}, 6);
    ASSERT_TRUE(editor->focus(3).is_ok());

    run(commands::MOVE_BACKWARD_BY_LINE);
    EXPECT_EQ(selection(), Selection(0, 0));

    run_at(commands::MOVE, 13);
    run(commands::MOVE_FORWARD_BY_LINE);
    EXPECT_EQ(selection(), Selection(15, 15));
}

TEST_F(CommandsTest, HorizontalMoveResetsColumn) {
    open({"Hello world", "Foo"}, 6);
    ASSERT_TRUE(editor->focus(4).is_ok());

    run(commands::MOVE_FORWARD_BY_LINE);
    run(commands::MOVE_BACKWARD);
    EXPECT_EQ(selection(), Selection(9, 9));
    EXPECT_FLOAT_EQ(editor->cursor()->left_lock, 3.0f);

    run(commands::MOVE_FORWARD_BY_LINE);
    EXPECT_EQ(selection(), Selection(15, 15));
}

// ============================================================================
// Ranges
// ============================================================================

TEST_F(CommandsTest, DirectionalMovesCollapseRange) {
    open({"Hello world", "Foo"}, 6);
    ASSERT_TRUE(editor->focus(2).is_ok());

    run_at(commands::MOVE_HEAD, 8);
    EXPECT_EQ(selection(), Selection(2, 8));
    run(commands::MOVE_FORWARD);
    EXPECT_EQ(selection(), Selection(8, 8));

    run_at(commands::MOVE_HEAD, 2);
    EXPECT_EQ(selection(), Selection(8, 2));
    run(commands::MOVE_FORWARD_BY_WORD);
    EXPECT_EQ(selection(), Selection(8, 8));

    run_at(commands::MOVE_HEAD, 2);
    run(commands::MOVE_BACKWARD);
    EXPECT_EQ(selection(), Selection(2, 2));
}

TEST_F(CommandsTest, BoundaryMovesStartFromRangeBound) {
    open({"Hello world", "Foo"}, 6);
    ASSERT_TRUE(editor->focus(2).is_ok());

    run_at(commands::MOVE_HEAD, 8);
    run(commands::MOVE_TO_LINE_END);
    EXPECT_EQ(selection(), Selection(11, 11));

    run_at(commands::MOVE_HEAD, 2);
    run(commands::MOVE_TO_LINE_START);
    EXPECT_EQ(selection(), Selection(0, 0));
}

TEST_F(CommandsTest, ExtendingMovesKeepAnchor) {
    open({"Hello world", "Foo"}, 6);
    ASSERT_TRUE(editor->focus(0).is_ok());

    run(commands::MOVE_HEAD_FORWARD_BY_WORD);
    EXPECT_EQ(selection(), Selection(0, 5));
    run(commands::MOVE_HEAD_FORWARD_BY_WORD);
    EXPECT_EQ(selection(), Selection(0, 11));
    run(commands::MOVE_HEAD_FORWARD);
    EXPECT_EQ(selection(), Selection(0, 12));
    run(commands::MOVE_HEAD_BACKWARD_BY_LINE);
    EXPECT_EQ(selection(), Selection(0, 6));
    run(commands::MOVE_HEAD_TO_DOC_END);
    EXPECT_EQ(selection(), Selection(0, 15));
    run(commands::MOVE_HEAD_TO_DOC_START);
    EXPECT_EQ(selection(), Selection(0, 0));
}

TEST_F(CommandsTest, SelectAll) {
    open({"Hello", "abc"}, 50);
    ASSERT_TRUE(editor->focus(2).is_ok());

    run(commands::SELECT_ALL);
    EXPECT_EQ(editor->selectable_size(), 10u);
    EXPECT_EQ(selection(), Selection(0, 9));
}

TEST_F(CommandsTest, SelectWord) {
    open({"Hello world", "Foo"}, 6);
    ASSERT_TRUE(editor->focus(0).is_ok());

    run_at(commands::SELECT_WORD, 7);
    EXPECT_EQ(selection(), Selection(6, 11));

    run(commands::MOVE_TO_DOC_START);
    run(commands::SELECT_WORD);
    // Trailing whitespace is left out
    EXPECT_EQ(selection(), Selection(0, 5));
}

TEST_F(CommandsTest, SelectWordAtLineBreakTakesPreviousWord) {
    open({"Hello world", "Foo"}, 6);
    ASSERT_TRUE(editor->focus(0).is_ok());

    run_at(commands::SELECT_WORD, 11);
    EXPECT_EQ(selection(), Selection(6, 11));

    run_at(commands::SELECT_WORD, 15);
    EXPECT_EQ(selection(), Selection(12, 15));
}

TEST_F(CommandsTest, SelectWordInEmptyDocumentIsNoOp) {
    open({""}, 6);
    ASSERT_TRUE(editor->focus(0).is_ok());

    run_at(commands::SELECT_WORD, 0);
    EXPECT_EQ(selection(), Selection(0, 0));
}

TEST_F(CommandsTest, SelectWordKeepsLeadingWhitespace) {
    open({"  ab cd"}, 20);
    ASSERT_TRUE(editor->focus(0).is_ok());

    run_at(commands::SELECT_WORD, 1);
    EXPECT_EQ(selection(), Selection(0, 4));
}

TEST_F(CommandsTest, SelectBlock) {
    open({"Hello world", "Foo"}, 6);
    ASSERT_TRUE(editor->focus(0).is_ok());

    run_at(commands::SELECT_BLOCK, 13);
    EXPECT_EQ(selection(), Selection(12, 15));

    run_at(commands::SELECT_BLOCK, 3);
    EXPECT_EQ(selection(), Selection(0, 11));
}

// ============================================================================
// Editing
// ============================================================================

TEST_F(CommandsTest, InsertText) {
    open({"Hello"}, 50);
    ASSERT_TRUE(editor->focus(5).is_ok());

    type(" there");
    EXPECT_EQ(content(), String("Hello there"));
    EXPECT_EQ(selection(), Selection(11, 11));

    run_at(commands::MOVE, 0);
    type(">");
    EXPECT_EQ(content(), String(">Hello there"));
    EXPECT_EQ(selection(), Selection(1, 1));
}

TEST_F(CommandsTest, InsertTextRejectsBadText) {
    open({"Hello"}, 50);
    ASSERT_TRUE(editor->focus(0).is_ok());

    CommandArgs empty;
    EXPECT_EQ(editor->execute(commands::INSERT_TEXT, empty).error().kind, ErrorKind::InvalidArgument);

    CommandArgs multiline;
    multiline.text = "a\nb";
    EXPECT_EQ(editor->execute(commands::INSERT_TEXT, multiline).error().kind, ErrorKind::InvalidArgument);
    EXPECT_EQ(content(), String("Hello"));
}

TEST_F(CommandsTest, InsertTextReplacesRange) {
    open({"Hello world", "Foo"}, 6);
    ASSERT_TRUE(editor->focus(0).is_ok());

    run_at(commands::MOVE_HEAD, 5);
    type("Howdy");
    EXPECT_EQ(content(), String("Howdy world\nFoo"));
    EXPECT_EQ(selection(), Selection(5, 5));
}

TEST_F(CommandsTest, InsertTextIntoEmptyParagraph) {
    open({"a", "", "b"}, 50);
    ASSERT_TRUE(editor->focus(2).is_ok());

    type("new");
    EXPECT_EQ(content(), String("a\nnew\nb"));
    EXPECT_EQ(selection(), Selection(5, 5));
}

TEST_F(CommandsTest, DeleteBackward) {
    open({"Hello"}, 50);
    ASSERT_TRUE(editor->focus(5).is_ok());

    run(commands::DELETE_BACKWARD);
    EXPECT_EQ(content(), String("Hell"));
    EXPECT_EQ(selection(), Selection(4, 4));

    run(commands::MOVE_TO_DOC_START);
    run(commands::DELETE_BACKWARD);
    EXPECT_EQ(content(), String("Hell"));
    EXPECT_EQ(selection(), Selection(0, 0));
}

TEST_F(CommandsTest, DeleteBackwardMergesParagraphs) {
    open({"Hello world", "Foo"}, 6);
    ASSERT_TRUE(editor->focus(12).is_ok());

    run(commands::DELETE_BACKWARD);
    EXPECT_EQ(content(), String("Hello worldFoo"));
    EXPECT_EQ(editor->document().children().size(), 1u);
    EXPECT_EQ(selection(), Selection(11, 11));
}

TEST_F(CommandsTest, DeleteSelectionAcrossParagraphs) {
    open({"Hello world", "Foo"}, 6);
    ASSERT_TRUE(editor->focus(0).is_ok());

    run(commands::SELECT_ALL);
    run(commands::DELETE_BACKWARD);
    EXPECT_EQ(content(), String(""));
    EXPECT_EQ(editor->selectable_size(), 1u);
    EXPECT_EQ(selection(), Selection(0, 0));
}

TEST_F(CommandsTest, DeleteRangeOrder) {
    open({"Hello world", "Foo"}, 6);
    const String& second = editor->document().children()[1]->id();

    auto operations = delete_range(editor->render_tree(), 3, 14);
    ASSERT_TRUE(operations.is_ok());
    ASSERT_EQ(operations.value().size(), 3u);
    EXPECT_EQ(operations.value()[0]->describe(), String("DeleteText(@15, 2)"));
    EXPECT_EQ(operations.value()[1]->describe(), String("MergeBlock(") + second + ")");
    EXPECT_EQ(operations.value()[2]->describe(), String("DeleteText(@5, 8)"));
}

TEST_F(CommandsTest, DeleteRangeRejected) {
    open({"Hello"}, 50);

    EXPECT_EQ(delete_range(editor->render_tree(), 5, 3).error().kind, ErrorKind::OutOfRange);
    EXPECT_EQ(delete_range(editor->render_tree(), 0, 7).error().kind, ErrorKind::OutOfRange);
    EXPECT_EQ(delete_range(editor->render_tree(), 0, 6).error().kind, ErrorKind::InvalidArgument);
    EXPECT_TRUE(delete_range(editor->render_tree(), 2, 2).value().empty());
}
