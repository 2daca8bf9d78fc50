#pragma once

#include "folio/core/registry.hpp"
#include "transformation.hpp"
#include "folio/render/render_tree.hpp"

namespace folio::cursor {

class Editor;

struct CommandArgs {
    std::optional<usize> position;
    String text;
};

// ============================================================================
// CommandHandler - Turns an input command into a Transformation
// ============================================================================

class CommandHandler {
public:
    virtual ~CommandHandler() = default;

    // Computes the target from the current layout and applies it; a no-op
    // while no cursor is active
    [[nodiscard]] virtual EditorResult<void> handle(Editor& editor, const CommandArgs& args) const = 0;
};

using CommandRegistry = TypeRegistry<std::unique_ptr<CommandHandler>>;

namespace commands {

inline const String MOVE = "cursor.move";
inline const String MOVE_BACKWARD = "cursor.moveBackward";
inline const String MOVE_FORWARD = "cursor.moveForward";
inline const String MOVE_BACKWARD_BY_LINE = "cursor.moveBackwardByLine";
inline const String MOVE_FORWARD_BY_LINE = "cursor.moveForwardByLine";
inline const String MOVE_BACKWARD_BY_WORD = "cursor.moveBackwardByWord";
inline const String MOVE_FORWARD_BY_WORD = "cursor.moveForwardByWord";
inline const String MOVE_TO_LINE_START = "cursor.moveToLineStart";
inline const String MOVE_TO_LINE_END = "cursor.moveToLineEnd";
inline const String MOVE_TO_DOC_START = "cursor.moveToDocStart";
inline const String MOVE_TO_DOC_END = "cursor.moveToDocEnd";

inline const String MOVE_HEAD = "cursor.moveHead";
inline const String MOVE_HEAD_BACKWARD = "cursor.moveHeadBackward";
inline const String MOVE_HEAD_FORWARD = "cursor.moveHeadForward";
inline const String MOVE_HEAD_BACKWARD_BY_LINE = "cursor.moveHeadBackwardByLine";
inline const String MOVE_HEAD_FORWARD_BY_LINE = "cursor.moveHeadForwardByLine";
inline const String MOVE_HEAD_BACKWARD_BY_WORD = "cursor.moveHeadBackwardByWord";
inline const String MOVE_HEAD_FORWARD_BY_WORD = "cursor.moveHeadForwardByWord";
inline const String MOVE_HEAD_TO_LINE_START = "cursor.moveHeadToLineStart";
inline const String MOVE_HEAD_TO_LINE_END = "cursor.moveHeadToLineEnd";
inline const String MOVE_HEAD_TO_DOC_START = "cursor.moveHeadToDocStart";
inline const String MOVE_HEAD_TO_DOC_END = "cursor.moveHeadToDocEnd";

inline const String SELECT_ALL = "cursor.selectAll";
inline const String SELECT_WORD = "cursor.selectWord";
inline const String SELECT_BLOCK = "cursor.selectBlock";

inline const String INSERT_TEXT = "text.insert";
inline const String DELETE_BACKWARD = "text.deleteBackward";

} // namespace commands

void register_default_commands(CommandRegistry& registry);

// Operations deleting the selectable range [from, to), highest offset first
[[nodiscard]] EditorResult<OperationList> delete_range(const render::RenderTree& tree, usize from, usize to);

} // namespace folio::cursor
