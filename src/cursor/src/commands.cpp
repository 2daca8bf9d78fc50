#include "folio/cursor/commands.hpp"
#include "folio/cursor/editor.hpp"

namespace folio::cursor {

namespace {

enum class Step : u8 {
    Backward,
    Forward,
    BackwardByLine,
    ForwardByLine,
    BackwardByWord,
    ForwardByWord,
    LineStart,
    LineEnd,
    DocStart,
    DocEnd,
};

bool is_backward(Step step) {
    return step == Step::Backward || step == Step::BackwardByLine || step == Step::BackwardByWord ||
           step == Step::LineStart || step == Step::DocStart;
}

// Relative moves collapse a range onto its bound instead of stepping past it
bool is_directional(Step step) {
    switch (step) {
        case Step::Backward:
        case Step::Forward:
        case Step::BackwardByLine:
        case Step::ForwardByLine:
        case Step::BackwardByWord:
        case Step::ForwardByWord:
            return true;
        default:
            return false;
    }
}

bool is_vertical(Step step) {
    return step == Step::BackwardByLine || step == Step::ForwardByLine;
}

EditorResult<usize> step_from(const layout::DocLayout& layout, Step step, usize from, f32 left_lock) {
    usize last = layout.size() - 1;
    switch (step) {
        case Step::Backward: return from == 0 ? usize{0} : from - 1;
        case Step::Forward: return from >= last ? last : from + 1;
        case Step::BackwardByLine: return layout.position_above(from, left_lock);
        case Step::ForwardByLine: return layout.position_below(from, left_lock);
        case Step::BackwardByWord: return layout.word_start(from);
        case Step::ForwardByWord: return layout.word_end(from);
        case Step::LineStart: return layout.line_start(from);
        case Step::LineEnd: return layout.line_end(from);
        case Step::DocStart: return usize{0};
        case Step::DocEnd: return last;
    }
    return from;
}

// ============================================================================
// Cursor movement
// ============================================================================

class MoveHandler : public CommandHandler {
public:
    explicit MoveHandler(bool extend) : m_extend(extend) {}

    EditorResult<void> handle(Editor& editor, const CommandArgs& args) const override {
        if (!editor.cursor() || editor.selectable_size() == 0) {
            return {};
        }
        if (!args.position) {
            return invalid_argument("move: position argument required");
        }
        usize target = std::min(*args.position, editor.selectable_size() - 1);
        std::optional<usize> anchor;
        if (m_extend) {
            anchor = editor.cursor()->anchor;
        }
        return editor.apply(Transformation::move_to(target, anchor));
    }

private:
    bool m_extend;
};

class StepHandler : public CommandHandler {
public:
    StepHandler(Step step, bool extend) : m_step(step), m_extend(extend) {}

    EditorResult<void> handle(Editor& editor, const CommandArgs&) const override {
        if (!editor.cursor() || editor.selectable_size() == 0) {
            return {};
        }
        const Cursor cursor = *editor.cursor();
        const auto& layout = editor.layout();
        bool backward = is_backward(m_step);

        Transformation transformation;
        if (m_extend) {
            auto target = step_from(layout, m_step, cursor.head, cursor.left_lock);
            if (target.is_err()) {
                return make_error(target.error());
            }
            transformation.head = target.value();
            transformation.anchor = cursor.anchor;
            transformation.keep_left_lock = is_vertical(m_step);
            return editor.apply(std::move(transformation));
        }

        usize origin = cursor.head;
        if (!cursor.is_collapsed()) {
            origin = backward ? cursor.from() : cursor.to();
            if (is_directional(m_step)) {
                transformation.head = origin;
                return editor.apply(std::move(transformation));
            }
        }

        auto target = step_from(layout, m_step, origin, cursor.left_lock);
        if (target.is_err()) {
            return make_error(target.error());
        }
        transformation.head = target.value();
        transformation.keep_left_lock = is_vertical(m_step);
        return editor.apply(std::move(transformation));
    }

private:
    Step m_step;
    bool m_extend;
};

// ============================================================================
// Selection
// ============================================================================

class SelectAllHandler : public CommandHandler {
public:
    EditorResult<void> handle(Editor& editor, const CommandArgs&) const override {
        if (!editor.cursor() || editor.selectable_size() == 0) {
            return {};
        }
        return editor.apply(Transformation::move_to(editor.selectable_size() - 1, usize{0}));
    }
};

class SelectWordHandler : public CommandHandler {
public:
    EditorResult<void> handle(Editor& editor, const CommandArgs& args) const override {
        if (!editor.cursor() || editor.selectable_size() == 0) {
            return {};
        }
        usize position = args.position.value_or(editor.cursor()->head);
        auto described = editor.layout().describe_position(position);
        if (described.is_err()) {
            return make_error(described.error());
        }
        const auto& hit = described.value().at_word();
        const layout::WordLayout* word = hit.node;
        usize start = position - hit.position;
        // Nothing selectable here (line break); take the word before it
        if (word->trimmed_size() == 0) {
            const auto* previous = static_cast<const layout::WordLayout*>(word->previous_cross_parent_sibling());
            if (!previous) {
                return {};
            }
            word = previous;
            start -= previous->size();
        }
        return editor.apply(Transformation::move_to(start + word->trimmed_size(), start));
    }
};

class SelectBlockHandler : public CommandHandler {
public:
    EditorResult<void> handle(Editor& editor, const CommandArgs& args) const override {
        if (!editor.cursor() || editor.selectable_size() == 0) {
            return {};
        }
        usize position = args.position.value_or(editor.cursor()->head);
        const auto* root = editor.render_tree().root();
        auto hit = render::find_atomic(*root, position);
        if (!hit) {
            StringBuilder sb;
            sb.append("selectBlock: position ").append(static_cast<u64>(position)).append(" outside document");
            return out_of_range(sb.build());
        }
        const render::RenderNode* block = render::enclosing(*hit->node, render::RenderKind::Block);
        if (!block) {
            return structural_violation(String("selectBlock: ") + hit->node->id() + " has no enclosing block");
        }
        usize start = block->selectable_start();
        return editor.apply(Transformation::move_to(start + block->selectable_size() - 1, start));
    }
};

// ============================================================================
// Editing
// ============================================================================

class InsertTextHandler : public CommandHandler {
public:
    EditorResult<void> handle(Editor& editor, const CommandArgs& args) const override {
        if (!editor.cursor()) {
            return {};
        }
        if (args.text.empty()) {
            return invalid_argument("insertText: empty text");
        }
        if (args.text.find("\n")) {
            return invalid_argument("insertText: text must not contain line breaks");
        }

        const Cursor cursor = *editor.cursor();
        Transformation transformation;
        if (!cursor.is_collapsed()) {
            auto removed = delete_range(editor.render_tree(), cursor.from(), cursor.to());
            if (removed.is_err()) {
                return make_error(removed.error());
            }
            transformation.operations = std::move(removed).value();
        }

        auto model_offset = editor.render_tree().to_model_offset(cursor.from());
        if (model_offset.is_err()) {
            return make_error(model_offset.error());
        }
        transformation.operations.push_back(std::make_unique<InsertText>(model_offset.value(), args.text));
        transformation.head = cursor.from() + args.text.size();
        return editor.apply(std::move(transformation));
    }
};

class DeleteBackwardHandler : public CommandHandler {
public:
    EditorResult<void> handle(Editor& editor, const CommandArgs&) const override {
        if (!editor.cursor()) {
            return {};
        }
        const Cursor cursor = *editor.cursor();
        if (cursor.is_collapsed() && cursor.head == 0) {
            return {};
        }
        usize from = cursor.is_collapsed() ? cursor.head - 1 : cursor.from();
        usize to = cursor.is_collapsed() ? cursor.head : cursor.to();

        auto removed = delete_range(editor.render_tree(), from, to);
        if (removed.is_err()) {
            return make_error(removed.error());
        }
        Transformation transformation;
        transformation.operations = std::move(removed).value();
        transformation.head = from;
        return editor.apply(std::move(transformation));
    }
};

template<typename Handler, typename... Args>
void add(CommandRegistry& registry, const String& name, Args... args) {
    registry.register_type(name, std::make_unique<Handler>(args...));
}

} // namespace

EditorResult<OperationList> delete_range(const render::RenderTree& tree, usize from, usize to) {
    if (!tree.root() || to > tree.selectable_size() || from > to) {
        StringBuilder sb;
        sb.append("delete_range: [").append(static_cast<u64>(from)).append(", ")
          .append(static_cast<u64>(to)).append(") outside document");
        return out_of_range(sb.build());
    }

    struct Pending {
        String inline_id;
        usize model_start;
        usize length;
    };

    OperationList operations;
    std::optional<Pending> pending;
    auto flush = [&]() {
        if (pending) {
            operations.push_back(std::make_unique<DeleteText>(pending->model_start, pending->length));
            pending.reset();
        }
    };

    for (usize position = to; position-- > from;) {
        auto hit = render::find_atomic(*tree.root(), position);
        if (!hit) {
            return out_of_range("delete_range: position without atomic");
        }

        if (hit->node->is_line_break()) {
            flush();
            const render::RenderNode* block = render::enclosing(*hit->node, render::RenderKind::Block);
            const render::RenderNode* doc = block ? block->parent() : nullptr;
            if (!doc) {
                return structural_violation("delete_range: line break outside a block");
            }
            usize index = *doc->child_index(*block);
            if (index + 1 >= doc->children().size()) {
                return invalid_argument("delete_range: the final line break cannot be deleted");
            }
            operations.push_back(std::make_unique<MergeBlock>(doc->children()[index + 1]->id()));
            continue;
        }

        auto model_offset = tree.to_model_offset(position);
        if (model_offset.is_err()) {
            return make_error(model_offset.error());
        }
        const String& inline_id = hit->node->parent()->id();
        if (pending && pending->inline_id == inline_id && pending->model_start == model_offset.value() + 1) {
            pending->model_start = model_offset.value();
            ++pending->length;
            continue;
        }
        flush();
        pending = Pending{inline_id, model_offset.value(), 1};
    }
    flush();
    return std::move(operations);
}

void register_default_commands(CommandRegistry& registry) {
    add<MoveHandler>(registry, commands::MOVE, false);
    add<StepHandler>(registry, commands::MOVE_BACKWARD, Step::Backward, false);
    add<StepHandler>(registry, commands::MOVE_FORWARD, Step::Forward, false);
    add<StepHandler>(registry, commands::MOVE_BACKWARD_BY_LINE, Step::BackwardByLine, false);
    add<StepHandler>(registry, commands::MOVE_FORWARD_BY_LINE, Step::ForwardByLine, false);
    add<StepHandler>(registry, commands::MOVE_BACKWARD_BY_WORD, Step::BackwardByWord, false);
    add<StepHandler>(registry, commands::MOVE_FORWARD_BY_WORD, Step::ForwardByWord, false);
    add<StepHandler>(registry, commands::MOVE_TO_LINE_START, Step::LineStart, false);
    add<StepHandler>(registry, commands::MOVE_TO_LINE_END, Step::LineEnd, false);
    add<StepHandler>(registry, commands::MOVE_TO_DOC_START, Step::DocStart, false);
    add<StepHandler>(registry, commands::MOVE_TO_DOC_END, Step::DocEnd, false);

    add<MoveHandler>(registry, commands::MOVE_HEAD, true);
    add<StepHandler>(registry, commands::MOVE_HEAD_BACKWARD, Step::Backward, true);
    add<StepHandler>(registry, commands::MOVE_HEAD_FORWARD, Step::Forward, true);
    add<StepHandler>(registry, commands::MOVE_HEAD_BACKWARD_BY_LINE, Step::BackwardByLine, true);
    add<StepHandler>(registry, commands::MOVE_HEAD_FORWARD_BY_LINE, Step::ForwardByLine, true);
    add<StepHandler>(registry, commands::MOVE_HEAD_BACKWARD_BY_WORD, Step::BackwardByWord, true);
    add<StepHandler>(registry, commands::MOVE_HEAD_FORWARD_BY_WORD, Step::ForwardByWord, true);
    add<StepHandler>(registry, commands::MOVE_HEAD_TO_LINE_START, Step::LineStart, true);
    add<StepHandler>(registry, commands::MOVE_HEAD_TO_LINE_END, Step::LineEnd, true);
    add<StepHandler>(registry, commands::MOVE_HEAD_TO_DOC_START, Step::DocStart, true);
    add<StepHandler>(registry, commands::MOVE_HEAD_TO_DOC_END, Step::DocEnd, true);

    add<SelectAllHandler>(registry, commands::SELECT_ALL);
    add<SelectWordHandler>(registry, commands::SELECT_WORD);
    add<SelectBlockHandler>(registry, commands::SELECT_BLOCK);

    add<InsertTextHandler>(registry, commands::INSERT_TEXT);
    add<DeleteBackwardHandler>(registry, commands::DELETE_BACKWARD);
}

} // namespace folio::cursor
