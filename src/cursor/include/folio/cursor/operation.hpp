#pragma once

#include "folio/core/types.hpp"
#include "folio/core/string.hpp"
#include "folio/core/error.hpp"
#include "folio/model/document.hpp"
#include <memory>

namespace folio::cursor {

// ============================================================================
// Operation - Reversible model edit
// ============================================================================

class Operation {
public:
    virtual ~Operation() = default;

    /**
     * @brief Applies the edit and returns the operation that undoes it
     *
     * On failure the document is left unchanged.
     */
    [[nodiscard]] virtual EditorResult<std::unique_ptr<Operation>> apply(model::Document& doc) const = 0;

    [[nodiscard]] virtual String describe() const = 0;
};

using OperationList = std::vector<std::unique_ptr<Operation>>;

// Inserts text at a model offset; the offset must fall in or next to a text leaf,
// or in an empty block (a new leaf is created)
class InsertText : public Operation {
public:
    InsertText(usize model_offset, String text) : m_offset(model_offset), m_text(std::move(text)) {}

    [[nodiscard]] EditorResult<std::unique_ptr<Operation>> apply(model::Document& doc) const override;
    [[nodiscard]] String describe() const override;

private:
    usize m_offset;
    String m_text;
};

// Deletes length bytes from the text leaf holding model_offset
class DeleteText : public Operation {
public:
    DeleteText(usize model_offset, usize length) : m_offset(model_offset), m_length(length) {}

    [[nodiscard]] EditorResult<std::unique_ptr<Operation>> apply(model::Document& doc) const override;
    [[nodiscard]] String describe() const override;

private:
    usize m_offset;
    usize m_length;
};

class InsertNode : public Operation {
public:
    InsertNode(String parent_id, usize index, std::unique_ptr<model::Node> subtree)
        : m_parent_id(std::move(parent_id)), m_index(index), m_subtree(std::move(subtree)) {}

    [[nodiscard]] EditorResult<std::unique_ptr<Operation>> apply(model::Document& doc) const override;
    [[nodiscard]] String describe() const override;

private:
    String m_parent_id;
    usize m_index;
    std::unique_ptr<model::Node> m_subtree;
};

class DeleteNode : public Operation {
public:
    DeleteNode(String parent_id, usize index) : m_parent_id(std::move(parent_id)), m_index(index) {}

    [[nodiscard]] EditorResult<std::unique_ptr<Operation>> apply(model::Document& doc) const override;
    [[nodiscard]] String describe() const override;

private:
    String m_parent_id;
    usize m_index;
};

// Moves the children of a block to the end of the preceding block and removes it
class MergeBlock : public Operation {
public:
    explicit MergeBlock(String block_id) : m_block_id(std::move(block_id)) {}

    [[nodiscard]] EditorResult<std::unique_ptr<Operation>> apply(model::Document& doc) const override;
    [[nodiscard]] String describe() const override;

private:
    String m_block_id;
};

// Moves the children of a block from child_index on into a new block right after it
class SplitBlock : public Operation {
public:
    SplitBlock(String block_id, usize child_index, String new_block_id, f32 line_height = 0)
        : m_block_id(std::move(block_id))
        , m_child_index(child_index)
        , m_new_block_id(std::move(new_block_id))
        , m_line_height(line_height) {}

    [[nodiscard]] EditorResult<std::unique_ptr<Operation>> apply(model::Document& doc) const override;
    [[nodiscard]] String describe() const override;

private:
    String m_block_id;
    usize m_child_index;
    String m_new_block_id;
    f32 m_line_height;
};

} // namespace folio::cursor
