#pragma once

#include "render_node.hpp"
#include "folio/core/registry.hpp"
#include <functional>

namespace folio::render {

// ============================================================================
// Per-type derivation
// ============================================================================

struct RenderBehavior {
    // Creates the render node mirroring a model node (attributes unset)
    std::function<std::unique_ptr<RenderNode>(const model::Node&)> create;
    // Copies model attributes into an existing render node
    std::function<void(RenderNode&, const model::Node&)> on_model_updated;
    // Whether model children map 1:1 onto render children
    bool mirrors_children{true};
};

using RenderRegistry = TypeRegistry<RenderBehavior>;

// Doc, Paragraph, Span and Text
[[nodiscard]] RenderRegistry default_render_registry();

// ============================================================================
// RenderTree - Render tree kept in sync with a model document
// ============================================================================

struct SyncStats {
    usize created{0};
    usize reused{0};
    usize removed{0};
};

class RenderTree {
public:
    using Listener = std::function<void(const DocRenderNode&)>;

    explicit RenderTree(RenderRegistry registry = default_render_registry());

    /**
     * @brief Reconciles the render tree with the model by node id
     *
     * Every model type is checked against the registry before anything is
     * touched, so a failed sync leaves the previous tree intact.
     */
    EditorResult<SyncStats> sync(const model::Document& doc);

    [[nodiscard]] const DocRenderNode* root() const { return m_root.get(); }
    [[nodiscard]] usize selectable_size() const { return m_root ? m_root->selectable_size() : 0; }

    [[nodiscard]] EditorResult<usize> to_model_offset(usize selectable_offset) const;

    [[nodiscard]] const RenderNode* find_by_id(const String& id) const;

    // Listeners run after every successful sync
    usize subscribe(Listener listener);
    void unsubscribe(usize handle);

    [[nodiscard]] const RenderRegistry& registry() const { return m_registry; }

private:
    [[nodiscard]] EditorResult<void> validate(const model::Node& node) const;
    std::unique_ptr<RenderNode> reconcile(std::unique_ptr<RenderNode> existing,
                                          const model::Node& node, SyncStats& stats);

    RenderRegistry m_registry;
    std::unique_ptr<DocRenderNode> m_root;
    std::vector<std::pair<usize, Listener>> m_listeners;
    usize m_next_handle{1};
};

} // namespace folio::render
