#include "folio/render/render_tree.hpp"
#include "folio/core/logger.hpp"
#include <unordered_map>

namespace folio::render {

// ============================================================================
// Default behaviors
// ============================================================================

RenderRegistry default_render_registry() {
    RenderRegistry registry("render");

    registry.register_type(model::Document::TYPE, RenderBehavior{
        [](const model::Node& node) -> std::unique_ptr<RenderNode> {
            return std::make_unique<DocRenderNode>(node.id());
        },
        [](RenderNode& render, const model::Node& node) {
            static_cast<DocRenderNode&>(render).on_model_updated(static_cast<const model::Document&>(node));
        },
        true,
    });

    registry.register_type(model::Paragraph::TYPE, RenderBehavior{
        [](const model::Node& node) -> std::unique_ptr<RenderNode> {
            return std::make_unique<BlockRenderNode>(node.id(), node.type());
        },
        [](RenderNode& render, const model::Node& node) {
            static_cast<BlockRenderNode&>(render).set_line_height(
                static_cast<const model::Paragraph&>(node).line_height());
        },
        true,
    });

    registry.register_type(model::Span::TYPE, RenderBehavior{
        [](const model::Node& node) -> std::unique_ptr<RenderNode> {
            return std::make_unique<InlineRenderNode>(node.id(), node.type(), true);
        },
        [](RenderNode& render, const model::Node& node) {
            static_cast<InlineRenderNode&>(render).set_style(static_cast<const model::Span&>(node).style());
        },
        true,
    });

    registry.register_type(model::Text::TYPE, RenderBehavior{
        [](const model::Node& node) -> std::unique_ptr<RenderNode> {
            return std::make_unique<InlineRenderNode>(node.id(), node.type(), false);
        },
        [](RenderNode& render, const model::Node& node) {
            auto& inline_node = static_cast<InlineRenderNode&>(render);
            const auto& text = static_cast<const model::Text&>(node);
            inline_node.set_style(text.style());
            inline_node.set_text(text.content());
        },
        false,
    });

    return registry;
}

// ============================================================================
// RenderTree
// ============================================================================

RenderTree::RenderTree(RenderRegistry registry) : m_registry(std::move(registry)) {}

EditorResult<void> RenderTree::validate(const model::Node& node) const {
    auto behavior = m_registry.lookup(node.type());
    if (behavior.is_err()) {
        return make_error(behavior.error());
    }
    if (!behavior.value()->mirrors_children) {
        return {};
    }
    for (const auto& child : node.children()) {
        auto result = validate(*child);
        if (result.is_err()) {
            return result;
        }
    }
    return {};
}

std::unique_ptr<RenderNode> RenderTree::reconcile(std::unique_ptr<RenderNode> existing,
                                                  const model::Node& node, SyncStats& stats) {
    const RenderBehavior& behavior = *m_registry.lookup(node.type()).value();

    std::unique_ptr<RenderNode> render;
    if (existing && existing->id() == node.id() && existing->type() == node.type()) {
        render = std::move(existing);
        ++stats.reused;
    } else {
        if (existing) {
            ++stats.removed;
        }
        render = behavior.create(node);
        ++stats.created;
    }

    behavior.on_model_updated(*render, node);
    if (!behavior.mirrors_children) {
        return render;
    }

    std::unordered_map<String, std::unique_ptr<RenderNode>> previous;
    for (auto& child : render->take_children()) {
        String id = child->id();
        previous.emplace(std::move(id), std::move(child));
    }

    for (const auto& model_child : node.children()) {
        std::unique_ptr<RenderNode> match;
        auto it = previous.find(model_child->id());
        if (it != previous.end()) {
            match = std::move(it->second);
            previous.erase(it);
        }
        render->append_child(reconcile(std::move(match), *model_child, stats));
    }

    for (const auto& [id, leftover] : previous) {
        // Derived children (the trailing line break) are recreated below
        if (leftover->type() != LINE_BREAK_TYPE) {
            ++stats.removed;
        }
    }

    render->on_children_updated();
    return render;
}

EditorResult<SyncStats> RenderTree::sync(const model::Document& doc) {
    auto valid = validate(doc);
    if (valid.is_err()) {
        logging::get("render").error("sync aborted, render tree left unchanged");
        return make_error(valid.error());
    }

    SyncStats stats;
    auto root = reconcile(std::move(m_root), doc, stats);
    m_root.reset(static_cast<DocRenderNode*>(root.release()));

    StringBuilder sb;
    sb.append("sync v").append(m_root->version())
      .append(": created ").append(static_cast<u64>(stats.created))
      .append(", reused ").append(static_cast<u64>(stats.reused))
      .append(", removed ").append(static_cast<u64>(stats.removed))
      .append(", selectable size ").append(static_cast<u64>(m_root->selectable_size()));
    logging::get("render").debug(sb.view());

    for (const auto& [handle, listener] : m_listeners) {
        listener(*m_root);
    }
    return stats;
}

EditorResult<usize> RenderTree::to_model_offset(usize selectable_offset) const {
    if (!m_root) {
        return out_of_range("render tree is empty");
    }
    return m_root->convert_selectable_offset_to_model_offset(selectable_offset);
}

namespace {

const RenderNode* find_node(const RenderNode& node, const String& id) {
    if (node.id() == id) {
        return &node;
    }
    for (const auto& child : node.children()) {
        if (const RenderNode* found = find_node(*child, id)) {
            return found;
        }
    }
    return nullptr;
}

} // namespace

const RenderNode* RenderTree::find_by_id(const String& id) const {
    return m_root ? find_node(*m_root, id) : nullptr;
}

usize RenderTree::subscribe(Listener listener) {
    usize handle = m_next_handle++;
    m_listeners.emplace_back(handle, std::move(listener));
    return handle;
}

void RenderTree::unsubscribe(usize handle) {
    std::erase_if(m_listeners, [handle](const auto& entry) { return entry.first == handle; });
}

} // namespace folio::render
