#pragma once

#include "types.hpp"
#include "string.hpp"
#include "error.hpp"
#include <unordered_map>

namespace folio {

// ============================================================================
// TypeRegistry - Maps node type tags to per-type behavior
// ============================================================================

/**
 * @brief Lookup table keyed by type tag
 *
 * Each tree layer (render derivation, measurement, painting) keeps one of
 * these. A lookup for a tag nobody registered fails with UnregisteredType
 * instead of falling back to a default.
 */
template<typename Entry>
class TypeRegistry {
public:
    explicit TypeRegistry(String name) : m_name(std::move(name)) {}

    // Replaces any existing entry for the tag
    void register_type(const String& type, Entry entry) {
        m_entries.insert_or_assign(type, std::move(entry));
    }

    [[nodiscard]] bool contains(const String& type) const {
        return m_entries.find(type) != m_entries.end();
    }

    [[nodiscard]] EditorResult<const Entry*> lookup(const String& type) const {
        auto it = m_entries.find(type);
        if (it == m_entries.end()) {
            StringBuilder sb;
            sb.append(m_name).append(": type \"").append(type).append("\" is not registered");
            return unregistered_type(sb.build());
        }
        return &it->second;
    }

    [[nodiscard]] const String& name() const { return m_name; }
    [[nodiscard]] usize size() const { return m_entries.size(); }

private:
    String m_name;
    std::unordered_map<String, Entry> m_entries;
};

} // namespace folio
