/**
 * @file metadata_collections.cpp
 */
#include "topomerge/report/metadata_collections.hpp"

namespace topomerge
{

// ============================================================================
// EdgeMetadatas
// ============================================================================

EdgeMetadatas EdgeMetadatas::copy() const
{
    map_type entries;
    for (const auto& [key, emd] : m_entries)
    {
        entries.emplace_hint(entries.end(), key, emd.copy());
    }
    return EdgeMetadatas(std::move(entries));
}

EdgeMetadatas EdgeMetadatas::merge(const EdgeMetadatas& other) const
{
    EdgeMetadatas result = copy();
    for (const auto& [key, emd] : other.m_entries)
    {
        // operator[] default-constructs an all-absent entry for new keys.
        auto& slot = result.m_entries[key];
        slot = slot.merge(emd);
    }
    return result;
}

EdgeMetadatas EdgeMetadatas::with_edge(const std::string& edge_id, const EdgeMetadata& emd) const
{
    EdgeMetadatas result = copy();
    auto& slot = result.m_entries[edge_id];
    slot = slot.merge(emd);
    return result;
}

const EdgeMetadata* EdgeMetadatas::find(const std::string& edge_id) const
{
    auto it = m_entries.find(edge_id);
    return it != m_entries.end() ? &it->second : nullptr;
}

// ============================================================================
// NodeMetadatas
// ============================================================================

NodeMetadatas NodeMetadatas::copy() const
{
    map_type entries;
    for (const auto& [key, nmd] : m_entries)
    {
        entries.emplace_hint(entries.end(), key, nmd.copy());
    }
    return NodeMetadatas(std::move(entries));
}

NodeMetadatas NodeMetadatas::merge(const NodeMetadatas& other) const
{
    NodeMetadatas result = copy();
    for (const auto& [key, nmd] : other.m_entries)
    {
        if (result.m_entries.count(key) == 0) // don't overwrite
        {
            result.m_entries.emplace(key, nmd.copy());
        }
    }
    return result;
}

NodeMetadatas NodeMetadatas::with_entry(const std::string& node_id, NodeMetadata nmd) const
{
    NodeMetadatas result = copy();
    result.m_entries.insert_or_assign(node_id, std::move(nmd));
    return result;
}

const NodeMetadata* NodeMetadatas::find(const std::string& node_id) const
{
    auto it = m_entries.find(node_id);
    return it != m_entries.end() ? &it->second : nullptr;
}

} // namespace topomerge
