/**
 * @file metadata_collections.hpp
 * @brief Keyed collections of edge and node metadata.
 */
#pragma once
#include "topomerge/common/common.hpp"
#include "topomerge/report/edge_metadata.hpp"
#include "topomerge/report/node_metadata.hpp"

namespace topomerge
{

// ============================================================================
// EdgeMetadatas
// ============================================================================

/**
 * @brief Edge metadata keyed by edge key (see `IIdCodec::make_edge_id()`).
 *
 * @par Merge policy
 * Deep merge: for each key of `other`, the entry is folded into the
 * receiver's entry with `EdgeMetadata::merge()`. A key missing on the
 * receiver side merges against an all-absent `EdgeMetadata`.
 *
 * @par Value semantics
 * - The const methods return new collections; iteration is in key order.
 */
class EdgeMetadatas
{
public:
    using map_type = std::map<std::string, EdgeMetadata>;
    using const_iterator = map_type::const_iterator;

public:
    EdgeMetadatas() = default;

    explicit EdgeMetadatas(map_type entries)
        : m_entries(std::move(entries))
    {
    }

    /**
     * @brief Return a deep copy of every entry.
     */
    EdgeMetadatas copy() const;

    /**
     * @brief Deep merge `other` into a copy of this collection.
     */
    EdgeMetadatas merge(const EdgeMetadatas& other) const;

    /**
     * @brief Return a copy with `emd` merged into the entry at `edge_id`.
     */
    EdgeMetadatas with_edge(const std::string& edge_id, const EdgeMetadata& emd) const;

    /**
     * @brief Find the entry for `edge_id`.
     * @return Pointer to the entry, or `nullptr` if not present.
     */
    const EdgeMetadata* find(const std::string& edge_id) const;

    bool contains(const std::string& edge_id) const
    {
        return m_entries.count(edge_id) != 0;
    }

    std::size_t size() const noexcept
    {
        return m_entries.size();
    }

    bool empty() const noexcept
    {
        return m_entries.empty();
    }

    const_iterator begin() const noexcept
    {
        return m_entries.begin();
    }

    const_iterator end() const noexcept
    {
        return m_entries.end();
    }

    friend bool operator==(const EdgeMetadatas& lhs, const EdgeMetadatas& rhs)
    {
        return lhs.m_entries == rhs.m_entries;
    }

    friend bool operator!=(const EdgeMetadatas& lhs, const EdgeMetadatas& rhs)
    {
        return !(lhs == rhs);
    }

private:
    map_type m_entries;
};

// ============================================================================
// NodeMetadatas
// ============================================================================

/**
 * @brief Node metadata keyed by node ID.
 *
 * @par Merge policy
 * Don't overwrite: only keys of `other` that are absent from the receiver are
 * copied in. An entry already present in the receiver is kept exactly as is
 * and is NOT merged with the corresponding entry of `other`. This differs
 * from `EdgeMetadatas::merge()` on purpose; labels are sticky per node.
 * Use `NodeMetadata::merge()` (or `Topology::with_node()`) to combine two
 * observations of the same node.
 *
 * @par Value semantics
 * - The const methods return new collections; iteration is in key order.
 */
class NodeMetadatas
{
public:
    using map_type = std::map<std::string, NodeMetadata>;
    using const_iterator = map_type::const_iterator;

public:
    NodeMetadatas() = default;

    explicit NodeMetadatas(map_type entries)
        : m_entries(std::move(entries))
    {
    }

    /**
     * @brief Return a deep copy of every entry.
     */
    NodeMetadatas copy() const;

    /**
     * @brief Copy into this collection the keys of `other` it does not have.
     */
    NodeMetadatas merge(const NodeMetadatas& other) const;

    /**
     * @brief Return a copy with the entry at `node_id` set to `nmd`.
     * @note Any existing entry is replaced, not merged.
     */
    NodeMetadatas with_entry(const std::string& node_id, NodeMetadata nmd) const;

    /**
     * @brief Find the entry for `node_id`.
     * @return Pointer to the entry, or `nullptr` if not present.
     */
    const NodeMetadata* find(const std::string& node_id) const;

    bool contains(const std::string& node_id) const
    {
        return m_entries.count(node_id) != 0;
    }

    std::size_t size() const noexcept
    {
        return m_entries.size();
    }

    bool empty() const noexcept
    {
        return m_entries.empty();
    }

    const_iterator begin() const noexcept
    {
        return m_entries.begin();
    }

    const_iterator end() const noexcept
    {
        return m_entries.end();
    }

    friend bool operator==(const NodeMetadatas& lhs, const NodeMetadatas& rhs)
    {
        return lhs.m_entries == rhs.m_entries;
    }

    friend bool operator!=(const NodeMetadatas& lhs, const NodeMetadatas& rhs)
    {
        return !(lhs == rhs);
    }

private:
    map_type m_entries;
};

} // namespace topomerge
