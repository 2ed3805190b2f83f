/**
 * @file topology.hpp
 */
#pragma once
#include "topomerge/common/common.hpp"
#include "topomerge/report/id_codec.hpp"
#include "topomerge/report/metadata_collections.hpp"
#include "topomerge/report/topology_diagnostics.hpp"
#include "topomerge/report/topology_exceptions.hpp"

namespace topomerge
{

/**
 * @brief One view of a network: edge metadata plus node metadata.
 *
 * @details
 * `Topology` is the unit probes report and collectors merge. Edges are
 * directional; each edge key names a (src, dst) pair and the edge is also
 * recorded in the source node's adjacency set.
 *
 * @par Value semantics
 * - A `Topology` is immutable once built. Every operation is const and
 *   returns a fresh value; neither the receiver nor the argument is modified.
 * - Edge metadata merge is commutative and associative. It is idempotent
 *   only for `max_conn_count_tcp`; traffic counters are summed, so merging a
 *   topology with itself doubles them.
 * - Node metadata merge keeps the receiver's entry on key collision, which
 *   makes it idempotent and associative but not commutative.
 *
 * @par Consistency
 * The structural invariants (edges reference existing, adjacency-linked
 * nodes; node IDs are well formed; label maps are present) are not enforced
 * by construction or merge. Call `validate()` before handing a merged
 * topology to invariant-sensitive consumers.
 *
 * @par Thread safety
 * - No internal synchronization.
 * - Any number of threads may call const methods on a shared instance.
 *   Callers replacing a "current" topology with a merge result must
 *   synchronize the replacement themselves.
 * - Every copy or merge costs time and memory proportional to the size of
 *   the topology; batch snapshots rather than merging them one by one.
 */
class Topology
{
public:
    Topology() = default;

    Topology(EdgeMetadatas edges, NodeMetadatas nodes);

    const EdgeMetadatas& edge_metadatas() const noexcept
    {
        return m_edges;
    }

    const NodeMetadatas& node_metadatas() const noexcept
    {
        return m_nodes;
    }

    /**
     * @brief Return a topology with `nmd` stored under `node_id`.
     *
     * @details
     * If a node already exists under `node_id`, the stored value is
     * `nmd.merge(existing)`: labels from `existing` overwrite those of `nmd`
     * on conflicting keys, while counters are summed and adjacency is
     * unioned.
     *
     * @return A fresh topology; every entry is copied, not just the touched node.
     */
    Topology with_node(const std::string& node_id, const NodeMetadata& nmd) const;

    /**
     * @brief Return a topology with `emd` merged into the edge `src_id -> dst_id`.
     *
     * @details
     * The edge key is built by `codec`. The source node's adjacency is not
     * touched; callers keep edges and adjacency in lockstep.
     */
    Topology with_edge(const std::string& src_id, const std::string& dst_id,
                       const EdgeMetadata& emd,
                       const IIdCodec& codec = DefaultIdCodec::instance()) const;

    /**
     * @brief Return a deep copy.
     */
    Topology copy() const;

    /**
     * @brief Merge `other` into a copy of this topology.
     * @details `EdgeMetadatas::merge()` and `NodeMetadatas::merge()` field-wise.
     */
    Topology merge(const Topology& other) const;

    /**
     * @brief Check the topology for inconsistencies.
     * @param codec The identifier codec used to decode edge keys and node IDs.
     * @return Diagnostics holding every violation found; `is_valid()` when none.
     */
    TopologyDiagnostics validate(const IIdCodec& codec = DefaultIdCodec::instance()) const;

    /**
     * @brief Validate, throwing on any violation.
     * @throw TopologyError with `ValidationFailed` and the diagnostics summary.
     */
    void ensure_valid(const IIdCodec& codec = DefaultIdCodec::instance()) const;

    friend bool operator==(const Topology& lhs, const Topology& rhs)
    {
        return lhs.m_edges == rhs.m_edges && lhs.m_nodes == rhs.m_nodes;
    }

    friend bool operator!=(const Topology& lhs, const Topology& rhs)
    {
        return !(lhs == rhs);
    }

private:
    EdgeMetadatas m_edges;
    NodeMetadatas m_nodes;

    // -------------------------------------------------------------------------
    // Validation helpers
    // -------------------------------------------------------------------------

    /// Edge key decodes; both nodes exist and source is adjacent to destination.
    void check_edges(const IIdCodec& codec, TopologyDiagnostics& diag) const;

    /// Labels present; node ID decodes; adjacent nodes and edges exist.
    void check_nodes(const IIdCodec& codec, TopologyDiagnostics& diag) const;
};

/**
 * @brief Create an empty topology.
 */
Topology make_topology();

} // namespace topomerge
