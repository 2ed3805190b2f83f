/**
 * @file topology.cpp
 */
#include "topomerge/report/topology.hpp"

namespace topomerge
{

// ============================================================================
// Construction
// ============================================================================

Topology::Topology(EdgeMetadatas edges, NodeMetadatas nodes)
    : m_edges(std::move(edges))
    , m_nodes(std::move(nodes))
{
}

Topology make_topology()
{
    return Topology();
}

// ============================================================================
// Copy-on-write operations
// ============================================================================

Topology Topology::with_node(const std::string& node_id, const NodeMetadata& nmd) const
{
    const NodeMetadata* existing = m_nodes.find(node_id);
    NodeMetadata stored = existing ? nmd.merge(*existing) : nmd;
    return Topology(m_edges.copy(), m_nodes.with_entry(node_id, std::move(stored)));
}

Topology Topology::with_edge(const std::string& src_id, const std::string& dst_id,
                             const EdgeMetadata& emd, const IIdCodec& codec) const
{
    return Topology(m_edges.with_edge(codec.make_edge_id(src_id, dst_id), emd), m_nodes.copy());
}

Topology Topology::copy() const
{
    return Topology(m_edges.copy(), m_nodes.copy());
}

Topology Topology::merge(const Topology& other) const
{
    return Topology(m_edges.merge(other.m_edges), m_nodes.merge(other.m_nodes));
}

// ============================================================================
// Validation
// ============================================================================

TopologyDiagnostics Topology::validate(const IIdCodec& codec) const
{
    TopologyDiagnostics diag;
    check_edges(codec, diag);
    check_nodes(codec, diag);
    return diag;
}

void Topology::ensure_valid(const IIdCodec& codec) const
{
    TopologyDiagnostics diag = validate(codec);
    if (!diag.is_valid())
    {
        throw TopologyError(TopologyErrorCode::ValidationFailed, diag.summary());
    }
}

void Topology::check_edges(const IIdCodec& codec, TopologyDiagnostics& diag) const
{
    for (const auto& entry : m_edges)
    {
        const std::string& edge_id = entry.first;
        auto parts = codec.parse_edge_id(edge_id);
        if (!parts)
        {
            diag.m_errors.push_back(DiagnosticItem{
                DiagnosticCategory::InvalidEdgeId,
                "invalid edge ID \"" + edge_id + "\"",
                {},
                edge_id});
            continue;
        }

        // The edge must be recorded in the right direction on its source node
        const NodeMetadata* src = m_nodes.find(parts->src);
        if (src == nullptr)
        {
            diag.m_errors.push_back(DiagnosticItem{
                DiagnosticCategory::MissingSourceNode,
                "node " + parts->src + " metadatas missing for edge \"" + edge_id + "\"",
                {parts->src},
                edge_id});
        }
        else if (!src->adjacency().contains(parts->dst))
        {
            diag.m_errors.push_back(DiagnosticItem{
                DiagnosticCategory::MissingAdjacency,
                "adjacency destination \"" + parts->dst + "\" missing from node \"" +
                    parts->src + "\" (from edge \"" + edge_id + "\")",
                {parts->src, parts->dst},
                edge_id});
        }

        // The destination must exist too; check_nodes already reports it when
        // the source lists it as adjacent
        const bool linked = src != nullptr && src->adjacency().contains(parts->dst);
        if (!linked && !m_nodes.contains(parts->dst))
        {
            diag.m_errors.push_back(DiagnosticItem{
                DiagnosticCategory::MissingDestinationNode,
                "node " + parts->dst + " metadatas missing for edge \"" + edge_id + "\"",
                {parts->dst},
                edge_id});
        }
    }
}

void Topology::check_nodes(const IIdCodec& codec, TopologyDiagnostics& diag) const
{
    for (const auto& [node_id, nmd] : m_nodes)
    {
        if (!nmd.has_metadata())
        {
            diag.m_errors.push_back(DiagnosticItem{
                DiagnosticCategory::MissingLabels,
                "node ID \"" + node_id + "\" has no label map",
                {node_id},
                std::string()});
        }
        if (!codec.parse_node_id(node_id))
        {
            diag.m_errors.push_back(DiagnosticItem{
                DiagnosticCategory::InvalidNodeId,
                "invalid node ID \"" + node_id + "\"",
                {node_id},
                std::string()});
        }

        // Every adjacency destination must itself have metadata, and the
        // edge toward it must be recorded
        for (const auto& dst_id : nmd.adjacency())
        {
            if (!m_nodes.contains(dst_id))
            {
                diag.m_errors.push_back(DiagnosticItem{
                    DiagnosticCategory::MissingAdjacentNode,
                    "node metadata missing from adjacency \"" + node_id + "\" -> \"" +
                        dst_id + "\"",
                    {node_id, dst_id},
                    std::string()});
            }
            std::string edge_id = codec.make_edge_id(node_id, dst_id);
            if (!m_edges.contains(edge_id))
            {
                diag.m_errors.push_back(DiagnosticItem{
                    DiagnosticCategory::MissingEdge,
                    "edge metadata missing for adjacency \"" + node_id + "\" -> \"" +
                        dst_id + "\"",
                    {node_id, dst_id},
                    std::move(edge_id)});
            }
        }
    }
}

} // namespace topomerge
