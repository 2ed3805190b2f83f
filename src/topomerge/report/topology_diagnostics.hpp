/**
 * @file topology_diagnostics.hpp
 */
#pragma once
#include "topomerge/common/common.hpp"

namespace topomerge
{

// ============================================================================
// Diagnostic item types
// ============================================================================

/**
 * @brief Category of topology consistency violation.
 */
enum class DiagnosticCategory
{
    InvalidEdgeId,          ///< An edge key does not decode to (src, dst).
    MissingSourceNode,      ///< No node metadata for the source of an edge.
    MissingDestinationNode, ///< No node metadata for the destination of an edge.
    MissingAdjacency,       ///< Source node adjacency does not contain the edge destination.
    MissingAdjacentNode,    ///< A node referenced by an adjacency set has no metadata.
    MissingEdge,            ///< An adjacency entry has no edge metadata.
    MissingLabels,          ///< A node's label map is absent.
    InvalidNodeId           ///< A node ID does not decode to (scope, kind).
};

/**
 * @brief Short stable name of a category, e.g. "missing-adjacency".
 */
const char* to_string(DiagnosticCategory category) noexcept;

/**
 * @brief A single consistency violation.
 */
struct DiagnosticItem
{
    DiagnosticCategory category;
    std::string message;

    /// Node IDs involved in this violation, in (src, dst) order where applicable.
    std::vector<std::string> involved_nodes;

    /// Edge key involved in this violation, or empty.
    std::string edge_id;
};

// ============================================================================
// TopologyDiagnostics
// ============================================================================

/**
 * @brief Aggregated result of `Topology::validate()`.
 *
 * @details
 * Validation never stops at the first violation; every violation found is
 * recorded as one `DiagnosticItem`. Edge checks come first in edge-key order,
 * followed by node checks in node-ID order.
 *
 * @par Thread safety
 * - No internal synchronization.
 * - Once constructed, the data is immutable.
 * - Concurrent reads are safe.
 */
class TopologyDiagnostics
{
public:
    /**
     * @brief Check if the topology passed every check.
     */
    bool is_valid() const noexcept
    {
        return m_errors.empty();
    }

    bool has_errors() const noexcept
    {
        return !m_errors.empty();
    }

    const std::vector<DiagnosticItem>& errors() const noexcept
    {
        return m_errors;
    }

    /**
     * @brief Count the errors in the given category.
     */
    std::size_t count(DiagnosticCategory category) const noexcept
    {
        return static_cast<std::size_t>(std::count_if(
            m_errors.begin(), m_errors.end(),
            [category](const DiagnosticItem& item) { return item.category == category; }));
    }

    /**
     * @brief Render all errors as one line.
     * @return `"<n> error(s): <msg>; <msg>"`, or an empty string if valid.
     */
    std::string summary() const;

    // Allow Topology to populate diagnostics
    friend class Topology;

private:
    std::vector<DiagnosticItem> m_errors;
};

} // namespace topomerge
