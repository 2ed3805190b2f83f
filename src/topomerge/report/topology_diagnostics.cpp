/**
 * @file topology_diagnostics.cpp
 */
#include "topomerge/report/topology_diagnostics.hpp"

#include <sstream>

namespace topomerge
{

const char* to_string(DiagnosticCategory category) noexcept
{
    switch (category)
    {
    case DiagnosticCategory::InvalidEdgeId:
        return "invalid-edge-id";
    case DiagnosticCategory::MissingSourceNode:
        return "missing-source-node";
    case DiagnosticCategory::MissingDestinationNode:
        return "missing-destination-node";
    case DiagnosticCategory::MissingAdjacency:
        return "missing-adjacency";
    case DiagnosticCategory::MissingAdjacentNode:
        return "missing-adjacent-node";
    case DiagnosticCategory::MissingEdge:
        return "missing-edge";
    case DiagnosticCategory::MissingLabels:
        return "missing-labels";
    case DiagnosticCategory::InvalidNodeId:
        return "invalid-node-id";
    }
    return "unknown";
}

std::string TopologyDiagnostics::summary() const
{
    if (m_errors.empty())
    {
        return std::string();
    }
    std::ostringstream oss;
    oss << m_errors.size() << " error(s): ";
    for (size_t i = 0; i < m_errors.size(); ++i)
    {
        if (i > 0)
        {
            oss << "; ";
        }
        oss << m_errors[i].message;
    }
    return oss.str();
}

} // namespace topomerge
