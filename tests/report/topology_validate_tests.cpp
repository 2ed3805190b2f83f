/**
 * @file topology_validate_tests.cpp
 * @brief Unit tests for Topology::validate() and Topology::ensure_valid()
 */
#include <gtest/gtest.h>
#include "topomerge/report/topology.hpp"

using namespace topomerge;

namespace
{

bool has_item(const TopologyDiagnostics& diag, DiagnosticCategory category, const std::string& node_id)
{
    for (const auto& item : diag.errors())
    {
        if (item.category != category)
        {
            continue;
        }
        for (const auto& involved : item.involved_nodes)
        {
            if (involved == node_id)
            {
                return true;
            }
        }
    }
    return false;
}

/// Accepts only node IDs of the form "scope;kind", with a non-empty scope.
class StrictScopeCodec : public DefaultIdCodec
{
public:
    std::optional<NodeIdParts> parse_node_id(const std::string& node_id) const override
    {
        auto parts = DefaultIdCodec::parse_node_id(node_id);
        if (!parts || parts->scope.empty())
        {
            return std::nullopt;
        }
        return parts;
    }
};

} // namespace

// ============================================================================
// Clean topologies
// ============================================================================

TEST(TopologyValidateTests, Clean_TwoNodesOneEdge)
{
    Topology t = make_topology()
        .with_node("A", make_node_metadata().with_adjacent("B"))
        .with_node("B", make_node_metadata())
        .with_edge("A", "B", EdgeMetadata{});

    auto diag = t.validate();
    EXPECT_TRUE(diag.is_valid());
    EXPECT_FALSE(diag.has_errors());
    EXPECT_TRUE(diag.summary().empty());
    EXPECT_NO_THROW(t.ensure_valid());
}

TEST(TopologyValidateTests, Clean_ScopedNodeIds)
{
    const std::string a = make_node_id("host1", "proc");
    const std::string b = make_node_id("host2", "proc");
    Topology t = make_topology()
        .with_node(a, make_node_metadata().with_adjacent(b))
        .with_node(b, make_node_metadata())
        .with_edge(a, b, EdgeMetadata{});
    EXPECT_TRUE(t.validate().is_valid());
    EXPECT_TRUE(t.validate(StrictScopeCodec{}).is_valid());
}

// ============================================================================
// Edge checks
// ============================================================================

TEST(TopologyValidateTests, Edge_MissingDestinationNode)
{
    // Edge A|B, A adjacent to B, but no metadata for B
    Topology t = make_topology()
        .with_node("A", make_node_metadata().with_adjacent("B"))
        .with_edge("A", "B", EdgeMetadata{});

    auto diag = t.validate();
    EXPECT_FALSE(diag.is_valid());
    EXPECT_TRUE(has_item(diag, DiagnosticCategory::MissingAdjacentNode, "B"));
    EXPECT_EQ(diag.count(DiagnosticCategory::MissingAdjacency), 0u);
}

TEST(TopologyValidateTests, Edge_MissingDestinationNodeAndAdjacency)
{
    // Edge A|B with neither the adjacency link nor node B
    Topology t = make_topology()
        .with_node("A", make_node_metadata())
        .with_edge("A", "B", EdgeMetadata{});

    auto diag = t.validate();
    EXPECT_FALSE(diag.is_valid());
    ASSERT_EQ(diag.errors().size(), 2u);
    EXPECT_TRUE(has_item(diag, DiagnosticCategory::MissingAdjacency, "B"));
    EXPECT_TRUE(has_item(diag, DiagnosticCategory::MissingDestinationNode, "B"));
    EXPECT_EQ(diag.errors()[1].edge_id, "A|B");
}

TEST(TopologyValidateTests, Edge_MissingDestinationReportedOnceWhenAdjacent)
{
    // A lists B, so the node-side adjacency check already covers the missing B
    Topology t = make_topology()
        .with_node("A", make_node_metadata().with_adjacent("B"))
        .with_edge("A", "B", EdgeMetadata{});

    auto diag = t.validate();
    EXPECT_EQ(diag.count(DiagnosticCategory::MissingDestinationNode), 0u);
    EXPECT_EQ(diag.count(DiagnosticCategory::MissingAdjacentNode), 1u);
    EXPECT_EQ(diag.errors().size(), 1u);
}

TEST(TopologyValidateTests, Edge_MissingBothEndpoints)
{
    Topology t = make_topology().with_edge("A", "B", EdgeMetadata{});

    auto diag = t.validate();
    ASSERT_EQ(diag.errors().size(), 2u);
    EXPECT_TRUE(has_item(diag, DiagnosticCategory::MissingSourceNode, "A"));
    EXPECT_TRUE(has_item(diag, DiagnosticCategory::MissingDestinationNode, "B"));
}

TEST(TopologyValidateTests, Edge_MissingSourceNode)
{
    Topology t = make_topology()
        .with_node("B", make_node_metadata())
        .with_edge("A", "B", EdgeMetadata{});

    auto diag = t.validate();
    ASSERT_EQ(diag.errors().size(), 1u);
    EXPECT_EQ(diag.errors()[0].category, DiagnosticCategory::MissingSourceNode);
    EXPECT_EQ(diag.errors()[0].edge_id, "A|B");
}

TEST(TopologyValidateTests, Edge_InvalidEdgeId)
{
    Topology t(EdgeMetadatas({{"no-delimiter", EdgeMetadata{}}}), NodeMetadatas());

    auto diag = t.validate();
    ASSERT_EQ(diag.errors().size(), 1u);
    EXPECT_EQ(diag.errors()[0].category, DiagnosticCategory::InvalidEdgeId);
    EXPECT_EQ(diag.errors()[0].edge_id, "no-delimiter");
}

// ============================================================================
// Node checks
// ============================================================================

TEST(TopologyValidateTests, Node_AbsentLabels)
{
    Topology t = make_topology().with_node("A", make_node_metadata().with_metadata(std::nullopt));

    auto diag = t.validate();
    ASSERT_EQ(diag.errors().size(), 1u);
    EXPECT_TRUE(has_item(diag, DiagnosticCategory::MissingLabels, "A"));
}

TEST(TopologyValidateTests, Node_EmptyLabelsAreValid)
{
    Topology t = make_topology().with_node("A", make_node_metadata_with(Labels{}));
    EXPECT_TRUE(t.validate().is_valid());
}

TEST(TopologyValidateTests, Node_InvalidNodeId)
{
    Topology t = make_topology().with_node("host;", make_node_metadata());

    auto diag = t.validate();
    ASSERT_EQ(diag.errors().size(), 1u);
    EXPECT_TRUE(has_item(diag, DiagnosticCategory::InvalidNodeId, "host;"));
}

TEST(TopologyValidateTests, Node_CodecIsPluggable)
{
    Topology t = make_topology().with_node("A", make_node_metadata());
    EXPECT_TRUE(t.validate().is_valid());

    auto diag = t.validate(StrictScopeCodec{});
    EXPECT_TRUE(has_item(diag, DiagnosticCategory::InvalidNodeId, "A"));
}

TEST(TopologyValidateTests, Node_AdjacencyWithoutEdge)
{
    Topology t = make_topology()
        .with_node("A", make_node_metadata().with_adjacent("B"))
        .with_node("B", make_node_metadata());

    auto diag = t.validate();
    ASSERT_EQ(diag.errors().size(), 1u);
    EXPECT_EQ(diag.errors()[0].category, DiagnosticCategory::MissingEdge);
    EXPECT_EQ(diag.errors()[0].edge_id, "A|B");
}

// ============================================================================
// Aggregation
// ============================================================================

TEST(TopologyValidateTests, Aggregate_ReportsEveryViolation)
{
    Topology t = make_topology()
        .with_node("A", make_node_metadata().with_metadata(std::nullopt).with_adjacent("Z"))
        .with_node("bad|id", make_node_metadata())
        .with_edge("Q", "R", EdgeMetadata{})
        .with_edge("A", "B", EdgeMetadata{});
    t = t.merge(Topology(EdgeMetadatas({{"garbage", EdgeMetadata{}}}), NodeMetadatas()));

    auto diag = t.validate();
    EXPECT_EQ(diag.count(DiagnosticCategory::InvalidEdgeId), 1u);
    EXPECT_EQ(diag.count(DiagnosticCategory::MissingSourceNode), 1u);    // Q|R
    EXPECT_EQ(diag.count(DiagnosticCategory::MissingDestinationNode), 2u); // A|B, Q|R
    EXPECT_EQ(diag.count(DiagnosticCategory::MissingAdjacency), 1u);     // A|B
    EXPECT_EQ(diag.count(DiagnosticCategory::MissingAdjacentNode), 1u);  // A -> Z
    EXPECT_EQ(diag.count(DiagnosticCategory::MissingEdge), 1u);          // A -> Z
    EXPECT_EQ(diag.count(DiagnosticCategory::MissingLabels), 1u);        // A
    EXPECT_EQ(diag.count(DiagnosticCategory::InvalidNodeId), 1u);        // bad|id
    EXPECT_EQ(diag.errors().size(), 9u);
    EXPECT_EQ(diag.summary().rfind("9 error(s): ", 0), 0u);
}

TEST(TopologyValidateTests, Aggregate_EdgeChecksPrecedeNodeChecks)
{
    Topology t = make_topology()
        .with_node("", make_node_metadata())
        .with_edge("X", "Y", EdgeMetadata{});

    auto diag = t.validate();
    ASSERT_EQ(diag.errors().size(), 3u);
    EXPECT_EQ(diag.errors()[0].category, DiagnosticCategory::MissingSourceNode);
    EXPECT_EQ(diag.errors()[1].category, DiagnosticCategory::MissingDestinationNode);
    EXPECT_EQ(diag.errors()[2].category, DiagnosticCategory::InvalidNodeId);
}

TEST(TopologyValidateTests, EnsureValid_ThrowsWithSummary)
{
    Topology t = make_topology().with_node("host;", make_node_metadata());
    try
    {
        t.ensure_valid();
        FAIL() << "expected TopologyError";
    }
    catch (const TopologyError& e)
    {
        EXPECT_EQ(e.code(), TopologyErrorCode::ValidationFailed);
        EXPECT_EQ(std::string(e.what()), t.validate().summary());
        EXPECT_NE(std::string(e.what()).find("invalid node ID"), std::string::npos);
    }
}

TEST(TopologyValidateTests, Validate_DoesNotModifyTopology)
{
    const Topology t = make_topology().with_node("A", make_node_metadata().with_adjacent("B"));
    const Topology before = t.copy();
    (void)t.validate();
    EXPECT_EQ(t, before);
}

TEST(TopologyValidateTests, CategoryNames)
{
    EXPECT_STREQ(to_string(DiagnosticCategory::MissingAdjacency), "missing-adjacency");
    EXPECT_STREQ(to_string(DiagnosticCategory::MissingDestinationNode), "missing-destination-node");
    EXPECT_STREQ(to_string(DiagnosticCategory::MissingEdge), "missing-edge");
    EXPECT_STREQ(to_string(DiagnosticCategory::InvalidNodeId), "invalid-node-id");
}

// ============================================================================
// Scenario: edges and adjacency kept in lockstep by the caller
// ============================================================================

TEST(TopologyValidateTests, Scenario_AdjacencyWithoutEdgeFailsUntilEdgeAdded)
{
    Topology t = make_topology()
        .with_node("A", make_node_metadata_with({{"role", "db"}}))
        .with_node("A", make_node_metadata_with({{"role", "db"}}).with_adjacent("B"))
        .with_node("B", make_node_metadata());

    auto diag = t.validate();
    EXPECT_FALSE(diag.is_valid());
    EXPECT_TRUE(has_item(diag, DiagnosticCategory::MissingEdge, "B"));
    EXPECT_THROW(t.ensure_valid(), TopologyError);

    Topology with_edge = t.with_edge("A", "B", EdgeMetadata{});
    EXPECT_TRUE(with_edge.validate().is_valid());
    EXPECT_FALSE(t.validate().is_valid());
}
