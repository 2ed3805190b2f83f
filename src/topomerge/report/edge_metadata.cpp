/**
 * @file edge_metadata.cpp
 */
#include "topomerge/report/edge_metadata.hpp"

namespace topomerge
{

namespace
{

/// Sum the traffic counters; combine the high-water mark with `conn_op`.
template <typename ConnReducer>
EdgeMetadata combine(const EdgeMetadata& lhs, const EdgeMetadata& rhs, ConnReducer conn_op)
{
    EdgeMetadata result;
    result.egress_packet_count = merge_counter(lhs.egress_packet_count, rhs.egress_packet_count, SumReducer{});
    result.ingress_packet_count = merge_counter(lhs.ingress_packet_count, rhs.ingress_packet_count, SumReducer{});
    result.egress_byte_count = merge_counter(lhs.egress_byte_count, rhs.egress_byte_count, SumReducer{});
    result.ingress_byte_count = merge_counter(lhs.ingress_byte_count, rhs.ingress_byte_count, SumReducer{});
    result.max_conn_count_tcp = merge_counter(lhs.max_conn_count_tcp, rhs.max_conn_count_tcp, conn_op);
    return result;
}

} // namespace

EdgeMetadata EdgeMetadata::copy() const
{
    return *this;
}

EdgeMetadata EdgeMetadata::merge(const EdgeMetadata& other) const
{
    return combine(*this, other, MaxReducer{});
}

EdgeMetadata EdgeMetadata::flatten(const EdgeMetadata& other) const
{
    // Summing two maxima over-approximates the true maximum; best effort.
    return combine(*this, other, SumReducer{});
}

} // namespace topomerge
