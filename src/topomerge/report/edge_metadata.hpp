/**
 * @file edge_metadata.hpp
 */
#pragma once
#include "topomerge/common/common.hpp"
#include "topomerge/report/counter_merge.hpp"

namespace topomerge
{

/**
 * @brief Counters a probe may collect about one directed edge.
 *
 * @details
 * Every field is an `OptionalCounter`; an absent field was not measured by
 * the probe. Fields are independent of each other and merge independently.
 *
 * @par Merge vs. flatten
 * - `merge()`: the operands are the same edge observed in two time windows.
 *   Traffic counters are summed; `max_conn_count_tcp` takes the maximum.
 * - `flatten()`: the operands are two different edges observed over the same
 *   window. All fields are summed, including `max_conn_count_tcp`, which makes
 *   that field an approximation (the sum of two maxima is an upper bound on
 *   the true maximum).
 *
 * @par Thread safety
 * - Plain value type; concurrent reads are safe.
 */
struct EdgeMetadata
{
    OptionalCounter egress_packet_count;
    OptionalCounter ingress_packet_count;
    /// Transport layer.
    OptionalCounter egress_byte_count;
    /// Transport layer.
    OptionalCounter ingress_byte_count;
    /// High-water mark of concurrent TCP connections.
    OptionalCounter max_conn_count_tcp;

    /**
     * @brief Return an independent copy.
     */
    EdgeMetadata copy() const;

    /**
     * @brief Fold a later observation of the same edge into this one.
     * @return A new value; neither operand is modified.
     */
    EdgeMetadata merge(const EdgeMetadata& other) const;

    /**
     * @brief Aggregate a different edge from the same time window into this one.
     * @return A new value; neither operand is modified.
     */
    EdgeMetadata flatten(const EdgeMetadata& other) const;

    friend bool operator==(const EdgeMetadata& lhs, const EdgeMetadata& rhs)
    {
        return lhs.egress_packet_count == rhs.egress_packet_count &&
               lhs.ingress_packet_count == rhs.ingress_packet_count &&
               lhs.egress_byte_count == rhs.egress_byte_count &&
               lhs.ingress_byte_count == rhs.ingress_byte_count &&
               lhs.max_conn_count_tcp == rhs.max_conn_count_tcp;
    }

    friend bool operator!=(const EdgeMetadata& lhs, const EdgeMetadata& rhs)
    {
        return !(lhs == rhs);
    }
};

} // namespace topomerge
