/**
 * @file node_metadata.hpp
 */
#pragma once
#include "topomerge/common/common.hpp"
#include "topomerge/report/id_list.hpp"

namespace topomerge
{

/// Free-form node labels.
using Labels = std::map<std::string, std::string>;

/// Per-node occurrence counters.
using Counters = std::map<std::string, std::int64_t>;

/**
 * @brief Metadata a probe may collect about one node.
 *
 * @details
 * A node carries three independent parts, each with its own merge rule:
 * - **Labels** (`metadata()`): string to string. On key collision the other
 *   (right-hand) side wins.
 * - **Counters**: string to integer. Values for the same key are summed; a
 *   missing key counts as zero.
 * - **Adjacency**: the set of node IDs this node has an observed edge toward.
 *   Merged by set union.
 *
 * @par Absent labels
 * The label map may be absent (as opposed to present and empty) only when
 * explicitly set via `with_metadata(std::nullopt)`. `Topology::validate()`
 * reports such nodes. `copy()` preserves absence; `merge()` yields a present
 * map whenever either operand has one.
 *
 * @par Value semantics
 * - All methods are const; every `with_*` and `merge` returns a new value.
 * - No validation is performed at this layer.
 *
 * @par Thread safety
 * - No internal synchronization; concurrent reads are safe.
 */
class NodeMetadata
{
public:
    /**
     * @brief Construct with an empty (present) label map, no counters and no adjacency.
     */
    NodeMetadata();

    /**
     * @brief Construct with the given label map, no counters and no adjacency.
     */
    explicit NodeMetadata(Labels labels);

    /**
     * @brief Construct with all three parts.
     */
    NodeMetadata(Labels labels, Counters counters, IdList adjacency);

    /**
     * @brief The label map, or `nullptr` if it is absent.
     */
    const Labels* metadata() const noexcept
    {
        return m_labels ? &*m_labels : nullptr;
    }

    bool has_metadata() const noexcept
    {
        return m_labels.has_value();
    }

    const Counters& counters() const noexcept
    {
        return m_counters;
    }

    const IdList& adjacency() const noexcept
    {
        return m_adjacency;
    }

    /**
     * @brief Return a copy with the label map replaced by `labels`.
     * @param labels The new label map; `std::nullopt` leaves it absent.
     */
    NodeMetadata with_metadata(std::optional<Labels> labels) const;

    /**
     * @brief Return a copy with the counter map replaced by `counters`.
     */
    NodeMetadata with_counters(Counters counters) const;

    /**
     * @brief Return a copy with the adjacency set replaced by `adjacency`.
     */
    NodeMetadata with_adjacency(IdList adjacency) const;

    /**
     * @brief Return a copy with `node_id` added to the adjacency set.
     * @note Idempotent.
     */
    NodeMetadata with_adjacent(const std::string& node_id) const;

    /**
     * @brief Return a deep copy. An absent label map stays absent.
     */
    NodeMetadata copy() const;

    /**
     * @brief Merge `other` into a copy of this node.
     *
     * @details
     * - Labels: keys of `other` overwrite.
     * - Counters: values of `other` are added to existing values.
     * - Adjacency: set union.
     *
     * @return A new value; neither operand is modified.
     */
    NodeMetadata merge(const NodeMetadata& other) const;

    friend bool operator==(const NodeMetadata& lhs, const NodeMetadata& rhs)
    {
        return lhs.m_labels == rhs.m_labels &&
               lhs.m_counters == rhs.m_counters &&
               lhs.m_adjacency == rhs.m_adjacency;
    }

    friend bool operator!=(const NodeMetadata& lhs, const NodeMetadata& rhs)
    {
        return !(lhs == rhs);
    }

private:
    std::optional<Labels> m_labels;
    Counters m_counters;
    IdList m_adjacency;
};

/**
 * @brief Create node metadata with an empty label map.
 */
NodeMetadata make_node_metadata();

/**
 * @brief Create node metadata with the supplied label map.
 */
NodeMetadata make_node_metadata_with(Labels labels);

} // namespace topomerge
