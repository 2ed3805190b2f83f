/**
 * @file node_metadata.cpp
 */
#include "topomerge/report/node_metadata.hpp"

namespace topomerge
{

NodeMetadata::NodeMetadata()
    : m_labels(Labels{})
{
}

NodeMetadata::NodeMetadata(Labels labels)
    : m_labels(std::move(labels))
{
}

NodeMetadata::NodeMetadata(Labels labels, Counters counters, IdList adjacency)
    : m_labels(std::move(labels))
    , m_counters(std::move(counters))
    , m_adjacency(std::move(adjacency))
{
}

NodeMetadata NodeMetadata::with_metadata(std::optional<Labels> labels) const
{
    NodeMetadata result = copy();
    result.m_labels = std::move(labels);
    return result;
}

NodeMetadata NodeMetadata::with_counters(Counters counters) const
{
    NodeMetadata result = copy();
    result.m_counters = std::move(counters);
    return result;
}

NodeMetadata NodeMetadata::with_adjacency(IdList adjacency) const
{
    NodeMetadata result = copy();
    result.m_adjacency = std::move(adjacency);
    return result;
}

NodeMetadata NodeMetadata::with_adjacent(const std::string& node_id) const
{
    NodeMetadata result = copy();
    result.m_adjacency = result.m_adjacency.add(node_id);
    return result;
}

NodeMetadata NodeMetadata::copy() const
{
    return *this;
}

NodeMetadata NodeMetadata::merge(const NodeMetadata& other) const
{
    NodeMetadata result = copy();
    if (other.m_labels)
    {
        if (!result.m_labels)
        {
            result.m_labels.emplace();
        }
        for (const auto& [key, value] : *other.m_labels)
        {
            (*result.m_labels)[key] = value; // other takes precedence
        }
    }
    for (const auto& [key, value] : other.m_counters)
    {
        // Wraps on overflow instead of signed overflow.
        auto& slot = result.m_counters[key];
        slot = static_cast<std::int64_t>(
            static_cast<std::uint64_t>(slot) + static_cast<std::uint64_t>(value));
    }
    result.m_adjacency = result.m_adjacency.merge(other.m_adjacency);
    return result;
}

NodeMetadata make_node_metadata()
{
    return NodeMetadata();
}

NodeMetadata make_node_metadata_with(Labels labels)
{
    return NodeMetadata(std::move(labels));
}

} // namespace topomerge
