/**
 * @file id_codec.cpp
 */
#include "topomerge/report/id_codec.hpp"

namespace topomerge
{

std::string DefaultIdCodec::make_edge_id(const std::string& src_id, const std::string& dst_id) const
{
    return src_id + edge_delim + dst_id;
}

std::optional<EdgeIdParts> DefaultIdCodec::parse_edge_id(const std::string& edge_id) const
{
    const auto pos = edge_id.find(edge_delim);
    if (pos == std::string::npos || edge_id.find(edge_delim, pos + 1) != std::string::npos)
    {
        return std::nullopt;
    }
    EdgeIdParts parts{edge_id.substr(0, pos), edge_id.substr(pos + 1)};
    if (parts.src.empty() || parts.dst.empty())
    {
        return std::nullopt;
    }
    return parts;
}

std::optional<NodeIdParts> DefaultIdCodec::parse_node_id(const std::string& node_id) const
{
    if (node_id.empty() || node_id.find(edge_delim) != std::string::npos)
    {
        return std::nullopt;
    }
    NodeIdParts parts;
    const auto pos = node_id.find(scope_delim);
    if (pos == std::string::npos)
    {
        parts.kind = node_id;
    }
    else
    {
        parts.scope = node_id.substr(0, pos);
        parts.kind = node_id.substr(pos + 1);
    }
    if (parts.kind.empty())
    {
        return std::nullopt;
    }
    return parts;
}

const DefaultIdCodec& DefaultIdCodec::instance() noexcept
{
    static const DefaultIdCodec codec;
    return codec;
}

std::string make_node_id(const std::string& scope, const std::string& kind)
{
    if (scope.empty())
    {
        return kind;
    }
    return scope + DefaultIdCodec::scope_delim + kind;
}

} // namespace topomerge
