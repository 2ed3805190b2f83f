/**
 * @file id_codec.hpp
 * @brief Identifier codec interface and the default delimiter-based codec.
 */
#pragma once
#include "topomerge/common/common.hpp"

namespace topomerge
{

/**
 * @brief The two node IDs an edge key decodes to, as (src, dst).
 */
struct EdgeIdParts
{
    std::string src;
    std::string dst;
};

/**
 * @brief The components a node ID decodes to.
 * @details An empty `scope` denotes the local scope.
 */
struct NodeIdParts
{
    std::string scope;
    std::string kind;
};

/**
 * @brief Interface for decoding edge keys and node IDs.
 *
 * @details
 * `Topology::validate()` consults the codec to check that every edge key and
 * node ID is well formed. The structure of the identifiers is otherwise
 * opaque to the merge core.
 *
 * @par Thread Safety
 * - Implementations must be safe to call concurrently from const methods.
 */
class IIdCodec
{
public:
    virtual ~IIdCodec() = default;

    /**
     * @brief Build the edge key for the directed edge `src_id -> dst_id`.
     */
    virtual std::string make_edge_id(const std::string& src_id, const std::string& dst_id) const = 0;

    /**
     * @brief Decode an edge key into its source and destination node IDs.
     * @return The decoded parts, or `std::nullopt` if the key is malformed.
     */
    virtual std::optional<EdgeIdParts> parse_edge_id(const std::string& edge_id) const = 0;

    /**
     * @brief Decode a node ID into its scope and topology-kind components.
     * @return The decoded parts, or `std::nullopt` if the ID is malformed.
     */
    virtual std::optional<NodeIdParts> parse_node_id(const std::string& node_id) const = 0;
};

/**
 * @brief Delimiter-based identifier codec.
 *
 * @details
 * - Edge key: `src|dst`. Both sides must be non-empty and the key must
 *   contain exactly one `|`.
 * - Node ID: `scope;kind`, or a bare `kind` in the local scope. The kind must
 *   be non-empty, and a node ID may not contain `|`.
 */
class DefaultIdCodec : public IIdCodec
{
public:
    static constexpr char edge_delim = '|';
    static constexpr char scope_delim = ';';

    std::string make_edge_id(const std::string& src_id, const std::string& dst_id) const override;
    std::optional<EdgeIdParts> parse_edge_id(const std::string& edge_id) const override;
    std::optional<NodeIdParts> parse_node_id(const std::string& node_id) const override;

    /**
     * @brief Shared stateless instance, used as the default for validation.
     */
    static const DefaultIdCodec& instance() noexcept;
};

/**
 * @brief Build a node ID from its scope and kind.
 * @details An empty scope yields the bare kind.
 */
std::string make_node_id(const std::string& scope, const std::string& kind);

} // namespace topomerge
