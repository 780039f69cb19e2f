#pragma once

/**
 * @file resource.hpp
 * @brief Resource payload model: a tagged tree of mappings, sequences and scalars
 */

#include "rfuri/common.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

namespace rfuri::resource {

/// Property holding a resource's self-identifier
constexpr std::string_view kIdentifierProperty = "@odata.id";

/// Property holding a resource's type tag
constexpr std::string_view kTypeProperty = "@odata.type";

struct Node;

/// Leaf value of a payload
using Scalar = std::variant<std::nullptr_t, bool, std::int64_t, std::uint64_t, double, std::string>;

/// Object members, in document order
using Mapping = std::vector<std::pair<std::string, Node>>;

/// Array elements
using Sequence = std::vector<Node>;

struct Node
{
    std::variant<Scalar, Mapping, Sequence> value;

    [[nodiscard]] const Mapping* as_mapping() const { return std::get_if<Mapping>(&value); }
    [[nodiscard]] const Sequence* as_sequence() const { return std::get_if<Sequence>(&value); }
    [[nodiscard]] const Scalar* as_scalar() const { return std::get_if<Scalar>(&value); }

    /**
     * Look up a direct member of a mapping node
     * @return Member node, or nullptr when this is not a mapping or the member is absent
     */
    [[nodiscard]] const Node* find(std::string_view name) const;

    /**
     * @return The string held by a scalar node, std::nullopt otherwise
     */
    [[nodiscard]] std::optional<std::string_view> as_string() const;
};

/**
 * @brief One payload retrieved from the service
 */
struct Resource
{
    Node root;

    /// Self-identifier, when the payload carries a string @odata.id
    [[nodiscard]] std::optional<std::string_view>
    identifier(std::string_view property = kIdentifierProperty) const;

    /// Type tag, when the payload carries a string @odata.type
    [[nodiscard]] std::optional<std::string_view> type() const;
};

using ResourceCollection = std::vector<Resource>;

/**
 * Convert a parsed JSON document into a node tree (member order preserved)
 */
[[nodiscard]] Node node_from_json(const nlohmann::ordered_json& j);

/**
 * Convert a node tree back into JSON (keys sorted)
 */
[[nodiscard]] nlohmann::json node_to_json(const Node& node);

/**
 * Parse one payload from JSON text
 * @return Resource or ParseError
 */
[[nodiscard]] rfuri::Result<Resource> parse_resource(std::string_view text);

}  // namespace rfuri::resource
