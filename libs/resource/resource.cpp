/**
 * @file resource.cpp
 * @brief Resource payload model and JSON conversion
 */

#include "rfuri/resource.hpp"

#include <algorithm>
#include <type_traits>

namespace rfuri::resource {

namespace {

template <typename... Ts>
struct Overloaded : Ts...
{
    using Ts::operator()...;
};

[[nodiscard]] Scalar scalar_from_json(const nlohmann::ordered_json& j)
{
    switch (j.type()) {
        case nlohmann::ordered_json::value_t::boolean:
            return j.get<bool>();
        case nlohmann::ordered_json::value_t::number_integer:
            return j.get<std::int64_t>();
        case nlohmann::ordered_json::value_t::number_unsigned:
            return j.get<std::uint64_t>();
        case nlohmann::ordered_json::value_t::number_float:
            return j.get<double>();
        case nlohmann::ordered_json::value_t::string:
            return j.get<std::string>();
        default:
            return nullptr;
    }
}

}  // namespace

const Node* Node::find(std::string_view name) const
{
    const auto* mapping = as_mapping();
    if (mapping == nullptr) {
        return nullptr;
    }
    auto it = std::ranges::find_if(*mapping, [&](const auto& member) { return member.first == name; });
    if (it == mapping->end()) {
        return nullptr;
    }
    return &it->second;
}

std::optional<std::string_view> Node::as_string() const
{
    const auto* scalar = as_scalar();
    if (scalar == nullptr) {
        return std::nullopt;
    }
    if (const auto* text = std::get_if<std::string>(scalar)) {
        return std::string_view(*text);
    }
    return std::nullopt;
}

std::optional<std::string_view> Resource::identifier(std::string_view property) const
{
    const Node* id = root.find(property);
    if (id == nullptr) {
        return std::nullopt;
    }
    return id->as_string();
}

std::optional<std::string_view> Resource::type() const
{
    const Node* type_node = root.find(kTypeProperty);
    if (type_node == nullptr) {
        return std::nullopt;
    }
    return type_node->as_string();
}

Node node_from_json(const nlohmann::ordered_json& j)
{
    if (j.is_object()) {
        Mapping mapping;
        mapping.reserve(j.size());
        for (const auto& [key, val] : j.items()) {
            mapping.emplace_back(key, node_from_json(val));
        }
        return Node{.value = std::move(mapping)};
    }
    if (j.is_array()) {
        Sequence sequence;
        sequence.reserve(j.size());
        for (const auto& elem : j) {
            sequence.push_back(node_from_json(elem));
        }
        return Node{.value = std::move(sequence)};
    }
    return Node{.value = scalar_from_json(j)};
}

nlohmann::json node_to_json(const Node& node)
{
    return std::visit(
        Overloaded{
            [](const Scalar& scalar) -> nlohmann::json {
                return std::visit(
                    [](const auto& leaf) -> nlohmann::json {
                        if constexpr (std::is_same_v<std::decay_t<decltype(leaf)>, std::nullptr_t>) {
                            return nullptr;
                        } else {
                            return leaf;
                        }
                    },
                    scalar);
            },
            [](const Mapping& mapping) -> nlohmann::json {
                nlohmann::json object = nlohmann::json::object();
                for (const auto& [key, child] : mapping) {
                    object[key] = node_to_json(child);
                }
                return object;
            },
            [](const Sequence& sequence) -> nlohmann::json {
                nlohmann::json array = nlohmann::json::array();
                for (const auto& child : sequence) {
                    array.push_back(node_to_json(child));
                }
                return array;
            }},
        node.value);
}

rfuri::Result<Resource> parse_resource(std::string_view text)
{
    try {
        return Resource{.root = node_from_json(nlohmann::ordered_json::parse(text))};
    } catch (const std::exception& ex) {
        return std::unexpected(
            Error::make("ParseError", std::string("Failed to parse resource payload: ") + ex.what()));
    }
}

}  // namespace rfuri::resource
