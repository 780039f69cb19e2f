#pragma once

/**
 * @file path_template.hpp
 * @brief Path templates ("/redfish/v1/Chassis/{ChassisId}") and the specification's path set
 */

#include "rfuri/common.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace rfuri::matcher {

/**
 * @brief A compiled path template
 *
 * Each placeholder "{Name}" (Name: one or more ASCII alphanumerics) matches one
 * or more characters other than '/'. Everything else is literal, including
 * balanced braces around anything but a plain name ("{}", "{Chassis-Id}").
 * Matching is anchored at both ends of the identifier.
 */
class PathTemplate
{
public:
    /**
     * Compile a template
     * @return Compiled template, or MalformedTemplate for an unmatched '{' or '}'
     */
    [[nodiscard]] static rfuri::Result<PathTemplate> compile(std::string text);

    [[nodiscard]] bool matches(std::string_view identifier) const;

    [[nodiscard]] const std::string& text() const { return m_text; }

    /// Placeholder names in template order
    [[nodiscard]] const std::vector<std::string>& parameters() const { return m_parameters; }

private:
    struct Piece
    {
        std::string literal;  ///< Empty for a placeholder
        bool wildcard;
    };

    PathTemplate() = default;

    [[nodiscard]] bool match_from(std::string_view identifier,
                                  std::size_t piece_index,
                                  std::size_t pos) const;

    std::string m_text;
    std::vector<Piece> m_pieces;
    std::vector<std::string> m_parameters;
};

/**
 * Match one identifier against one template
 * @return false when the template does not match or is malformed
 */
[[nodiscard]] bool matches(std::string_view identifier, std::string_view path_template);

/**
 * @brief All path templates declared by a specification
 *
 * Templates are kept in lexicographic order so the first reported match is
 * reproducible. Duplicate templates are collapsed.
 */
class PathSet
{
public:
    PathSet() = default;

    [[nodiscard]] static rfuri::Result<PathSet> build(std::vector<std::string> templates);

    [[nodiscard]] bool matches_any(std::string_view identifier) const;

    /// First template (in lexicographic order) matching the identifier
    [[nodiscard]] std::optional<std::string_view> first_match(std::string_view identifier) const;

    [[nodiscard]] std::size_t size() const { return m_templates.size(); }
    [[nodiscard]] bool empty() const { return m_templates.empty(); }
    [[nodiscard]] const std::vector<PathTemplate>& templates() const { return m_templates; }

private:
    std::vector<PathTemplate> m_templates;
};

}  // namespace rfuri::matcher
