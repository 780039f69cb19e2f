/**
 * @file path_template.cpp
 * @brief Path template compilation and anchored matching
 */

#include "rfuri/path_template.hpp"

#include <algorithm>
#include <cctype>
#include <format>
#include <ranges>
#include <utility>
#include <vector>

namespace rfuri::matcher {

namespace {

constexpr char kPathSeparator = '/';

[[nodiscard]] bool is_placeholder_char(char c)
{
    return std::isalnum(static_cast<unsigned char>(c)) != 0;
}

[[nodiscard]] rfuri::Error malformed(std::string_view text, std::size_t pos, std::string_view why)
{
    return Error::make("MalformedTemplate",
                       std::format("Malformed path template '{}' at offset {}: {}", text, pos, why));
}

}  // namespace

rfuri::Result<PathTemplate> PathTemplate::compile(std::string text)
{
    // Delimiters must balance; only their contents decide what is a placeholder
    std::vector<std::size_t> open_braces;
    for (std::size_t pos = 0; pos < text.size(); ++pos) {
        if (text[pos] == '{') {
            open_braces.push_back(pos);
        } else if (text[pos] == '}') {
            if (open_braces.empty()) {
                return std::unexpected(malformed(text, pos, "unmatched '}'"));
            }
            open_braces.pop_back();
        }
    }
    if (!open_braces.empty()) {
        return std::unexpected(malformed(text, open_braces.back(), "unterminated '{'"));
    }

    PathTemplate compiled;
    std::string literal;

    for (std::size_t pos = 0; pos < text.size(); ++pos) {
        const char c = text[pos];
        const std::size_t close = c == '{' ? text.find('}', pos + 1) : std::string::npos;
        std::string_view name;
        if (close != std::string::npos) {
            name = std::string_view(text.data() + pos + 1, close - pos - 1);
        }
        // "{}", "{Chassis-Id}" and the outer braces of "{{Id}}" stay literal text
        if (name.empty() || !std::ranges::all_of(name, is_placeholder_char)) {
            literal.push_back(c);
            continue;
        }

        if (!literal.empty()) {
            compiled.m_pieces.push_back(Piece{.literal = std::move(literal), .wildcard = false});
            literal.clear();
        }
        compiled.m_pieces.push_back(Piece{.literal = std::string{}, .wildcard = true});
        compiled.m_parameters.emplace_back(name);
        pos = close;
    }
    if (!literal.empty()) {
        compiled.m_pieces.push_back(Piece{.literal = std::move(literal), .wildcard = false});
    }

    compiled.m_text = std::move(text);
    return compiled;
}

bool PathTemplate::matches(std::string_view identifier) const
{
    return match_from(identifier, 0, 0);
}

bool PathTemplate::match_from(std::string_view identifier,
                              std::size_t piece_index,
                              std::size_t pos) const
{
    if (piece_index == m_pieces.size()) {
        return pos == identifier.size();
    }

    const Piece& piece = m_pieces[piece_index];
    if (!piece.wildcard) {
        if (!identifier.substr(pos).starts_with(piece.literal)) {
            return false;
        }
        return match_from(identifier, piece_index + 1, pos + piece.literal.size());
    }

    // A placeholder consumes at least one character and never crosses a separator
    std::size_t segment_end = pos;
    while (segment_end < identifier.size() && identifier[segment_end] != kPathSeparator) {
        ++segment_end;
    }
    for (std::size_t end = segment_end; end > pos; --end) {
        if (match_from(identifier, piece_index + 1, end)) {
            return true;
        }
    }
    return false;
}

bool matches(std::string_view identifier, std::string_view path_template)
{
    auto compiled = PathTemplate::compile(std::string(path_template));
    if (!compiled) {
        return false;
    }
    return compiled->matches(identifier);
}

rfuri::Result<PathSet> PathSet::build(std::vector<std::string> templates)
{
    std::ranges::sort(templates);
    const auto [first, last] = std::ranges::unique(templates);
    templates.erase(first, last);

    PathSet set;
    set.m_templates.reserve(templates.size());
    for (auto& text : templates) {
        auto compiled = PathTemplate::compile(std::move(text));
        if (!compiled) {
            return std::unexpected(compiled.error());
        }
        set.m_templates.push_back(std::move(*compiled));
    }
    return set;
}

bool PathSet::matches_any(std::string_view identifier) const
{
    return first_match(identifier).has_value();
}

std::optional<std::string_view> PathSet::first_match(std::string_view identifier) const
{
    auto it = std::ranges::find_if(m_templates, [&](const PathTemplate& candidate) {
        return candidate.matches(identifier);
    });
    if (it == m_templates.end()) {
        return std::nullopt;
    }
    return std::string_view(it->text());
}

}  // namespace rfuri::matcher
