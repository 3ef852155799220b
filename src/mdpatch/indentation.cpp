#include "indentation.hpp"

#include "diagnostics.hpp"
#include "error.hpp"
#include "skip_region.hpp"
#include "text.hpp"

#include <algorithm>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <cassert>
#include <cstddef>

namespace mdpatch {

std::vector<std::size_t> compute_blank_line_indents(
    const std::vector<std::string_view>& lines, const line_origin_map& origins)
{
    assert(lines.size() == origins.size());

    const std::size_t size = lines.size();

    std::vector<bool> non_blank(size);
    std::vector<std::size_t> indents(size);

    for (std::size_t i = 0; i < size; ++i)
    {
        non_blank[i] = origins[i].has_value() && !is_blank(lines[i]);
        indents[i] = non_blank[i] ? count_leading(lines[i], ' ') : max_indent;
    }

    const auto propagate = [&](const std::size_t i, std::size_t& past_indent)
    {
        if (!origins[i].has_value())
        {
            return;
        }

        if (non_blank[i])
        {
            past_indent = indents[i];
            return;
        }

        indents[i] = std::min(indents[i], past_indent);
    };

    std::size_t past_indent = max_indent;
    for (std::size_t i = 0; i < size; ++i)
    {
        propagate(i, past_indent);
    }

    past_indent = max_indent;
    for (std::size_t i = size; i-- > 0;)
    {
        propagate(i, past_indent);
    }

    for (std::size_t i = 0; i < size; ++i)
    {
        if (indents[i] == max_indent)
        {
            indents[i] = 0;
        }
    }

    return indents;
}

void indentation_normalizer::rewrite(std::string& output_buffer,
    const std::string_view cleaned_source, const line_origin_map& origins)
{
    const std::vector<std::string_view> lines = split_lines(cleaned_source);
    const std::vector<std::size_t> indents =
        compute_blank_line_indents(lines, origins);

    std::vector<std::string> rewritten;
    rewritten.reserve(lines.size());

    for (std::size_t i = 0; i < lines.size(); ++i)
    {
        const std::string_view line = lines[i];

        if (!origins[i].has_value() || !is_blank(line) ||
            line == std::string(indents[i], ' '))
        {
            rewritten.emplace_back(line);
            continue;
        }

        _sink.log(severity::debug, *origins[i] + 1,
            "old indent = ", count_leading(line, ' '),
            ", new indent = ", indents[i]);

        rewritten.emplace_back(indents[i], ' ');
    }

    join_lines(output_buffer, rewritten);
}

indentation_normalizer::indentation_normalizer(diagnostic_sink& sink) noexcept
    : _sink{sink}
{}

std::optional<error> indentation_normalizer::normalize(const config& cfg,
    std::string& output_buffer, const std::string_view source)
{
    return apply_within_clean_region(cfg.skip, _sink, output_buffer, source,
        [&](std::string& out, const std::string_view cleaned,
            const line_origin_map& origins) -> std::optional<error>
        {
            rewrite(out, cleaned, origins);
            return std::nullopt;
        });
}

} // namespace mdpatch
