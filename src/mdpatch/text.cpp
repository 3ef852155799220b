#include "text.hpp"

#include <string>
#include <string_view>
#include <vector>

#include <cstddef>

namespace mdpatch {

[[nodiscard]] static bool is_space(const char c) noexcept
{
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\v' ||
           c == '\f';
}

std::vector<std::string_view> split_lines(const std::string_view source)
{
    std::vector<std::string_view> result;

    std::size_t line_start = 0;
    std::size_t i = 0;

    while (i < source.size())
    {
        const char c = source[i];

        if (c != '\n' && c != '\r')
        {
            ++i;
            continue;
        }

        result.emplace_back(source.substr(line_start, i - line_start));

        if (c == '\r' && i + 1 < source.size() && source[i + 1] == '\n')
        {
            ++i;
        }

        ++i;
        line_start = i;
    }

    if (line_start < source.size())
    {
        result.emplace_back(source.substr(line_start));
    }

    return result;
}

void join_lines(
    std::string& output_buffer, const std::vector<std::string>& lines)
{
    for (const std::string& line : lines)
    {
        output_buffer.append(line);
        output_buffer.append(1, '\n');
    }
}

std::string_view trim_left(const std::string_view sv) noexcept
{
    std::size_t begin = 0;
    while (begin < sv.size() && is_space(sv[begin]))
    {
        ++begin;
    }

    return sv.substr(begin);
}

std::string_view trim(const std::string_view sv) noexcept
{
    const std::string_view left_trimmed = trim_left(sv);

    std::size_t end = left_trimmed.size();
    while (end > 0 && is_space(left_trimmed[end - 1]))
    {
        --end;
    }

    return left_trimmed.substr(0, end);
}

bool is_blank(const std::string_view sv) noexcept
{
    return trim_left(sv).empty();
}

std::size_t count_leading(const std::string_view sv, const char c) noexcept
{
    std::size_t result = 0;

    while (result < sv.size() && sv[result] == c)
    {
        ++result;
    }

    return result;
}

void expand_tabs(std::string& output_buffer, const std::string_view line,
    const std::size_t tab_width)
{
    for (const char c : line)
    {
        if (c != '\t')
        {
            output_buffer.append(1, c);
            continue;
        }

        output_buffer.append(tab_width, ' ');
    }
}

} // namespace mdpatch
