#include "classifier.hpp"

#include "text.hpp"

#include <array>
#include <optional>
#include <string_view>

#include <cassert>
#include <cstddef>

namespace mdpatch {

namespace {

using ls = line_state;

using transition_row = std::array<line_state, line_shape_count>;

// Columns: math_delimiter, fence_open, skipped_fence_open, fence_close, other
constexpr transition_row normal_row{ls::math_block_begin, ls::code_block_begin,
    ls::skipped_code_block_begin, ls::code_block_begin, ls::normal_line};

constexpr transition_row math_row{ls::math_block_end, ls::math_block_content,
    ls::math_block_content, ls::math_block_content, ls::math_block_content};

constexpr transition_row code_row{ls::code_block_content,
    ls::code_block_content, ls::code_block_content, ls::code_block_end,
    ls::code_block_content};

constexpr transition_row skipped_code_row{ls::skipped_code_block_content,
    ls::skipped_code_block_content, ls::skipped_code_block_content,
    ls::skipped_code_block_end, ls::skipped_code_block_content};

// Indexed by the previous state. Every End state repeats `normal_row`.
constexpr std::array<transition_row, line_state_count> transition_table{
    normal_row,       // begin
    normal_row,       // normal_line
    math_row,         // math_block_begin
    math_row,         // math_block_content
    normal_row,       // math_block_end
    code_row,         // code_block_begin
    code_row,         // code_block_content
    normal_row,       // code_block_end
    skipped_code_row, // skipped_code_block_begin
    skipped_code_row, // skipped_code_block_content
    normal_row        // skipped_code_block_end
};

constexpr std::string_view math_delimiter = "$$";
constexpr std::string_view fence_prefix = "```";

[[nodiscard]] bool is_fence_begin(const line_state state) noexcept
{
    return state == ls::code_block_begin ||
           state == ls::skipped_code_block_begin;
}

[[nodiscard]] bool is_fence_end(const line_state state) noexcept
{
    return state == ls::code_block_end || state == ls::skipped_code_block_end;
}

} // namespace

std::string_view to_string(const line_state state) noexcept
{
    switch (state)
    {
        case ls::begin: return "begin";
        case ls::normal_line: return "normal_line";
        case ls::math_block_begin: return "math_block_begin";
        case ls::math_block_content: return "math_block_content";
        case ls::math_block_end: return "math_block_end";
        case ls::code_block_begin: return "code_block_begin";
        case ls::code_block_content: return "code_block_content";
        case ls::code_block_end: return "code_block_end";
        case ls::skipped_code_block_begin: return "skipped_code_block_begin";
        case ls::skipped_code_block_content:
            return "skipped_code_block_content";
        case ls::skipped_code_block_end: return "skipped_code_block_end";
    }

    return "unknown";
}

bool is_code_block_state(const line_state state) noexcept
{
    return state == ls::code_block_begin ||
           state == ls::code_block_content ||
           state == ls::skipped_code_block_begin ||
           state == ls::skipped_code_block_content;
}

line_shape classify_shape(const line_state state,
    const std::string_view trimmed_line, const classifier_context& context,
    const language_set& excluded_languages)
{
    if (is_code_block_state(state) && context._fence_length.has_value() &&
        trimmed_line.size() == *context._fence_length &&
        count_leading(trimmed_line, '`') == trimmed_line.size())
    {
        return line_shape::fence_close;
    }

    if (trimmed_line == math_delimiter)
    {
        return line_shape::math_delimiter;
    }

    if (trimmed_line.substr(0, fence_prefix.size()) == fence_prefix)
    {
        const std::size_t n_backticks = count_leading(trimmed_line, '`');
        const std::string_view info_string =
            trim(trimmed_line.substr(n_backticks));

        return excluded_languages.find(info_string) != excluded_languages.end()
                   ? line_shape::skipped_fence_open
                   : line_shape::fence_open;
    }

    return line_shape::other;
}

std::optional<transition> next_state(const line_state state,
    const std::string_view line, const classifier_context& context,
    const language_set& excluded_languages)
{
    if (is_code_block_state(state) && !context._fence_length.has_value())
    {
        return std::nullopt;
    }

    const std::string_view trimmed = trim(line);

    const line_shape shape =
        classify_shape(state, trimmed, context, excluded_languages);

    const auto row = static_cast<std::size_t>(state);
    const auto column = static_cast<std::size_t>(shape);

    assert(row < transition_table.size());
    assert(column < line_shape_count);

    transition result{._state = transition_table[row][column],
        ._context = context};

    if (is_fence_begin(result._state))
    {
        result._context._fence_length = count_leading(trimmed, '`');
    }
    else if (is_fence_end(result._state))
    {
        result._context._fence_length.reset();
    }

    return result;
}

classifier::classifier(const language_set& excluded_languages) noexcept
    : _excluded_languages{excluded_languages}, _state{ls::begin}, _context{}
{}

bool classifier::advance(const std::string_view line)
{
    const std::optional<transition> t =
        next_state(_state, line, _context, _excluded_languages);

    if (!t.has_value())
    {
        return false;
    }

    _state = t->_state;
    _context = t->_context;
    return true;
}

line_state classifier::state() const noexcept
{
    return _state;
}

const classifier_context& classifier::context() const noexcept
{
    return _context;
}

} // namespace mdpatch
