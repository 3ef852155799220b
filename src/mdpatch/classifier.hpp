#pragma once

#include <functional>
#include <optional>
#include <set>
#include <string>
#include <string_view>

#include <cstddef>
#include <cstdint>

namespace mdpatch {

enum class line_state : std::uint8_t
{
    begin,
    normal_line,
    math_block_begin,
    math_block_content,
    math_block_end,
    code_block_begin,
    code_block_content,
    code_block_end,
    skipped_code_block_begin,
    skipped_code_block_content,
    skipped_code_block_end
};

inline constexpr std::size_t line_state_count = 11;

enum class line_shape : std::uint8_t
{
    math_delimiter,
    fence_open,
    skipped_fence_open,
    fence_close,
    other
};

inline constexpr std::size_t line_shape_count = 5;

using language_set = std::set<std::string, std::less<>>;

struct classifier_context
{
    // Length of the backtick run that closes the open fence.
    std::optional<std::size_t> _fence_length;
};

struct transition
{
    line_state _state;
    classifier_context _context;
};

[[nodiscard]] std::string_view to_string(const line_state state) noexcept;

[[nodiscard]] bool is_code_block_state(const line_state state) noexcept;

[[nodiscard]] line_shape classify_shape(const line_state state,
    const std::string_view trimmed_line, const classifier_context& context,
    const language_set& excluded_languages);

// Returns `std::nullopt` when `state` is inside a fenced block but `context`
// carries no fence length. That is a caller bug, reported upstream as
// `error_kind::malformed_fence_delimiter`.
[[nodiscard]] std::optional<transition> next_state(const line_state state,
    const std::string_view line, const classifier_context& context,
    const language_set& excluded_languages);

// Tracks the state across the lines of one document.
class classifier
{
private:
    const language_set& _excluded_languages;
    line_state _state;
    classifier_context _context;

public:
    [[nodiscard]] explicit classifier(
        const language_set& excluded_languages) noexcept;

    [[nodiscard]] bool advance(const std::string_view line);

    [[nodiscard]] line_state state() const noexcept;
    [[nodiscard]] const classifier_context& context() const noexcept;
};

} // namespace mdpatch
