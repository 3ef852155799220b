#pragma once

#include <string>
#include <string_view>
#include <vector>

#include <cstddef>

namespace mdpatch {

// Splits on `\n`, `\r\n` and `\r`. A trailing line break does not produce an
// extra empty line, so "a\nb\n" and "a\nb" both yield two lines.
[[nodiscard]] std::vector<std::string_view> split_lines(
    const std::string_view source);

// Joins with `\n` and terminates the last line.
void join_lines(
    std::string& output_buffer, const std::vector<std::string>& lines);

[[nodiscard]] std::string_view trim(const std::string_view sv) noexcept;
[[nodiscard]] std::string_view trim_left(const std::string_view sv) noexcept;

[[nodiscard]] bool is_blank(const std::string_view sv) noexcept;

[[nodiscard]] std::size_t count_leading(
    const std::string_view sv, const char c) noexcept;

void expand_tabs(std::string& output_buffer, const std::string_view line,
    const std::size_t tab_width);

} // namespace mdpatch
