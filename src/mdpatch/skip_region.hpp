#pragma once

#include "error.hpp"

#include <functional>
#include <optional>
#include <random>
#include <string>
#include <string_view>
#include <vector>

#include <cstddef>
#include <cstdint>

namespace mdpatch {

class diagnostic_sink;

inline constexpr std::string_view default_wildcard_tag = "mdpatch.*";
inline constexpr std::size_t default_tab_width = 2;

struct skip_config
{
    std::string tag;
    std::string wildcard_tag{default_wildcard_tag};
    std::size_t tab_width = default_tab_width;

    // Fixed seed for the placeholder token. Unset means a random one.
    std::optional<std::uint32_t> placeholder_seed;
};

// One entry per cleaned line: the 0-based original line index, or
// `std::nullopt` for the placeholder standing in for a removed skip region.
using line_origin_map = std::vector<std::optional<std::size_t>>;

using transform_fn = std::function<std::optional<error>(
    std::string& output_buffer, const std::string_view cleaned_source,
    const line_origin_map& origins)>;

[[nodiscard]] std::string make_skip_marker(
    const std::string_view tag, const std::string_view toggle);

// `<!-- tag block N -->`, with `N` drawn from `engine` until the line does not
// occur anywhere in `source`.
[[nodiscard]] std::string make_placeholder(const std::string_view tag,
    const std::string_view source, std::mt19937& engine);

// Removes the skip regions of `source`, runs `transform` on what is left and
// splices the regions back. Appends to `output_buffer` only on success.
[[nodiscard]] std::optional<error> apply_within_clean_region(
    const skip_config& cfg, diagnostic_sink& sink, std::string& output_buffer,
    const std::string_view source, const transform_fn& transform);

} // namespace mdpatch
