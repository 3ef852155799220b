#pragma once

#include "error.hpp"
#include "skip_region.hpp"

#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <cstddef>

namespace mdpatch {

class diagnostic_sink;

inline constexpr std::string_view indentation_tag = "mdpatch.indentation";

// Indent given to blank lines before propagation. Larger than any real one.
inline constexpr std::size_t max_indent =
    std::numeric_limits<std::size_t>::max();

// Blank lines get the smallest indentation of their closest non-blank
// neighbours above and below. Placeholder lines (no origin) are neither
// anchors nor targets; their entry is unspecified.
[[nodiscard]] std::vector<std::size_t> compute_blank_line_indents(
    const std::vector<std::string_view>& lines,
    const line_origin_map& origins);

class indentation_normalizer
{
public:
    struct config
    {
        skip_config skip{.tag = std::string{indentation_tag}};
    };

private:
    diagnostic_sink& _sink;

    void rewrite(std::string& output_buffer,
        const std::string_view cleaned_source, const line_origin_map& origins);

public:
    [[nodiscard]] explicit indentation_normalizer(
        diagnostic_sink& sink) noexcept;

    [[nodiscard]] std::optional<error> normalize(const config& cfg,
        std::string& output_buffer, const std::string_view source);
};

} // namespace mdpatch
