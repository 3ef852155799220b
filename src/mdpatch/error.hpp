#pragma once

#include <string_view>

#include <cstddef>

namespace mdpatch {

enum class error_kind
{
    unclosed_skip_region,
    unopened_skip_region,
    malformed_fence_delimiter
};

struct error
{
    error_kind _kind;
    std::size_t _line; // 1-based, in the original document
};

[[nodiscard]] std::string_view to_string(const error_kind kind) noexcept;

} // namespace mdpatch
