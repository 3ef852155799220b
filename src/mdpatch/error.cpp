#include "error.hpp"

#include <string_view>

namespace mdpatch {

std::string_view to_string(const error_kind kind) noexcept
{
    switch (kind)
    {
        case error_kind::unclosed_skip_region: return "unclosed skip region";
        case error_kind::unopened_skip_region: return "unopened skip region";
        case error_kind::malformed_fence_delimiter:
            return "malformed fence delimiter";
    }

    return "unknown error";
}

} // namespace mdpatch
