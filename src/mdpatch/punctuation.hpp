#pragma once

#include "classifier.hpp"
#include "error.hpp"
#include "skip_region.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace mdpatch {

class diagnostic_sink;

inline constexpr std::string_view punctuation_tag = "mdpatch.punctuation";
inline constexpr std::string_view full_stop_tag = "mdpatch.full-stop";

// `$x$, y` -> `$x$，y`. Lines with an odd number of `$` are left alone.
// Returns whether `line` changed.
[[nodiscard]] bool rewrite_math_punctuation(std::string& line);

// `。` -> `．` over the whole line. Returns whether `line` changed.
[[nodiscard]] bool rewrite_full_stops(std::string& line);

class punctuation_normalizer
{
public:
    struct config
    {
        bool fix_math_punctuation = true;
        bool fix_full_stop = false;
        bool rewrite_math_blocks = false;
        language_set excluded_languages{"tex", "text", "plain"};
        skip_config skip{.tag = std::string{punctuation_tag}};
    };

    [[nodiscard]] static config math_punctuation_preset();
    [[nodiscard]] static config full_stop_preset();

private:
    diagnostic_sink& _sink;

    [[nodiscard]] bool is_rewrite_eligible(
        const config& cfg, const line_state state) const noexcept;

    [[nodiscard]] std::optional<error> rewrite(const config& cfg,
        std::string& output_buffer, const std::string_view cleaned_source,
        const line_origin_map& origins);

public:
    [[nodiscard]] explicit punctuation_normalizer(
        diagnostic_sink& sink) noexcept;

    [[nodiscard]] std::optional<error> normalize(const config& cfg,
        std::string& output_buffer, const std::string_view source);
};

} // namespace mdpatch
