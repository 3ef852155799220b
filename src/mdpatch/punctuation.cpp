#include "punctuation.hpp"

#include "classifier.hpp"
#include "diagnostics.hpp"
#include "error.hpp"
#include "skip_region.hpp"
#include "text.hpp"

#include <array>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <cassert>
#include <cstddef>

namespace mdpatch {

namespace {

struct punctuation_pair
{
    std::string_view _from;
    std::string_view _to;
};

constexpr std::array<punctuation_pair, 7> math_punctuation_pairs{{
    {",", "，"},
    {".", "．"},
    {";", "；"},
    {":", "："},
    {"!", "！"},
    {"?", "？"},
    {"。", "．"},
}};

constexpr punctuation_pair full_stop_pair{"。", "．"};

[[nodiscard]] const punctuation_pair* match_punctuation(
    const std::string_view line, const std::size_t idx) noexcept
{
    const std::string_view rest = line.substr(idx);

    for (const punctuation_pair& p : math_punctuation_pairs)
    {
        if (rest.substr(0, p._from.size()) == p._from)
        {
            return &p;
        }
    }

    return nullptr;
}

} // namespace

bool rewrite_math_punctuation(std::string& line)
{
    std::vector<std::size_t> dollars;
    for (std::size_t i = 0; i < line.size(); ++i)
    {
        if (line[i] == '$')
        {
            dollars.emplace_back(i);
        }
    }

    // Unbalanced delimiters: pairing would be a guess.
    if (dollars.empty() || dollars.size() % 2 != 0)
    {
        return false;
    }

    const std::string_view source = line;

    std::string result;
    result.reserve(line.size() + 16);

    std::size_t copied_up_to = 0;
    bool changed = false;

    for (std::size_t k = 1; k < dollars.size(); k += 2)
    {
        const std::size_t after_close = dollars[k] + 1;

        const punctuation_pair* const p =
            match_punctuation(source, after_close);
        if (p == nullptr)
        {
            continue;
        }

        result.append(source.substr(copied_up_to, after_close - copied_up_to));
        result.append(p->_to);

        std::size_t resume_idx = after_close + p->_from.size();

        // One separating space goes away, trailing whitespace stays.
        if (resume_idx < source.size() && source[resume_idx] == ' ' &&
            !is_blank(source.substr(resume_idx + 1)))
        {
            ++resume_idx;
        }

        copied_up_to = resume_idx;
        changed = true;
    }

    if (!changed)
    {
        return false;
    }

    result.append(source.substr(copied_up_to));
    line = std::move(result);
    return true;
}

bool rewrite_full_stops(std::string& line)
{
    bool changed = false;

    for (std::size_t idx = line.find(full_stop_pair._from);
         idx != std::string::npos;
         idx = line.find(full_stop_pair._from, idx + full_stop_pair._to.size()))
    {
        line.replace(idx, full_stop_pair._from.size(), full_stop_pair._to);
        changed = true;
    }

    return changed;
}

punctuation_normalizer::config punctuation_normalizer::math_punctuation_preset()
{
    return config{};
}

punctuation_normalizer::config punctuation_normalizer::full_stop_preset()
{
    return config{
        .fix_math_punctuation = false,
        .fix_full_stop = true,
        .rewrite_math_blocks = true,
        .excluded_languages = {},
        .skip = {.tag = std::string{full_stop_tag}} //
    };
}

bool punctuation_normalizer::is_rewrite_eligible(
    const config& cfg, const line_state state) const noexcept
{
    switch (state)
    {
        case line_state::normal_line:
        case line_state::code_block_content: return true;
        case line_state::math_block_content: return cfg.rewrite_math_blocks;
        default: return false;
    }
}

std::optional<error> punctuation_normalizer::rewrite(const config& cfg,
    std::string& output_buffer, const std::string_view cleaned_source,
    const line_origin_map& origins)
{
    const std::vector<std::string_view> lines = split_lines(cleaned_source);
    assert(lines.size() == origins.size());

    classifier cls{cfg.excluded_languages};

    std::vector<std::string> rewritten;
    rewritten.reserve(lines.size());

    std::size_t n_changed = 0;

    for (std::size_t i = 0; i < lines.size(); ++i)
    {
        std::string& line = rewritten.emplace_back(lines[i]);

        if (!origins[i].has_value())
        {
            continue;
        }

        const std::size_t original_line = *origins[i] + 1;

        if (!cls.advance(line))
        {
            _sink.log(severity::error, original_line,
                "code block content reached without a recorded fence "
                "delimiter");

            return error{._kind = error_kind::malformed_fence_delimiter,
                ._line = original_line};
        }

        if (!is_rewrite_eligible(cfg, cls.state()))
        {
            continue;
        }

        bool changed = false;

        if (cfg.fix_math_punctuation)
        {
            changed |= rewrite_math_punctuation(line);
        }

        if (cfg.fix_full_stop)
        {
            changed |= rewrite_full_stops(line);
        }

        if (changed)
        {
            ++n_changed;
            _sink.log(severity::debug, original_line,
                "punctuation fixes applied (", to_string(cls.state()), ")");
        }
    }

    _sink.log(severity::debug, std::nullopt, "punctuation fix completed: ",
        n_changed, " lines modified");

    join_lines(output_buffer, rewritten);
    return std::nullopt;
}

punctuation_normalizer::punctuation_normalizer(diagnostic_sink& sink) noexcept
    : _sink{sink}
{}

std::optional<error> punctuation_normalizer::normalize(const config& cfg,
    std::string& output_buffer, const std::string_view source)
{
    return apply_within_clean_region(cfg.skip, _sink, output_buffer, source,
        [&](std::string& out, const std::string_view cleaned,
            const line_origin_map& origins)
        { return rewrite(cfg, out, cleaned, origins); });
}

} // namespace mdpatch
