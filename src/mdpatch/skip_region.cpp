#include "skip_region.hpp"

#include "diagnostics.hpp"
#include "error.hpp"
#include "text.hpp"

#include <optional>
#include <random>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <cassert>
#include <cstddef>
#include <cstdint>

namespace mdpatch {

std::string make_skip_marker(
    const std::string_view tag, const std::string_view toggle)
{
    std::string result;
    result.reserve(tag.size() + toggle.size() + 10);

    result.append("<!-- ");
    result.append(tag);
    result.append(1, ' ');
    result.append(toggle);
    result.append(" -->");

    return result;
}

std::string make_placeholder(const std::string_view tag,
    const std::string_view source, std::mt19937& engine)
{
    std::uniform_int_distribution<std::uint32_t> dist{0, 2147483647};

    while (true)
    {
        std::string token = "block ";
        token.append(std::to_string(dist(engine)));

        std::string result = make_skip_marker(tag, token);
        if (source.find(result) == std::string_view::npos)
        {
            return result;
        }
    }
}

namespace {

[[nodiscard]] std::string make_pass_placeholder(
    const skip_config& cfg, const std::string_view source)
{
    if (cfg.placeholder_seed.has_value())
    {
        std::mt19937 engine{*cfg.placeholder_seed};
        return make_placeholder(cfg.tag, source, engine);
    }

    thread_local std::mt19937 engine{std::random_device{}()};
    return make_placeholder(cfg.tag, source, engine);
}

struct removed_region
{
    std::vector<std::string_view> _lines;
};

class skip_region_pass
{
private:
    const skip_config& _cfg;
    diagnostic_sink& _sink;
    const std::string_view _source;

    const std::string _on_marker;
    const std::string _off_marker;
    const std::string _wildcard_on_marker;
    const std::string _wildcard_off_marker;
    const std::string _placeholder;

    std::vector<std::string> _cleaned_lines;
    line_origin_map _origins;
    std::vector<removed_region> _removed_regions;

    [[nodiscard]] bool is_on_marker(const std::string_view trimmed) const
    {
        return trimmed == _on_marker || trimmed == _wildcard_on_marker;
    }

    [[nodiscard]] bool is_off_marker(const std::string_view trimmed) const
    {
        return trimmed == _off_marker || trimmed == _wildcard_off_marker;
    }

    void report(const error& e)
    {
        _sink.log(severity::error, e._line, to_string(e._kind), " for tag '",
            _cfg.tag, "': every '", _on_marker, "' (or '",
            _wildcard_on_marker, "') must be matched by a later '",
            _off_marker, "' (or '", _wildcard_off_marker, "')");
    }

    [[nodiscard]] std::optional<error> extract(
        const std::vector<std::string_view>& lines)
    {
        std::size_t depth = 0;
        std::size_t region_indent = 0;
        std::size_t region_first_line = 0;
        removed_region current_region;

        for (std::size_t i = 0; i < lines.size(); ++i)
        {
            const std::string_view line = lines[i];
            const std::string_view trimmed = trim(line);

            if (is_on_marker(trimmed))
            {
                if (depth == 0)
                {
                    region_indent = count_leading(line, ' ');
                    region_first_line = i;
                }

                ++depth;
                _sink.log(severity::debug, i + 1, "skip begin, level = ",
                    depth);
            }

            if (depth == 0)
            {
                if (is_off_marker(trimmed))
                {
                    const error e{._kind = error_kind::unopened_skip_region,
                        ._line = i + 1};

                    report(e);
                    return e;
                }

                std::string& cleaned = _cleaned_lines.emplace_back();
                expand_tabs(cleaned, line, _cfg.tab_width);
                _origins.emplace_back(i);
                continue;
            }

            current_region._lines.emplace_back(line);

            if (!is_off_marker(trimmed))
            {
                continue;
            }

            --depth;
            _sink.log(severity::debug, i + 1, "skip end, level = ", depth);

            if (depth != 0)
            {
                continue;
            }

            _removed_regions.emplace_back(std::move(current_region));
            current_region = removed_region{};

            std::string& placeholder = _cleaned_lines.emplace_back();
            placeholder.append(region_indent, ' ');
            placeholder.append(_placeholder);
            _origins.emplace_back(std::nullopt);
        }

        if (depth > 0)
        {
            const error e{._kind = error_kind::unclosed_skip_region,
                ._line = region_first_line + 1};

            report(e);
            return e;
        }

        return std::nullopt;
    }

    void restore(std::string& output_buffer, const std::string_view result)
    {
        std::size_t next_region = 0;

        for (const std::string_view line : split_lines(result))
        {
            if (trim(line) != _placeholder)
            {
                output_buffer.append(line);
                output_buffer.append(1, '\n');
                continue;
            }

            assert(next_region < _removed_regions.size());

            for (const std::string_view raw_line :
                _removed_regions[next_region]._lines)
            {
                output_buffer.append(raw_line);
                output_buffer.append(1, '\n');
            }

            ++next_region;
            _sink.log(severity::debug, std::nullopt, "restored skip region ",
                next_region);
        }

        assert(next_region == _removed_regions.size());
    }

public:
    [[nodiscard]] explicit skip_region_pass(const skip_config& cfg,
        diagnostic_sink& sink, const std::string_view source)
        : _cfg{cfg},
          _sink{sink},
          _source{source},
          _on_marker{make_skip_marker(cfg.tag, "on")},
          _off_marker{make_skip_marker(cfg.tag, "off")},
          _wildcard_on_marker{make_skip_marker(cfg.wildcard_tag, "on")},
          _wildcard_off_marker{make_skip_marker(cfg.wildcard_tag, "off")},
          _placeholder{make_pass_placeholder(cfg, source)}
    {}

    [[nodiscard]] std::optional<error> run(
        std::string& output_buffer, const transform_fn& transform)
    {
        const std::vector<std::string_view> lines = split_lines(_source);

        _sink.log(severity::debug, std::nullopt, "processing ", lines.size(),
            " lines with skip tag '", _cfg.tag, "'");

        if (const std::optional<error> e = extract(lines); e.has_value())
        {
            return e;
        }

        assert(_cleaned_lines.size() == _origins.size());

        std::string cleaned_source;
        cleaned_source.reserve(_source.size());
        join_lines(cleaned_source, _cleaned_lines);

        _sink.log(severity::debug, std::nullopt, "cleaned content: ",
            _cleaned_lines.size(), " lines, ", _removed_regions.size(),
            " skip regions");

        std::string result;
        result.reserve(cleaned_source.size());

        if (const std::optional<error> e =
                transform(result, cleaned_source, _origins);
            e.has_value())
        {
            return e;
        }

        if (_removed_regions.empty())
        {
            output_buffer.append(result);
            return std::nullopt;
        }

        _sink.log(severity::debug, std::nullopt, "restoring ",
            _removed_regions.size(), " skip regions");

        restore(output_buffer, result);
        return std::nullopt;
    }
};

} // namespace

std::optional<error> apply_within_clean_region(const skip_config& cfg,
    diagnostic_sink& sink, std::string& output_buffer,
    const std::string_view source, const transform_fn& transform)
{
    if (source.empty())
    {
        sink.log(severity::debug, std::nullopt,
            "empty content provided, nothing to do");

        return std::nullopt;
    }

    return skip_region_pass{cfg, sink, source}.run(output_buffer, transform);
}

} // namespace mdpatch
