#include "diagnostics.hpp"

#include <algorithm>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <cstddef>

namespace mdpatch {

std::string_view to_string(const severity sev) noexcept
{
    switch (sev)
    {
        case severity::debug: return "debug";
        case severity::notice: return "notice";
        case severity::warning: return "warning";
        case severity::error: return "error";
    }

    return "unknown";
}

[[nodiscard]] static std::string_view plain_tag(const severity sev) noexcept
{
    switch (sev)
    {
        case severity::debug: return "DEBUG";
        case severity::notice: return "NOTICE";
        case severity::warning: return "WARNING";
        case severity::error: return "ERROR";
    }

    return "UNKNOWN";
}

bool diagnostic_sink::should_write(const severity sev) const noexcept
{
    return _stream != nullptr &&
           static_cast<int>(sev) >= static_cast<int>(_threshold);
}

void diagnostic_sink::write(const diagnostic& d)
{
    std::ostream& os = *_stream;

    if (_format == diagnostic_format::github_actions)
    {
        os << "::" << to_string(d._severity) << "::";

        if (d._line.has_value())
        {
            os << "line " << *d._line << ": ";
        }

        os << d._message << '\n';
        return;
    }

    os << "((MDPATCH " << plain_tag(d._severity) << "))";

    if (d._line.has_value())
    {
        os << "(" << *d._line << ")";
    }

    os << ": " << d._message << '\n';
}

diagnostic_sink::diagnostic_sink() noexcept
    : _stream{nullptr},
      _format{diagnostic_format::plain},
      _threshold{severity::error}
{}

diagnostic_sink::diagnostic_sink(std::ostream& stream,
    const diagnostic_format format, const severity threshold) noexcept
    : _stream{&stream}, _format{format}, _threshold{threshold}
{}

void diagnostic_sink::emit(const severity sev,
    const std::optional<std::size_t> line, std::string message)
{
    diagnostic& d = _records.emplace_back(diagnostic{
        ._line = line, ._severity = sev, ._message = std::move(message)});

    if (should_write(sev))
    {
        write(d);
    }
}

void diagnostic_sink::begin_group(const std::string_view title)
{
    if (_format == diagnostic_format::github_actions &&
        should_write(severity::debug))
    {
        *_stream << "::group::" << title << '\n';
    }
}

void diagnostic_sink::end_group()
{
    if (_format == diagnostic_format::github_actions &&
        should_write(severity::debug))
    {
        *_stream << "::endgroup::\n";
    }
}

const std::vector<diagnostic>& diagnostic_sink::records() const noexcept
{
    return _records;
}

bool diagnostic_sink::has_errors() const noexcept
{
    return std::any_of(_records.begin(), _records.end(),
        [](const diagnostic& d) { return d._severity == severity::error; });
}

void diagnostic_sink::clear() noexcept
{
    _records.clear();
}

} // namespace mdpatch
