#pragma once

#include <iosfwd>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <cstddef>

namespace mdpatch {

enum class severity
{
    debug,
    notice,
    warning,
    error
};

enum class diagnostic_format
{
    plain,         // ((MDPATCH ERROR))(12): message
    github_actions // ::error::line 12: message
};

struct diagnostic
{
    std::optional<std::size_t> _line; // 1-based
    severity _severity;
    std::string _message;
};

[[nodiscard]] std::string_view to_string(const severity sev) noexcept;

// Collects every diagnostic it receives. When constructed with a stream, the
// ones at or above `threshold` are also written to it as they arrive.
class diagnostic_sink
{
private:
    std::ostream* _stream;
    diagnostic_format _format;
    severity _threshold;
    std::vector<diagnostic> _records;

    [[nodiscard]] bool should_write(const severity sev) const noexcept;
    void write(const diagnostic& d);

public:
    [[nodiscard]] diagnostic_sink() noexcept;

    [[nodiscard]] explicit diagnostic_sink(std::ostream& stream,
        const diagnostic_format format = diagnostic_format::plain,
        const severity threshold = severity::warning) noexcept;

    void emit(const severity sev, const std::optional<std::size_t> line,
        std::string message);

    template <typename... Ts>
    void log(const severity sev, const std::optional<std::size_t> line,
        const Ts&... xs)
    {
        std::ostringstream oss;
        (oss << ... << xs);
        emit(sev, line, std::move(oss).str());
    }

    void begin_group(const std::string_view title);
    void end_group();

    [[nodiscard]] const std::vector<diagnostic>& records() const noexcept;
    [[nodiscard]] bool has_errors() const noexcept;
    void clear() noexcept;
};

} // namespace mdpatch
