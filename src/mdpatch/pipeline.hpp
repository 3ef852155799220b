#pragma once

#include "diagnostics.hpp"
#include "error.hpp"
#include "indentation.hpp"
#include "punctuation.hpp"

#include <filesystem>
#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <cstddef>

namespace mdpatch {

enum class mode
{
    pre, // blank line indentation, then punctuation after inline math
    post // full stops
};

[[nodiscard]] std::optional<mode> parse_mode(
    const std::string_view sv) noexcept;

enum class file_outcome
{
    unchanged,
    modified,
    failed
};

// One file name per line. Blank lines and `#` comments are ignored, a missing
// file yields an empty list.
[[nodiscard]] std::vector<std::string> load_ignore_list(
    const std::filesystem::path& path);

// Explicit `files` take precedence over `directory`, which is walked
// recursively. Only existing regular `.md` files whose name is not ignored
// are kept. The result is sorted.
[[nodiscard]] std::vector<std::filesystem::path> discover_markdown_files(
    const std::vector<std::filesystem::path>& files,
    const std::optional<std::filesystem::path>& directory,
    const std::vector<std::string>& ignore_list);

[[nodiscard]] bool read_file_in_buffer(
    const std::filesystem::path& path, std::string& buffer);

class pipeline
{
public:
    struct config
    {
        mode run_mode = mode::pre;
        indentation_normalizer::config indentation{};
        punctuation_normalizer::config math_punctuation =
            punctuation_normalizer::math_punctuation_preset();
        punctuation_normalizer::config full_stop =
            punctuation_normalizer::full_stop_preset();
    };

    struct log_config
    {
        diagnostic_format format = diagnostic_format::plain;
        severity threshold = severity::warning;
    };

private:
    const config _cfg;

public:
    [[nodiscard]] explicit pipeline(const config& cfg);

    [[nodiscard]] const config& get_config() const noexcept;

    // Every transform of the mode runs with its own skip region extraction.
    [[nodiscard]] std::optional<error> transform_document(
        diagnostic_sink& sink, std::string& output_buffer,
        const std::string_view source) const;

    // Writes the file back only if the transformed content differs.
    [[nodiscard]] file_outcome process_file(
        diagnostic_sink& sink, const std::filesystem::path& path) const;

    // Returns the number of failed files. Diagnostics of one file are written
    // to `log_stream` in one piece, whatever the number of `jobs`.
    [[nodiscard]] std::size_t process_files(std::ostream& log_stream,
        const log_config& log_cfg,
        const std::vector<std::filesystem::path>& paths,
        const std::size_t jobs) const;
};

} // namespace mdpatch
