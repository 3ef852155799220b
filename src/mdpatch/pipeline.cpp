#include "pipeline.hpp"

#include "diagnostics.hpp"
#include "error.hpp"
#include "indentation.hpp"
#include "punctuation.hpp"
#include "text.hpp"

#include <algorithm>
#include <atomic>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <mutex>
#include <optional>
#include <ostream>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>
#include <thread>
#include <vector>

#include <cstddef>

namespace mdpatch {

namespace fs = std::filesystem;

std::optional<mode> parse_mode(const std::string_view sv) noexcept
{
    if (sv == "pre")
    {
        return mode::pre;
    }

    if (sv == "post")
    {
        return mode::post;
    }

    return std::nullopt;
}

std::vector<std::string> load_ignore_list(const fs::path& path)
{
    std::vector<std::string> result;

    std::ifstream ifs(path);
    if (!ifs)
    {
        return result;
    }

    std::string line;
    while (std::getline(ifs, line))
    {
        const std::string_view entry = trim(line);
        if (entry.empty() || entry.front() == '#')
        {
            continue;
        }

        result.emplace_back(entry);
    }

    return result;
}

std::vector<fs::path> discover_markdown_files(
    const std::vector<fs::path>& files,
    const std::optional<fs::path>& directory,
    const std::vector<std::string>& ignore_list)
{
    const auto is_markdown = [](const fs::path& p)
    { return p.extension() == ".md"; };

    std::vector<fs::path> candidates;

    if (!files.empty())
    {
        std::copy_if(files.begin(), files.end(),
            std::back_inserter(candidates), is_markdown);
    }
    else if (directory.has_value())
    {
        std::error_code ec;
        for (fs::recursive_directory_iterator it{*directory, ec}, end;
             !ec && it != end; it.increment(ec))
        {
            if (is_markdown(it->path()))
            {
                candidates.emplace_back(it->path());
            }
        }
    }

    std::vector<fs::path> result;

    for (const fs::path& p : candidates)
    {
        std::error_code ec;
        if (!fs::is_regular_file(p, ec))
        {
            continue;
        }

        const std::string file_name = p.filename().string();
        if (std::find(ignore_list.begin(), ignore_list.end(), file_name) !=
            ignore_list.end())
        {
            continue;
        }

        result.emplace_back(p);
    }

    std::sort(result.begin(), result.end());
    return result;
}

bool read_file_in_buffer(const fs::path& path, std::string& buffer)
{
    std::ifstream ifs(path, std::ios::binary | std::ios::ate);
    if (!ifs)
    {
        return false;
    }

    const auto size = static_cast<std::streamsize>(ifs.tellg());
    ifs.seekg(0, std::ios::beg);

    buffer.clear();
    buffer.resize(static_cast<std::size_t>(size));

    return static_cast<bool>(ifs.read(buffer.data(), size));
}

[[nodiscard]] static bool write_buffer_to_file(
    const fs::path& path, const std::string_view buffer)
{
    std::ofstream ofs(path, std::ios::binary | std::ios::trunc);
    if (!ofs)
    {
        return false;
    }

    ofs.write(buffer.data(), static_cast<std::streamsize>(buffer.size()));
    ofs.flush();

    return static_cast<bool>(ofs);
}

pipeline::pipeline(const config& cfg) : _cfg{cfg}
{}

const pipeline::config& pipeline::get_config() const noexcept
{
    return _cfg;
}

std::optional<error> pipeline::transform_document(diagnostic_sink& sink,
    std::string& output_buffer, const std::string_view source) const
{
    if (_cfg.run_mode == mode::post)
    {
        punctuation_normalizer normalizer{sink};
        return normalizer.normalize(_cfg.full_stop, output_buffer, source);
    }

    std::string indented;
    indented.reserve(source.size());

    indentation_normalizer indenter{sink};
    if (const std::optional<error> e =
            indenter.normalize(_cfg.indentation, indented, source);
        e.has_value())
    {
        return e;
    }

    punctuation_normalizer normalizer{sink};
    return normalizer.normalize(_cfg.math_punctuation, output_buffer, indented);
}

file_outcome pipeline::process_file(
    diagnostic_sink& sink, const fs::path& path) const
{
    std::string old_content;
    if (!read_file_in_buffer(path, old_content))
    {
        sink.log(severity::error, std::nullopt, "failed to read file '",
            path.string(), "'");

        return file_outcome::failed;
    }

    sink.log(severity::debug, std::nullopt, "read ", old_content.size(),
        " characters from '", path.string(), "'");

    std::string new_content;
    new_content.reserve(old_content.size() + 1024);

    if (const std::optional<error> e =
            transform_document(sink, new_content, old_content);
        e.has_value())
    {
        sink.log(severity::error, e->_line, "error processing '",
            path.string(), "': ", to_string(e->_kind));

        return file_outcome::failed;
    }

    if (new_content == old_content)
    {
        sink.log(severity::debug, std::nullopt,
            "no changes detected, file not modified");

        return file_outcome::unchanged;
    }

    if (!write_buffer_to_file(path, new_content))
    {
        sink.log(severity::error, std::nullopt, "failed to write file '",
            path.string(), "'");

        return file_outcome::failed;
    }

    sink.log(severity::debug, std::nullopt, "file modified: wrote ",
        new_content.size(), " characters to '", path.string(), "'");

    return file_outcome::modified;
}

std::size_t pipeline::process_files(std::ostream& log_stream,
    const log_config& log_cfg, const std::vector<fs::path>& paths,
    const std::size_t jobs) const
{
    std::atomic<std::size_t> next_idx{0};
    std::atomic<std::size_t> n_failures{0};
    std::mutex log_mutex;

    const auto worker = [&]
    {
        std::ostringstream buffered_log;

        for (std::size_t i = next_idx++; i < paths.size(); i = next_idx++)
        {
            buffered_log.str("");

            diagnostic_sink sink{
                buffered_log, log_cfg.format, log_cfg.threshold};

            sink.begin_group(paths[i].string());

            if (process_file(sink, paths[i]) == file_outcome::failed)
            {
                ++n_failures;
            }

            sink.end_group();

            const std::lock_guard<std::mutex> lock{log_mutex};
            log_stream << buffered_log.str() << std::flush;
        }
    };

    const std::size_t n_threads = std::clamp<std::size_t>(
        jobs, 1, std::max<std::size_t>(paths.size(), 1));

    if (n_threads == 1)
    {
        worker();
        return n_failures;
    }

    std::vector<std::thread> threads;
    threads.reserve(n_threads);

    for (std::size_t t = 0; t < n_threads; ++t)
    {
        threads.emplace_back(worker);
    }

    for (std::thread& t : threads)
    {
        t.join();
    }

    return n_failures;
}

} // namespace mdpatch
