#include <mdpatch/classifier.hpp>
#include <mdpatch/diagnostics.hpp>
#include <mdpatch/error.hpp>
#include <mdpatch/pipeline.hpp>
#include <mdpatch/skip_region.hpp>

#include <charconv>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include <cstddef>
#include <cstdlib>

namespace {

constexpr int exit_usage_error = 1;
constexpr int exit_processing_error = 2;

void print_usage(std::ostream& os)
{
    os << "mdpatch - normalize Markdown documents before linting\n\n"
       << "Usage: mdpatch -m <pre|post> [options] [DIRECTORY | -]\n"
       << "  -m, --mode MODE        pre: blank line indentation and\n"
       << "                         punctuation after inline math;\n"
       << "                         post: full stops\n"
       << "  -f, --files FILE...    Process these Markdown files\n"
       << "  -j, --jobs N           Process N files in parallel\n"
       << "  -v, --verbose          Print debug diagnostics\n"
       << "  --ignore-file PATH     File names to skip\n"
       << "                         (default .remarkignore)\n"
       << "  --exclude-lang LANG    Code fence language left untouched\n"
       << "                         (repeatable, default: tex text plain)\n"
       << "  --tab-width N          Spaces per tab (default 2)\n"
       << "  -h, --help             Show this help\n\n"
       << "With '-' the document is read from stdin and written to stdout.\n"
       << "Set RUNNER_DEBUG to emit GitHub Actions workflow commands."
       << std::endl;
}

[[nodiscard]] std::optional<std::size_t> parse_size(const std::string_view sv)
{
    std::size_t result = 0;
    const auto [ptr, ec] =
        std::from_chars(sv.data(), sv.data() + sv.size(), result);

    if (ec != std::errc{} || ptr != sv.data() + sv.size())
    {
        return std::nullopt;
    }

    return result;
}

[[nodiscard]] std::string read_stdin()
{
    std::string input_buffer;
    input_buffer.reserve(128000);

    std::string line_buffer;
    line_buffer.reserve(512);

    while (std::getline(std::cin, line_buffer))
    {
        input_buffer.append(line_buffer);
        input_buffer.append(1, '\n');
    }

    return input_buffer;
}

} // namespace

int main(int argc, char** argv)
{
    std::ios_base::sync_with_stdio(false);
    std::cin.tie(nullptr);

    std::optional<mdpatch::mode> run_mode;
    std::vector<std::filesystem::path> files;
    std::optional<std::filesystem::path> directory;
    std::filesystem::path ignore_file{".remarkignore"};
    std::optional<mdpatch::language_set> excluded_languages;
    std::optional<std::size_t> tab_width;
    std::size_t jobs = 1;
    bool verbose = false;
    bool use_stdin = false;

    const auto require_value = [&](int& i, const std::string_view opt)
        -> std::optional<std::string_view>
    {
        if (i + 1 >= argc)
        {
            std::cerr << "mdpatch: " << opt << " requires a value" << std::endl;
            return std::nullopt;
        }

        return std::string_view{argv[++i]};
    };

    for (int i = 1; i < argc; ++i)
    {
        const std::string_view arg = argv[i];

        if (arg == "-h" || arg == "--help")
        {
            print_usage(std::cout);
            return 0;
        }

        if (arg == "-m" || arg == "--mode")
        {
            const std::optional<std::string_view> value = require_value(i, arg);
            if (!value.has_value())
            {
                return exit_usage_error;
            }

            run_mode = mdpatch::parse_mode(*value);
            if (!run_mode.has_value())
            {
                std::cerr << "mdpatch: invalid mode '" << *value << "'"
                          << std::endl;

                return exit_usage_error;
            }
        }
        else if (arg == "-f" || arg == "--files")
        {
            while (i + 1 < argc && argv[i + 1][0] != '-')
            {
                files.emplace_back(argv[++i]);
            }
        }
        else if (arg == "-j" || arg == "--jobs" || arg == "--tab-width")
        {
            const std::optional<std::string_view> value = require_value(i, arg);
            if (!value.has_value())
            {
                return exit_usage_error;
            }

            const std::optional<std::size_t> parsed = parse_size(*value);
            if (!parsed.has_value() || (*parsed == 0 && arg != "--tab-width"))
            {
                std::cerr << "mdpatch: invalid value '" << *value << "' for "
                          << arg << std::endl;

                return exit_usage_error;
            }

            if (arg == "--tab-width")
            {
                tab_width = *parsed;
            }
            else
            {
                jobs = *parsed;
            }
        }
        else if (arg == "--ignore-file")
        {
            const std::optional<std::string_view> value = require_value(i, arg);
            if (!value.has_value())
            {
                return exit_usage_error;
            }

            ignore_file = *value;
        }
        else if (arg == "--exclude-lang")
        {
            const std::optional<std::string_view> value = require_value(i, arg);
            if (!value.has_value())
            {
                return exit_usage_error;
            }

            if (!excluded_languages.has_value())
            {
                excluded_languages.emplace();
            }

            excluded_languages->emplace(*value);
        }
        else if (arg == "-v" || arg == "--verbose")
        {
            verbose = true;
        }
        else if (arg == "-")
        {
            use_stdin = true;
        }
        else if (arg.size() > 1 && arg[0] == '-')
        {
            std::cerr << "mdpatch: unknown option '" << arg << "'" << std::endl;
            return exit_usage_error;
        }
        else
        {
            directory = std::filesystem::path{arg};
        }
    }

    if (!run_mode.has_value())
    {
        std::cerr << "mdpatch: missing required option '--mode'\n\n";
        print_usage(std::cerr);
        return exit_usage_error;
    }

    if (!use_stdin && files.empty() && !directory.has_value())
    {
        print_usage(std::cout);
        return 0;
    }

    mdpatch::pipeline::config cfg{.run_mode = *run_mode};

    if (tab_width.has_value())
    {
        cfg.indentation.skip.tab_width = *tab_width;
        cfg.math_punctuation.skip.tab_width = *tab_width;
        cfg.full_stop.skip.tab_width = *tab_width;
    }

    if (excluded_languages.has_value())
    {
        cfg.math_punctuation.excluded_languages = *excluded_languages;
    }

    mdpatch::pipeline::log_config log_cfg{
        .format = mdpatch::diagnostic_format::plain,
        .threshold = verbose ? mdpatch::severity::debug
                             : mdpatch::severity::warning //
    };

    if (std::getenv("RUNNER_DEBUG") != nullptr)
    {
        log_cfg.format = mdpatch::diagnostic_format::github_actions;
        log_cfg.threshold = mdpatch::severity::debug;
    }

    // Workflow commands are read from stdout by the CI runner.
    std::ostream& log_stream =
        log_cfg.format == mdpatch::diagnostic_format::github_actions
            ? std::cout
            : std::cerr;

    const mdpatch::pipeline pl{cfg};

    if (use_stdin)
    {
        const std::string input_buffer = read_stdin();

        std::string output_buffer;
        output_buffer.reserve(input_buffer.size() + 1024);

        mdpatch::diagnostic_sink sink{std::cerr, log_cfg.format,
            log_cfg.threshold};

        if (const std::optional<mdpatch::error> e =
                pl.transform_document(sink, output_buffer, input_buffer);
            e.has_value())
        {
            std::cerr << "((MDPATCH ERROR))(" << e->_line
                      << "): Fatal error while normalizing stdin ("
                      << mdpatch::to_string(e->_kind) << ")\n"
                      << std::endl;

            return exit_processing_error;
        }

        std::cout << output_buffer << std::flush;
        return 0;
    }

    const std::vector<std::filesystem::path> paths =
        mdpatch::discover_markdown_files(
            files, directory, mdpatch::load_ignore_list(ignore_file));

    std::cout << paths.size() << " file(s) found" << std::endl;

    const std::size_t n_failures =
        pl.process_files(log_stream, log_cfg, paths, jobs);

    if (n_failures > 0)
    {
        std::cerr << "((MDPATCH ERROR)): " << n_failures
                  << " file(s) could not be processed\n"
                  << std::endl;

        return exit_processing_error;
    }

    return 0;
}
