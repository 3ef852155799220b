#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include <mdpatch/diagnostics.hpp>
#include <mdpatch/error.hpp>
#include <mdpatch/skip_region.hpp>
#include <mdpatch/text.hpp>

#include <optional>
#include <random>
#include <string>
#include <string_view>
#include <vector>

#include <cstddef>

using namespace std::string_view_literals;

namespace {

const mdpatch::skip_config test_cfg{.tag = "t"};

[[nodiscard]] std::optional<mdpatch::error> identity(std::string& output_buffer,
    const std::string_view cleaned_source, const mdpatch::line_origin_map&)
{
    output_buffer.append(cleaned_source);
    return std::nullopt;
}

// Turns every `x` into `y`, placeholders excluded.
[[nodiscard]] std::optional<mdpatch::error> replace_x(
    std::string& output_buffer, const std::string_view cleaned_source,
    const mdpatch::line_origin_map& origins)
{
    const std::vector<std::string_view> lines =
        mdpatch::split_lines(cleaned_source);

    REQUIRE(lines.size() == origins.size());

    for (std::size_t i = 0; i < lines.size(); ++i)
    {
        std::string line{lines[i]};

        if (origins[i].has_value())
        {
            for (char& c : line)
            {
                if (c == 'x')
                {
                    c = 'y';
                }
            }
        }

        output_buffer.append(line);
        output_buffer.append(1, '\n');
    }

    return std::nullopt;
}

void do_test(const std::string_view source, const std::string_view expected,
    const mdpatch::transform_fn& transform = identity,
    const mdpatch::skip_config& cfg = test_cfg)
{
    mdpatch::diagnostic_sink sink;

    std::string output_buffer;
    const std::optional<mdpatch::error> e = mdpatch::apply_within_clean_region(
        cfg, sink, output_buffer, source, transform);

    REQUIRE(!e.has_value());
    REQUIRE(!sink.has_errors());
    REQUIRE(output_buffer == expected);
}

void do_test_error(const std::string_view source,
    const mdpatch::error_kind kind, const std::size_t line)
{
    mdpatch::diagnostic_sink sink;

    std::string output_buffer{"untouched"};
    const std::optional<mdpatch::error> e = mdpatch::apply_within_clean_region(
        test_cfg, sink, output_buffer, source, identity);

    REQUIRE(e.has_value());
    REQUIRE(e->_kind == kind);
    REQUIRE(e->_line == line);
    REQUIRE(output_buffer == "untouched");

    REQUIRE(sink.has_errors());
    REQUIRE(sink.records().back()._line == std::optional<std::size_t>{line});
}

} // namespace

TEST_CASE("make_skip_marker")
{
    REQUIRE(mdpatch::make_skip_marker("mdpatch.*", "on") ==
            "<!-- mdpatch.* on -->");

    REQUIRE(mdpatch::make_skip_marker("t", "off") == "<!-- t off -->");
}

TEST_CASE("skip_region empty source")
{
    do_test(""sv, ""sv);
}

TEST_CASE("skip_region no regions")
{
    do_test("test\ncontent"sv, "test\ncontent\n"sv);
    do_test("test\r\ncontent\r\n"sv, "test\ncontent\n"sv);
}

TEST_CASE("skip_region single region without trailing newline")
{
    do_test("before\n<!-- t on -->\nskip this\n<!-- t off -->\nafter"sv,
        "before\n<!-- t on -->\nskip this\n<!-- t off -->\nafter\n"sv);
}

TEST_CASE("skip_region single region")
{
    const std::string_view source = R"(a
<!-- t on -->
should be skipped
<!-- t off -->
b
)"sv;

    do_test(source, source);
}

TEST_CASE("skip_region region is not transformed")
{
    const std::string_view source = R"(x1
<!-- t on -->
x2
<!-- t off -->
x3
)"sv;

    const std::string_view expected = R"(y1
<!-- t on -->
x2
<!-- t off -->
y3
)"sv;

    do_test(source, expected, replace_x);
}

TEST_CASE("skip_region nested regions")
{
    const std::string_view source = R"(x
<!-- t on -->
x
  <!-- t on -->
  x
  <!-- t off -->
x
<!-- t off -->
x
)"sv;

    const std::string_view expected = R"(y
<!-- t on -->
x
  <!-- t on -->
  x
  <!-- t off -->
x
<!-- t off -->
y
)"sv;

    do_test(source, expected, replace_x);
}

TEST_CASE("skip_region wildcard")
{
    const std::string_view source = R"(x
<!-- mdpatch.* on -->
x
<!-- t off -->
x
)"sv;

    const std::string_view expected = R"(y
<!-- mdpatch.* on -->
x
<!-- t off -->
y
)"sv;

    do_test(source, expected, replace_x);
}

TEST_CASE("skip_region markers of other tags are ordinary lines")
{
    const std::string_view source = R"(x
<!-- other on -->
x
<!-- other off -->
)"sv;

    const std::string_view expected = R"(y
<!-- other on -->
y
<!-- other off -->
)"sv;

    do_test(source, expected, replace_x);
}

TEST_CASE("skip_region indented markers")
{
    const std::string_view source =
        "x\n   <!-- t on -->  \nx\n\t<!-- t off -->\nx\n"sv;

    const std::string_view expected =
        "y\n   <!-- t on -->  \nx\n\t<!-- t off -->\ny\n"sv;

    do_test(source, expected, replace_x);
}

TEST_CASE("skip_region tabs expanded outside regions only")
{
    const std::string_view source =
        "line\twith\ttabs\n<!-- t on -->\n\tkept\n<!-- t off -->\n"sv;

    const std::string_view expected =
        "line  with  tabs\n<!-- t on -->\n\tkept\n<!-- t off -->\n"sv;

    do_test(source, expected);

    const mdpatch::skip_config wide_cfg{.tag = "t", .tab_width = 4};
    do_test("\ta\n"sv, "    a\n"sv, identity, wide_cfg);
}

TEST_CASE("skip_region origins and placeholder")
{
    const std::string_view source = R"(a
    <!-- t on -->
b
    <!-- t off -->
c
)"sv;

    std::vector<std::string> seen_lines;
    mdpatch::line_origin_map seen_origins;

    const auto capture = [&](std::string& output_buffer,
                             const std::string_view cleaned_source,
                             const mdpatch::line_origin_map& origins)
        -> std::optional<mdpatch::error>
    {
        for (const std::string_view line : mdpatch::split_lines(cleaned_source))
        {
            seen_lines.emplace_back(line);
        }

        seen_origins = origins;
        output_buffer.append(cleaned_source);
        return std::nullopt;
    };

    do_test(source, source, capture);

    REQUIRE(seen_lines.size() == 3);
    REQUIRE(seen_lines[0] == "a");
    REQUIRE(seen_lines[1].rfind("    <!-- t block ", 0) == 0);
    REQUIRE(seen_lines[2] == "c");

    const mdpatch::line_origin_map expected_origins{0, std::nullopt, 4};
    REQUIRE(seen_origins == expected_origins);
}

TEST_CASE("skip_region regions restored in order")
{
    const std::string_view source = R"(<!-- t on -->
first
<!-- t off -->
middle
<!-- t on -->
second
<!-- t off -->
)"sv;

    do_test(source, source);
}

TEST_CASE("make_placeholder")
{
    std::mt19937 engine{42};
    const std::string first = mdpatch::make_placeholder("t", ""sv, engine);

    REQUIRE(first.rfind("<!-- t block ", 0) == 0);
    REQUIRE(first.size() > "<!-- t block  -->"sv.size());

    std::mt19937 same_engine{42};
    REQUIRE(mdpatch::make_placeholder("t", ""sv, same_engine) == first);

    std::mt19937 fresh_engine{42};
    const std::string source = "text\n" + first + "\n";
    const std::string regenerated =
        mdpatch::make_placeholder("t", source, fresh_engine);

    REQUIRE(regenerated != first);
    REQUIRE(source.find(regenerated) == std::string::npos);
}

TEST_CASE("skip_region placeholder does not collide with source")
{
    const mdpatch::skip_config seeded_cfg{.tag = "t", .placeholder_seed = 42u};

    std::mt19937 engine{42};
    const std::string first_token =
        mdpatch::make_placeholder("t", ""sv, engine);

    // The line the pass would draw first is already part of the document.
    const std::string source = "x\n" + first_token +
                               "\n<!-- t on -->\nx\n<!-- t off -->\n" +
                               first_token + "\n";

    const std::string expected = "y\n" + first_token +
                                 "\n<!-- t on -->\nx\n<!-- t off -->\n" +
                                 first_token + "\n";

    do_test(source, expected, replace_x, seeded_cfg);

    std::vector<std::string> seen_lines;
    const auto capture = [&](std::string& output_buffer,
                             const std::string_view cleaned_source,
                             const mdpatch::line_origin_map&)
        -> std::optional<mdpatch::error>
    {
        for (const std::string_view line : mdpatch::split_lines(cleaned_source))
        {
            seen_lines.emplace_back(line);
        }

        output_buffer.append(cleaned_source);
        return std::nullopt;
    };

    do_test(source, source, capture, seeded_cfg);

    REQUIRE(seen_lines.size() == 4);
    REQUIRE(seen_lines[1] == first_token);
    REQUIRE(seen_lines[2].rfind("<!-- t block ", 0) == 0);
    REQUIRE(seen_lines[2] != first_token);
    REQUIRE(seen_lines[3] == first_token);
}

TEST_CASE("skip_region transform error is propagated")
{
    mdpatch::diagnostic_sink sink;

    const auto failing = [](std::string& output_buffer, const std::string_view,
                             const mdpatch::line_origin_map&)
        -> std::optional<mdpatch::error>
    {
        output_buffer.append("partial");
        return mdpatch::error{
            ._kind = mdpatch::error_kind::malformed_fence_delimiter,
            ._line = 2};
    };

    std::string output_buffer;
    const std::optional<mdpatch::error> e = mdpatch::apply_within_clean_region(
        test_cfg, sink, output_buffer, "a\nb\n"sv, failing);

    REQUIRE(e.has_value());
    REQUIRE(e->_kind == mdpatch::error_kind::malformed_fence_delimiter);
    REQUIRE(output_buffer.empty());
}

TEST_CASE("skip_region unopened region")
{
    do_test_error("a\n<!-- t off -->\nb\n"sv,
        mdpatch::error_kind::unopened_skip_region, 2);

    do_test_error("<!-- t on -->\n<!-- t off -->\n<!-- mdpatch.* off -->\n"sv,
        mdpatch::error_kind::unopened_skip_region, 3);
}

TEST_CASE("skip_region unclosed region")
{
    do_test_error("a\n<!-- t on -->\nb\n"sv,
        mdpatch::error_kind::unclosed_skip_region, 2);

    do_test_error("<!-- t on -->\n<!-- t on -->\n<!-- t off -->\n"sv,
        mdpatch::error_kind::unclosed_skip_region, 1);
}
