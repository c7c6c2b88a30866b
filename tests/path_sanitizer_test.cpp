#include <pathwright/path_sanitizer.hpp>

#include <gtest/gtest.h>

#include <string>

using namespace pathwright;

namespace {

constexpr auto posix = platform_profile::posix;
constexpr auto windows = platform_profile::windows;

} // namespace

TEST(path_sanitizer, posix_replaces_leading_dot)
{
    const auto p = sanitize_path("one/.two/three", posix);
    EXPECT_EQ(p, "one/_two/three");
    EXPECT_EQ(p.find('.'), std::string::npos);
}

TEST(path_sanitizer, posix_defuses_relative_segments)
{
    EXPECT_EQ(sanitize_path("../etc/./passwd", posix), "_./etc/_/passwd");
}

TEST(path_sanitizer, posix_replaces_nul)
{
    const std::string with_nul("a\0b", 3);
    EXPECT_EQ(sanitize_segment(with_nul, posix), "a_b");
}

TEST(path_sanitizer, posix_keeps_windows_reserved_chars)
{
    EXPECT_EQ(sanitize_path("a:b/c?d", posix), "a:b/c?d");
}

TEST(path_sanitizer, segment_separator_is_replaced)
{
    EXPECT_EQ(sanitize_segment("AC/DC", posix), "AC_DC");
    EXPECT_EQ(sanitize_segment("AC/DC", windows), "AC_DC");
    EXPECT_EQ(sanitize_segment("AC\\DC", windows), "AC_DC");
}

TEST(path_sanitizer, windows_replaces_trailing_dot)
{
    const auto p = sanitize_path("one/two./three", windows);
    EXPECT_EQ(p.find('.'), std::string::npos);
    EXPECT_EQ(p, "one\\two\\three");
}

TEST(path_sanitizer, windows_strips_a_single_trailing_char)
{
    EXPECT_EQ(sanitize_segment("foo..", windows), "foo.");
    EXPECT_EQ(sanitize_segment("foo. ", windows), "foo.");
    EXPECT_EQ(sanitize_segment("foo", windows), "foo");
}

TEST(path_sanitizer, windows_replaces_illegal_chars)
{
    const auto p = sanitize_path(":*?\"<>|", windows);
    for(const char c : std::string(":*?\"<>|")) {
        EXPECT_EQ(p.find(c), std::string::npos) << c;
    }
    EXPECT_EQ(p, "_______");
}

TEST(path_sanitizer, windows_removes_control_chars)
{
    EXPECT_EQ(sanitize_segment("a\tb\x01" "c", windows), "abc");
}

TEST(path_sanitizer, windows_replaces_trailing_space)
{
    const auto p = sanitize_path("one/two /three", windows);
    EXPECT_EQ(p.find(' '), std::string::npos);
}

TEST(path_sanitizer, windows_keeps_leading_dot)
{
    EXPECT_EQ(sanitize_segment(".hidden", windows), ".hidden");
}

TEST(path_sanitizer, windows_keeps_drive_designator)
{
    EXPECT_EQ(sanitize_path("C:\\Music\\a:b", windows), "C:\\Music\\a_b");
    // a lone "C:" is a name, not a drive
    EXPECT_EQ(sanitize_path("C:", windows), "C_");
}

TEST(path_sanitizer, works_on_empty_string)
{
    EXPECT_EQ(sanitize_path("", posix), "");
    EXPECT_EQ(sanitize_path("", windows), "");
    EXPECT_EQ(sanitize_segment("", posix), "");
}

TEST(path_sanitizer, segment_count_is_preserved)
{
    EXPECT_EQ(sanitize_path("/a//b/", posix), "/a//b/");
    EXPECT_EQ(split_path("/a//b/", posix).size(), 5u);
}

TEST(path_sanitizer, custom_replace_runs_after_built_in_sub)
{
    // The built-in rule rewrites the leading dot, a custom rule may undo it.
    EXPECT_EQ(sanitize_path("a/.?/b", posix, {{"^_", "."}}), "a/.?/b");
    // A rule that matches nothing leaves the built-in rewrite in place.
    EXPECT_EQ(sanitize_path("a/.?/b", posix, {{"foo", "bar"}}), "a/_?/b");
}

TEST(path_sanitizer, custom_replace_adds_replacements)
{
    EXPECT_EQ(sanitize_path("foo/bar", posix, {{"foo", "bar"}}), "bar/bar");
}

TEST(path_sanitizer, custom_rules_apply_in_order)
{
    const rule_set rules{{"a", "b"}, {"b", "c"}};
    EXPECT_EQ(sanitize_path("a/b", posix, rules), "c/c");
}

TEST(path_sanitizer, create_and_sanitize_path_keeps_elements_separate)
{
    const std::vector<std::string> elements{"AC/DC", "Back in Black", ".01 Hells Bells"};
    EXPECT_EQ(create_and_sanitize_path(elements, posix),
            "AC_DC/Back in Black/_01 Hells Bells");
    EXPECT_EQ(create_and_sanitize_path(elements, windows),
            "AC_DC\\Back in Black\\.01 Hells Bells");
}

TEST(path_sanitizer, split_and_join)
{
    const auto segments = split_path("a\\b/c", windows);
    ASSERT_EQ(segments.size(), 3u);
    EXPECT_EQ(segments[0], "a");
    EXPECT_EQ(segments[1], "b");
    EXPECT_EQ(segments[2], "c");
    EXPECT_EQ(join_path(segments, windows), "a\\b\\c");
    EXPECT_EQ(join_path(segments, posix), "a/b/c");

    // a backslash is an ordinary character on POSIX
    EXPECT_EQ(split_path("a\\b", posix).size(), 1u);
}
