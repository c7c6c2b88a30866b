#include "path_sanitizer.hpp"
#include "system.hpp"

#include <cctype>
#include <cstring>
#include <utility>

namespace pathwright {
namespace {

constexpr char replacement_char = '_';

// These may not appear anywhere in a Windows file name. Separators are included
// because a segment handed to `sanitize_segment` directly hasn't been split.
constexpr char windows_reserved_chars[] = "\\/:*?\"<>|";

bool is_control_char(const char c) noexcept
{
    return static_cast<unsigned char>(c) < 0x20;
}

void replace_posix_illegal_chars(std::string& segment)
{
    for(char& c : segment) {
        if(c == '/' || c == '\0') {
            c = replacement_char;
        }
    }
}

void replace_windows_illegal_chars(std::string& segment)
{
    std::string legal;
    legal.reserve(segment.size());
    for(const char c : segment) {
        if(is_control_char(c)) {
            continue;
        }
        // `sizeof - 1` so that the terminating NUL isn't considered reserved
        // (it's a control character anyway).
        if(std::memchr(windows_reserved_chars, c, sizeof(windows_reserved_chars) - 1)) {
            legal += replacement_char;
        } else {
            legal += c;
        }
    }
    // Windows silently drops a trailing dot or space, so "foo." and "foo" would
    // name the same file.
    if(!legal.empty() && (legal.back() == '.' || legal.back() == ' ')) {
        legal.pop_back();
    }
    segment = std::move(legal);
}

} // namespace

std::string sanitize_segment(
        std::string segment, const platform_profile profile, const rule_set& custom_rules)
{
    if(profile == platform_profile::windows) {
        replace_windows_illegal_chars(segment);
    } else {
        replace_posix_illegal_chars(segment);
        // This also takes care of "." and "..".
        if(!segment.empty() && segment.front() == '.') {
            segment.front() = replacement_char;
        }
    }
    return apply_rules(std::move(segment), custom_rules);
}

std::string sanitize_path(
        std::string_view path, const platform_profile profile, const rule_set& custom_rules)
{
    auto segments = split_path(path, profile);
    for(auto i = 0u; i < segments.size(); ++i) {
        if(i == 0 && segments.size() > 1 && is_drive_designator(segments[i], profile)) {
            continue;
        }
        segments[i] = sanitize_segment(std::move(segments[i]), profile, custom_rules);
    }
    return join_path(segments, profile);
}

std::string sanitize_path(std::string_view path, const rule_set& custom_rules)
{
    return sanitize_path(path, system::current_platform_profile(), custom_rules);
}

std::string create_and_sanitize_path(const std::vector<std::string>& path_elements,
        const platform_profile profile, const rule_set& custom_rules)
{
    std::vector<std::string> segments;
    segments.reserve(path_elements.size());
    for(const auto& element : path_elements) {
        segments.emplace_back(sanitize_segment(element, profile, custom_rules));
    }
    return join_path(segments, profile);
}

std::vector<std::string> split_path(std::string_view path, const platform_profile profile)
{
    std::vector<std::string> segments;
    std::string_view::size_type begin = 0;
    for(auto i = 0u; i < path.size(); ++i) {
        if(is_separator(path[i], profile)) {
            segments.emplace_back(path.substr(begin, i - begin));
            begin = i + 1;
        }
    }
    segments.emplace_back(path.substr(begin));
    return segments;
}

std::string join_path(
        const std::vector<std::string>& segments, const platform_profile profile)
{
    std::string path;
    for(auto i = 0u; i < segments.size(); ++i) {
        if(i > 0) {
            path += separator(profile);
        }
        path += segments[i];
    }
    return path;
}

bool is_drive_designator(std::string_view segment, const platform_profile profile) noexcept
{
    return profile == platform_profile::windows && segment.size() == 2
            && std::isalpha(static_cast<unsigned char>(segment[0])) && segment[1] == ':';
}

} // namespace pathwright
