#include "path_legalizer.hpp"
#include "path_sanitizer.hpp"
#include "string_utils.hpp"
#include "system.hpp"
#include "log.hpp"

#include <algorithm>
#include <utility>

namespace pathwright {
namespace {

// If the first two candidates don't fit, a third is not attempted. This keeps the
// work done per path linear in the number of segments, whatever the caller passes.
constexpr int max_candidate_rounds = 2;

enum class legalize_state
{
    try_candidate,
    truncate,
    done
};

bool fits(const std::vector<std::string>& segments, const int max_bytes) noexcept
{
    return std::all_of(segments.begin(), segments.end(), [max_bytes](const auto& s) {
        return s.size() <= static_cast<size_t>(max_bytes);
    });
}

/** Applies `rules` to every segment but a leading drive designator. */
std::vector<std::string> apply_to_segments(std::vector<std::string> segments,
        const rule_set& rules, const platform_profile profile)
{
    for(auto i = 0u; i < segments.size(); ++i) {
        if(i == 0 && segments.size() > 1 && is_drive_designator(segments[i], profile)) {
            continue;
        }
        segments[i] = apply_rules(std::move(segments[i]), rules);
    }
    return segments;
}

void truncate_segments(std::vector<std::string>& segments, const int max_bytes)
{
    for(auto i = 0u; i < segments.size(); ++i) {
        const bool is_file_name = i == segments.size() - 1;
        segments[i] = truncate_to_limit(segments[i], max_bytes, is_file_name);
    }
}

/** Truncation may leave a trailing dot or space, neither of which Windows allows. */
void strip_trailing_dots_and_spaces(
        std::vector<std::string>& segments, const platform_profile profile)
{
    if(profile != platform_profile::windows) {
        return;
    }
    for(auto i = 0u; i < segments.size(); ++i) {
        if(i == 0 && segments.size() > 1 && is_drive_designator(segments[i], profile)) {
            continue;
        }
        auto& s = segments[i];
        while(!s.empty() && (s.back() == '.' || s.back() == ' ')) {
            s.pop_back();
        }
    }
}

} // namespace

name_parts split_extension(std::string_view name) noexcept
{
    const auto dot = name.rfind('.');
    if(dot == std::string_view::npos || dot == 0 || dot == name.size() - 1) {
        return {name, {}};
    }
    return {name.substr(0, dot), name.substr(dot)};
}

std::string truncate_to_limit(
        std::string_view segment, int max_bytes, const bool has_extension)
{
    max_bytes = std::max(max_bytes, 0);
    const auto limit = static_cast<size_t>(max_bytes);
    if(segment.size() <= limit) {
        return std::string(segment);
    }

    if(has_extension) {
        const auto parts = split_extension(segment);
        // The stem must keep at least one character, otherwise the result would be
        // all extension (and on POSIX a hidden file).
        if(parts.suffix.size() < limit) {
            std::string truncated(
                    util::utf8_truncate(parts.stem, limit - parts.suffix.size()));
            if(!truncated.empty()) {
                truncated += parts.suffix;
                return truncated;
            }
        }
    }
    return std::string(util::utf8_truncate(segment, limit));
}

std::string truncate_path(
        std::string_view path, const int max_bytes, const platform_profile profile)
{
    auto segments = split_path(path, profile);
    truncate_segments(segments, max_bytes);
    return join_path(segments, profile);
}

std::string truncate_path(std::string_view path)
{
    return truncate_path(path, system::max_filename_length(),
            system::current_platform_profile());
}

legalize_result legalize_path(std::string_view path,
        const std::vector<rule_set>& candidates, const replacement_rule& default_rule,
        const platform_profile profile, const length_oracle& max_filename_length)
{
    const int max_bytes = std::max(max_filename_length(), 0);
    const auto sanitized = split_path(sanitize_path(path, profile), profile);
    const int num_rounds = std::min(
            std::max(static_cast<int>(candidates.size()), 1), max_candidate_rounds);

    legalize_result result;
    legalize_state state = legalize_state::try_candidate;
    int round = 0;
    while(state != legalize_state::done) {
        switch(state) {
        case legalize_state::try_candidate: {
            const auto segments = candidates.empty()
                    ? sanitized
                    : apply_to_segments(sanitized, candidates[round], profile);
            if(fits(segments, max_bytes)) {
                result.path = join_path(segments, profile);
                state = legalize_state::done;
            } else if(++round == num_rounds) {
                state = legalize_state::truncate;
            }
            break;
        }
        case legalize_state::truncate: {
            auto segments = apply_to_segments(sanitized, {default_rule}, profile);
            truncate_segments(segments, max_bytes);
            strip_trailing_dots_and_spaces(segments, profile);
            result.path = join_path(segments, profile);
            result.truncated = true;
            state = legalize_state::done;
            break;
        }
        case legalize_state::done:
            break;
        }
    }
    return result;
}

legalize_result legalize_path(std::string_view path,
        const std::vector<rule_set>& candidates, const replacement_rule& default_rule)
{
    return legalize_path(path, candidates, default_rule,
            system::current_platform_profile(),
            [] { return system::max_filename_length(); });
}

// -- path_legalizer --

path_legalizer::path_legalizer(legalizer_settings settings)
    : settings_(std::move(settings))
{}

legalize_result path_legalizer::legalize(std::string_view path) const
{
    auto result = legalize_path(path, settings_.replacements, settings_.default_rule,
            settings_.profile, [this] { return max_filename_length(); });
#ifdef PATHWRIGHT_ENABLE_DEBUGGING
    if(result.truncated) {
        log::log_legalizer("{LEGALIZER}",
                util::format("no candidate fit, truncated \"%s\" to \"%s\"",
                        std::string(path).c_str(), result.path.c_str()));
    } else {
        log::log_legalizer("{LEGALIZER}",
                util::format("legalized \"%s\" to \"%s\"", std::string(path).c_str(),
                        result.path.c_str()),
                log::priority::low);
    }
#endif // PATHWRIGHT_ENABLE_DEBUGGING
    return result;
}

std::string path_legalizer::sanitize(std::string_view path) const
{
    return sanitize_path(path, settings_.profile);
}

std::string path_legalizer::truncate(std::string_view path) const
{
    return truncate_path(path, max_filename_length(), settings_.profile);
}

int path_legalizer::max_filename_length() const
{
    if(settings_.max_filename_length != values::none) {
        return settings_.max_filename_length;
    }
    const path dir = settings_.library_root.empty() ? path(".") : settings_.library_root;
    std::error_code error;
    const int n = system::max_filename_length(dir, error);
    if(error) {
        log::log_system("{SYSTEM}",
                util::format("could not determine max file name length of %s (%s), "
                             "using %i",
                        dir.string().c_str(), error.message().c_str(), n),
                log::priority::high);
    }
    return n;
}

} // namespace pathwright
