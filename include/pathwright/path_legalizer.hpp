#ifndef PATHWRIGHT_PATH_LEGALIZER_HEADER
#define PATHWRIGHT_PATH_LEGALIZER_HEADER

#include "platform.hpp"
#include "replacement_rule.hpp"
#include "settings.hpp"

#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace pathwright {

struct legalize_result
{
    std::string path;
    // Set if no candidate rule set made the path fit and the default rule and byte
    // truncation had to be used instead. Substituting text until the path fits
    // does not count as truncation.
    bool truncated = false;
};

/**
 * Returns the maximum number of bytes a path segment may have. It is queried once
 * per `legalize_path`/`truncate_path` call.
 */
using length_oracle = std::function<int()>;

/** A file name split at its extension. `stem + suffix` is always the input. */
struct name_parts
{
    std::string_view stem;
    // Includes the dot, e.g. ".flac", or empty if the name has no extension.
    std::string_view suffix;
};

/**
 * The extension is the text from the last dot, provided that dot is neither the
 * first nor the last byte of `name`. Thus ".hidden" and "trailing." have none and
 * "f.a.e" has ".e".
 */
name_parts split_extension(std::string_view name) noexcept;

/**
 * Shortens `segment` to at most `max_bytes` bytes of UTF-8. Multi-byte characters
 * are never split: one that would straddle the limit is dropped whole.
 *
 * If `has_extension` is set, the extension of `segment` (see `split_extension`) is
 * preserved and bytes are removed from the end of the stem instead, unless the
 * extension leaves no room for at least one character of the stem, in which case
 * the segment is truncated as a whole. A negative `max_bytes` is taken as zero. A
 * segment within the limit is returned unchanged.
 */
std::string truncate_to_limit(std::string_view segment, int max_bytes,
        bool has_extension = false);

/**
 * Applies `truncate_to_limit` to every segment of `path`. Only the final segment
 * is considered to have an extension.
 */
std::string truncate_path(
        std::string_view path, int max_bytes, platform_profile profile);

/**
 * Same as above, with the profile of the running platform and the limit of the
 * filesystem of the current working directory.
 */
std::string truncate_path(std::string_view path);

/**
 * Produces a path that is legal under `profile` and whose segments are all within
 * the limit returned by `max_filename_length`.
 *
 * `path` is sanitized with the built-in rules of `profile`, then the candidate rule
 * sets are tried in order, each against the sanitized path (not against the
 * output of the previous candidate). The first candidate whose result fits is
 * returned. With no candidates the sanitized path itself is the only candidate.
 *
 * At most two candidates are tried. If they don't fit, `default_rule` is applied to
 * the sanitized path, the result is truncated and `truncated` is set in the result.
 * Under the Windows profile, dots and spaces that truncation leaves at the end of a
 * segment are stripped. A negative limit is taken as zero.
 * `default_rule` must be chosen so that truncation alone can make its output fit.
 */
legalize_result legalize_path(std::string_view path,
        const std::vector<rule_set>& candidates, const replacement_rule& default_rule,
        platform_profile profile, const length_oracle& max_filename_length);

/** Same as above, for the running platform and the current working directory. */
legalize_result legalize_path(std::string_view path,
        const std::vector<rule_set>& candidates,
        const replacement_rule& default_rule = {});

/**
 * Binds the legalization primitives to a `legalizer_settings` instance. The length
 * limit is resolved anew on every call.
 */
class path_legalizer
{
    legalizer_settings settings_;

public:
    explicit path_legalizer(legalizer_settings settings);

    legalize_result legalize(std::string_view path) const;
    std::string sanitize(std::string_view path) const;
    std::string truncate(std::string_view path) const;

    /**
     * Returns the configured limit, or asks the filesystem of `library_root` if none
     * is configured. The result is not cached.
     */
    int max_filename_length() const;

    platform_profile profile() const noexcept { return settings_.profile; }
    const legalizer_settings& settings() const noexcept { return settings_; }
};

} // namespace pathwright

#endif // PATHWRIGHT_PATH_LEGALIZER_HEADER
