#ifndef PATHWRIGHT_PATH_SANITIZER_HEADER
#define PATHWRIGHT_PATH_SANITIZER_HEADER

#include "platform.hpp"
#include "replacement_rule.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace pathwright {

/**
 * This is used primarily to sanitize paths assembled from untrusted metadata (tags
 * of audio files, results of online lookups), as such values may contain characters
 * that are illegal on the host's filesystem or that change the meaning of the path
 * (separators, leading dots). All such paths must first be sanitized before using
 * them.
 *
 * The built-in rules of `profile` are applied first, then `custom_rules` are
 * applied to their output in order, so that custom rules may both revert a
 * built-in rewrite and add rewrites of their own.
 */
std::string sanitize_segment(std::string segment, platform_profile profile,
        const rule_set& custom_rules = {});

/**
 * Splits `path` into segments, sanitizes each with `sanitize_segment` and joins
 * them with the separator of `profile`. The number of segments is preserved.
 *
 * A leading Windows drive designator (e.g. "C:") is left untouched.
 */
std::string sanitize_path(std::string_view path, platform_profile profile,
        const rule_set& custom_rules = {});

/** Same as above, for the profile of the running platform. */
std::string sanitize_path(std::string_view path, const rule_set& custom_rules = {});

/**
 * Sanitizes each of `path_elements` (e.g. album artist, album, title) as a single
 * segment, so that separators within an element can't introduce new directories,
 * and joins the results.
 */
std::string create_and_sanitize_path(const std::vector<std::string>& path_elements,
        platform_profile profile, const rule_set& custom_rules = {});

/**
 * Splits `path` at every separator of `profile`. Empty segments (including those
 * before a leading and after a trailing separator) are kept, so joining the result
 * yields `path` with its separators normalized.
 */
std::vector<std::string> split_path(std::string_view path, platform_profile profile);
std::string join_path(const std::vector<std::string>& segments, platform_profile profile);

/** Returns true if `segment` is a drive designator such as "C:" under `profile`. */
bool is_drive_designator(std::string_view segment, platform_profile profile) noexcept;

} // namespace pathwright

#endif // PATHWRIGHT_PATH_SANITIZER_HEADER
