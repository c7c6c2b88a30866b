#ifndef PATHWRIGHT_PLATFORM_HEADER
#define PATHWRIGHT_PLATFORM_HEADER

namespace pathwright {

/**
 * Determines which characters are illegal in a path segment and how segment
 * boundaries are treated. The profile is an explicit argument of every path
 * primitive so that paths for another platform's filesystem (e.g. a FAT formatted
 * portable player mounted on a POSIX host) may be produced as well.
 */
enum class platform_profile
{
    // Only the separator and NUL are illegal. Leading dots are rewritten so that
    // no segment becomes a hidden file (or "." or "..").
    posix,
    // `:*?"<>|` and control characters are illegal, and segments may not end in
    // a dot or a space. Both '/' and '\' separate segments.
    windows
};

/** Returns the segment separator used when joining segments for `profile`. */
constexpr char separator(const platform_profile profile) noexcept
{
    return profile == platform_profile::windows ? '\\' : '/';
}

/** Returns true if `c` separates segments under `profile`. */
constexpr bool is_separator(const char c, const platform_profile profile) noexcept
{
    return c == '/' || (profile == platform_profile::windows && c == '\\');
}

} // namespace pathwright

#endif // PATHWRIGHT_PLATFORM_HEADER
