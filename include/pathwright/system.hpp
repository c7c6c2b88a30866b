#ifndef PATHWRIGHT_SYSTEM_HEADER
#define PATHWRIGHT_SYSTEM_HEADER

#include "path.hpp"
#include "platform.hpp"

#include <system_error>

namespace pathwright {
namespace system {

/**
 * The limit most filesystems (ext4, btrfs, APFS, NTFS, exFAT) impose on a single
 * path segment. It's used when the filesystem can't tell.
 */
constexpr int default_max_filename_length = 255;

/** Returns `errno` on UNIX and the result of calling `GetLastError` on Windows. */
std::error_code last_error() noexcept;

/**
 * Returns the maximum number of bytes a single segment (file or directory name)
 * may have on the filesystem on which `dir` resides. `dir` must exist. If `error`
 * is set, the returned value is `default_max_filename_length`.
 *
 * The filesystem is probed on every invocation, caching is left to the caller.
 */
int max_filename_length(const path& dir, std::error_code& error);

/**
 * Same as above, but probes the current working directory and silently falls
 * back to `default_max_filename_length` if the probe fails.
 */
int max_filename_length();

/** Returns the profile matching the platform this was compiled for. */
platform_profile current_platform_profile() noexcept;

} // namespace system
} // namespace pathwright

#endif // PATHWRIGHT_SYSTEM_HEADER
