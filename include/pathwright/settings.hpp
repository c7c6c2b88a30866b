#ifndef PATHWRIGHT_SETTINGS_HEADER
#define PATHWRIGHT_SETTINGS_HEADER

#include "consensus.hpp"
#include "path.hpp"
#include "platform.hpp"
#include "replacement_rule.hpp"
#include "system.hpp"

#include <vector>

namespace pathwright {
namespace values {

constexpr int none = -2;

} // values

struct legalizer_settings
{
    // The rules of the filesystem to which paths are written. Set this to
    // `platform_profile::windows` when writing to a FAT or NTFS volume from a
    // POSIX host.
    platform_profile profile = system::current_platform_profile();

    // The maximum number of bytes in a single path segment. If it's
    // `values::none`, the filesystem of `library_root` is asked on every
    // legalization, falling back to 255 bytes if that fails.
    int max_filename_length = values::none;

    // The directory under which legalized paths are created. It's only used to
    // determine `max_filename_length`. If empty, the current working directory is
    // used.
    path library_root;

    // The candidate rule sets, tried in order, each against the sanitized path.
    // Only the first two are ever tried, see `legalize_path`.
    std::vector<rule_set> replacements;

    // Applied when no candidate produces a path within the length limit, before
    // the path is truncated. Must not produce output that truncation can't fix.
    // The identity rule by default.
    replacement_rule default_rule;
};

struct consensus_settings
{
    // The fields of interest and their kinds.
    field_table fields = album_fields();

    // A preferred field with at least one observation overrides its fallback.
    field_overrides overrides = album_field_overrides();
};

} // namespace pathwright

#endif // PATHWRIGHT_SETTINGS_HEADER
