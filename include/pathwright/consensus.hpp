#ifndef PATHWRIGHT_CONSENSUS_HEADER
#define PATHWRIGHT_CONSENSUS_HEADER

#include <cstdint>
#include <map>
#include <string>
#include <variant>
#include <vector>

namespace pathwright {

struct consensus_settings;

/** The value of a single metadata field of an item (e.g. a track's album). */
using field_value = std::variant<std::string, int64_t, double>;

/** The kind of a field determines its zero value when nothing was observed. */
enum class field_kind
{
    string,
    integer,
    real
};

/** Maps the name of each field of interest to its kind. */
using field_table = std::map<std::string, field_kind>;

/** The fields of a single item. Fields an item doesn't carry are simply absent. */
using record = std::map<std::string, field_value>;

/**
 * Maps a preferred field to the fallback field it overrides, e.g. "albumartist" to
 * "artist".
 */
using field_overrides = std::map<std::string, std::string>;

struct consensus_result
{
    // The most common value of each field, or the zero value of the field's kind if
    // no item carried a non-empty value for it.
    std::map<std::string, field_value> likely;
    // Whether every item agreed on the field's most common value.
    std::map<std::string, bool> consensus;
};

/** Returns "", 0 or 0.0, depending on `kind`. */
field_value zero_value(field_kind kind);

/** Only an empty string is empty. Numeric values, zero included, are values. */
bool is_empty(const field_value& value) noexcept;

/**
 * Runs `plurality` on the non-empty values of each field in `fields` across all
 * `records`. A field's consensus is set only if its most common value occurs in
 * every record, which is stronger than merely winning the plurality.
 *
 * After that, for every entry of `overrides` whose preferred field was observed in
 * at least one record, the preferred field's likely value and consensus are copied
 * to the fallback field, whatever the fallback's own values were.
 */
consensus_result most_common_fields(const std::vector<record>& records,
        const field_table& fields, const field_overrides& overrides = {});

/**
 * Same as above, with the fields and overrides of `settings`. Fields without
 * consensus are logged.
 */
consensus_result most_common_fields(
        const std::vector<record>& records, const consensus_settings& settings);

/**
 * The album level fields that describe a batch of tracks imported together, with
 * the album artist overriding the track artist.
 */
field_table album_fields();
field_overrides album_field_overrides();

} // namespace pathwright

#endif // PATHWRIGHT_CONSENSUS_HEADER
