#include "consensus.hpp"
#include "plurality.hpp"
#include "settings.hpp"
#include "string_utils.hpp"
#include "log.hpp"

namespace pathwright {

field_value zero_value(const field_kind kind)
{
    switch(kind) {
    case field_kind::integer: return int64_t(0);
    case field_kind::real: return 0.0;
    case field_kind::string:
    default: return std::string();
    }
}

bool is_empty(const field_value& value) noexcept
{
    const auto* s = std::get_if<std::string>(&value);
    return s && s->empty();
}

consensus_result most_common_fields(const std::vector<record>& records,
        const field_table& fields, const field_overrides& overrides)
{
    consensus_result result;
    // Whether a field was observed at all, which decides if it may override.
    std::map<std::string, bool> observed;

    for(const auto& field : fields) {
        const auto& name = field.first;
        std::vector<field_value> values;
        values.reserve(records.size());
        for(const auto& r : records) {
            auto it = r.find(name);
            if(it != r.end() && !is_empty(it->second)) {
                values.push_back(it->second);
            }
        }

        observed[name] = !values.empty();
        if(values.empty()) {
            result.likely[name] = zero_value(field.second);
            result.consensus[name] = false;
            continue;
        }
        auto winner = plurality(values);
        result.consensus[name] = static_cast<size_t>(winner.second) == records.size();
        result.likely[name] = std::move(winner.first);
    }

    for(const auto& o : overrides) {
        const auto& preferred = o.first;
        const auto& fallback = o.second;
        auto it = observed.find(preferred);
        if(it == observed.end() || !it->second) {
            continue;
        }
        result.likely[fallback] = result.likely[preferred];
        result.consensus[fallback] = result.consensus[preferred];
    }

    return result;
}

consensus_result most_common_fields(
        const std::vector<record>& records, const consensus_settings& settings)
{
    auto result = most_common_fields(records, settings.fields, settings.overrides);
#ifdef PATHWRIGHT_ENABLE_DEBUGGING
    for(const auto& c : result.consensus) {
        if(!c.second) {
            log::log_consensus("{CONSENSUS}",
                    util::format("no consensus on '%s' among %i items", c.first.c_str(),
                            static_cast<int>(records.size())),
                    log::priority::low);
        }
    }
#endif // PATHWRIGHT_ENABLE_DEBUGGING
    return result;
}

field_table album_fields()
{
    return {
        {"artist", field_kind::string},
        {"album", field_kind::string},
        {"albumartist", field_kind::string},
        {"year", field_kind::integer},
        {"disctotal", field_kind::integer},
        {"mb_albumid", field_kind::string},
        {"label", field_kind::string},
        {"barcode", field_kind::string},
        {"catalognum", field_kind::string},
        {"country", field_kind::string},
        {"media", field_kind::string},
        {"albumdisambig", field_kind::string},
    };
}

field_overrides album_field_overrides()
{
    return {{"albumartist", "artist"}};
}

} // namespace pathwright
