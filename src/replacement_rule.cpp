#include "replacement_rule.hpp"

#include <stdexcept>
#include <utility>

namespace pathwright {

replacement_rule::replacement_rule(std::string pattern, std::string substitution)
    : pattern_(std::move(pattern))
    , substitution_(std::move(substitution))
    , is_identity_(false)
{
    try {
        regex_.assign(pattern_, std::regex::ECMAScript);
    } catch(const std::regex_error& e) {
        throw std::invalid_argument(
                "invalid replacement pattern (" + pattern_ + "): " + e.what());
    }
}

std::string replacement_rule::apply(const std::string& segment) const
{
    if(is_identity_) {
        return segment;
    }
    return std::regex_replace(segment, regex_, substitution_);
}

std::string apply_rules(std::string segment, const rule_set& rules)
{
    for(const auto& rule : rules) {
        segment = rule.apply(segment);
    }
    return segment;
}

} // namespace pathwright
