#ifndef PATHWRIGHT_REPLACEMENT_RULE_HEADER
#define PATHWRIGHT_REPLACEMENT_RULE_HEADER

#include <regex>
#include <string>
#include <vector>

namespace pathwright {

/**
 * A text rewrite applied to a single path segment: every match of `pattern` (an
 * ECMAScript regular expression) is replaced with `substitution`, which may refer
 * to the match with `$&` and to capture groups with `$1`, `$2` etc.
 *
 * A default constructed rule is the identity and leaves every segment untouched.
 */
class replacement_rule
{
    std::string pattern_;
    std::string substitution_;
    std::regex regex_;
    bool is_identity_ = true;

public:
    replacement_rule() = default;

    /**
     * Compiles `pattern`. If it's not a valid regular expression, an
     * `std::invalid_argument` exception is thrown.
     */
    replacement_rule(std::string pattern, std::string substitution);

    /** Returns `segment` with every match of the pattern substituted. */
    std::string apply(const std::string& segment) const;

    const std::string& pattern() const noexcept { return pattern_; }
    const std::string& substitution() const noexcept { return substitution_; }
    bool is_identity() const noexcept { return is_identity_; }
};

/**
 * The rules of a set are applied in declaration order, each to the output of the
 * previous one.
 */
using rule_set = std::vector<replacement_rule>;

std::string apply_rules(std::string segment, const rule_set& rules);

} // namespace pathwright

#endif // PATHWRIGHT_REPLACEMENT_RULE_HEADER
