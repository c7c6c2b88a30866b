#ifndef PATHWRIGHT_PLURALITY_HEADER
#define PATHWRIGHT_PLURALITY_HEADER

#include <algorithm>
#include <iterator>
#include <stdexcept>
#include <utility>
#include <vector>

namespace pathwright {

/**
 * Returns the most frequent value in [first, last) along with the number of times
 * it occurs. If several values are tied, the one that occurs first wins.
 *
 * Values are only compared with `operator==`, so the result never depends on
 * hashing or ordering. This is quadratic in the number of distinct values, which is
 * fine for the handful of candidates of a single batch.
 *
 * If the range is empty, an `std::invalid_argument` exception is thrown.
 */
template <typename InputIt>
std::pair<typename std::iterator_traits<InputIt>::value_type, int> plurality(
        InputIt first, InputIt last)
{
    using value_type = typename std::iterator_traits<InputIt>::value_type;
    // Counts in the order in which values were first seen.
    std::vector<std::pair<value_type, int>> counts;
    for(; first != last; ++first) {
        const auto& value = *first;
        auto it = std::find_if(counts.begin(), counts.end(),
                [&value](const auto& c) { return c.first == value; });
        if(it == counts.end()) {
            counts.emplace_back(value, 1);
        } else {
            ++it->second;
        }
    }

    if(counts.empty()) {
        throw std::invalid_argument("sequence must be non-empty");
    }

    auto winner = counts.begin();
    for(auto it = counts.begin() + 1; it != counts.end(); ++it) {
        // Strictly greater so that the earliest of tied values is kept.
        if(it->second > winner->second) {
            winner = it;
        }
    }
    return std::move(*winner);
}

template <typename Iterable>
auto plurality(const Iterable& values)
        -> decltype(plurality(std::begin(values), std::end(values)))
{
    return plurality(std::begin(values), std::end(values));
}

} // namespace pathwright

#endif // PATHWRIGHT_PLURALITY_HEADER
