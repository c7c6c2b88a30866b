#ifndef PATHWRIGHT_STRING_UTILS_HEADER
#define PATHWRIGHT_STRING_UTILS_HEADER

#include <algorithm>
#include <cstddef>
#include <cstdio> // std::snprintf
#include <iterator> // std::begin, std::end
#include <memory> // std::unique_ptr
#include <string>
#include <string_view>

namespace pathwright {
namespace util {
namespace c_str {

template <typename C>
constexpr auto size(const C& c) noexcept(noexcept(c.size())) -> decltype(c.size())
{
    return c.size();
}

/**
 * Since C-strings are 0 terminated, the actual returned length is one less than the
 * array's size.
 */
template <typename C, size_t N>
constexpr size_t size(const C (&array)[N]) noexcept
{
    return N - 1;
}

} // namespace c_str

template <typename String1, typename String2>
bool starts_with(const String1& s, const String2& prefix) noexcept
{
    using std::begin;
    return c_str::size(s) >= c_str::size(prefix)
            && std::equal(begin(s), begin(s) + c_str::size(prefix), begin(prefix));
}

template <typename String1, typename String2>
bool ends_with(const String1& s, const String2& suffix) noexcept
{
    using std::begin;
    using std::end;
    const auto n = c_str::size(suffix);
    return c_str::size(s) >= n
            && std::equal(end(s) - n, end(s), begin(suffix), begin(suffix) + n);
}

/** Continuation bytes have the bit pattern 10xxxxxx. */
constexpr bool is_utf8_continuation(const unsigned char c) noexcept
{
    return (c & 0xc0) == 0x80;
}

/**
 * Returns the number of bytes of the UTF-8 sequence introduced by `lead`. Stray
 * continuation bytes and invalid lead bytes are treated as single byte sequences.
 */
constexpr int utf8_sequence_length(const unsigned char lead) noexcept
{
    if(lead < 0x80) {
        return 1;
    } else if((lead & 0xe0) == 0xc0) {
        return 2;
    } else if((lead & 0xf0) == 0xe0) {
        return 3;
    } else if((lead & 0xf8) == 0xf0) {
        return 4;
    }
    return 1;
}

/**
 * Returns the longest prefix of `s` that is at most `max_bytes` long and does not
 * end in the middle of a UTF-8 sequence. A character that would straddle the limit
 * is dropped whole.
 */
inline std::string_view utf8_truncate(std::string_view s, const size_t max_bytes) noexcept
{
    if(s.size() <= max_bytes) {
        return s;
    }
    size_t cut = max_bytes;
    // A UTF-8 sequence has at most 3 continuation bytes. Anything longer is not
    // valid UTF-8 and is cut at the byte limit.
    int num_continuations = 0;
    while(cut > 0 && num_continuations < 3
            && is_utf8_continuation(static_cast<unsigned char>(s[cut]))) {
        --cut;
        ++num_continuations;
    }
    if(num_continuations > 0) {
        const auto lead = static_cast<unsigned char>(s[cut]);
        if(is_utf8_continuation(lead) || utf8_sequence_length(lead) == 1) {
            // `s[cut]` does not introduce the sequence that was split, so the
            // bytes we walked over were stray.
            cut = max_bytes;
        }
    }
    return s.substr(0, cut);
}

template <typename... Args>
std::string format(const char* format_str, Args&&... args)
{
    const size_t length = std::snprintf(nullptr, 0, format_str, args...) + 1;
    std::unique_ptr<char[]> buffer(new char[length]);
    std::snprintf(buffer.get(), length, format_str, args...);
    // -1 to exclude the '\0' at the end
    return std::string(buffer.get(), buffer.get() + length - 1);
}

} // namespace util
} // namespace pathwright

#endif // PATHWRIGHT_STRING_UTILS_HEADER
