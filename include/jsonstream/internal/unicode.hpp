//
// https://en.wikipedia.org/wiki/UTF-8#Codepage_layout
// https://stackoverflow.com/questions/6240055/
//

#ifndef JSONSTREAM_INTERNAL_UNICODE_HPP
#define JSONSTREAM_INTERNAL_UNICODE_HPP

#include <cstdint>
#include <string>

#include "util.hpp"

namespace jsonstream {
namespace internal {
namespace util {

static constexpr std::uint_least32_t UTF16_ERR = 0xFFFFFFFFu;

// Read the 4 hex digits of a \u escape.
template <typename Input>
inline std::uint_least32_t utf_unesc_unit(Input& is)
{
    std::uint_least32_t res = 0;
    for (int i = 0; i < 4; ++i)
    {
        if (is.end())
            return UTF16_ERR;

        char c = is.peek();
        if (c >= 0x30 && c <= 0x39) // '0' to '9'
            res = (res << 4) + std::uint_least32_t(c - 0x30);
        else if (c >= 0x41 && c <= 0x46) // 'A' to 'F'
            res = (res << 4) + std::uint_least32_t(c - 0x41 + 10);
        else if (c >= 0x61 && c <= 0x66) // 'a' to 'f'
            res = (res << 4) + std::uint_least32_t(c - 0x61 + 10);
        else
            return UTF16_ERR;

        is.take();
    }
    return res;
}

inline bool is_high_surrogate(std::uint_least32_t c) { return (c & 0xfc00u) == 0xd800u; }
inline bool is_low_surrogate(std::uint_least32_t c) { return (c & 0xfc00u) == 0xdc00u; }

// Append codepoint cp to os as UTF-8.
inline void put_utf8(std::string& os, std::uint_least32_t cp)
{
    if (cp < 0x80u) {
        os.push_back((char)cp);
    }
    else if (cp < 0x800u)
    {
        os.push_back((char)(0xc0u | (cp >> 6)));
        os.push_back((char)(0x80u | (cp & 0x3fu)));
    }
    else if (cp < 0x10000u)
    {
        os.push_back((char)(0xe0u | (cp >> 12)));
        os.push_back((char)(0x80u | ((cp >> 6) & 0x3fu)));
        os.push_back((char)(0x80u | (cp & 0x3fu)));
    }
    else
    {
        os.push_back((char)(0xf0u | (cp >> 18)));
        os.push_back((char)(0x80u | ((cp >> 12) & 0x3fu)));
        os.push_back((char)(0x80u | ((cp >> 6) & 0x3fu)));
        os.push_back((char)(0x80u | (cp & 0x3fu)));
    }
}

// Unescape \uXXXX (or a \uXXXX\uXXXX surrogate pair) into os as UTF-8.
// Assumes leading \u was removed.
template <typename Input>
inline bool utf_put_unescape(Input& is, std::string& os)
{
    std::uint_least32_t c1 = utf_unesc_unit(is);
    if (c1 == UTF16_ERR) return false;

    if (is_high_surrogate(c1))
    {
        if (!iutil::take(is, 0x5c) || !iutil::take(is, 0x75)) // "\u"
            return false;

        std::uint_least32_t c2 = utf_unesc_unit(is);
        if (c2 == UTF16_ERR || !is_low_surrogate(c2))
            return false;

        put_utf8(os, (((c1 & 0x03ffu) << 10) | (c2 & 0x03ffu)) + 0x10000u);
        return true;
    }
    else if (!is_low_surrogate(c1)) // unpaired?
    {
        put_utf8(os, c1);
        return true;
    }
    return false;
}

}}}

#endif
