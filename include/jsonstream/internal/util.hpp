
#ifndef JSONSTREAM_INTERNAL_UTIL_HPP
#define JSONSTREAM_INTERNAL_UTIL_HPP

#include <cstddef>
#include <cstdint>
#include <limits>
#include <string>
#include <type_traits>

#include "config.hpp"

namespace jsonstream {

namespace internal {
namespace util {}
}
namespace iutil = internal::util;

namespace internal {
namespace util {

template <bool test, typename T = int>
using enable_if_t = typename std::enable_if<test, T>::type;

template <typename T>
using make_unsigned_t = typename std::make_unsigned<T>::type;

template <typename T>
using is_nb_signed_integral = std::integral_constant<bool,
    !std::is_same<T, bool>::value && std::is_integral<T>::value && std::is_signed<T>::value>;

template <typename T>
using is_nb_unsigned_integral = std::integral_constant<bool,
    !std::is_same<T, bool>::value && std::is_integral<T>::value && std::is_unsigned<T>::value>;

// Buffer size at least as large as required to represent
// an integral value as decimal text (includes sign).
template <typename T>
struct max_chars10 : std::integral_constant<int,
    // round up digits10 + sign
    std::numeric_limits<T>::digits10 + 1 + std::is_signed<T>::value>
{};

template <typename = void>
struct strings
{
    static constexpr char null_str[] = { 'n', 'u', 'l', 'l' };
    static constexpr char false_str[] = { 'f', 'a', 'l', 's', 'e' };
    static constexpr char true_str[] = { 't', 'r', 'u', 'e' };
};

template <typename T> constexpr char strings<T>::null_str[];
template <typename T> constexpr char strings<T>::false_str[];
template <typename T> constexpr char strings<T>::true_str[];

template <typename = void>
struct LUTS
{
    // row = 16 chars
    // \b, \f, \n, \r, \t, /, \, "
    static constexpr char ctrl[] =
    {
        0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,
        0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,
        0,0, '"', 0,0,0,0,0,0,0,0,0,0,0,0, '/',
        0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,
        0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,
        0,0,0,0,0,0,0,0,0,0,0,0, '\\', 0,0,0,
        0,0, '\b', 0,0,0, '\f', 0,0,0,0,0,0,0, '\n', 0,
        0,0, '\r', 0, '\t', 0,0,0,0,0,0,0,0,0,0,0,
        0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,
        0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,
        0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,
        0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,
        0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,
        0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,
        0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,
        0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0
    };
};

template <typename T>
constexpr char LUTS<T>::ctrl[];

// Character produced by the escape sequence '\c', or 0 if '\c' is not
// a single-character escape.
inline char ctrl_lut(char c) noexcept
{
    return LUTS<>::ctrl[static_cast<unsigned char>(c)];
}

inline bool is_digit(char c) noexcept { return c >= 0x30 && c <= 0x39; }

inline bool is_ws(char c) noexcept
{
    switch (c)
    {
        case 0x20: // space
        case 0x09: // horizontal tab
        case 0x0a: // line feed
        case 0x0d: // carriage return
            return true;
        default:
            return false;
    }
}

// Extract c if it is the next character.
template <typename Input>
inline bool take(Input& is, char c)
{
    if (!is.end() && is.peek() == c)
    {
        is.take();
        return true;
    }
    else return false;
}

// Absolute value of a signed integral type. Converts to unsigned equivalent.
template <typename T>
constexpr make_unsigned_t<T> absu(T value) noexcept
{
    static_assert(
        std::numeric_limits<T>::max() + std::numeric_limits<T>::min() == 0 ||
        // can unsigned T store |signed min T|?
        std::numeric_limits<make_unsigned_t<T>>::digits > std::numeric_limits<T>::digits,
        "Platform not supported.");

#ifdef _MSC_VER
#pragma warning(push)
#pragma warning(disable: 4146)
#endif
    return value < 0 ? -static_cast<make_unsigned_t<T>>(value) : value;
#ifdef _MSC_VER
#pragma warning(pop)
#endif
}

// Negate an unsigned integral type and convert to signed.
// Behavior is undefined if uvalue > |min T|.
template <typename T>
inline T uneg(make_unsigned_t<T> uvalue) noexcept
{
    static constexpr T ubound = std::numeric_limits<T>::max();

    JSONSTREAM_ASSERT(uvalue <= absu(std::numeric_limits<T>::min()));

    return uvalue <= static_cast<make_unsigned_t<T>>(ubound) ?
        -static_cast<T>(uvalue) :
        -ubound - static_cast<T>(uvalue - static_cast<make_unsigned_t<T>>(ubound));
}

// Render a byte for diagnostics: printable ASCII as-is, anything else as \xHH.
inline std::string printable(char c)
{
    static constexpr char hex[] = "0123456789abcdef";
    auto u = static_cast<unsigned char>(c);
    if (u >= 0x20 && u < 0x7f)
        return std::string(1, c);

    std::string res = "\\x";
    res += hex[u >> 4];
    res += hex[u & 0xf];
    return res;
}

}}}

#endif
