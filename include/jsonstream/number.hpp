//
// Conversion of lexical JSON number text to C++ arithmetic types.
// The tokenizer keeps number tokens as text so that each read
// primitive can pick the type it needs.
//

#ifndef JSONSTREAM_NUMBER_HPP
#define JSONSTREAM_NUMBER_HPP

#include <cmath>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <string>
#include <system_error>
#include <type_traits>

#include "fast_float/fast_float.h"

#include "internal/util.hpp"
#include "core.hpp"

namespace jsonstream {
namespace internal {

// Accumulate decimal digits into an unsigned value.
// Text must be digits only.
template <typename UintT>
inline error read_udigits(const char* p, const char* pend, UintT& out_value)
{
    static constexpr UintT max = std::numeric_limits<UintT>::max();

    if (p == pend)
        return ERROR_invalid_num;

    out_value = 0;
    for (; p != pend; ++p)
    {
        if (!iutil::is_digit(*p))
            return ERROR_invalid_num;

        UintT digit = UintT(*p - '0');
        if (out_value > (max - digit) / 10)
            return ERROR_out_of_range;

        out_value = 10 * out_value + digit;
    }
    return ERROR_none;
}

template <typename T, iutil::enable_if_t<iutil::is_nb_unsigned_integral<T>::value> = 0>
inline error do_to_number(const char* p, const char* pend, T& out_value)
{
    bool neg = p != pend && *p == '-';
    if (neg) ++p;

    T value;
    error e = read_udigits(p, pend, value);
    if (e) return e;

    // "-0" is fine
    if (neg && value != 0)
        return ERROR_out_of_range;

    out_value = value;
    return ERROR_none;
}

template <typename T, iutil::enable_if_t<iutil::is_nb_signed_integral<T>::value> = 0>
inline error do_to_number(const char* p, const char* pend, T& out_value)
{
    using UintT = iutil::make_unsigned_t<T>;

    bool neg = p != pend && *p == '-';
    if (neg) ++p;

    UintT uvalue;
    error e = read_udigits(p, pend, uvalue);
    if (e) return e;

    if (neg) {
        if (uvalue > iutil::absu(std::numeric_limits<T>::min()))
            return ERROR_out_of_range;
    }
    else if (uvalue > iutil::absu(std::numeric_limits<T>::max()))
        return ERROR_out_of_range;

    out_value = neg ? iutil::uneg<T>(uvalue) : (T)uvalue;
    return ERROR_none;
}

template <typename T, iutil::enable_if_t<std::is_floating_point<T>::value> = 0>
inline error do_to_number(const char* p, const char* pend, T& out_value)
{
    static_assert(std::is_same<T, float>::value || std::is_same<T, double>::value,
        "Only float and double are supported.");

    T value;
    auto res = fast_float::from_chars(p, pend, value);
    if (res.ec == std::errc::result_out_of_range)
        return ERROR_out_of_range;
    if (res.ec != std::errc() || res.ptr != pend)
        return ERROR_invalid_num;
    if (!std::isfinite(value))
        return ERROR_out_of_range;

    out_value = value;
    return ERROR_none;
}

}

// Convert lexical number text to T, where T is any non-bool
// integral type, float or double. On failure, out_value is
// unchanged and the error is ERROR_invalid_num (e.g. a fraction
// requested as an integer) or ERROR_out_of_range.
template <typename T>
inline error to_number(const char* str, std::size_t length, T& out_value)
{
    static_assert(
        iutil::is_nb_signed_integral<T>::value ||
        iutil::is_nb_unsigned_integral<T>::value ||
        std::is_floating_point<T>::value,
        "T must be a non-bool integral or floating-point type.");

    return internal::do_to_number(str, str + length, out_value);
}

template <typename T>
inline error to_number(const std::string& text, T& out_value)
{
    return to_number(text.data(), text.size(), out_value);
}

}

#endif
