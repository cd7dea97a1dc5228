//
// Token assertion layer.
//
// Each read function consumes exactly one token from the stream
// and either returns a typed value or throws parse_error:
//
// - null reads as the zero value of the requested type;
// - a token of the requested shape is converted;
// - in the *_or_end forms, the given closing delimiter reads as
//   "not present" and ends the caller's loop;
// - anything else is ERROR_malformed.
//
// skip_value() is the exception: it consumes a whole value.
//

#ifndef JSONSTREAM_READ_HPP
#define JSONSTREAM_READ_HPP

#include <cstddef>
#include <cstdint>
#include <string>
#include <type_traits>

#include "internal/util.hpp"

#include "core.hpp"
#include "token.hpp"
#include "number.hpp"
#include "stream.hpp"

namespace jsonstream {
namespace internal {

// Build the ERROR_malformed exception for token t, which did not match
// what the caller expected. If end is non-zero, the caller
// would also have accepted that closing delimiter.
inline parse_error unexpected(const token& t, const char* expected, char end = 0,
    const char* reason = nullptr)
{
    std::string detail = "expected ";
    detail += expected;
    if (end != 0)
    {
        detail += " or the delimiter '";
        detail += end;
        detail += '\'';
    }
    detail += ", got ";
    detail += t.describe();
    if (reason)
    {
        detail += " (";
        detail += reason;
        detail += ')';
    }
    return parse_error(t.pos(), ERROR_malformed, detail);
}

template <typename T, typename = void>
struct value_traits;

template <>
struct value_traits<bool>
{
    static inline const char* expected(void) { return "a boolean"; }
    static inline bool is_kind(const token& t) { return t.kind() == TOKEN_boolean; }
    static inline bool convert(const token& t, char) { return t.get_bool(); }
};

template <>
struct value_traits<std::string>
{
    static inline const char* expected(void) { return "a string"; }
    static inline bool is_kind(const token& t) { return t.kind() == TOKEN_string; }
    static inline std::string convert(const token& t, char) { return t.text(); }
};

template <typename T>
struct value_traits<T, iutil::enable_if_t<
    iutil::is_nb_signed_integral<T>::value ||
    iutil::is_nb_unsigned_integral<T>::value ||
    std::is_floating_point<T>::value, void>>
{
    static inline const char* expected(void)
    {
        return std::is_floating_point<T>::value ? "a number" :
            std::is_signed<T>::value ? "an integer" : "an unsigned integer";
    }

    static inline bool is_kind(const token& t) { return t.kind() == TOKEN_number; }

    static inline T convert(const token& t, char end)
    {
        T value = 0;
        error e = to_number(t.text(), value);
        if (e)
            throw unexpected(t, expected(), end, error_msg(e));
        return value;
    }
};

// Value of token t in hand as T. Null is the zero value.
template <typename T>
inline T token_value(const token& t, char end)
{
    using traits = value_traits<T>;

    if (t.is_null())
        return T();
    if (!traits::is_kind(t))
        throw unexpected(t, traits::expected(), end);

    return traits::convert(t, end);
}
}


// Read a value of type T.
// T can be bool, std::string, float, double or any non-bool
// integral type. Integers are range-checked for T.
// Throws parse_error.
template <typename T>
inline T read(stream& js)
{
    token t = js.next();
    return internal::token_value<T>(t, 0);
}

// Read a value of type T, or the closing delimiter end.
// Returns false (and sets out_value to zero) if end was read.
// Throws parse_error.
template <typename T>
inline bool read_or_end(stream& js, end_delim end, T& out_value)
{
    token t = js.next();
    if (t.is_delim(end))
    {
        out_value = T();
        return false;
    }

    out_value = internal::token_value<T>(t, end);
    return true;
}

inline bool read_bool(stream& js) { return read<bool>(js); }
inline std::int64_t read_int(stream& js) { return read<std::int64_t>(js); }
inline std::uint64_t read_uint(stream& js) { return read<std::uint64_t>(js); }
inline double read_float(stream& js) { return read<double>(js); }
inline std::string read_string(stream& js) { return read<std::string>(js); }

inline bool read_bool_or_end(stream& js, end_delim end, bool& out_value)
{
    return read_or_end(js, end, out_value);
}

inline bool read_int_or_end(stream& js, end_delim end, std::int64_t& out_value)
{
    return read_or_end(js, end, out_value);
}

inline bool read_uint_or_end(stream& js, end_delim end, std::uint64_t& out_value)
{
    return read_or_end(js, end, out_value);
}

inline bool read_float_or_end(stream& js, end_delim end, double& out_value)
{
    return read_or_end(js, end, out_value);
}

inline bool read_string_or_end(stream& js, end_delim end, std::string& out_value)
{
    return read_or_end(js, end, out_value);
}

// Throw unless t is the delimiter expected.
inline void assert_delim(const token& t, delim expected)
{
    if (!t.is_delim(expected))
    {
        std::string desc = "the delimiter '";
        desc += static_cast<char>(expected);
        desc += '\'';
        throw internal::unexpected(t, desc.c_str());
    }
}

// Read the delimiter expected.
// Throws parse_error if the next token is anything else.
inline void read_delim(stream& js, delim expected)
{
    token t = js.next();
    assert_delim(t, expected);
}

// Consume the rest of the value that starts with first.
// Nested objects and arrays are consumed up to their closing delimiter.
inline void skip_value(stream& js, const token& first)
{
    if (first.is_delim(DELIM_end_object) || first.is_delim(DELIM_end_array))
        throw internal::unexpected(first, "a value");

    if (!first.is_delim(DELIM_begin_object) && !first.is_delim(DELIM_begin_array))
        return;

    // tokenizer guarantees delimiters are balanced
    std::size_t depth = 1;
    while (depth != 0)
    {
        token t = js.next();
        if (t.is_delim(DELIM_begin_object) || t.is_delim(DELIM_begin_array))
            ++depth;
        else if (t.is_delim(DELIM_end_object) || t.is_delim(DELIM_end_array))
            --depth;
    }
}

// Consume one complete value.
inline void skip_value(stream& js)
{
    token t = js.next();
    skip_value(js, t);
}

}

#endif
