
#ifndef JSONSTREAM_CONSUMER_HPP
#define JSONSTREAM_CONSUMER_HPP

#include <string>

#include "core.hpp"
#include "token.hpp"
#include "stream.hpp"
#include "read.hpp"

namespace jsonstream {

//
// A type that reads itself from a token stream.
//
// unmarshal_from_json() is given the first token of the value,
// already read from js (usually '{' or '['; check it with
// assert_delim()). It must consume every remaining token of the
// value, up to and including the closing delimiter, and nothing
// more. Failures are thrown; they propagate to unmarshal().
//
// An object-shaped value typically looks like:
//
//   void unmarshal_from_json(stream& js, const token& first) override
//   {
//       assert_delim(first, DELIM_begin_object);
//       std::string name;
//       while (read_string_or_end(js, END_object, name))
//       {
//           if (name == "v") v = read_int(js);
//           else skip_value(js);
//       }
//   }
//
class consumer
{
public:
    virtual ~consumer(void) = default;

    virtual void unmarshal_from_json(stream& js, const token& first_token) = 0;
};


// Read a nested value into c.
// Returns false if the value was null (c is untouched).
// Throws parse_error, or whatever c throws.
inline bool read_consumer(stream& js, consumer& c)
{
    token t = js.next();
    if (t.is_null())
        return false;

    c.unmarshal_from_json(js, t);
    return true;
}

// Read a nested value into c, or the closing delimiter end.
// Returns false if end was read.
// out_present is false if the value was null or end was read.
inline bool read_consumer_or_end(stream& js, consumer& c, end_delim end, bool& out_present)
{
    out_present = false;

    token t = js.next();
    if (t.is_delim(end))
        return false;
    if (t.is_null())
        return true;

    c.unmarshal_from_json(js, t);
    out_present = true;
    return true;
}

// Read a nested value into c, or the closing delimiter end.
// Returns false if end was read.
inline bool read_consumer_or_end(stream& js, consumer& c, end_delim end)
{
    bool present;
    return read_consumer_or_end(js, c, end, present);
}

// Value of a token in hand as T, with the same rules as read<T>().
template <typename T>
inline T to_value(const token& t)
{
    return internal::token_value<T>(t, 0);
}

// Loop over the fields of the object starting with first.
// Calls fn(const std::string& name) for each field; fn must
// consume exactly one value. Returns after the closing '}'.
template <typename Fn>
inline void for_each_field(stream& js, const token& first, Fn fn)
{
    assert_delim(first, DELIM_begin_object);

    std::string name;
    while (read_string_or_end(js, END_object, name))
        fn(static_cast<const std::string&>(name));
}

// Loop over the elements of the array starting with first.
// Calls fn(const token& element_first) for each element; fn must
// consume the rest of the element. Returns after the closing ']'.
template <typename Fn>
inline void for_each_element(stream& js, const token& first, Fn fn)
{
    assert_delim(first, DELIM_begin_array);

    while (true)
    {
        token t = js.next();
        if (t.is_delim(END_array))
            break;

        fn(static_cast<const token&>(t));
    }
}

}

#endif
