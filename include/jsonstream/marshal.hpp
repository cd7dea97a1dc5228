//
// Entry points. unmarshal() and marshal() are the only
// places that catch; everything below them throws.
// Whatever a consumer or producer throws comes back as a status.
//

#ifndef JSONSTREAM_MARSHAL_HPP
#define JSONSTREAM_MARSHAL_HPP

#include <cstddef>
#include <exception>
#include <ios>
#include <istream>
#include <ostream>
#include <sstream>
#include <string>

#include "core.hpp"
#include "stream.hpp"
#include "consumer.hpp"
#include "writer.hpp"

namespace jsonstream {

// A type that writes itself as JSON.
class producer
{
public:
    virtual ~producer(void) = default;

    // Write exactly one complete JSON value.
    // Failures are thrown; they propagate to marshal().
    virtual void marshal_to_json(writer& w) const = 0;
};

// Flags for unmarshal().
enum umflag : unsigned
{
    UMFLAG_none = 0,
    // Fail with ERROR_trailing_data if anything but
    // whitespace follows the top-level value.
    UMFLAG_reject_trailing = 0x1
};

inline umflag operator|(umflag a, umflag b)
{
    return static_cast<umflag>(static_cast<unsigned>(a) | static_cast<unsigned>(b));
}

namespace internal {

inline status unmarshal_impl(stream& js, consumer& c, umflag flags)
{
    try
    {
        read_consumer(js, c);

        if ((flags & UMFLAG_reject_trailing) && !js.end())
        {
            parse_error e(js.ipos(), ERROR_trailing_data);
            return status(e.code(), e.what(), e.offset());
        }
        return status();
    }
    catch (const parse_error& e) {
        return status(e.code(), e.what(), e.offset());
    }
    catch (const std::ios_base::failure& e) {
        return status(ERROR_io, e.what(), js.ipos());
    }
    catch (const std::exception& e) {
        return status(ERROR_consumer, e.what(), js.ipos());
    }
    catch (...) {
        return status(ERROR_consumer, error_msg(ERROR_consumer), js.ipos());
    }
}
}

// Read the JSON value in [data, data + size) into c.
// A top-level null leaves c untouched.
inline status unmarshal(consumer& c, const char* data, std::size_t size,
    umflag flags = UMFLAG_none)
{
    stream js(data, size);
    return internal::unmarshal_impl(js, c, flags);
}

// Read the JSON value in the null-terminated string src into c.
inline status unmarshal(consumer& c, const char* src, umflag flags = UMFLAG_none)
{
    stream js(src);
    return internal::unmarshal_impl(js, c, flags);
}

// Read the JSON value in src into c.
inline status unmarshal(consumer& c, const std::string& src, umflag flags = UMFLAG_none)
{
    stream js(src);
    return internal::unmarshal_impl(js, c, flags);
}

// Read the JSON value in src into c.
// With UMFLAG_reject_trailing, src is read to its end.
inline status unmarshal(consumer& c, std::istream& src, umflag flags = UMFLAG_none)
{
    stream js(src);
    return internal::unmarshal_impl(js, c, flags);
}

// Write p as JSON to os.
inline status marshal(const producer& p, std::ostream& os)
{
    try
    {
        writer w(os);
        p.marshal_to_json(w);
        os.flush();

        if (!os)
            return status(ERROR_io, error_msg(ERROR_io));
        return status();
    }
    catch (const std::ios_base::failure& e) {
        return status(ERROR_io, e.what());
    }
    catch (const std::exception& e) {
        return status(ERROR_consumer, e.what());
    }
    catch (...) {
        return status(ERROR_consumer, error_msg(ERROR_consumer));
    }
}

// Write p as JSON to out.
// out is only assigned on success.
inline status marshal(const producer& p, std::string& out)
{
    std::ostringstream os;
    status res = marshal(p, os);
    if (res.ok())
        out = os.str();

    return res;
}

}

#endif
