
#ifndef JSONSTREAM_WRITER_HPP
#define JSONSTREAM_WRITER_HPP

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <cmath>
#include <limits>
#include <locale>
#include <ostream>
#include <sstream>
#include <string>
#include <stdexcept>

#include "internal/util.hpp"

namespace jsonstream {

// Low-level JSON writer.
// Writes exactly what it is told to; the caller is responsible
// for separators and document structure.
class writer
{
public:
    explicit writer(std::ostream& stream) :
        m_stream(stream)
    {}

    writer(const writer&) = delete;
    writer& operator=(const writer&) = delete;

    inline void write_byte(char c) { m_stream.put(c); }

    inline void write_start_object(void) { m_stream.put(0x7b); }
    inline void write_end_object(void) { m_stream.put(0x7d); }
    inline void write_start_array(void) { m_stream.put(0x5b); }
    inline void write_end_array(void) { m_stream.put(0x5d); }
    inline void write_key_separator(void) { m_stream.put(0x3a); }
    inline void write_item_separator(void) { m_stream.put(0x2c); }

    inline void write_int(std::int64_t value) { write_int_impl(value); }
    inline void write_uint(std::uint64_t value) { write_uint_impl(value); }

    // Throws std::invalid_argument if value is NAN or infinity.
    inline void write_double(double value) { write_floating_impl(value); }

    inline void write_bool(bool value)
    {
        value ? m_stream.write(iutil::strings<>::true_str, 4) :
            m_stream.write(iutil::strings<>::false_str, 5);
    }

    inline void write_null(void) { m_stream.write(iutil::strings<>::null_str, 4); }

    // Write string. String is escaped.
    inline void write_string(const char* value, std::size_t length)
    {
        m_stream.put(0x22); // '"'
        write_escaped(value, length);
        m_stream.put(0x22);
    }

    // Write string or null.
    inline void write_string(const char* value)
    {
        if (value)
            write_string(value, std::strlen(value));
        else write_null();
    }

    inline void write_string(const std::string& value)
    {
        write_string(value.data(), value.size());
    }

    // Write object key followed by ':'.
    inline void write_key(const std::string& name)
    {
        write_string(name);
        write_key_separator();
    }

    // Write object key followed by ':'.
    inline void write_key(const char* name)
    {
        if (!name)
            throw std::invalid_argument("Key is null.");

        write_string(name);
        write_key_separator();
    }

    // Write string contents without quotes. String is escaped.
    void write_escaped(const char* str, std::size_t length);

    // Get stream.
    inline std::ostream& stream(void) noexcept { return m_stream; }

private:
    template <typename UintT>
    inline void write_uint_impl(UintT value);
    template <typename IntT>
    inline void write_int_impl(IntT value);
    template <typename FloatT>
    inline void write_floating_impl(FloatT value);

private:
    std::ostream& m_stream;
};



template <typename UintT>
inline void writer::write_uint_impl(UintT value)
{
    char strbuf[iutil::max_chars10<UintT>::value];
    const auto strbuf_end = strbuf + sizeof(strbuf);

    auto strp = strbuf_end;
    do {
        // units first
        *(--strp) = (char)0x30 + (char)(value % 10);
        value /= 10;
    } while (value != 0);

    m_stream.write(strp, strbuf_end - strp);
}

template <typename IntT>
inline void writer::write_int_impl(IntT value)
{
    char strbuf[iutil::max_chars10<IntT>::value];
    const auto strbuf_end = strbuf + sizeof(strbuf);

    auto abs_value = iutil::absu(value);
    auto strp = strbuf_end;
    do {
        // units first
        *(--strp) = (char)0x30 + (char)(abs_value % 10);
        abs_value /= 10;
    } while (abs_value != 0);

    if (value < 0)
        *(--strp) = '-';

    m_stream.write(strp, strbuf_end - strp);
}

template <typename FloatT>
inline void writer::write_floating_impl(FloatT value)
{
    if (!std::isfinite(value))
        throw std::invalid_argument("Value is NAN or infinity.");

    std::ostringstream sstream;
    sstream.imbue(std::locale::classic()); // make decimal point '.'
    sstream.precision(std::numeric_limits<FloatT>::max_digits10);
    sstream << value;

    m_stream << sstream.str();
}

inline void writer::write_escaped(const char* str, std::size_t length)
{
    static constexpr char hex[] = "0123456789abcdef";

    for (std::size_t i = 0; i < length; ++i)
    {
        char c = str[i];
        switch (c)
        {
            case 0x08: m_stream.write("\\b", 2); break;
            case 0x0c: m_stream.write("\\f", 2); break;
            case 0x0a: m_stream.write("\\n", 2); break;
            case 0x0d: m_stream.write("\\r", 2); break;
            case 0x09: m_stream.write("\\t", 2); break;
            case 0x22: m_stream.write("\\\"", 2); break; // '"'
            case 0x5c: m_stream.write("\\\\", 2); break; // '\'

            default:
                if (static_cast<unsigned char>(c) < 0x20)
                {
                    const char esc[] = { '\\', 'u', '0', '0',
                        hex[(c >> 4) & 0xf], hex[c & 0xf] };
                    m_stream.write(esc, 6);
                }
                else m_stream.put(c);
                break;
        }
    }
}


// Escape string. Result is not quoted.
inline std::string escape(const char* str, std::size_t length)
{
    std::ostringstream os;
    writer w(os);
    w.write_escaped(str, length);
    return os.str();
}

// Escape string. Result is not quoted.
inline std::string escape(const std::string& str)
{
    return escape(str.data(), str.size());
}

}

#endif
