
#ifndef JSONSTREAM_IO_STRING_HPP
#define JSONSTREAM_IO_STRING_HPP

#include <cstddef>
#include <istream>
#include <string>

#include "internal/config.hpp"

namespace jsonstream {

//
// Byte sources read by basic_tokenizer. An input implements:
//
// - char peek();
//   Get character. If end(), behavior is undefined.
//
// - char take();
//   Extract character. If end(), behavior is undefined.
//
// - bool end();
//   True if input has run out of characters.
//
// - bool bad();
//   True if the input stopped because of an I/O failure
//   rather than running out of characters.
//
// - std::size_t ipos();
//   Get input position.
//


//
// Input string.
// ------------------------
// Borrows the characters; they must outlive the in_str.
// ------------------------
//
class in_str
{
public:
    in_str(const char* src, std::size_t size) :
        m_begin(src), m_cur(src), m_end(src + size)
    {
        JSONSTREAM_ASSERT(src || size == 0);
    }

    explicit in_str(const std::string& src) :
        in_str(src.data(), src.size())
    {}

    in_str(std::string&&) = delete;

    in_str(in_str&&) = default;
    in_str(const in_str&) = delete;

    in_str& operator=(in_str&&) = default;
    in_str& operator=(const in_str&) = delete;

    // Get char. If end(), behavior is undefined.
    inline char peek(void) const noexcept { return *m_cur; }

    // Extract char. If end(), behavior is undefined.
    inline char take(void) noexcept { return *m_cur++; }

    // True if input has run out of characters.
    inline bool end(void) const noexcept { return m_cur == m_end; }

    // Memory never fails.
    inline bool bad(void) const noexcept { return false; }

    // Get input position.
    inline std::size_t ipos(void) const noexcept
    {
        return (std::size_t)(m_cur - m_begin);
    }

private:
    const char* m_begin;
    const char* m_cur;
    const char* m_end;
};


//
// Adapts a std::istream.
// ------------------------
// Borrows the stream. Reads block on the stream's buffer.
// ------------------------
//
class in_stdstream
{
public:
    using traits_type = std::istream::traits_type;

public:
    explicit in_stdstream(std::istream& stream) :
        m_stream(stream), m_pos(0)
    {}

    in_stdstream(in_stdstream&&) = default;
    in_stdstream(const in_stdstream&) = delete;

    // reference member deletes both assignment operators
    in_stdstream& operator=(in_stdstream&&) = delete;
    in_stdstream& operator=(const in_stdstream&) = delete;

    // Get char. If end(), behavior is undefined.
    inline char peek(void) { return traits_type::to_char_type(m_stream.peek()); }

    // Extract char. If end(), behavior is undefined.
    inline char take(void)
    {
        ++m_pos;
        return traits_type::to_char_type(m_stream.get());
    }

    // True if input has run out of characters.
    inline bool end(void)
    {
        return !m_stream.good() ||
            traits_type::eq_int_type(m_stream.peek(), traits_type::eof());
    }

    // True if the stream failed for a reason other than reaching its end.
    inline bool bad(void) const { return m_stream.bad(); }

    // Get input position (characters extracted so far).
    inline std::size_t ipos(void) const noexcept { return m_pos; }

private:
    std::istream& m_stream;
    std::size_t m_pos;
};

}

#endif
