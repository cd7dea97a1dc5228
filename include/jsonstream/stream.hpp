
#ifndef JSONSTREAM_STREAM_HPP
#define JSONSTREAM_STREAM_HPP

#include <cstddef>
#include <cstring>
#include <istream>
#include <memory>
#include <string>
#include <utility>

#include "core.hpp"
#include "token.hpp"
#include "io_string.hpp"
#include "tokenizer.hpp"

namespace jsonstream {

//
// Token stream.
// ------------------------
// Owns its tokenizer. The characters or std::istream
// it reads from are borrowed and must outlive the stream.
// Not thread-safe.
// ------------------------
//
class stream
{
public:
    stream(const char* src, std::size_t size) :
        m_src(new basic_tokenizer<in_str>(src, size))
    {}

    explicit stream(const char* src) :
        stream(src, std::strlen(src))
    {}

    explicit stream(const std::string& src) :
        stream(src.data(), src.size())
    {}

    // must outlive the stream
    stream(std::string&&) = delete;

    explicit stream(std::istream& src) :
        m_src(new basic_tokenizer<in_stdstream>(src))
    {}

    // Read from a custom token source.
    explicit stream(std::unique_ptr<token_source> src) :
        m_src(std::move(src))
    {
        JSONSTREAM_ASSERT(m_src);
    }

    stream(stream&&) = default;
    stream(const stream&) = delete;

    stream& operator=(stream&&) = default;
    stream& operator=(const stream&) = delete;

    // Read the next token.
    // Running out of input is always premature here: the caller
    // asked for a token that a complete document would have.
    // Throws parse_error.
    inline token next(void)
    {
        token t;
        error e = m_src->next(t);
        if (e == ERROR_eof)
            e = ERROR_premature_end;
        if (e)
            throw parse_error(m_src->ipos(), e);

        return t;
    }

    // Read the next token if there is one.
    // Returns false if the input ended between top-level values.
    // Throws parse_error on any other failure.
    inline bool try_next(token& out)
    {
        error e = m_src->next(out);
        if (e == ERROR_eof)
            return false;
        if (e)
            throw parse_error(m_src->ipos(), e);

        return true;
    }

    // True if only whitespace remains.
    inline bool end(void) { return m_src->end(); }

    // Get input position.
    inline std::size_t ipos(void) const { return m_src->ipos(); }

private:
    std::unique_ptr<token_source> m_src;
};

}

#endif
