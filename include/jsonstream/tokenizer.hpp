
#ifndef JSONSTREAM_TOKENIZER_HPP
#define JSONSTREAM_TOKENIZER_HPP

#include <cstddef>
#include <deque>
#include <stack>
#include <string>
#include <utility>

#include "internal/config.hpp"
#include "internal/util.hpp"
#include "internal/unicode.hpp"

#include "core.hpp"
#include "token.hpp"

namespace jsonstream {

// Source of tokens read by a stream.
class token_source
{
public:
    virtual ~token_source(void) = default;

    // Read the next token into out.
    // Returns ERROR_eof if the input ended cleanly between top-level
    // values, ERROR_premature_end if it ended inside a value, or
    // another error if the input is not valid JSON.
    virtual error next(token& out) = 0;

    // Skip whitespace. True if no input remains.
    virtual bool end(void) = 0;

    // Get input position.
    virtual std::size_t ipos(void) const = 0;
};


namespace internal {

enum docnode : unsigned
{
    DOCNODE_array,
    DOCNODE_object,
    DOCNODE_key,
    DOCNODE_root
};

struct node_info
{
    docnode type;
    bool has_children;

    node_info(docnode type) :
        type(type), has_children(false)
    {}
};
}


//
// JSON tokenizer.
//
// Input is a byte source (see io_string.hpp).
//
// - Yields one token per call to next(); ':' and ','
//   are validated and consumed internally.
// - Non-throwing: failures are returned as error codes.
// - Numbers are returned as their lexical text.
//
template <typename Input>
class basic_tokenizer final : public token_source
{
public:
    template <typename ...Args>
    explicit basic_tokenizer(Args&&... args) :
        m_is(std::forward<Args>(args)...), m_depth(0)
    {
        m_nodes.push({ internal::DOCNODE_root });
    }

    basic_tokenizer(const basic_tokenizer&) = delete;
    basic_tokenizer& operator=(const basic_tokenizer&) = delete;

    error next(token& out) override;

    inline bool end(void) override { return !skip_ws(); }

    inline std::size_t ipos(void) const override { return m_is.ipos(); }

    // Current nesting depth (open objects and arrays).
    inline std::size_t depth(void) const noexcept { return m_depth; }

private:
    // Skip whitespace.
    // Returns true if input has more characters.
    inline bool skip_ws(void)
    {
        while (!m_is.end() && iutil::is_ws(m_is.peek())) {
            m_is.take();
        }
        return !m_is.end();
    }

    // Input ran out at a token boundary.
    inline error boundary_end(void) const
    {
        if (m_is.bad()) return ERROR_io;
        return m_nodes.top().type == internal::DOCNODE_root ?
            ERROR_eof : ERROR_premature_end;
    }

    // Input ran out inside a token.
    inline error inner_end(void) const
    {
        return m_is.bad() ? ERROR_io : ERROR_premature_end;
    }

    // All values (object/array/primitive) complete a key-value pair.
    inline void end_child_node(void)
    {
        if (m_nodes.top().type == internal::DOCNODE_key)
            m_nodes.pop();

        m_nodes.top().has_children = true;
    }

    inline error read_value(token& out);
    inline error read_begin(token& out, internal::docnode type, char c);
    inline error read_end(token& out, internal::docnode type, char c);
    inline error read_str(std::string& out);
    inline error read_numstr(std::string& out);

    template <std::size_t N>
    inline error consume_literal(const char(&str)[N]);

private:
    Input m_is;
    std::size_t m_depth;
    std::stack<internal::node_info, std::deque<internal::node_info>> m_nodes;
};



template <typename Input>
inline error basic_tokenizer<Input>::next(token& out)
{
    using namespace internal;

    if (!skip_ws())
        return boundary_end();

    char c = m_is.peek();
    switch (m_nodes.top().type)
    {
        case DOCNODE_key:
            if (c != ':')
                return ERROR_key_sep;
            m_is.take();

            if (!skip_ws())
                return boundary_end();
            return read_value(out);

        case DOCNODE_object:
            if (c == '}')
                return read_end(out, DOCNODE_object, c);
            if (c == ']')
                return ERROR_mismatched_end;

            if (m_nodes.top().has_children)
            {
                if (c != ',')
                    return ERROR_item_sep;
                m_is.take();

                if (!skip_ws())
                    return boundary_end();
                c = m_is.peek();
            }

            if (c != '"')
                return ERROR_expected_key;
            {
                std::size_t pos = m_is.ipos();
                std::string key;
                error e = read_str(key);
                if (e) return e;

                out = token::make_string(std::move(key), pos);
                m_nodes.push({ DOCNODE_key });
                // don't end_child_node(), key-value pair is incomplete
                return ERROR_none;
            }

        case DOCNODE_array:
            if (c == ']')
                return read_end(out, DOCNODE_array, c);
            if (c == '}')
                return ERROR_mismatched_end;

            if (m_nodes.top().has_children)
            {
                if (c != ',')
                    return ERROR_item_sep;
                m_is.take();

                if (!skip_ws())
                    return boundary_end();
            }
            return read_value(out);

        case DOCNODE_root:
        default:
            return read_value(out);
    }
}

template <typename Input>
inline error basic_tokenizer<Input>::read_value(token& out)
{
    using namespace internal;

    const std::size_t pos = m_is.ipos();
    const char c = m_is.peek();
    error e;

    switch (c)
    {
        case 0x7b: return read_begin(out, DOCNODE_object, c); // '{'
        case 0x5b: return read_begin(out, DOCNODE_array, c);  // '['

        case 0x22: // '"'
        {
            std::string str;
            e = read_str(str);
            if (e) return e;
            out = token::make_string(std::move(str), pos);
            break;
        }

        case 0x74: // 't'
            e = consume_literal(iutil::strings<>::true_str);
            if (e) return e;
            out = token::make_bool(true, pos);
            break;

        case 0x66: // 'f'
            e = consume_literal(iutil::strings<>::false_str);
            if (e) return e;
            out = token::make_bool(false, pos);
            break;

        case 0x6e: // 'n'
            e = consume_literal(iutil::strings<>::null_str);
            if (e) return e;
            out = token::make_null(pos);
            break;

        default:
        {
            if (c != 0x2d && !iutil::is_digit(c)) // '-'
                return ERROR_invalid_token;

            std::string num;
            e = read_numstr(num);
            if (e) return e;
            out = token::make_number(std::move(num), pos);
            break;
        }
    }

    end_child_node();
    return ERROR_none;
}

template <typename Input>
inline error basic_tokenizer<Input>::read_begin(token& out, internal::docnode type, char c)
{
    if (m_depth >= JSONSTREAM_MAX_DEPTH)
        return ERROR_depth_exceeded;

    out = token::make_delim(c, m_is.ipos());
    m_is.take();

    m_nodes.push({ type });
    ++m_depth;
    return ERROR_none;
}

template <typename Input>
inline error basic_tokenizer<Input>::read_end(token& out, internal::docnode type, char c)
{
    JSONSTREAM_ASSERT(m_nodes.top().type == type);
    (void)type;

    out = token::make_delim(c, m_is.ipos());
    m_is.take();

    m_nodes.pop();
    --m_depth;
    end_child_node();
    return ERROR_none;
}

template <typename Input>
template <std::size_t N>
inline error basic_tokenizer<Input>::consume_literal(const char(&str)[N])
{
    for (std::size_t i = 0; i < N; ++i)
    {
        if (m_is.end())
            return inner_end();
        if (m_is.peek() != str[i])
            return ERROR_invalid_literal;
        m_is.take();
    }
    return ERROR_none;
}

template <typename Input>
inline error basic_tokenizer<Input>::read_str(std::string& out)
{
    JSONSTREAM_ASSERT(m_is.peek() == 0x22);
    m_is.take(); // skip '"'

    while (true)
    {
        if (m_is.end())
            return inner_end();

        char c = m_is.peek();
        if (c == 0x22) // '"'
            break;

        if (static_cast<unsigned char>(c) < 0x20)
            return ERROR_str_ctrl;

        if (c != 0x5c) // '\'
        {
            out.push_back(m_is.take());
            continue;
        }

        m_is.take(); // skip '\'
        if (m_is.end())
            return inner_end();

        c = m_is.peek();
        char uc = iutil::ctrl_lut(c);
        if (uc != 0)
        {
            out.push_back(uc);
            m_is.take();
        }
        else if (c == 0x75) // 'u'
        {
            m_is.take();
            if (!iutil::utf_put_unescape(m_is, out))
                return m_is.end() ? inner_end() : ERROR_str_escape;
        }
        else return ERROR_str_escape;
    }

    m_is.take(); // '"'
    return ERROR_none;
}

// Read all chars matching a JSON number pattern.
// Does not check if number is within range of any type.
template <typename Input>
inline error basic_tokenizer<Input>::read_numstr(std::string& buf)
{
    if (m_is.peek() == 0x2d) // '-'
        buf.push_back(m_is.take());

    if (m_is.end())
        return inner_end();
    if (!iutil::is_digit(m_is.peek()))
        return ERROR_invalid_num;

    // no leading zeros
    if (m_is.peek() == 0x30)
    {
        buf.push_back(m_is.take());
        if (!m_is.end() && iutil::is_digit(m_is.peek()))
            return ERROR_invalid_num;
    }

    while (!m_is.end() && iutil::is_digit(m_is.peek()))
        buf.push_back(m_is.take());

    if (!m_is.end() && m_is.peek() == 0x2e) // '.'
    {
        buf.push_back(m_is.take());

        // at least one digit on right
        if (m_is.end())
            return inner_end();
        if (!iutil::is_digit(m_is.peek()))
            return ERROR_invalid_num;

        while (!m_is.end() && iutil::is_digit(m_is.peek()))
            buf.push_back(m_is.take());
    }

    if (!m_is.end() && (m_is.peek() == 0x65 || m_is.peek() == 0x45)) // 'e', 'E'
    {
        buf.push_back(m_is.take());

        if (!m_is.end() && (m_is.peek() == 0x2b || m_is.peek() == 0x2d)) // '+', '-'
            buf.push_back(m_is.take());

        // at least one exponent digit
        if (m_is.end())
            return inner_end();
        if (!iutil::is_digit(m_is.peek()))
            return ERROR_invalid_num;

        while (!m_is.end() && iutil::is_digit(m_is.peek()))
            buf.push_back(m_is.take());
    }

    return ERROR_none;
}

}

#endif
