
#ifndef JSONSTREAM_TOKEN_HPP
#define JSONSTREAM_TOKEN_HPP

#include <cstddef>
#include <string>
#include <utility>

#include "internal/util.hpp"

namespace jsonstream {

enum token_kind : unsigned
{
    TOKEN_null,
    TOKEN_boolean,
    TOKEN_number,
    TOKEN_string,
    TOKEN_delim
};

inline const char* token_kind_name(token_kind kind)
{
    switch (kind)
    {
        case TOKEN_null: return "null";
        case TOKEN_boolean: return "boolean";
        case TOKEN_number: return "number";
        case TOKEN_string: return "string";
        case TOKEN_delim: return "delimiter";
        default: return "invalid token";
    }
}

// Structural delimiters.
enum delim : char
{
    DELIM_begin_object = '{',
    DELIM_end_object = '}',
    DELIM_begin_array = '[',
    DELIM_end_array = ']'
};

// Delimiters that terminate a container.
enum end_delim : char
{
    END_object = '}',
    END_array = ']'
};

// One JSON token.
// Numbers keep their lexical text until converted
// by a read primitive (see number.hpp).
class token final
{
public:
    // null
    token(void) noexcept :
        m_kind(TOKEN_null), m_bool(false), m_delim(0), m_pos(0)
    {}

    static inline token make_null(std::size_t pos)
    {
        token t;
        t.m_pos = pos;
        return t;
    }

    static inline token make_bool(bool value, std::size_t pos)
    {
        token t;
        t.m_kind = TOKEN_boolean;
        t.m_bool = value;
        t.m_pos = pos;
        return t;
    }

    static inline token make_number(std::string text, std::size_t pos)
    {
        token t;
        t.m_kind = TOKEN_number;
        t.m_text = std::move(text);
        t.m_pos = pos;
        return t;
    }

    static inline token make_string(std::string text, std::size_t pos)
    {
        token t;
        t.m_kind = TOKEN_string;
        t.m_text = std::move(text);
        t.m_pos = pos;
        return t;
    }

    static inline token make_delim(char d, std::size_t pos)
    {
        token t;
        t.m_kind = TOKEN_delim;
        t.m_delim = d;
        t.m_pos = pos;
        return t;
    }

    inline token_kind kind(void) const noexcept { return m_kind; }

    inline bool is_null(void) const noexcept { return m_kind == TOKEN_null; }

    // True if this is the delimiter d.
    inline bool is_delim(char d) const noexcept
    {
        return m_kind == TOKEN_delim && m_delim == d;
    }

    // Value of a boolean token.
    inline bool get_bool(void) const noexcept { return m_bool; }

    // Delimiter char of a delimiter token, else 0.
    inline char get_delim(void) const noexcept { return m_delim; }

    // Unescaped text of a string token, lexical text of a number token.
    inline const std::string& text(void) const noexcept { return m_text; }

    // Input offset of the first character of this token.
    inline std::size_t pos(void) const noexcept { return m_pos; }

    // Kind and value for diagnostics, e.g. 'string "a"' or 'number 23'.
    inline std::string describe(void) const
    {
        switch (m_kind)
        {
            case TOKEN_null: return "null";
            case TOKEN_boolean: return m_bool ? "boolean true" : "boolean false";
            case TOKEN_number: return "number " + m_text;
            case TOKEN_string: return "string \"" + m_text + "\"";
            case TOKEN_delim: return "delimiter '" + iutil::printable(m_delim) + "'";
            default: return token_kind_name(m_kind);
        }
    }

private:
    token_kind m_kind;
    bool m_bool;
    char m_delim;
    std::size_t m_pos;
    std::string m_text;
};

}

#endif
