//
// Error codes, the parse_error exception and the status
// returned by the unmarshal()/marshal() entry points.
//

#ifndef JSONSTREAM_CORE_HPP
#define JSONSTREAM_CORE_HPP

#include <cstddef>
#include <string>
#include <stdexcept>
#include <utility>

#include "internal/config.hpp"

namespace jsonstream {

// always >= 0
enum error : int
{
    ERROR_none = 0,
    // Input ran out at a token boundary. Returned by the tokenizer only;
    // stream::next() turns it into ERROR_premature_end.
    ERROR_eof,
    ERROR_premature_end,
    ERROR_malformed,
    ERROR_invalid_num,
    ERROR_out_of_range,
    ERROR_invalid_literal,
    ERROR_str_escape,
    ERROR_str_ctrl,
    ERROR_invalid_token,
    ERROR_key_sep,
    ERROR_item_sep,
    ERROR_expected_key,
    ERROR_mismatched_end,
    ERROR_depth_exceeded,
    ERROR_io,
    ERROR_trailing_data,
    ERROR_consumer
};

inline const char* error_msg(error e)
{
    switch (e)
    {
    case ERROR_none:            return "No error.";
    case ERROR_eof:             return "End of input.";
    case ERROR_premature_end:   return "Unexpected end of input.";
    case ERROR_malformed:       return "Unexpected token.";
    case ERROR_invalid_num:     return "Invalid number.";
    case ERROR_out_of_range:    return "Out of range.";
    case ERROR_invalid_literal: return "Invalid literal.";
    case ERROR_str_escape:      return "Invalid string escape.";
    case ERROR_str_ctrl:        return "Unescaped control character in string.";
    case ERROR_invalid_token:   return "Invalid character.";
    case ERROR_key_sep:         return "Expected ':'";
    case ERROR_item_sep:        return "Expected ','";
    case ERROR_expected_key:    return "Expected string key.";
    case ERROR_mismatched_end:  return "Mismatched closing delimiter.";
    case ERROR_depth_exceeded:  return "Maximum nesting depth exceeded.";
    case ERROR_io:              return "I/O error.";
    case ERROR_trailing_data:   return "Unexpected data after top-level value.";
    case ERROR_consumer:        return "Consumer failure.";
    default:                    return "Unknown error.";
    }
}

class parse_error : public std::runtime_error
{
public:
    parse_error(std::size_t offset, error e) :
        std::runtime_error(get_msg(offset, e, nullptr)),
        m_offset(offset), m_code(e)
    {}

    parse_error(std::size_t offset, error e, const std::string& detail) :
        std::runtime_error(get_msg(offset, e, detail.c_str())),
        m_offset(offset), m_code(e)
    {}

    // Input offset at which the failure was detected.
    inline std::size_t offset(void) const noexcept { return m_offset; }

    inline error code(void) const noexcept { return m_code; }

private:
    static inline std::string get_msg(std::size_t off, error e, const char* detail)
    {
        auto res = "JSON parse error at offset " + std::to_string(off) + ": " + error_msg(e);
        if (detail && *detail)
        {
            res += ' ';
            res += detail;
        }
        return res;
    }

private:
    std::size_t m_offset;
    error m_code;
};

// Outcome of unmarshal() or marshal().
// A default-constructed status is success.
class status
{
public:
    status(void) noexcept : m_code(ERROR_none), m_offset(0) {}

    status(error code, std::string message, std::size_t offset = 0) :
        m_code(code), m_offset(offset), m_message(std::move(message))
    {}

    inline bool ok(void) const noexcept { return m_code == ERROR_none; }

    inline error code(void) const noexcept { return m_code; }

    // Input offset of the failure, 0 if not applicable.
    inline std::size_t offset(void) const noexcept { return m_offset; }

    inline const std::string& message(void) const noexcept { return m_message; }

private:
    error m_code;
    std::size_t m_offset;
    std::string m_message;
};

}

#endif
