
#undef NDEBUG

#include <cassert>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <iostream>
#include <limits>
#include <sstream>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <vector>

#include "jsonstream/jsonstream.hpp"

namespace js = jsonstream;


// Run fn, which must throw parse_error with code e.
// Returns the exception message.
template <typename Fn>
static std::string expect_error(js::error e, Fn fn)
{
    try {
        fn();
    }
    catch (const js::parse_error& ex)
    {
        assert(ex.code() == e);
        return ex.what();
    }
    assert(false && "expected parse_error");
    return std::string();
}

// Tokenize src to the end; return the error that stopped it.
static js::error first_error(const std::string& src)
{
    js::basic_tokenizer<js::in_str> tk(src);
    js::token t;
    js::error e;
    while ((e = tk.next(t)) == js::ERROR_none) {}
    return e;
}

static bool contains(const std::string& haystack, const std::string& needle)
{
    return haystack.find(needle) != std::string::npos;
}


// {"v": <milliseconds>}
struct duration_wrapper : js::consumer, js::producer
{
    std::chrono::milliseconds v{ 0 };

    void unmarshal_from_json(js::stream& s, const js::token& first) override
    {
        js::assert_delim(first, js::DELIM_begin_object);

        std::string name;
        while (js::read_string_or_end(s, js::END_object, name))
        {
            if (name == "v")
                v = std::chrono::milliseconds(js::read_int(s));
            else js::skip_value(s);
        }
    }

    void marshal_to_json(js::writer& w) const override
    {
        w.write_start_object();
        w.write_key("v");
        w.write_int(v.count());
        w.write_end_object();
    }
};

// [x, y]
struct point : js::consumer
{
    std::int32_t x = 0;
    std::int32_t y = 0;

    void unmarshal_from_json(js::stream& s, const js::token& first) override
    {
        js::assert_delim(first, js::DELIM_begin_array);
        x = js::read<std::int32_t>(s);
        y = js::read<std::int32_t>(s);
        js::read_delim(s, js::DELIM_end_array);
    }
};

struct point_list : js::consumer
{
    std::vector<point> points;

    void unmarshal_from_json(js::stream& s, const js::token& first) override
    {
        js::for_each_element(s, first, [&](const js::token& elem) {
            point p;
            p.unmarshal_from_json(s, elem);
            points.push_back(p);
        });
    }
};

struct int_list : js::consumer
{
    std::vector<int> values;

    void unmarshal_from_json(js::stream& s, const js::token& first) override
    {
        js::for_each_element(s, first, [&](const js::token& elem) {
            values.push_back(js::to_value<int>(elem));
        });
    }
};

struct person : js::consumer, js::producer
{
    std::string name;
    std::uint64_t age = 0;
    double score = 0;
    bool active = false;
    std::vector<std::string> tags;
    std::vector<duration_wrapper> timeouts;
    std::size_t null_timeouts = 0;

    void unmarshal_from_json(js::stream& s, const js::token& first) override
    {
        js::for_each_field(s, first, [&](const std::string& field) {
            if (field == "name") name = js::read_string(s);
            else if (field == "age") age = js::read_uint(s);
            else if (field == "score") score = js::read_float(s);
            else if (field == "active") active = js::read_bool(s);
            else if (field == "tags") read_tags(s);
            else if (field == "timeouts") read_timeouts(s);
            else js::skip_value(s);
        });
    }

    void marshal_to_json(js::writer& w) const override
    {
        w.write_start_object();
        w.write_key("name");
        w.write_string(name);
        w.write_item_separator();
        w.write_key("age");
        w.write_uint(age);
        w.write_item_separator();
        w.write_key("score");
        w.write_double(score);
        w.write_item_separator();
        w.write_key("active");
        w.write_bool(active);
        w.write_item_separator();

        w.write_key("tags");
        w.write_start_array();
        for (std::size_t i = 0; i < tags.size(); ++i)
        {
            if (i != 0) w.write_item_separator();
            w.write_string(tags[i]);
        }
        w.write_end_array();
        w.write_item_separator();

        w.write_key("timeouts");
        w.write_start_array();
        for (std::size_t i = 0; i < timeouts.size(); ++i)
        {
            if (i != 0) w.write_item_separator();
            timeouts[i].marshal_to_json(w);
        }
        w.write_end_array();
        w.write_end_object();
    }

private:
    void read_tags(js::stream& s)
    {
        js::read_delim(s, js::DELIM_begin_array);

        std::string tag;
        while (js::read_string_or_end(s, js::END_array, tag))
            tags.push_back(tag);
    }

    void read_timeouts(js::stream& s)
    {
        js::read_delim(s, js::DELIM_begin_array);

        while (true)
        {
            duration_wrapper d;
            bool present;
            if (!js::read_consumer_or_end(s, d, js::END_array, present))
                break;

            if (present) timeouts.push_back(d);
            else ++null_timeouts;
        }
    }
};

struct failing_consumer : js::consumer
{
    void unmarshal_from_json(js::stream& s, const js::token& first) override
    {
        js::skip_value(s, first);
        throw std::runtime_error("rejected by consumer");
    }
};

// Throws something that is not a std::exception.
struct int_throwing_consumer : js::consumer, js::producer
{
    void unmarshal_from_json(js::stream& s, const js::token& first) override
    {
        js::skip_value(s, first);
        throw 42;
    }

    void marshal_to_json(js::writer& w) const override
    {
        w.write_null();
        throw 42;
    }
};

struct nan_producer : js::producer
{
    void marshal_to_json(js::writer& w) const override
    {
        w.write_double(std::numeric_limits<double>::quiet_NaN());
    }
};



static void test_tokenizer(void)
{
    std::cout << "\nTokenizer tests...";

    {
        const std::string src = R"({"a":[1,-2.5e3,true,false,null,"x\n\u00e9\ud834\udd1e"]} )";
        js::basic_tokenizer<js::in_str> tk(src);
        js::token t;

        assert(tk.next(t) == js::ERROR_none && t.is_delim('{') && t.pos() == 0);
        assert(tk.next(t) == js::ERROR_none && t.kind() == js::TOKEN_string && t.text() == "a");
        assert(t.pos() == 1);
        assert(tk.next(t) == js::ERROR_none && t.is_delim('[') && t.pos() == 5);
        assert(tk.depth() == 2);
        assert(tk.next(t) == js::ERROR_none && t.kind() == js::TOKEN_number && t.text() == "1");
        assert(tk.next(t) == js::ERROR_none && t.text() == "-2.5e3" && t.pos() == 8);
        assert(tk.next(t) == js::ERROR_none && t.kind() == js::TOKEN_boolean && t.get_bool());
        assert(tk.next(t) == js::ERROR_none && t.kind() == js::TOKEN_boolean && !t.get_bool());
        assert(tk.next(t) == js::ERROR_none && t.is_null());
        assert(tk.next(t) == js::ERROR_none && t.kind() == js::TOKEN_string);
        assert(t.text() == "x\n\xc3\xa9\xf0\x9d\x84\x9e");
        assert(tk.next(t) == js::ERROR_none && t.is_delim(']'));
        assert(tk.next(t) == js::ERROR_none && t.is_delim('}'));
        assert(tk.depth() == 0);
        assert(tk.next(t) == js::ERROR_eof);
        assert(tk.end());
    }

    // valid documents run to a clean end
    assert(first_error("") == js::ERROR_eof);
    assert(first_error("  \t\r\n ") == js::ERROR_eof);
    assert(first_error("1 2 \"three\"") == js::ERROR_eof);
    assert(first_error("{\"a\":{},\"b\":[],\"c\":[[]]}") == js::ERROR_eof);
    assert(first_error("-0.0e+00") == js::ERROR_eof);
    assert(first_error("\"\\\"\\\\\\/\\b\\f\\n\\r\\t\"") == js::ERROR_eof);

    // structure
    assert(first_error("{\"a\" 1}") == js::ERROR_key_sep);
    assert(first_error("[1 2]") == js::ERROR_item_sep);
    assert(first_error("[1,]") == js::ERROR_invalid_token);
    assert(first_error("{\"a\":1,}") == js::ERROR_expected_key);
    assert(first_error("{1:2}") == js::ERROR_expected_key);
    assert(first_error("[}") == js::ERROR_mismatched_end);
    assert(first_error("{\"a\":1]") == js::ERROR_mismatched_end);
    assert(first_error("]") == js::ERROR_invalid_token);
    assert(first_error("@") == js::ERROR_invalid_token);

    // running out inside a container or token is premature
    assert(first_error("[1,2") == js::ERROR_premature_end);
    assert(first_error("{\"a\":") == js::ERROR_premature_end);
    assert(first_error("\"abc") == js::ERROR_premature_end);
    assert(first_error("tru") == js::ERROR_premature_end);
    assert(first_error("-") == js::ERROR_premature_end);
    assert(first_error("1.") == js::ERROR_premature_end);
    assert(first_error("1e+") == js::ERROR_premature_end);

    // numbers
    assert(first_error("01") == js::ERROR_invalid_num);
    assert(first_error("-a") == js::ERROR_invalid_num);
    assert(first_error("1.e5") == js::ERROR_invalid_num);
    assert(first_error("1ex") == js::ERROR_invalid_num);

    // literals and strings
    assert(first_error("trux") == js::ERROR_invalid_literal);
    assert(first_error("nul1") == js::ERROR_invalid_literal);
    assert(first_error("\"a\\x\"") == js::ERROR_str_escape);
    assert(first_error("\"\\udc00\"") == js::ERROR_str_escape);
    assert(first_error("\"\\ud834x\"") == js::ERROR_str_escape);
    assert(first_error("\"\\u12g4\"") == js::ERROR_str_escape);
    assert(first_error("\"a\tb\"") == js::ERROR_str_ctrl);

    // depth
    {
        std::string ok(JSONSTREAM_MAX_DEPTH, '[');
        ok.append(JSONSTREAM_MAX_DEPTH, ']');
        assert(first_error(ok) == js::ERROR_eof);

        std::string deep(JSONSTREAM_MAX_DEPTH + 1, '[');
        assert(first_error(deep) == js::ERROR_depth_exceeded);
    }

    std::cout << " passed";
}

static void test_numbers(void)
{
    std::cout << "\nNumber conversion tests...";

    std::int8_t i8 = 0;
    assert(js::to_number("127", i8) == js::ERROR_none && i8 == 127);
    assert(js::to_number("-128", i8) == js::ERROR_none && i8 == -128);
    assert(js::to_number("128", i8) == js::ERROR_out_of_range && i8 == -128);
    assert(js::to_number("-129", i8) == js::ERROR_out_of_range);

    std::int64_t i64 = 0;
    assert(js::to_number("-9223372036854775808", i64) == js::ERROR_none);
    assert(i64 == std::numeric_limits<std::int64_t>::min());
    assert(js::to_number("9223372036854775807", i64) == js::ERROR_none);
    assert(i64 == std::numeric_limits<std::int64_t>::max());
    assert(js::to_number("9223372036854775808", i64) == js::ERROR_out_of_range);
    assert(js::to_number("1.5", i64) == js::ERROR_invalid_num);
    assert(js::to_number("1e3", i64) == js::ERROR_invalid_num);

    std::uint64_t u64 = 0;
    assert(js::to_number("18446744073709551615", u64) == js::ERROR_none);
    assert(u64 == std::numeric_limits<std::uint64_t>::max());
    assert(js::to_number("18446744073709551616", u64) == js::ERROR_out_of_range);
    assert(js::to_number("-1", u64) == js::ERROR_out_of_range);
    assert(js::to_number("-0", u64) == js::ERROR_none && u64 == 0);

    double d = 0;
    assert(js::to_number("-1.2344999999999999", d) == js::ERROR_none && d == -1.2345);
    assert(js::to_number("1e+17", d) == js::ERROR_none && d == 1e+17);
    assert(js::to_number("1e400", d) == js::ERROR_out_of_range);

    float f = 0;
    assert(js::to_number("3.5", f) == js::ERROR_none && f == 3.5f);

    std::cout << " passed";
}

static void test_stream(void)
{
    std::cout << "\nStream tests...";

    // input text is borrowed, so temporaries are refused
    static_assert(!std::is_constructible<js::stream, std::string&&>::value, "");
    static_assert(!std::is_constructible<js::in_str, std::string&&>::value, "");
    static_assert(std::is_constructible<js::stream, const std::string&>::value, "");

    {
        js::stream s("  1 2 ");
        js::token t;
        assert(s.try_next(t) && t.text() == "1");
        assert(s.try_next(t) && t.text() == "2");
        assert(!s.try_next(t));
        assert(s.end());
    }
    {
        js::stream s("");
        expect_error(js::ERROR_premature_end, [&] { s.next(); });
    }
    {
        js::stream s("[1,");
        s.next();
        s.next();
        std::string msg = expect_error(js::ERROR_premature_end, [&] { s.next(); });
        assert(contains(msg, "Unexpected end of input."));
    }
    {
        js::stream s("[1 2]");
        s.next();
        s.next();
        std::string msg = expect_error(js::ERROR_item_sep, [&] { s.next(); });
        assert(contains(msg, "at offset 3"));
    }
    {
        std::istringstream in("[true, \"x\"]");
        js::stream s(in);
        assert(s.next().is_delim('['));
        assert(s.next().get_bool());
        assert(s.next().text() == "x");
        assert(s.next().is_delim(']'));
        assert(s.ipos() == 11);
        assert(s.end());
    }

    std::cout << " passed";
}

static void test_reads(void)
{
    std::cout << "\nAssertion layer tests...";

    // well-formed literals
    {
        js::stream s("true 23 18446744073709551615 1.5 \"hi\\u0021\" -7");
        assert(js::read_bool(s) == true);
        assert(js::read_int(s) == 23);
        assert(js::read_uint(s) == 18446744073709551615u);
        assert(js::read_float(s) == 1.5);
        assert(js::read_string(s) == "hi!");
        assert(js::read<short>(s) == -7);
    }

    // null is the zero value
    {
        js::stream s("null null null null null");
        assert(js::read_bool(s) == false);
        assert(js::read_int(s) == 0);
        assert(js::read_uint(s) == 0);
        assert(js::read_float(s) == 0.0);
        assert(js::read_string(s).empty());
    }

    // wrong shape
    {
        js::stream s("\"a\"");
        std::string msg = expect_error(js::ERROR_malformed, [&] { js::read_int(s); });
        assert(contains(msg, "expected an integer, got string \"a\""));
    }
    {
        js::stream s("23");
        std::string msg = expect_error(js::ERROR_malformed, [&] { js::read_string(s); });
        assert(contains(msg, "expected a string, got number 23"));
    }
    {
        js::stream s("1");
        expect_error(js::ERROR_malformed, [&] { js::read_bool(s); });
    }
    {
        js::stream s("{");
        expect_error(js::ERROR_malformed, [&] { js::read_float(s); });
    }

    // number not representable in the requested type
    {
        js::stream s("1.5");
        std::string msg = expect_error(js::ERROR_malformed, [&] { js::read_int(s); });
        assert(contains(msg, "Invalid number."));
    }
    {
        js::stream s("-1");
        std::string msg = expect_error(js::ERROR_malformed, [&] { js::read_uint(s); });
        assert(contains(msg, "Out of range."));
    }
    {
        js::stream s("300");
        expect_error(js::ERROR_malformed, [&] { js::read<std::uint8_t>(s); });
    }

    // end of input
    {
        js::stream s("  ");
        expect_error(js::ERROR_premature_end, [&] { js::read_int(s); });
    }

    // [v1, ..., vn] ends exactly past ']'
    {
        const std::string src = "[1, 2, 3]  ";
        js::stream s(src);
        js::read_delim(s, js::DELIM_begin_array);

        std::int64_t v = -1;
        assert(js::read_int_or_end(s, js::END_array, v) && v == 1);
        assert(js::read_int_or_end(s, js::END_array, v) && v == 2);
        assert(js::read_int_or_end(s, js::END_array, v) && v == 3);
        assert(!js::read_int_or_end(s, js::END_array, v) && v == 0);
        assert(s.ipos() == 9);
        assert(s.end());
    }

    // null element is present, the terminator is not
    {
        js::stream s("[true, false, null]");
        js::read_delim(s, js::DELIM_begin_array);

        bool b = false;
        assert(js::read_bool_or_end(s, js::END_array, b) && b == true);
        assert(js::read_bool_or_end(s, js::END_array, b) && b == false);
        assert(js::read_bool_or_end(s, js::END_array, b) && b == false);
        assert(!js::read_bool_or_end(s, js::END_array, b) && b == false);
    }

    // other typed *_or_end reads
    {
        js::stream s("[\"a\", null][2.5][7]");
        js::read_delim(s, js::DELIM_begin_array);

        std::string str;
        assert(js::read_string_or_end(s, js::END_array, str) && str == "a");
        assert(js::read_string_or_end(s, js::END_array, str) && str.empty());
        assert(!js::read_string_or_end(s, js::END_array, str));

        double d = 0;
        js::read_delim(s, js::DELIM_begin_array);
        assert(js::read_float_or_end(s, js::END_array, d) && d == 2.5);
        assert(!js::read_float_or_end(s, js::END_array, d) && d == 0.0);

        std::uint64_t u = 0;
        js::read_delim(s, js::DELIM_begin_array);
        assert(js::read_uint_or_end(s, js::END_array, u) && u == 7);
        assert(!js::read_uint_or_end(s, js::END_array, u));
    }

    // the wrong terminator is malformed
    {
        js::stream s("[1]");
        js::read_delim(s, js::DELIM_begin_array);

        std::int64_t v = 0;
        assert(js::read_int_or_end(s, js::END_object, v) && v == 1);
        std::string msg = expect_error(js::ERROR_malformed,
            [&] { js::read_int_or_end(s, js::END_object, v); });
        assert(contains(msg, "expected an integer or the delimiter '}', got delimiter ']'"));
    }

    // delimiters
    {
        js::stream s("[");
        std::string msg = expect_error(js::ERROR_malformed,
            [&] { js::read_delim(s, js::DELIM_begin_object); });
        assert(contains(msg, "expected the delimiter '{', got delimiter '['"));

        js::token t = js::token::make_string("x", 4);
        msg = expect_error(js::ERROR_malformed,
            [&] { js::assert_delim(t, js::DELIM_begin_array); });
        assert(contains(msg, "at offset 4"));
    }

    // skip_value consumes exactly one value
    {
        js::stream s("[{\"a\":[1,2,{\"b\":null}]},\"x\",3]");
        js::read_delim(s, js::DELIM_begin_array);
        js::skip_value(s);

        std::string str;
        assert(js::read_string_or_end(s, js::END_array, str) && str == "x");
        std::int64_t v = 0;
        assert(js::read_int_or_end(s, js::END_array, v) && v == 3);
        assert(!js::read_int_or_end(s, js::END_array, v));
        assert(s.end());
    }
    {
        js::stream s("[[[]]");
        expect_error(js::ERROR_premature_end, [&] { js::skip_value(s); });

        js::stream s2("]");
        expect_error(js::ERROR_malformed,
            [&] { js::skip_value(s2, js::token::make_delim(']', 0)); });
    }

    std::cout << " passed";
}

static void test_consumers(void)
{
    std::cout << "\nConsumer tests...";

    // round trip
    {
        duration_wrapper dw;
        dw.v = std::chrono::milliseconds(23);

        std::string out;
        assert(js::marshal(dw, out).ok());
        assert(out == "{\"v\":23}");

        duration_wrapper dw2;
        js::status st = js::unmarshal(dw2, out);
        assert(st.ok() && st.code() == js::ERROR_none);
        assert(dw2.v == std::chrono::milliseconds(23));
    }

    // '{' alone is premature, not malformed
    {
        js::stream s("{");
        js::token first = s.next();
        duration_wrapper dw;
        expect_error(js::ERROR_premature_end, [&] { dw.unmarshal_from_json(s, first); });

        js::status st = js::unmarshal(dw, "{");
        assert(st.code() == js::ERROR_premature_end);
        assert(contains(st.message(), "Unexpected end of input."));
    }

    // unknown fields are skipped
    {
        duration_wrapper dw;
        js::status st = js::unmarshal(dw,
            R"({"x":{"y":[1,2,{"z":null}]},"v":5,"w":"s","t":true})");
        assert(st.ok());
        assert(dw.v == std::chrono::milliseconds(5));
    }

    // top-level null leaves the consumer untouched
    {
        duration_wrapper dw;
        dw.v = std::chrono::milliseconds(9);
        assert(js::unmarshal(dw, " null ").ok());
        assert(dw.v == std::chrono::milliseconds(9));
    }

    // nested consumers, null elements, helper loops
    {
        person p;
        js::status st = js::unmarshal(p,
            R"({"name":"Ann","age":41,"score":9.5,"active":true,"extra":[{}],)"
            R"("tags":["a",null,"b"],"timeouts":[{"v":1},null,{"v":2}]})");
        assert(st.ok());
        assert(p.name == "Ann" && p.age == 41 && p.score == 9.5 && p.active);
        assert(p.tags.size() == 3 && p.tags[0] == "a" && p.tags[1].empty() && p.tags[2] == "b");
        assert(p.timeouts.size() == 2 && p.null_timeouts == 1);
        assert(p.timeouts[0].v.count() == 1 && p.timeouts[1].v.count() == 2);

        std::string out;
        assert(js::marshal(p, out).ok());
        assert(out == R"({"name":"Ann","age":41,"score":9.5,"active":true,)"
            R"("tags":["a","","b"],"timeouts":[{"v":1},{"v":2}]})");

        person p2;
        assert(js::unmarshal(p2, out).ok());
        assert(p2.name == p.name && p2.age == p.age && p2.tags == p.tags);
        assert(p2.timeouts.size() == 2 && p2.null_timeouts == 0);
    }
    {
        point_list pl;
        assert(js::unmarshal(pl, "[[1,2],[-3,4]]").ok());
        assert(pl.points.size() == 2);
        assert(pl.points[1].x == -3 && pl.points[1].y == 4);

        point_list bad;
        js::status st = js::unmarshal(bad, "[[1,2,3]]");
        assert(st.code() == js::ERROR_malformed);
    }
    {
        int_list il;
        assert(js::unmarshal(il, "[1, null, 3]").ok());
        assert(il.values.size() == 3 && il.values[1] == 0 && il.values[2] == 3);

        int_list empty;
        assert(js::unmarshal(empty, "[]").ok() && empty.values.empty());

        int_list bad;
        assert(js::unmarshal(bad, "[1, \"2\"]").code() == js::ERROR_malformed);
    }

    // read_consumer directly
    {
        js::stream s("[{\"v\":3}, null]");
        js::read_delim(s, js::DELIM_begin_array);

        duration_wrapper dw;
        assert(js::read_consumer_or_end(s, dw, js::END_array));
        assert(dw.v.count() == 3);
        assert(js::read_consumer(s, dw) == false);
        js::read_delim(s, js::DELIM_end_array);
    }

    // errors reach the entry point with their offset
    {
        duration_wrapper dw;
        js::status st = js::unmarshal(dw, R"({"v":"a"})");
        assert(st.code() == js::ERROR_malformed && st.offset() == 5);

        st = js::unmarshal(dw, "23");
        assert(st.code() == js::ERROR_malformed);

        st = js::unmarshal(dw, "");
        assert(st.code() == js::ERROR_premature_end);

        st = js::unmarshal(dw, R"({"v":1,})");
        assert(st.code() == js::ERROR_expected_key);
    }

    // domain failures are reported, not swallowed
    {
        failing_consumer fc;
        js::status st = js::unmarshal(fc, "[1,2]");
        assert(st.code() == js::ERROR_consumer);
        assert(st.message() == "rejected by consumer");

        int_throwing_consumer itc;
        st = js::unmarshal(itc, "{\"a\":[1]}");
        assert(st.code() == js::ERROR_consumer);
        assert(st.message() == js::error_msg(js::ERROR_consumer));
        assert(st.offset() == 9);
    }

    // trailing data policy
    {
        duration_wrapper dw;
        assert(js::unmarshal(dw, "{\"v\":1} x").ok());

        js::status st = js::unmarshal(dw, "{\"v\":1} x", js::UMFLAG_reject_trailing);
        assert(st.code() == js::ERROR_trailing_data && st.offset() == 8);

        assert(js::unmarshal(dw, "{\"v\":1}  \n", js::UMFLAG_reject_trailing).ok());
    }

    // memory and std::istream sources
    {
        const char buf[] = "{\"v\":11}garbage";
        duration_wrapper dw;
        assert(js::unmarshal(dw, buf, 8, js::UMFLAG_reject_trailing).ok());
        assert(dw.v.count() == 11);

        // sized buffer without a terminator, size held in an unsigned
        const char unterminated[] = { '{', '"', 'v', '"', ':', '7', '}' };
        unsigned n = sizeof(unterminated);
        assert(js::unmarshal(dw, unterminated, n).ok());
        assert(dw.v.count() == 7);
        assert(js::unmarshal(dw, unterminated, 6).code() == js::ERROR_premature_end);
        assert(js::unmarshal(dw, unterminated, n,
            js::UMFLAG_none | js::UMFLAG_reject_trailing).ok());

        std::istringstream in("{\"v\": 42}\n");
        assert(js::unmarshal(dw, in, js::UMFLAG_reject_trailing).ok());
        assert(dw.v.count() == 42);
    }

    std::cout << " passed";
}

static void test_writer(void)
{
    std::cout << "\nWriter tests...";

    assert(js::escape("The \"quoted\" part") == "The \\\"quoted\\\" part");
    assert(js::escape("back\\slash") == "back\\\\slash");
    assert(js::escape("\b\f\n\r\t") == "\\b\\f\\n\\r\\t");
    assert(js::escape(std::string("a\x01" "b\x1f", 4)) == "a\\u0001b\\u001f");
    assert(js::escape("caf\xc3\xa9 / ok") == "caf\xc3\xa9 / ok");

    {
        std::ostringstream os;
        js::writer w(os);
        w.write_string("The \"quoted\" part");
        assert(os.str() == "\"The \\\"quoted\\\" part\"");
    }
    {
        std::ostringstream os;
        js::writer w(os);
        w.write_start_array();
        w.write_int(std::numeric_limits<std::int64_t>::min());
        w.write_item_separator();
        w.write_uint(std::numeric_limits<std::uint64_t>::max());
        w.write_item_separator();
        w.write_int(0);
        w.write_item_separator();
        w.write_double(-1.2345);
        w.write_item_separator();
        w.write_double(0.5);
        w.write_item_separator();
        w.write_bool(false);
        w.write_item_separator();
        w.write_null();
        w.write_item_separator();
        w.write_string(static_cast<const char*>(nullptr));
        w.write_byte(']');
        assert(os.str() ==
            "[-9223372036854775808,18446744073709551615,0,-1.2344999999999999,0.5,false,null,null]");
    }
    {
        std::ostringstream os;
        js::writer w(os);
        bool thrown = false;
        try { w.write_double(std::numeric_limits<double>::infinity()); }
        catch (const std::invalid_argument&) { thrown = true; }
        assert(thrown);
    }

    // written doubles read back exactly
    {
        std::ostringstream os;
        js::writer w(os);
        w.write_double(0.1);

        std::string text = os.str();
        js::stream s(text);
        assert(js::read_float(s) == 0.1);
    }

    // encode failures
    {
        nan_producer np;
        std::string out = "unchanged";
        js::status st = js::marshal(np, out);
        assert(st.code() == js::ERROR_consumer && out == "unchanged");

        duration_wrapper dw;
        std::ostringstream bad;
        bad.setstate(std::ios_base::badbit);
        assert(js::marshal(dw, bad).code() == js::ERROR_io);

        int_throwing_consumer itc;
        out = "unchanged";
        st = js::marshal(itc, out);
        assert(st.code() == js::ERROR_consumer && out == "unchanged");
    }

    std::cout << " passed";
}


int main(int argc, char** argv)
{
    (void)argc;
    (void)argv;

    std::cout.sync_with_stdio(false);

    std::cout << "\nEscape test: " << js::escape("Hello\tworld!");

    test_tokenizer();
    test_numbers();
    test_stream();
    test_reads();
    test_consumers();
    test_writer();

    std::cout << "\n\nAll tests passed." << std::endl;
    return 0;
}
