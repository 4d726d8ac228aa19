#include <catch2/catch_test_macros.hpp>
#include "arbiter/json_canonicalization.hpp"
#include <cmath>
#include <limits>

using namespace arbiter::json;
using json = nlohmann::json;

namespace
{
    std::string canon(const json &value)
    {
        auto result = RFC8785Canonicalizer::canonicalize(value);
        REQUIRE(result.has_value());
        return *result;
    }
}

TEST_CASE("RFC 8785 - Members are sorted at every depth", "[json]")
{
    json obj = {
        {"z", 1},
        {"a", 2},
        {"nested", {{"y", 3}, {"b", 4}}},
        {"array", {9, 8, 7}}};

    REQUIRE(canon(obj) == R"({"a":2,"array":[9,8,7],"nested":{"b":4,"y":3},"z":1})");
}

TEST_CASE("RFC 8785 - Insertion order does not change the bytes", "[json]")
{
    json first = json::object();
    first["b"] = {{"d", 1}, {"c", 2}};
    first["a"] = "x";

    json second = json::object();
    second["a"] = "x";
    second["b"] = {{"c", 2}, {"d", 1}};

    REQUIRE(canon(first) == canon(second));
}

TEST_CASE("RFC 8785 - Member names compare by UTF-16 code units", "[json]")
{
    // U+1F600 is a surrogate pair (0xD83D 0xDE00) and sorts before U+FB33
    json obj = json::parse(R"({"\ufb33":1,"\ud83d\ude00":2,"\u20ac":3,"1":4,"\r":5,"\u0080":6,"\u00f6":7})");
    REQUIRE(canon(obj) == "{\"\\r\":5,\"1\":4,\"\xC2\x80\":6,\"\xC3\xB6\":7,\"\xE2\x82\xAC\":3,"
                          "\"\xF0\x9F\x98\x80\":2,\"\xEF\xAC\xB3\":1}");
}

TEST_CASE("RFC 8785 - String escaping", "[json]")
{
    json obj = {
        {"quote", "He said \"hello\""},
        {"newline", "line1\nline2"},
        {"tab", "a\tb"},
        {"slash", "a/b"}};

    REQUIRE(canon(obj) == R"({"newline":"line1\nline2","quote":"He said \"hello\"","slash":"a/b","tab":"a\tb"})");
}

TEST_CASE("RFC 8785 - Control characters use lowercase \\u escapes", "[json]")
{
    json obj = {{"ctrl", std::string("test\x01\x1F")}};
    REQUIRE(canon(obj) == R"({"ctrl":"test\u0001\u001f"})");
}

TEST_CASE("RFC 8785 - Non-ASCII text is emitted as UTF-8", "[json]")
{
    json obj = {{"name", "\xC3\xA9t\xC3\xA9"}};
    REQUIRE(canon(obj) == "{\"name\":\"\xC3\xA9t\xC3\xA9\"}");
}

TEST_CASE("RFC 8785 - Number formatting", "[json]")
{
    REQUIRE(canon(json{{"int", 42}, {"negative", -17}, {"zero", 0}}) == R"({"int":42,"negative":-17,"zero":0})");
    REQUIRE(canon(json(1.0)) == "1");
    REQUIRE(canon(json(100.0)) == "100");
    REQUIRE(canon(json(-0.0)) == "0");
    REQUIRE(canon(json(1.5)) == "1.5");
    REQUIRE(canon(json(0.1)) == "0.1");
    REQUIRE(canon(json(0.000001)) == "0.000001");
    REQUIRE(canon(json(1e-7)) == "1e-7");
    REQUIRE(canon(json(1e21)) == "1e+21");
    REQUIRE(canon(json(1e20)) == "100000000000000000000");
    REQUIRE(canon(json(123456.789)) == "123456.789");
}

TEST_CASE("RFC 8785 - Boolean and null", "[json]")
{
    json obj = {
        {"bool_true", true},
        {"bool_false", false},
        {"null_val", nullptr}};

    REQUIRE(canon(obj) == R"({"bool_false":false,"bool_true":true,"null_val":null})");
}

TEST_CASE("RFC 8785 - Empty structures", "[json]")
{
    REQUIRE(canon(json::object()) == "{}");
    REQUIRE(canon(json::array()) == "[]");
}

TEST_CASE("RFC 8785 - Non-finite numbers are rejected", "[json]")
{
    json obj = {{"nested", {{"value", std::numeric_limits<double>::quiet_NaN()}}}};
    REQUIRE(RFC8785Canonicalizer::contains_non_finite(obj));

    auto result = RFC8785Canonicalizer::canonicalize(obj);
    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error().code == arbiter::ErrorCode::InvalidInput);

    REQUIRE_FALSE(RFC8785Canonicalizer::canonicalize(json(std::numeric_limits<double>::infinity())).has_value());
    REQUIRE_FALSE(RFC8785Canonicalizer::contains_non_finite(json{{"x", 1.25}}));
}

TEST_CASE("RFC 8785 - Canonicalize from text", "[json]")
{
    auto result = RFC8785Canonicalizer::canonicalize_string(R"({ "b" : [1, 2.50, true], "a" : null })");
    REQUIRE(result.has_value());
    REQUIRE(*result == R"({"a":null,"b":[1,2.5,true]})");

    auto bad = RFC8785Canonicalizer::canonicalize_string("{not json");
    REQUIRE_FALSE(bad.has_value());
    REQUIRE(bad.error().code == arbiter::ErrorCode::ParsingError);
}

TEST_CASE("UTF-8 well-formedness", "[json]")
{
    REQUIRE(is_valid_utf8(""));
    REQUIRE(is_valid_utf8("asm-1"));
    REQUIRE(is_valid_utf8("\xC3\xA9tude"));
    REQUIRE(is_valid_utf8("\xF0\x9F\x98\x80"));

    REQUIRE_FALSE(is_valid_utf8("\xFF"));
    REQUIRE_FALSE(is_valid_utf8("\xC3"));
    REQUIRE_FALSE(is_valid_utf8("\xC0\xAF"));
    REQUIRE_FALSE(is_valid_utf8("\xED\xA0\x80"));
    REQUIRE_FALSE(is_valid_utf8("\xF4\x90\x80\x80"));
}

TEST_CASE("Optional string members", "[json]")
{
    json j = {{"name", "x"}, {"empty", nullptr}};
    REQUIRE(optional_string(j, "name") == std::optional<std::string>("x"));
    REQUIRE_FALSE(optional_string(j, "empty").has_value());
    REQUIRE_FALSE(optional_string(j, "missing").has_value());
    REQUIRE(nullable(std::nullopt).is_null());
    REQUIRE(nullable(std::string("y")) == "y");
}
