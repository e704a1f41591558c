#include <catch2/catch_test_macros.hpp>
#include "persistence/json.hpp"
#include "test_support.hpp"
#include <limits>

namespace json = nle::persistence::json;
using nle::test::approx;

namespace {
json::Value parse_ok(const std::string& text) {
    json::Value v;
    json::ParseError err;
    if(!json::parse(text, v, err)) FAIL("parse failed: " << err.message << " at " << err.offset);
    return v;
}
} // namespace

TEST_CASE("json parses nested documents", "[json]") {
    auto v = parse_ok(R"({"a": [1, 2.5, -3e2], "b": {"c": true, "d": null}, "e": "x"})");
    REQUIRE(v.is_object());
    const auto* a = v.find("a");
    REQUIRE(a);
    REQUIRE(a->items().size() == 3);
    REQUIRE(approx(a->items()[1].as_number(), 2.5));
    REQUIRE(approx(a->items()[2].as_number(), -300.0));
    REQUIRE(v.find("b")->find("c")->as_bool());
    REQUIRE(v.find("b")->find("d")->is_null());
    REQUIRE(v.find("e")->as_string() == "x");
    REQUIRE(v.find("missing") == nullptr);
}

TEST_CASE("json string escapes", "[json]") {
    auto v = parse_ok(R"(["line\nbreak", "quote \" slash \/", "\u00e9", "\ud83c\udfac"])");
    REQUIRE(v.items()[0].as_string() == "line\nbreak");
    REQUIRE(v.items()[1].as_string() == "quote \" slash /");
    REQUIRE(v.items()[2].as_string() == "\xC3\xA9");
    REQUIRE(v.items()[3].as_string() == "\xF0\x9F\x8E\xAC");
}

TEST_CASE("json rejects malformed input with an offset", "[json]") {
    json::Value v;
    json::ParseError err;
    REQUIRE_FALSE(json::parse("{\"a\": }", v, err));
    REQUIRE(err.offset == 6);
    REQUIRE_FALSE(json::parse("[1, 2", v, err));
    REQUIRE_FALSE(json::parse("{\"a\": 1} extra", v, err));
    REQUIRE(err.message == "trailing characters after document");
    REQUIRE_FALSE(json::parse("\"\\ud83c\"", v, err));
    REQUIRE_FALSE(json::parse("01x", v, err));
    REQUIRE_FALSE(json::parse("", v, err));
    REQUIRE_FALSE(json::parse(std::string(300, '['), v, err));
    REQUIRE(err.message == "nesting too deep");
}

TEST_CASE("json writer keeps member order and integer formatting", "[json]") {
    json::Value o = json::Value::object();
    o.set("z", json::Value::number(3));
    o.set("a", json::Value::number(0.25));
    o.set("s", json::Value::string("tab\there"));
    json::Value arr = json::Value::array();
    arr.push(json::Value::boolean(false));
    arr.push(json::Value::null());
    o.set("list", std::move(arr));
    o.set("z", json::Value::number(4));

    REQUIRE(json::write(o, 0) == R"({"z":4,"a":0.25,"s":"tab\there","list":[false,null]})");
    auto pretty = json::write(o, 2);
    REQUIRE(pretty.find("\n  \"z\": 4") != std::string::npos);

    auto back = parse_ok(pretty);
    REQUIRE(back.members().size() == 4);
    REQUIRE(back.members()[0].key == "z");
    REQUIRE(approx(back.find("a")->as_number(), 0.25));
}

TEST_CASE("json numbers survive a write and parse", "[json]") {
    const double values[] = {0.1, 1.0 / 3.0, 1e-7, 123456789.125, -42.0};
    for(double d : values) {
        json::Value v = parse_ok(json::write(json::Value::number(d), 0));
        REQUIRE(v.as_number() == d);
    }
    REQUIRE(json::write(json::Value::number(std::numeric_limits<double>::infinity()), 0) == "null");
}
