#include <catch2/catch.hpp>

#include "asar/header_json.hpp"
#include "util/error.hpp"

#include <string>

using stylepatch::Error;
using stylepatch::ErrorKind;
using stylepatch::asar::JsonValue;
using stylepatch::asar::parse_json;
using stylepatch::asar::quote_json_string;

TEST_CASE("parse_json keeps object members in source order", "[asar][json]") {
    const JsonValue v = parse_json("{\"zeta\":1,\"alpha\":2,\"mid\":3}");

    REQUIRE(v.is_object());
    REQUIRE(v.members.size() == 3);
    REQUIRE(v.members[0].key == "zeta");
    REQUIRE(v.members[1].key == "alpha");
    REQUIRE(v.members[2].key == "mid");

    REQUIRE(v.find("alpha") != nullptr);
    REQUIRE(v.find("alpha")->text == "2");
    REQUIRE(v.find("missing") == nullptr);
}

TEST_CASE("parse_json records raw source ranges", "[asar][json]") {
    const std::string src = "{ \"a\" : [1, 2.5e3, true] , \"b\":{\"c\":null} }";
    const JsonValue v = parse_json(src);

    const JsonValue* a = v.find("a");
    REQUIRE(a != nullptr);
    REQUIRE(a->items.size() == 3);
    REQUIRE(a->items[1].text == "2.5e3");
    REQUIRE(src.substr(a->rawBegin, a->rawEnd - a->rawBegin) == "[1, 2.5e3, true]");

    const JsonValue* b = v.find("b");
    REQUIRE(src.substr(b->rawBegin, b->rawEnd - b->rawBegin) == "{\"c\":null}");
    REQUIRE(v.members[0].rawKey == "\"a\"");
}

TEST_CASE("parse_json decodes string escapes", "[asar][json]") {
    SECTION("Simple escapes") {
        const JsonValue v = parse_json("\"a\\\"b\\\\c\\/d\\n\\t\"");
        REQUIRE(v.is_string());
        REQUIRE(v.text == "a\"b\\c/d\n\t");
    }

    SECTION("Unicode escapes and surrogate pairs") {
        const JsonValue v = parse_json("\"\\u00e9\\ud83d\\ude00\"");
        REQUIRE(v.text == "\xc3\xa9\xf0\x9f\x98\x80");
    }

    SECTION("Raw key keeps the escaped spelling") {
        const JsonValue v = parse_json("{\"caf\\u00e9\":0}");
        REQUIRE(v.members[0].key == "caf\xc3\xa9");
        REQUIRE(v.members[0].rawKey == "\"caf\\u00e9\"");
    }
}

TEST_CASE("parse_json rejects malformed documents", "[asar][json][errors]") {
    auto kind_of = [](const std::string& text) {
        try {
            (void)parse_json(text);
        } catch (const Error& e) {
            return e.kind();
        }
        return ErrorKind::Io;
    };

    REQUIRE(kind_of("") == ErrorKind::InvalidEncoding);
    REQUIRE(kind_of("{\"a\":1,}") == ErrorKind::InvalidEncoding);
    REQUIRE(kind_of("{\"a\" 1}") == ErrorKind::InvalidEncoding);
    REQUIRE(kind_of("{} x") == ErrorKind::InvalidEncoding);
    REQUIRE(kind_of("\"unterminated") == ErrorKind::InvalidEncoding);
    REQUIRE(kind_of("\"\\ud83d\"") == ErrorKind::InvalidEncoding);
    REQUIRE(kind_of("\"\\q\"") == ErrorKind::InvalidEncoding);
    REQUIRE(kind_of("01") == ErrorKind::InvalidEncoding);
    REQUIRE(kind_of("tru") == ErrorKind::InvalidEncoding);
    REQUIRE(kind_of("\"\xc0\xaf\"") == ErrorKind::InvalidEncoding);
    REQUIRE(kind_of(std::string(300, '[') + std::string(300, ']')) == ErrorKind::InvalidEncoding);
}

TEST_CASE("quote_json_string escapes like JSON.stringify", "[asar][json]") {
    REQUIRE(quote_json_string("plain") == "\"plain\"");
    REQUIRE(quote_json_string("a\"b\\c") == "\"a\\\"b\\\\c\"");
    REQUIRE(quote_json_string("line\nbreak\ttab") == "\"line\\nbreak\\ttab\"");
    REQUIRE(quote_json_string(std::string("\x01", 1)) == "\"\\u0001\"");
    REQUIRE(quote_json_string("a/b") == "\"a/b\"");
    REQUIRE(quote_json_string("caf\xc3\xa9") == "\"caf\xc3\xa9\"");
}
