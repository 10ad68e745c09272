#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace stylepatch::asar {

// Minimal JSON tree for the archive header.
// Object members keep source order, and every value remembers the byte range
// it was parsed from so unrecognized members can be written back verbatim.
struct JsonMember;

struct JsonValue {
    enum class Kind {
        Null,
        Bool,
        Number,
        String,
        Object,
        Array,
    };

    Kind kind{Kind::Null};
    bool boolValue{false};
    std::string text;  // decoded string, or the literal text of a number

    std::vector<JsonMember> members;  // Kind::Object, source order
    std::vector<JsonValue> items;     // Kind::Array

    std::size_t rawBegin{0};
    std::size_t rawEnd{0};

    bool is_object() const { return kind == Kind::Object; }
    bool is_string() const { return kind == Kind::String; }
    bool is_number() const { return kind == Kind::Number; }
    bool is_bool() const { return kind == Kind::Bool; }

    // First member with the given key, or nullptr.
    const JsonValue* find(std::string_view key) const;
};

struct JsonMember {
    std::string key;
    std::string rawKey;  // exact source token, quotes included
    JsonValue value;
};

// Parses a complete JSON document. Throws stylepatch::Error(InvalidEncoding).
JsonValue parse_json(std::string_view text);

// Quotes and escapes `s` the way JSON.stringify does.
std::string quote_json_string(std::string_view s);

} // namespace stylepatch::asar
