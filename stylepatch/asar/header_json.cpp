#include "header_json.hpp"

#include "asar_format.hpp"
#include "../util/error.hpp"
#include "../util/utf8.hpp"

#include <cstdint>
#include <cstdio>

namespace stylepatch::asar {

const JsonValue* JsonValue::find(std::string_view key) const {
    for (const auto& m : members) {
        if (m.key == key) {
            return &m.value;
        }
    }
    return nullptr;
}

namespace {

[[noreturn]] void fail(const char* what, std::size_t pos) {
    throw Error(ErrorKind::InvalidEncoding,
                std::string("header JSON: ") + what + " at byte " + std::to_string(pos));
}

bool is_ws(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r';
}

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

class Parser {
public:
    explicit Parser(std::string_view s) : s_(s) {}

    JsonValue parse_document() {
        JsonValue v = parse_value(0);
        skip_ws();
        if (i_ != s_.size()) {
            fail("trailing characters", i_);
        }
        return v;
    }

private:
    void skip_ws() {
        while (i_ < s_.size() && is_ws(s_[i_])) {
            i_++;
        }
    }

    bool consume(char c) {
        skip_ws();
        if (i_ < s_.size() && s_[i_] == c) {
            i_++;
            return true;
        }
        return false;
    }

    void expect_literal(std::string_view lit) {
        if (s_.substr(i_, lit.size()) != lit) {
            fail("invalid literal", i_);
        }
        i_ += lit.size();
    }

    JsonValue parse_value(std::size_t depth) {
        if (depth > ASAR_MAX_JSON_DEPTH) {
            fail("nesting too deep", i_);
        }

        skip_ws();
        if (i_ >= s_.size()) {
            fail("unexpected end of input", i_);
        }

        JsonValue v;
        v.rawBegin = i_;

        const char c = s_[i_];
        if (c == '{') {
            parse_object(v, depth);
        } else if (c == '[') {
            parse_array(v, depth);
        } else if (c == '"') {
            v.kind = JsonValue::Kind::String;
            v.text = parse_string();
        } else if (c == 't') {
            expect_literal("true");
            v.kind = JsonValue::Kind::Bool;
            v.boolValue = true;
        } else if (c == 'f') {
            expect_literal("false");
            v.kind = JsonValue::Kind::Bool;
            v.boolValue = false;
        } else if (c == 'n') {
            expect_literal("null");
            v.kind = JsonValue::Kind::Null;
        } else if (c == '-' || (c >= '0' && c <= '9')) {
            v.kind = JsonValue::Kind::Number;
            v.text = parse_number();
        } else {
            fail("unexpected character", i_);
        }

        v.rawEnd = i_;
        return v;
    }

    void parse_object(JsonValue& v, std::size_t depth) {
        v.kind = JsonValue::Kind::Object;
        i_++;  // {

        if (consume('}')) {
            return;
        }

        for (;;) {
            skip_ws();
            if (i_ >= s_.size() || s_[i_] != '"') {
                fail("expected member name", i_);
            }

            JsonMember m;
            const std::size_t keyBegin = i_;
            m.key = parse_string();
            m.rawKey = std::string(s_.substr(keyBegin, i_ - keyBegin));

            if (!consume(':')) {
                fail("expected ':'", i_);
            }

            m.value = parse_value(depth + 1);
            v.members.push_back(std::move(m));

            if (consume(',')) continue;
            if (consume('}')) return;
            fail("expected ',' or '}'", i_);
        }
    }

    void parse_array(JsonValue& v, std::size_t depth) {
        v.kind = JsonValue::Kind::Array;
        i_++;  // [

        if (consume(']')) {
            return;
        }

        for (;;) {
            v.items.push_back(parse_value(depth + 1));

            if (consume(',')) continue;
            if (consume(']')) return;
            fail("expected ',' or ']'", i_);
        }
    }

    std::uint32_t parse_hex4() {
        if (i_ + 4 > s_.size()) {
            fail("truncated \\u escape", i_);
        }
        std::uint32_t v = 0;
        for (int k = 0; k < 4; ++k) {
            const int h = hex_value(s_[i_ + k]);
            if (h < 0) fail("invalid \\u escape", i_);
            v = (v << 4) | static_cast<std::uint32_t>(h);
        }
        i_ += 4;
        return v;
    }

    std::string parse_string() {
        i_++;  // opening quote

        std::string out;
        for (;;) {
            if (i_ >= s_.size()) {
                fail("unterminated string", i_);
            }

            const char c = s_[i_];
            if (c == '"') {
                i_++;
                return out;
            }
            if (static_cast<unsigned char>(c) < 0x20) {
                fail("control character in string", i_);
            }
            if (c != '\\') {
                out.push_back(c);
                i_++;
                continue;
            }

            i_++;
            if (i_ >= s_.size()) {
                fail("unterminated escape", i_);
            }

            const char e = s_[i_++];
            switch (e) {
                case '"': out.push_back('"'); break;
                case '\\': out.push_back('\\'); break;
                case '/': out.push_back('/'); break;
                case 'b': out.push_back('\b'); break;
                case 'f': out.push_back('\f'); break;
                case 'n': out.push_back('\n'); break;
                case 'r': out.push_back('\r'); break;
                case 't': out.push_back('\t'); break;
                case 'u': {
                    std::uint32_t cp = parse_hex4();
                    if (cp >= 0xD800 && cp <= 0xDBFF) {
                        if (i_ + 2 > s_.size() || s_[i_] != '\\' || s_[i_ + 1] != 'u') {
                            fail("unpaired surrogate", i_);
                        }
                        i_ += 2;
                        const std::uint32_t lo = parse_hex4();
                        if (lo < 0xDC00 || lo > 0xDFFF) {
                            fail("unpaired surrogate", i_);
                        }
                        cp = 0x10000 + ((cp - 0xD800) << 10) + (lo - 0xDC00);
                    } else if (cp >= 0xDC00 && cp <= 0xDFFF) {
                        fail("unpaired surrogate", i_);
                    }
                    util::append_utf8(out, cp);
                    break;
                }
                default:
                    fail("invalid escape", i_ - 1);
            }
        }
    }

    std::string parse_number() {
        const std::size_t start = i_;

        if (s_[i_] == '-') i_++;

        auto digits = [this]() {
            const std::size_t d = i_;
            while (i_ < s_.size() && s_[i_] >= '0' && s_[i_] <= '9') i_++;
            return i_ - d;
        };

        if (i_ < s_.size() && s_[i_] == '0') {
            i_++;
        } else if (digits() == 0) {
            fail("invalid number", start);
        }

        if (i_ < s_.size() && s_[i_] == '.') {
            i_++;
            if (digits() == 0) fail("invalid number", start);
        }

        if (i_ < s_.size() && (s_[i_] == 'e' || s_[i_] == 'E')) {
            i_++;
            if (i_ < s_.size() && (s_[i_] == '+' || s_[i_] == '-')) i_++;
            if (digits() == 0) fail("invalid number", start);
        }

        return std::string(s_.substr(start, i_ - start));
    }

    std::string_view s_;
    std::size_t i_{0};
};

} // namespace

JsonValue parse_json(std::string_view text) {
    if (!util::is_valid_utf8(text)) {
        throw Error(ErrorKind::InvalidEncoding, "header JSON is not valid UTF-8");
    }

    Parser parser(text);
    return parser.parse_document();
}

std::string quote_json_string(std::string_view s) {
    std::string out;
    out.reserve(s.size() + 2);
    out.push_back('"');

    for (char c : s) {
        switch (c) {
            case '"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\b': out += "\\b"; break;
            case '\f': out += "\\f"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(static_cast<unsigned char>(c)));
                    out += buf;
                } else {
                    out.push_back(c);
                }
                break;
        }
    }

    out.push_back('"');
    return out;
}

} // namespace stylepatch::asar
