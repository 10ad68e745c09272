#include "injection_engine.hpp"

#include "../util/error.hpp"
#include "../util/log.hpp"
#include "../util/utf8.hpp"

#include <cstdint>
#include <optional>
#include <utility>

namespace stylepatch::inject {

using util::LogLevel;
using util::logf;

namespace {

bool is_hex(char c) {
    return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F');
}

std::uint32_t hex_digit(char c) {
    if (c >= '0' && c <= '9') {
        return static_cast<std::uint32_t>(c - '0');
    }
    if (c >= 'a' && c <= 'f') {
        return static_cast<std::uint32_t>(c - 'a' + 10);
    }
    return static_cast<std::uint32_t>(c - 'A' + 10);
}

bool read_hex(std::string_view s, std::size_t pos, std::size_t count, std::uint32_t& value) {
    if (pos + count > s.size()) {
        return false;
    }
    value = 0;
    for (std::size_t k = 0; k < count; ++k) {
        if (!is_hex(s[pos + k])) {
            return false;
        }
        value = (value << 4) | hex_digit(s[pos + k]);
    }
    return true;
}

struct ScanFailure {
    std::size_t at{0};
    std::string what;
};

// Parses the unicode escape that starts at body[i] == '\\', body[i + 1] == 'u'.
// Returns one past the escape, or npos if it is malformed.
std::size_t read_unicode_escape(std::string_view body, std::size_t i, std::uint32_t& cp) {
    std::size_t pos = i + 2;
    if (pos < body.size() && body[pos] == '{') {
        const std::size_t close = body.find('}', pos + 1);
        if (close == std::string_view::npos || close == pos + 1) {
            return std::string_view::npos;
        }
        cp = 0;
        for (std::size_t k = pos + 1; k < close; ++k) {
            if (!is_hex(body[k])) {
                return std::string_view::npos;
            }
            cp = (cp << 4) | hex_digit(body[k]);
            if (cp > 0x10FFFF) {
                return std::string_view::npos;
            }
        }
        return close + 1;
    }
    if (!read_hex(body, pos, 4, cp)) {
        return std::string_view::npos;
    }
    return pos + 4;
}

// Walks the body of a template literal as the JS lexer would. With `cooked`
// set, escapes must be valid in an untagged literal and their values are
// appended to it; without it the body is read raw (String.raw).
std::optional<ScanFailure> scan_template(std::string_view body, std::string* cooked) {
    std::size_t i = 0;
    while (i < body.size()) {
        const char c = body[i];

        if (c == '`') {
            return ScanFailure{i, "unescaped backtick"};
        }
        if (c == '$' && i + 1 < body.size() && body[i + 1] == '{') {
            return ScanFailure{i, "unescaped '${'"};
        }
        if (c != '\\') {
            if (cooked) {
                cooked->push_back(c);
            }
            ++i;
            continue;
        }

        if (i + 1 >= body.size()) {
            return ScanFailure{i, "trailing backslash escapes the closing backtick"};
        }
        const char e = body[i + 1];
        if (!cooked) {
            i += 2;
            continue;
        }

        switch (e) {
        case 'n': cooked->push_back('\n'); i += 2; break;
        case 't': cooked->push_back('\t'); i += 2; break;
        case 'r': cooked->push_back('\r'); i += 2; break;
        case 'b': cooked->push_back('\b'); i += 2; break;
        case 'f': cooked->push_back('\f'); i += 2; break;
        case 'v': cooked->push_back('\v'); i += 2; break;
        case '0':
            if (i + 2 < body.size() && body[i + 2] >= '0' && body[i + 2] <= '9') {
                return ScanFailure{i, "octal escape is not allowed in a template literal"};
            }
            cooked->push_back('\0');
            i += 2;
            break;
        case '1': case '2': case '3': case '4': case '5': case '6': case '7': case '8': case '9':
            return ScanFailure{i, "octal escape is not allowed in a template literal"};
        case 'x': {
            std::uint32_t value = 0;
            if (!read_hex(body, i + 2, 2, value)) {
                return ScanFailure{i, "malformed \\x escape"};
            }
            (void)util::append_utf8(*cooked, value);
            i += 4;
            break;
        }
        case 'u': {
            std::uint32_t cp = 0;
            std::size_t next = read_unicode_escape(body, i, cp);
            if (next == std::string_view::npos) {
                return ScanFailure{i, "malformed \\u escape"};
            }
            if (cp >= 0xD800 && cp <= 0xDBFF && next + 1 < body.size() &&
                body[next] == '\\' && body[next + 1] == 'u') {
                std::uint32_t low = 0;
                const std::size_t after = read_unicode_escape(body, next, low);
                if (after != std::string_view::npos && low >= 0xDC00 && low <= 0xDFFF) {
                    cp = 0x10000 + ((cp - 0xD800) << 10) + (low - 0xDC00);
                    next = after;
                }
            }
            if (!util::append_utf8(*cooked, cp)) {
                (void)util::append_utf8(*cooked, 0xFFFD); // lone surrogate
            }
            i = next;
            break;
        }
        case '\r':
            i += (i + 2 < body.size() && body[i + 2] == '\n') ? 3 : 2;
            break;
        case '\n':
            i += 2;
            break;
        default:
            cooked->push_back(e);
            i += 2;
            break;
        }
    }
    return std::nullopt;
}

// CSS for the inner String.raw literal. Escape pairs are kept as they are so
// CSS escapes survive; backticks and placeholders get a backslash.
std::string escape_raw_literal(std::string_view css) {
    std::string out;
    out.reserve(css.size());

    for (std::size_t i = 0; i < css.size(); ++i) {
        const char c = css[i];
        if (c == '\\') {
            if (i + 1 < css.size()) {
                out.push_back(c);
                out.push_back(css[++i]);
            } else {
                out += "\\\\";
            }
        } else if (c == '`') {
            out += "\\`";
        } else if (c == '$' && i + 1 < css.size() && css[i + 1] == '{') {
            out += "\\$";
        } else {
            out.push_back(c);
        }
    }

    return out;
}

} // namespace

std::string escape_template(std::string_view text) {
    std::string out;
    out.reserve(text.size());

    for (std::size_t i = 0; i < text.size(); ++i) {
        const char c = text[i];
        if (c == '\\') {
            out += "\\\\";
        } else if (c == '`') {
            out += "\\`";
        } else if (c == '$' && i + 1 < text.size() && text[i + 1] == '{') {
            out += "\\$";
        } else {
            out.push_back(c);
        }
    }

    return out;
}

std::string unescape_template(std::string_view body) {
    std::string cooked;
    cooked.reserve(body.size());
    if (const auto failure = scan_template(body, &cooked)) {
        throw Error(ErrorKind::PayloadEscapeViolation,
                    "template literal body: " + failure->what + " at byte " + std::to_string(failure->at));
    }
    return cooked;
}

std::string escape_css(std::string_view css) {
    return escape_template(escape_raw_literal(css));
}

InjectionEngine::InjectionEngine(InjectionConfig cfg) : cfg_(std::move(cfg)) {}

ByteRange InjectionEngine::find_anchor(std::string_view text) const {
    const std::string& anchor = cfg_.anchor;
    if (anchor.empty()) {
        throw Error(ErrorKind::AnchorNotFound, "anchor string is empty");
    }

    const std::size_t first = text.find(anchor);
    if (first == std::string_view::npos) {
        throw Error(ErrorKind::AnchorNotFound, "anchor '" + anchor + "' not found in target script");
    }

    const std::size_t second = text.find(anchor, first + 1);
    if (second != std::string_view::npos) {
        throw Error(ErrorKind::AmbiguousAnchor,
                    "anchor '" + anchor + "' occurs more than once (bytes " + std::to_string(first) +
                    " and " + std::to_string(second) + ")");
    }

    return ByteRange{first, first + anchor.size()};
}

bool InjectionEngine::already_patched(std::string_view text) const {
    if (cfg_.guardToken.empty()) {
        return false;
    }
    return text.find(cfg_.guardToken) != std::string_view::npos;
}

void InjectionEngine::validate_payload(std::string_view css, std::string_view js) const {
    // The CSS sits in String.raw \`...\` inside the executeJavaScript `...` literal:
    // cook it once for the outer literal, then read the result raw.
    std::string cooked;
    if (const auto failure = scan_template(css, &cooked)) {
        throw Error(ErrorKind::PayloadEscapeViolation,
                    "CSS payload: " + failure->what + " at byte " + std::to_string(failure->at));
    }
    if (const auto failure = scan_template(cooked, nullptr)) {
        throw Error(ErrorKind::PayloadEscapeViolation,
                    "CSS payload breaks the String.raw literal: " + failure->what);
    }

    std::string cookedJs;
    if (const auto failure = scan_template(js, &cookedJs)) {
        throw Error(ErrorKind::PayloadEscapeViolation,
                    "JS payload: " + failure->what + " at byte " + std::to_string(failure->at));
    }
    if (js.find(cfg_.scriptBegin) != std::string_view::npos ||
        js.find(cfg_.scriptEnd) != std::string_view::npos) {
        throw Error(ErrorKind::PayloadEscapeViolation, "JS payload contains a script sentinel");
    }
}

std::string InjectionEngine::head() const {
    return "\n    " + cfg_.windowExpr + ".on('dom-ready', () => {\n"
           "        " + cfg_.windowExpr + ".executeJavaScript(`\n"
           "            let " + cfg_.guardToken + " = String.raw \\`";
}

std::string InjectionEngine::middle() const {
    return "\\`;\n"
           "            const style = document.createElement('style');\n"
           "            style.innerHTML = " + cfg_.guardToken + ";\n"
           "            document.head.appendChild(style);\n"
           "\n"
           "            " + cfg_.scriptBegin + "\n";
}

std::string InjectionEngine::tail() const {
    return "\n"
           "            " + cfg_.scriptEnd + "\n"
           "        `);\n"
           "    });";
}

std::string InjectionEngine::render_block(std::string_view css, std::string_view js) const {
    std::string block = head();
    block.append(css);
    block += middle();
    block.append(js);
    block += tail();
    return block;
}

std::string InjectionEngine::inject(std::string_view text, ByteRange anchor,
                                    std::string_view css, std::string_view js) const {
    if (anchor.begin > anchor.end || anchor.end > text.size()) {
        throw Error(ErrorKind::AnchorNotFound, "anchor range lies outside the target script");
    }

    if (cfg_.validatePayloads) {
        validate_payload(css, js);
    }

    const std::string block = render_block(css, js);

    std::string out;
    out.reserve(text.size() + block.size());
    out.append(text.substr(0, anchor.begin));
    out += block;
    out.append(text.substr(anchor.begin));

    logf(LogLevel::Debug, "inject", "inserted %zu-byte block at byte %zu", block.size(), anchor.begin);
    return out;
}

InjectionEngine::BlockSpan InjectionEngine::locate_block(std::string_view text) const {
    const std::string h = head();
    const std::string m = middle();
    const std::string t = tail();

    BlockSpan span;

    span.begin = text.find(h);
    if (span.begin == std::string_view::npos) {
        throw Error(ErrorKind::AnchorNotFound, "no injected block found in target script");
    }

    span.cssBegin = span.begin + h.size();
    span.cssEnd = text.find(m, span.cssBegin);
    if (span.cssEnd == std::string_view::npos) {
        throw Error(ErrorKind::AnchorNotFound, "injected block has no end of CSS literal");
    }

    span.jsBegin = span.cssEnd + m.size();
    span.jsEnd = text.find(t, span.jsBegin);
    if (span.jsEnd == std::string_view::npos) {
        throw Error(ErrorKind::AnchorNotFound, "injected block has no " + cfg_.scriptEnd + " sentinel");
    }

    span.end = span.jsEnd + t.size();
    return span;
}

std::string InjectionEngine::replace_payload(std::string_view text, std::string_view css, std::string_view js) const {
    if (cfg_.validatePayloads) {
        validate_payload(css, js);
    }

    const BlockSpan span = locate_block(text);

    std::string out;
    out.reserve(text.size() + css.size() + js.size());
    out.append(text.substr(0, span.cssBegin));
    out.append(css);
    out.append(text.substr(span.cssEnd, span.jsBegin - span.cssEnd));
    out.append(js);
    out.append(text.substr(span.jsEnd));
    return out;
}

std::string InjectionEngine::remove_injection(std::string_view text) const {
    const BlockSpan span = locate_block(text);

    std::string out;
    out.reserve(text.size() - (span.end - span.begin));
    out.append(text.substr(0, span.begin));
    out.append(text.substr(span.end));

    logf(LogLevel::Debug, "inject", "removed %zu-byte block at byte %zu", span.end - span.begin, span.begin);
    return out;
}

} // namespace stylepatch::inject
