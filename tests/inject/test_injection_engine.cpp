#include <catch2/catch.hpp>

#include "inject/injection_engine.hpp"
#include "util/error.hpp"

#include "../helpers/asar_fixtures.hpp"

#include <functional>
#include <string>

using stylepatch::Error;
using stylepatch::ErrorKind;
using stylepatch::inject::ByteRange;
using stylepatch::inject::InjectionConfig;
using stylepatch::inject::InjectionEngine;
using stylepatch::inject::escape_css;
using stylepatch::inject::escape_template;
using stylepatch::inject::unescape_template;
using test_helpers::host_script;

namespace {

ErrorKind error_of(const std::function<void()>& fn) {
    try {
        fn();
    } catch (const Error& e) {
        return e.kind();
    }
    FAIL("expected stylepatch::Error");
    return ErrorKind::Io;
}

std::size_t count_of(const std::string& text, const std::string& needle) {
    std::size_t n = 0;
    for (std::size_t pos = text.find(needle); pos != std::string::npos; pos = text.find(needle, pos + 1)) {
        ++n;
    }
    return n;
}

} // namespace

TEST_CASE("escape_template escapes template literal metacharacters", "[inject][escape]") {
    REQUIRE(escape_template("console.log('hi');") == "console.log('hi');");
    REQUIRE(escape_template("let a = `${b}`;") == "let a = \\`\\${b}\\`;");
    REQUIRE(escape_template("a\\b $c") == "a\\\\b $c");
    REQUIRE(escape_template("") == "");

    REQUIRE(unescape_template(escape_template("let a = `${b}`;\\n")) == "let a = `${b}`;\\n");
}

TEST_CASE("unescape_template follows template literal escapes", "[inject][escape]") {
    REQUIRE(unescape_template("a\\tb\\nc") == "a\tb\nc");
    REQUIRE(unescape_template("\\x41\\u0042\\u{43}") == "ABC");
    REQUIRE(unescape_template("\\uD83D\\uDE00") == "\xf0\x9f\x98\x80");
    REQUIRE(unescape_template("one\\\ntwo") == "onetwo");
    REQUIRE(unescape_template("\\0") == std::string(1, '\0'));
    REQUIRE(unescape_template("\\q\\'") == "q'");

    REQUIRE(error_of([] { (void)unescape_template("\\u00zz"); }) == ErrorKind::PayloadEscapeViolation);
    REQUIRE(error_of([] { (void)unescape_template("\\x4"); }) == ErrorKind::PayloadEscapeViolation);
    REQUIRE(error_of([] { (void)unescape_template("\\1"); }) == ErrorKind::PayloadEscapeViolation);
    REQUIRE(error_of([] { (void)unescape_template("\\01"); }) == ErrorKind::PayloadEscapeViolation);
    REQUIRE(error_of([] { (void)unescape_template("\\u{110000}"); }) == ErrorKind::PayloadEscapeViolation);
    REQUIRE(error_of([] { (void)unescape_template("tail\\"); }) == ErrorKind::PayloadEscapeViolation);
}

TEST_CASE("escape_css escapes for both literal levels", "[inject][escape]") {
    REQUIRE(escape_css("body { color: red; }") == "body { color: red; }");
    REQUIRE(escape_css("a\\b") == "a\\\\b");
    REQUIRE(escape_css("content: `x`;") == "content: \\\\\\`x\\\\\\`;");
    REQUIRE(escape_css("${x} $y") == "\\\\\\${x} $y");
    REQUIRE(escape_css("a\\") == "a\\\\\\\\");
    REQUIRE(escape_css("") == "");

    SECTION("The String.raw literal sees CSS escapes") {
        // After the outer literal is evaluated the inner literal reads \` as a
        // CSS-escaped backtick and \f101 as an icon code point.
        REQUIRE(unescape_template(escape_css("content:'`'")) == "content:'\\`'");
        REQUIRE(unescape_template(escape_css(".i::before { content: '\\f101'; }")) ==
                ".i::before { content: '\\f101'; }");
        REQUIRE(unescape_template(escape_css("a\\")) == "a\\\\");
    }
}

TEST_CASE("InjectionEngine find_anchor", "[inject][anchor]") {
    const InjectionEngine engine;

    SECTION("Single occurrence") {
        const std::string text = host_script();
        const ByteRange r = engine.find_anchor(text);
        REQUIRE(text.substr(r.begin, r.size()) == "mainWindow.webContents.");
        REQUIRE(r.begin == text.find("mainWindow.webContents."));
    }

    SECTION("Missing anchor") {
        REQUIRE(error_of([&] { (void)engine.find_anchor("console.log('hi');"); }) == ErrorKind::AnchorNotFound);
    }

    SECTION("Two occurrences") {
        const std::string text = host_script() + "mainWindow.webContents.openDevTools();\n";
        REQUIRE(error_of([&] { (void)engine.find_anchor(text); }) == ErrorKind::AmbiguousAnchor);
    }

    SECTION("Overlapping occurrences count as two") {
        InjectionConfig cfg;
        cfg.anchor = "aa";
        const InjectionEngine overlapping(cfg);
        REQUIRE(error_of([&] { (void)overlapping.find_anchor("xaaay"); }) == ErrorKind::AmbiguousAnchor);
    }

    SECTION("Empty anchor") {
        InjectionConfig cfg;
        cfg.anchor.clear();
        const InjectionEngine empty(cfg);
        REQUIRE(error_of([&] { (void)empty.find_anchor("anything"); }) == ErrorKind::AnchorNotFound);
    }
}

TEST_CASE("InjectionEngine inject places the block before the anchor", "[inject]") {
    const InjectionEngine engine;
    const std::string text = host_script();
    const ByteRange anchor = engine.find_anchor(text);

    const std::string css = "body { background: #000; }";
    const std::string js = "console.log('themed');";
    const std::string out = engine.inject(text, anchor, css, js);

    const std::string block = engine.render_block(css, js);
    REQUIRE(out == text.substr(0, anchor.begin) + block + text.substr(anchor.begin));
    REQUIRE(out.size() == text.size() + block.size());

    SECTION("Block contents") {
        REQUIRE(engine.already_patched(out));
        REQUIRE_FALSE(engine.already_patched(text));

        REQUIRE(block.find("mainWindow.webContents.on('dom-ready'") != std::string::npos);
        REQUIRE(block.find("mainWindow.webContents.executeJavaScript(`") != std::string::npos);
        REQUIRE(block.find("let CSS_INJECTION_USER_CSS = String.raw \\`" + css + "\\`;") != std::string::npos);
        REQUIRE(block.find("//JS_SCRIPT_BEGIN\n" + js + "\n") != std::string::npos);
        REQUIRE(block.find("//JS_SCRIPT_END") != std::string::npos);
        REQUIRE(block.find("document.head.appendChild(style);") != std::string::npos);
    }

    SECTION("Original anchor statement follows the block") {
        const std::size_t blockEnd = anchor.begin + block.size();
        REQUIRE(out.compare(blockEnd, anchor.size(), "mainWindow.webContents.") == 0);
        REQUIRE(count_of(out, "//JS_SCRIPT_BEGIN") == 1);
    }

    SECTION("Anchor range outside the text") {
        REQUIRE(error_of([&] { (void)engine.inject("short", ByteRange{2, 40}, css, js); }) ==
                ErrorKind::AnchorNotFound);
    }
}

TEST_CASE("InjectionEngine validates payloads", "[inject][validate]") {
    const InjectionEngine engine;

    SECTION("Escaped payloads are accepted") {
        const std::string css = escape_css("a { content: `x` } q::after { content: '${process.pid}' } \\");
        REQUIRE_NOTHROW(engine.validate_payload(css, escape_template("let a = `${b}`; x\\")));
        REQUIRE_NOTHROW(engine.validate_payload(escape_css(".i { content: '\\f101'; }"), ""));
    }

    SECTION("Bare backtick in CSS") {
        REQUIRE(error_of([&] { engine.validate_payload("a`b", ""); }) == ErrorKind::PayloadEscapeViolation);
    }

    SECTION("Bare placeholder in CSS") {
        REQUIRE(error_of([&] { engine.validate_payload("a ${b}", ""); }) == ErrorKind::PayloadEscapeViolation);
    }

    SECTION("Backtick after an escaped backslash") {
        REQUIRE(error_of([&] { engine.validate_payload("a\\\\`b", ""); }) == ErrorKind::PayloadEscapeViolation);
    }

    SECTION("CSS escaped for one literal level only") {
        // One backslash is consumed by executeJavaScript's literal, leaving a bare
        // backtick or placeholder in the String.raw literal.
        REQUIRE(error_of([&] { engine.validate_payload("content:'\\`'", ""); }) ==
                ErrorKind::PayloadEscapeViolation);
        REQUIRE(error_of([&] { engine.validate_payload("content:'\\${process.pid}'", ""); }) ==
                ErrorKind::PayloadEscapeViolation);
        REQUIRE(error_of([&] { engine.validate_payload("a\\\\", ""); }) == ErrorKind::PayloadEscapeViolation);
    }

    SECTION("CSS with an escape the outer literal cannot lex") {
        REQUIRE(error_of([&] { engine.validate_payload("content:'\\u00zz'", ""); }) ==
                ErrorKind::PayloadEscapeViolation);
        REQUIRE(error_of([&] { engine.validate_payload("a\\", ""); }) == ErrorKind::PayloadEscapeViolation);
    }

    SECTION("Unescaped JS") {
        REQUIRE(error_of([&] { engine.validate_payload("", "let a = `${b}`;"); }) ==
                ErrorKind::PayloadEscapeViolation);
        REQUIRE(error_of([&] { engine.validate_payload("", "let a = '${b}';"); }) ==
                ErrorKind::PayloadEscapeViolation);
        REQUIRE(error_of([&] { engine.validate_payload("", "x\\"); }) == ErrorKind::PayloadEscapeViolation);
    }

    SECTION("JS containing a sentinel") {
        REQUIRE(error_of([&] { engine.validate_payload("", "x();\n//JS_SCRIPT_END\n"); }) ==
                ErrorKind::PayloadEscapeViolation);
    }

    SECTION("inject refuses unsafe CSS") {
        const std::string text = host_script();
        const ByteRange anchor = engine.find_anchor(text);
        REQUIRE(error_of([&] { (void)engine.inject(text, anchor, "`", ""); }) == ErrorKind::PayloadEscapeViolation);
    }

    SECTION("Validation can be switched off") {
        InjectionConfig cfg;
        cfg.validatePayloads = false;
        const InjectionEngine trusting(cfg);

        const std::string text = host_script();
        REQUIRE_NOTHROW(trusting.inject(text, trusting.find_anchor(text), "`", ""));
    }
}

TEST_CASE("InjectionEngine replace_payload rewrites only the payload", "[inject][update]") {
    const InjectionEngine engine;
    const std::string text = host_script();
    const std::string patched = engine.inject(text, engine.find_anchor(text), "old { }", "old();");

    const std::string updated = engine.replace_payload(patched, "new { color: blue; }", "");
    REQUIRE(updated == engine.inject(text, engine.find_anchor(text), "new { color: blue; }", ""));
    REQUIRE(updated.find("old") == std::string::npos);

    REQUIRE(error_of([&] { (void)engine.replace_payload(text, "x", ""); }) == ErrorKind::AnchorNotFound);
    REQUIRE(error_of([&] { (void)engine.replace_payload(patched, "`", ""); }) == ErrorKind::PayloadEscapeViolation);
}

TEST_CASE("InjectionEngine remove_injection restores the host text", "[inject][remove]") {
    const InjectionEngine engine;
    const std::string text = host_script();
    const std::string patched = engine.inject(text, engine.find_anchor(text), "a { }", "b();");

    REQUIRE(engine.remove_injection(patched) == text);
    REQUIRE(error_of([&] { (void)engine.remove_injection(text); }) == ErrorKind::AnchorNotFound);

    SECTION("Truncated block") {
        const std::string broken = patched.substr(0, patched.find("//JS_SCRIPT_END"));
        REQUIRE(error_of([&] { (void)engine.remove_injection(broken); }) == ErrorKind::AnchorNotFound);
    }
}

TEST_CASE("InjectionEngine honours configured markers", "[inject][config]") {
    InjectionConfig cfg;
    cfg.anchor = "win.on('ready'";
    cfg.guardToken = "MY_THEME_CSS";
    cfg.windowExpr = "win.webContents";
    cfg.scriptBegin = "/*BEGIN*/";
    cfg.scriptEnd = "/*END*/";
    const InjectionEngine engine(cfg);

    const std::string text = "const win = make();\nwin.on('ready', go);\n";
    const std::string out = engine.inject(text, engine.find_anchor(text), "p { }", "");

    REQUIRE(out.find("win.webContents.on('dom-ready'") != std::string::npos);
    REQUIRE(out.find("let MY_THEME_CSS = String.raw") != std::string::npos);
    REQUIRE(out.find("/*BEGIN*/") != std::string::npos);
    REQUIRE(engine.already_patched(out));
    REQUIRE(engine.remove_injection(out) == text);
}
