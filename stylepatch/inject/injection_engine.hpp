#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace stylepatch::inject {

// Splice-point and marker strings for one host script.
struct InjectionConfig {
    // Statement fragment that must occur exactly once in the host script.
    std::string anchor{"mainWindow.webContents."};

    // Present in the host script only after a successful injection.
    std::string guardToken{"CSS_INJECTION_USER_CSS"};

    // Expression the generated block hooks 'dom-ready' on.
    std::string windowExpr{"mainWindow.webContents"};

    std::string scriptBegin{"//JS_SCRIPT_BEGIN"};
    std::string scriptEnd{"//JS_SCRIPT_END"};

    // Reject payloads that would break out of their literal instead of trusting the caller.
    bool validatePayloads{true};
};

struct ByteRange {
    std::size_t begin{0};
    std::size_t end{0};

    std::size_t size() const { return end - begin; }
};

// Escapes text for the body of an untagged template literal:
// '\' -> '\\', '`' -> '\`', '${' -> '\${'.
std::string escape_template(std::string_view text);

// Value a template literal with this body evaluates to.
// Throws stylepatch::Error(PayloadEscapeViolation) if the body does not lex.
std::string unescape_template(std::string_view body);

// Escapes CSS for the String.raw literal nested in the block's executeJavaScript
// literal. CSS escapes such as '\f101' reach the stylesheet unchanged.
std::string escape_css(std::string_view css);

// Generates and removes the CSS/JS loader block inside a host script.
//
// Payload precondition: CSS must already be escaped with escape_css and JS with
// escape_template. Both are emitted verbatim into the block.
class InjectionEngine {
public:
    explicit InjectionEngine(InjectionConfig cfg = {});

    const InjectionConfig& config() const { return cfg_; }

    // Locate the anchor.
    // Throws stylepatch::Error(AnchorNotFound) for zero matches, (AmbiguousAnchor) for more than one.
    ByteRange find_anchor(std::string_view text) const;

    // True if the guard token is present.
    bool already_patched(std::string_view text) const;

    // Throws stylepatch::Error(PayloadEscapeViolation) if either payload would end or
    // interpolate into its literal once the block is evaluated, or if the JS
    // contains a script sentinel.
    void validate_payload(std::string_view css, std::string_view js) const;

    // Replace `anchor` with the generated block followed by the original anchor text.
    std::string inject(std::string_view text, ByteRange anchor,
                       std::string_view css, std::string_view js) const;

    // Rewrite the CSS literal and JS region of an existing block.
    // Throws stylepatch::Error(AnchorNotFound) if no complete block is present.
    std::string replace_payload(std::string_view text, std::string_view css, std::string_view js) const;

    // Remove the generated block, leaving the original host text.
    // Throws stylepatch::Error(AnchorNotFound) if no complete block is present.
    std::string remove_injection(std::string_view text) const;

    // Block text that inject() places before the anchor.
    std::string render_block(std::string_view css, std::string_view js) const;

private:
    struct BlockSpan {
        std::size_t begin{0};     // start of the block
        std::size_t cssBegin{0};
        std::size_t cssEnd{0};
        std::size_t jsBegin{0};
        std::size_t jsEnd{0};
        std::size_t end{0};       // one past the block, where the anchor text resumes
    };

    BlockSpan locate_block(std::string_view text) const;

    std::string head() const;
    std::string middle() const;
    std::string tail() const;

    InjectionConfig cfg_;
};

} // namespace stylepatch::inject
