#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <string_view>

namespace stylepatch::util {

// Strict UTF-8 check: rejects overlong forms, surrogates and code points above U+10FFFF.
bool is_valid_utf8(std::span<const std::uint8_t> bytes);
bool is_valid_utf8(std::string_view text);

// Append the UTF-8 encoding of `cp` to `out`. Returns false for surrogates and out-of-range values.
bool append_utf8(std::string& out, std::uint32_t cp);

} // namespace stylepatch::util
