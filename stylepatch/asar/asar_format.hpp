#pragma once

// Electron ASAR archive format
//
// The header is framed as two Chromium pickles. All integers are u32 little-endian.
//
// Layout:
// ┌─────────────────────────────────────┐
// │ Size pickle (8 bytes)               │
// │   payload_size  : u32 = 4           │
// │   header_size   : u32 = padded + 8  │
// ├─────────────────────────────────────┤
// │ Header pickle (header_size bytes)   │
// │   payload_size  : u32 = padded + 4  │
// │   json_size     : u32               │
// │   json          : char[json_size]   │
// │   zero padding up to `padded`       │
// ├─────────────────────────────────────┤
// │ File Data (variable)                │
// │   Concatenated file contents        │
// │   (no alignment padding)            │
// └─────────────────────────────────────┘
//
// Header JSON:
//   {"files": {"<name>": <entry>, ...}}
//   directory: {"files": {...}}
//   file:      {"size": N, "offset": "N"}   (offset is a decimal string)
//   unpacked:  {"size": N, "unpacked": true}
//   link:      {"link": "relative/target"}

#include <cstddef>
#include <cstdint>

namespace stylepatch::asar {

// payload_size of the size pickle (it carries a single u32)
constexpr std::uint32_t ASAR_SIZE_PICKLE_PAYLOAD = 4;

// Size pickle: payload_size + header_size
constexpr std::size_t ASAR_SIZE_PICKLE_BYTES = 8;

// Fixed prefix before the JSON text: size pickle + header pickle payload_size + json_size
constexpr std::size_t ASAR_PREFIX_SIZE = 16;

// Header pickle payloads are padded to this boundary
constexpr std::size_t ASAR_HEADER_ALIGNMENT = 4;

// Maximum nesting of header JSON (to prevent malicious files)
constexpr std::size_t ASAR_MAX_JSON_DEPTH = 256;

inline constexpr std::size_t padded_json_size(std::size_t jsonSize) {
    return jsonSize + (ASAR_HEADER_ALIGNMENT - (jsonSize % ASAR_HEADER_ALIGNMENT)) % ASAR_HEADER_ALIGNMENT;
}

// Offset of the data section for a given JSON length.
inline constexpr std::size_t data_section_offset(std::size_t jsonSize) {
    return ASAR_PREFIX_SIZE + padded_json_size(jsonSize);
}

} // namespace stylepatch::asar
