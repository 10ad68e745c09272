#pragma once

#include "header_json.hpp"

#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace stylepatch::asar {

// Header member the model does not interpret (e.g. "integrity", "executable").
// Written back exactly as it was read.
struct RawMember {
    std::string rawKey;
    std::string rawValue;
};

// Source order of an entry object's members, so an untouched header
// re-encodes to identical bytes.
struct MemberLayout {
    std::vector<std::string> order;  // decoded member names
    std::vector<RawMember> extra;
};

// Byte range of a value token in the header JSON it was read from.
struct TokenSpan {
    std::size_t begin{0};
    std::size_t end{0};

    bool empty() const { return begin == end; }
};

struct FileRecord {
    std::uint64_t size{0};
    std::uint64_t offset{0};  // relative to the data section; unused when unpacked
    bool unpacked{false};

    MemberLayout layout;

    // Where "size" and "offset" were read from and the values found there.
    // Empty spans for records created in memory.
    TokenSpan sizeToken;
    TokenSpan offsetToken;
    std::uint64_t sourceSize{0};
    std::uint64_t sourceOffset{0};

    std::uint64_t end() const { return offset + size; }
};

struct Link {
    std::string target;
    std::string rawTarget;  // exact source token; empty for links created in memory

    MemberLayout layout;
};

struct Entry;

struct Directory {
    std::vector<Entry> children;  // declaration order

    MemberLayout layout;

    Entry* find(std::string_view name);
    const Entry* find(std::string_view name) const;
};

struct Entry {
    std::string name;
    std::string rawName;  // exact source token; empty for entries created in memory

    std::variant<Directory, FileRecord, Link> node;

    bool is_directory() const { return std::holds_alternative<Directory>(node); }
    bool is_file() const { return std::holds_alternative<FileRecord>(node); }
    bool is_link() const { return std::holds_alternative<Link>(node); }
};

// Header root: {"files": {...}} plus any other top-level members.
using ArchiveHeader = Directory;

// Builds the header tree from parsed JSON.
// Throws stylepatch::Error(InvalidEncoding) when the structure is wrong.
ArchiveHeader header_from_json(const JsonValue& root, std::string_view source);

// Serializes the header tree as compact JSON.
std::string header_to_json(const ArchiveHeader& header);

// Rewrites `source`, the JSON `header` was decoded from, with the current size
// and offset of every record whose values changed. All other bytes, whitespace
// included, are kept.
std::string splice_header_json(std::string_view source, const ArchiveHeader& header);

// Walks every file record in declaration order, depth first.
// `path` is the slash-joined entry path.
void for_each_file(ArchiveHeader& header,
                   const std::function<void(const std::string& path, FileRecord& record)>& fn);

void for_each_file(const ArchiveHeader& header,
                   const std::function<void(const std::string& path, const FileRecord& record)>& fn);

// Resolves a slash-separated path ("app/mainScreen.js"). Leading '/' is ignored.
const Entry* find_entry(const ArchiveHeader& header, std::string_view path);
Entry* find_entry(ArchiveHeader& header, std::string_view path);

// Splits "a/b/c" into {"a", "b", "c"}, dropping empty components.
std::vector<std::string> split_path(std::string_view path);

} // namespace stylepatch::asar
