#include "archive_index.hpp"

#include "../util/error.hpp"

#include <algorithm>
#include <limits>

namespace stylepatch::asar {

Entry* Directory::find(std::string_view name) {
    for (auto& child : children) {
        if (child.name == name) {
            return &child;
        }
    }
    return nullptr;
}

const Entry* Directory::find(std::string_view name) const {
    for (const auto& child : children) {
        if (child.name == name) {
            return &child;
        }
    }
    return nullptr;
}

namespace {

[[noreturn]] void bad_structure(const std::string& path, const std::string& what) {
    throw Error(ErrorKind::InvalidEncoding,
                "header entry '" + (path.empty() ? std::string("/") : path) + "': " + what);
}

std::string join_path(const std::string& parent, const std::string& name) {
    if (parent.empty()) return name;
    return parent + "/" + name;
}

bool parse_u64(std::string_view s, std::uint64_t* out) {
    if (s.empty()) return false;

    std::uint64_t v = 0;
    for (char c : s) {
        if (c < '0' || c > '9') return false;
        const std::uint64_t digit = static_cast<std::uint64_t>(c - '0');
        if (v > (std::numeric_limits<std::uint64_t>::max() - digit) / 10) return false;
        v = v * 10 + digit;
    }
    *out = v;
    return true;
}

RawMember raw_member(const JsonMember& m, std::string_view source) {
    RawMember raw;
    raw.rawKey = m.rawKey;
    raw.rawValue = std::string(source.substr(m.value.rawBegin, m.value.rawEnd - m.value.rawBegin));
    return raw;
}

Directory directory_from_json(const JsonValue& obj, std::string_view source, const std::string& path);

FileRecord file_from_json(const JsonValue& obj, std::string_view source, const std::string& path) {
    FileRecord rec;
    bool haveOffset = false;

    for (const auto& m : obj.members) {
        rec.layout.order.push_back(m.key);

        if (m.key == "size") {
            if (!m.value.is_number() || !parse_u64(m.value.text, &rec.size)) {
                bad_structure(path, "'size' must be a non-negative integer");
            }
            rec.sizeToken = TokenSpan{m.value.rawBegin, m.value.rawEnd};
            rec.sourceSize = rec.size;
        } else if (m.key == "offset") {
            if (!m.value.is_string()) {
                bad_structure(path, "'offset' must be a decimal string");
            }
            if (!parse_u64(m.value.text, &rec.offset)) {
                bad_structure(path, "'offset' is not a decimal integer: " + m.value.text);
            }
            rec.offsetToken = TokenSpan{m.value.rawBegin, m.value.rawEnd};
            rec.sourceOffset = rec.offset;
            haveOffset = true;
        } else if (m.key == "unpacked") {
            if (!m.value.is_bool()) {
                bad_structure(path, "'unpacked' must be a boolean");
            }
            rec.unpacked = m.value.boolValue;
        } else {
            rec.layout.extra.push_back(raw_member(m, source));
        }
    }

    if (!rec.unpacked && !haveOffset) {
        bad_structure(path, "packed file has no 'offset'");
    }

    return rec;
}

Link link_from_json(const JsonValue& obj, std::string_view source, const std::string& path) {
    Link link;

    for (const auto& m : obj.members) {
        link.layout.order.push_back(m.key);

        if (m.key == "link") {
            if (!m.value.is_string()) {
                bad_structure(path, "'link' must be a string");
            }
            link.target = m.value.text;
            link.rawTarget = std::string(source.substr(m.value.rawBegin, m.value.rawEnd - m.value.rawBegin));
        } else {
            link.layout.extra.push_back(raw_member(m, source));
        }
    }

    return link;
}

Entry entry_from_json(const JsonMember& member, std::string_view source, const std::string& parent) {
    const std::string path = join_path(parent, member.key);

    if (!member.value.is_object()) {
        bad_structure(path, "entry is not a JSON object");
    }
    if (member.key.empty() || member.key == "." || member.key == ".." ||
        member.key.find('/') != std::string::npos) {
        bad_structure(path, "invalid entry name");
    }

    Entry entry;
    entry.name = member.key;
    entry.rawName = member.rawKey;

    const JsonValue& obj = member.value;
    if (obj.find("files")) {
        entry.node = directory_from_json(obj, source, path);
    } else if (obj.find("size")) {
        entry.node = file_from_json(obj, source, path);
    } else if (obj.find("link")) {
        entry.node = link_from_json(obj, source, path);
    } else {
        bad_structure(path, "entry is neither a file, a directory nor a link");
    }

    return entry;
}

Directory directory_from_json(const JsonValue& obj, std::string_view source, const std::string& path) {
    Directory dir;

    for (const auto& m : obj.members) {
        dir.layout.order.push_back(m.key);

        if (m.key == "files") {
            if (!m.value.is_object()) {
                bad_structure(path, "'files' must be an object");
            }
            dir.children.reserve(m.value.members.size());
            for (const auto& child : m.value.members) {
                if (dir.find(child.key)) {
                    bad_structure(join_path(path, child.key), "duplicate entry name");
                }
                dir.children.push_back(entry_from_json(child, source, path));
            }
        } else {
            dir.layout.extra.push_back(raw_member(m, source));
        }
    }

    return dir;
}

// Emits members in `layout.order`; names the model does not own come from `extra` in sequence.
template <typename EmitKnown>
void write_members(std::string& out,
                   const MemberLayout& layout,
                   const std::vector<std::string>& defaultOrder,
                   EmitKnown&& emitKnown) {
    const std::vector<std::string>& order = layout.order.empty() ? defaultOrder : layout.order;

    out.push_back('{');

    std::size_t nextExtra = 0;
    bool first = true;
    for (const auto& name : order) {
        if (!first) out.push_back(',');

        if (!emitKnown(name)) {
            if (nextExtra >= layout.extra.size()) {
                throw Error(ErrorKind::MalformedHeader, "header member layout is inconsistent at '" + name + "'");
            }
            const RawMember& raw = layout.extra[nextExtra++];
            out += raw.rawKey;
            out.push_back(':');
            out += raw.rawValue;
        }
        first = false;
    }

    out.push_back('}');
}

void write_directory(std::string& out, const Directory& dir);

void write_entry(std::string& out, const Entry& entry) {
    out += entry.rawName.empty() ? quote_json_string(entry.name) : entry.rawName;
    out.push_back(':');

    if (const auto* dir = std::get_if<Directory>(&entry.node)) {
        write_directory(out, *dir);
    } else if (const auto* rec = std::get_if<FileRecord>(&entry.node)) {
        static const std::vector<std::string> kPackedOrder{"size", "offset"};
        static const std::vector<std::string> kUnpackedOrder{"size", "unpacked"};

        write_members(out, rec->layout, rec->unpacked ? kUnpackedOrder : kPackedOrder,
                      [&](const std::string& name) {
                          if (name == "size") {
                              out += "\"size\":" + std::to_string(rec->size);
                          } else if (name == "offset") {
                              out += "\"offset\":\"" + std::to_string(rec->offset) + "\"";
                          } else if (name == "unpacked") {
                              out += rec->unpacked ? "\"unpacked\":true" : "\"unpacked\":false";
                          } else {
                              return false;
                          }
                          return true;
                      });
    } else {
        const auto& link = std::get<Link>(entry.node);
        static const std::vector<std::string> kLinkOrder{"link"};

        write_members(out, link.layout, kLinkOrder, [&](const std::string& name) {
            if (name != "link") return false;
            out += "\"link\":";
            out += link.rawTarget.empty() ? quote_json_string(link.target) : link.rawTarget;
            return true;
        });
    }
}

void write_directory(std::string& out, const Directory& dir) {
    static const std::vector<std::string> kDirOrder{"files"};

    write_members(out, dir.layout, kDirOrder, [&](const std::string& name) {
        if (name != "files") return false;

        out += "\"files\":{";
        bool first = true;
        for (const auto& child : dir.children) {
            if (!first) out.push_back(',');
            write_entry(out, child);
            first = false;
        }
        out.push_back('}');
        return true;
    });
}

template <typename DirT, typename Fn>
void walk_files(DirT& dir, const std::string& prefix, const Fn& fn) {
    for (auto& child : dir.children) {
        const std::string path = join_path(prefix, child.name);
        if (auto* sub = std::get_if<Directory>(&child.node)) {
            walk_files(*sub, path, fn);
        } else if (auto* rec = std::get_if<FileRecord>(&child.node)) {
            fn(path, *rec);
        }
    }
}

template <typename DirT>
auto find_entry_impl(DirT& header, std::string_view path) -> decltype(header.find(path)) {
    const std::vector<std::string> parts = split_path(path);
    if (parts.empty()) return nullptr;

    DirT* dir = &header;
    for (std::size_t i = 0; i < parts.size(); ++i) {
        auto* entry = dir->find(parts[i]);
        if (!entry) return nullptr;
        if (i + 1 == parts.size()) return entry;

        dir = std::get_if<Directory>(&entry->node);
        if (!dir) return nullptr;
    }
    return nullptr;
}

} // namespace

ArchiveHeader header_from_json(const JsonValue& root, std::string_view source) {
    if (!root.is_object()) {
        throw Error(ErrorKind::InvalidEncoding, "header JSON root is not an object");
    }

    const JsonValue* files = root.find("files");
    if (!files || !files->is_object()) {
        throw Error(ErrorKind::InvalidEncoding, "header JSON has no 'files' object");
    }

    return directory_from_json(root, source, "");
}

std::string header_to_json(const ArchiveHeader& header) {
    std::string out;
    write_directory(out, header);
    return out;
}

std::string splice_header_json(std::string_view source, const ArchiveHeader& header) {
    struct Edit {
        TokenSpan at;
        std::string text;
    };
    std::vector<Edit> edits;

    for_each_file(header, [&](const std::string& path, const FileRecord& rec) {
        if (rec.size != rec.sourceSize) {
            if (rec.sizeToken.empty()) {
                throw Error(ErrorKind::MalformedHeader, "record '" + path + "' has no size token to rewrite");
            }
            edits.push_back(Edit{rec.sizeToken, std::to_string(rec.size)});
        }
        if (rec.offset != rec.sourceOffset) {
            if (rec.offsetToken.empty()) {
                throw Error(ErrorKind::MalformedHeader, "record '" + path + "' has no offset token to rewrite");
            }
            edits.push_back(Edit{rec.offsetToken, "\"" + std::to_string(rec.offset) + "\""});
        }
    });

    std::sort(edits.begin(), edits.end(), [](const Edit& a, const Edit& b) { return a.at.begin < b.at.begin; });

    std::string out;
    out.reserve(source.size() + edits.size() * 4);
    std::size_t pos = 0;
    for (const auto& edit : edits) {
        if (edit.at.begin < pos || edit.at.end > source.size()) {
            throw Error(ErrorKind::MalformedHeader, "header value tokens overlap");
        }
        out.append(source.substr(pos, edit.at.begin - pos));
        out += edit.text;
        pos = edit.at.end;
    }
    out.append(source.substr(pos));
    return out;
}

void for_each_file(ArchiveHeader& header,
                   const std::function<void(const std::string& path, FileRecord& record)>& fn) {
    walk_files(header, std::string{}, fn);
}

void for_each_file(const ArchiveHeader& header,
                   const std::function<void(const std::string& path, const FileRecord& record)>& fn) {
    walk_files(header, std::string{}, fn);
}

const Entry* find_entry(const ArchiveHeader& header, std::string_view path) {
    return find_entry_impl(header, path);
}

Entry* find_entry(ArchiveHeader& header, std::string_view path) {
    return find_entry_impl(header, path);
}

std::vector<std::string> split_path(std::string_view path) {
    std::vector<std::string> parts;

    std::size_t start = 0;
    while (start <= path.size()) {
        std::size_t slash = path.find('/', start);
        if (slash == std::string_view::npos) slash = path.size();

        if (slash > start) {
            parts.emplace_back(path.substr(start, slash - start));
        }
        start = slash + 1;
    }

    return parts;
}

} // namespace stylepatch::asar
