#include "archive.hpp"

#include "../util/byte_buffer.hpp"
#include "../util/error.hpp"
#include "../util/log.hpp"

#include <algorithm>
#include <limits>
#include <string_view>

namespace stylepatch::asar {

using util::LogLevel;
using util::logf;

std::string normalize_path(const std::string& path) {
    std::string out;
    for (const auto& part : split_path(path)) {
        if (!out.empty()) out.push_back('/');
        out += part;
    }
    return out;
}

Archive::Archive() {
    header_.layout.order.push_back("files");
}

Archive::Archive(Archive&& other) noexcept = default;
Archive& Archive::operator=(Archive&& other) noexcept = default;

Archive Archive::decode(std::span<const std::uint8_t> bytes) {
    if (bytes.size() < ASAR_PREFIX_SIZE) {
        throw Error(ErrorKind::MalformedHeader,
                    "archive is " + std::to_string(bytes.size()) + " bytes, smaller than the " +
                    std::to_string(ASAR_PREFIX_SIZE) + "-byte size prefix");
    }

    util::ByteReader reader(bytes);

    const std::uint32_t sizePayload = reader.read_u32();
    const std::uint32_t headerSize = reader.read_u32();
    const std::uint32_t headerPayload = reader.read_u32();
    const std::uint32_t jsonSize = reader.read_u32();

    if (sizePayload != ASAR_SIZE_PICKLE_PAYLOAD) {
        throw Error(ErrorKind::MalformedHeader,
                    "size pickle payload is " + std::to_string(sizePayload) + ", expected 4");
    }

    const std::size_t padded = padded_json_size(jsonSize);
    if (static_cast<std::uint64_t>(headerPayload) != static_cast<std::uint64_t>(padded) + 4 ||
        static_cast<std::uint64_t>(headerSize) != static_cast<std::uint64_t>(padded) + ASAR_SIZE_PICKLE_BYTES) {
        throw Error(ErrorKind::MalformedHeader,
                    "header pickle sizes disagree (header=" + std::to_string(headerSize) +
                    " payload=" + std::to_string(headerPayload) + " json=" + std::to_string(jsonSize) + ")");
    }

    if (reader.remaining() < padded) {
        throw Error(ErrorKind::TruncatedData,
                    "header JSON needs " + std::to_string(padded) + " bytes, archive has " +
                    std::to_string(reader.remaining()) + " after the prefix");
    }

    const auto jsonBytes = reader.read_bytes(jsonSize);
    reader.skip(padded - jsonSize);

    const std::string_view jsonText(reinterpret_cast<const char*>(jsonBytes.data()), jsonBytes.size());
    const JsonValue root = parse_json(jsonText);

    Archive archive;
    archive.header_ = header_from_json(root, jsonText);
    archive.headerSource_.assign(jsonText);

    const auto data = reader.read_bytes(reader.remaining());
    archive.blob_.assign(data.begin(), data.end());

    archive.rebuild_index();
    archive.validate_records();

    logf(LogLevel::Debug, "asar", "decoded %zu files, header %u bytes, data %zu bytes",
         archive.paths_.size(), jsonSize, archive.blob_.size());

    return archive;
}

std::vector<std::uint8_t> Archive::encode() const {
    const std::string json = headerSource_.empty() ? header_to_json(header_)
                                                   : splice_header_json(headerSource_, header_);
    const std::size_t padded = padded_json_size(json.size());

    if (padded + ASAR_SIZE_PICKLE_BYTES > std::numeric_limits<std::uint32_t>::max()) {
        throw Error(ErrorKind::MalformedHeader, "header JSON is too large for the pickle prefix");
    }

    util::ByteWriter writer(data_section_offset(json.size()) + blob_.size());
    writer.write_u32(ASAR_SIZE_PICKLE_PAYLOAD);
    writer.write_u32(static_cast<std::uint32_t>(padded + ASAR_SIZE_PICKLE_BYTES));
    writer.write_u32(static_cast<std::uint32_t>(padded + 4));
    writer.write_u32(static_cast<std::uint32_t>(json.size()));
    writer.write_text(json);
    writer.pad_to(ASAR_HEADER_ALIGNMENT);
    writer.write_bytes(blob_);

    return writer.take();
}

bool Archive::has_file(const std::string& path) const {
    return pathIndex_.find(normalize_path(path)) != pathIndex_.end();
}

const FileRecord* Archive::get_record(const std::string& path) const {
    auto it = pathIndex_.find(normalize_path(path));
    if (it == pathIndex_.end()) {
        return nullptr;
    }
    return records_[it->second];
}

std::span<const std::uint8_t> Archive::file_bytes(const std::string& path) const {
    const FileRecord* rec = get_record(path);
    if (!rec) {
        throw Error(ErrorKind::EntryNotFound, "no file '" + path + "' in archive");
    }
    if (rec->unpacked) {
        throw Error(ErrorKind::EntryNotFound, "file '" + path + "' is stored outside the archive");
    }

    return std::span<const std::uint8_t>(blob_).subspan(static_cast<std::size_t>(rec->offset),
                                                        static_cast<std::size_t>(rec->size));
}

bool Archive::add_file(const std::string& path, std::span<const std::uint8_t> data, bool unpacked) {
    const std::vector<std::string> parts = split_path(path);
    if (parts.empty()) {
        return false;
    }

    Directory* dir = &header_;
    for (std::size_t i = 0; i + 1 < parts.size(); ++i) {
        Entry* child = dir->find(parts[i]);
        if (!child) {
            Entry sub;
            sub.name = parts[i];
            sub.node = Directory{};
            dir->children.push_back(std::move(sub));
            child = &dir->children.back();
        }

        dir = std::get_if<Directory>(&child->node);
        if (!dir) {
            return false;
        }
    }

    if (dir->find(parts.back())) {
        return false;
    }

    Entry entry;
    entry.name = parts.back();
    FileRecord rec;
    rec.size = data.size();
    rec.unpacked = unpacked;
    entry.node = std::move(rec);
    dir->children.push_back(std::move(entry));

    // The decoded JSON text no longer describes the tree.
    headerSource_.clear();
    rebuild_index();

    if (unpacked) {
        return true;
    }

    // Place the bytes before the first packed record declared after the new one.
    const std::string key = normalize_path(path);
    const std::size_t ordinal = pathIndex_.at(key);
    FileRecord* added = records_[ordinal];

    std::uint64_t insertAt = blob_.size();
    for (std::size_t i = ordinal + 1; i < records_.size(); ++i) {
        if (!records_[i]->unpacked) {
            insertAt = std::min(insertAt, records_[i]->offset);
        }
    }

    for (std::size_t i = ordinal + 1; i < records_.size(); ++i) {
        if (!records_[i]->unpacked) {
            records_[i]->offset += data.size();
        }
    }

    added->offset = insertAt;
    blob_.insert(blob_.begin() + static_cast<std::ptrdiff_t>(insertAt), data.begin(), data.end());
    return true;
}

std::int64_t Archive::replace_entry(const std::string& path, std::vector<std::uint8_t> data) {
    auto it = pathIndex_.find(normalize_path(path));
    if (it == pathIndex_.end()) {
        throw Error(ErrorKind::EntryNotFound, "no file '" + path + "' in archive");
    }

    const std::size_t ordinal = it->second;
    FileRecord* target = records_[ordinal];
    if (target->unpacked) {
        throw Error(ErrorKind::EntryNotFound, "file '" + path + "' is stored outside the archive");
    }

    if (std::find(target->layout.order.begin(), target->layout.order.end(), "integrity") !=
        target->layout.order.end()) {
        logf(LogLevel::Warning, "asar",
             "'%s' carries an integrity hash that will not match the new content; "
             "hosts that verify archive integrity will refuse to load it",
             paths_[ordinal].c_str());
    }

    const std::uint64_t oldOffset = target->offset;
    const std::uint64_t oldEnd = target->end();
    const std::int64_t delta = static_cast<std::int64_t>(data.size()) - static_cast<std::int64_t>(target->size);

    // Decide which records move before touching any of them.
    std::vector<FileRecord*> shifted;
    for (std::size_t i = 0; i < records_.size(); ++i) {
        FileRecord* r = records_[i];
        if (i == ordinal || r->unpacked) continue;

        const bool overlaps = (r->size > 0 && target->size > 0 && r->offset < oldEnd && r->end() > oldOffset) ||
                              (r->offset > oldOffset && r->offset < oldEnd);
        if (overlaps) {
            throw Error(ErrorKind::MalformedHeader,
                        "file '" + paths_[i] + "' overlaps '" + paths_[ordinal] + "' in the data section");
        }

        if (r->offset > oldOffset || (r->offset == oldOffset && i > ordinal)) {
            shifted.push_back(r);
        }
    }

    std::vector<std::uint8_t> blob;
    blob.reserve(static_cast<std::size_t>(static_cast<std::int64_t>(blob_.size()) + delta));
    blob.insert(blob.end(), blob_.begin(), blob_.begin() + static_cast<std::ptrdiff_t>(oldOffset));
    blob.insert(blob.end(), data.begin(), data.end());
    blob.insert(blob.end(), blob_.begin() + static_cast<std::ptrdiff_t>(oldEnd), blob_.end());
    blob_ = std::move(blob);

    target->size = data.size();
    for (FileRecord* r : shifted) {
        r->offset = static_cast<std::uint64_t>(static_cast<std::int64_t>(r->offset) + delta);
    }

    logf(LogLevel::Debug, "asar", "replaced %s (%llu -> %zu bytes), shifted %zu records",
         paths_[ordinal].c_str(), static_cast<unsigned long long>(oldEnd - oldOffset),
         data.size(), shifted.size());

    return delta;
}

std::vector<std::string> Archive::list_directory(const std::string& dirPath) const {
    std::vector<std::string> result;

    const Directory* dir = &header_;
    if (!split_path(dirPath).empty()) {
        const Entry* entry = find_entry(header_, dirPath);
        if (!entry) {
            return result;
        }
        dir = std::get_if<Directory>(&entry->node);
        if (!dir) {
            return result;
        }
    }

    for (const auto& child : dir->children) {
        result.push_back(child.is_directory() ? child.name + "/" : child.name);
    }

    std::sort(result.begin(), result.end());
    return result;
}

void Archive::rebuild_index() {
    paths_.clear();
    records_.clear();
    pathIndex_.clear();

    for_each_file(header_, [this](const std::string& path, FileRecord& record) {
        pathIndex_[path] = paths_.size();
        paths_.push_back(path);
        records_.push_back(&record);
    });
}

void Archive::validate_records() const {
    for (std::size_t i = 0; i < records_.size(); ++i) {
        const FileRecord* r = records_[i];
        if (r->unpacked) continue;

        if (r->offset > blob_.size() || r->size > blob_.size() - r->offset) {
            throw Error(ErrorKind::TruncatedData,
                        "file '" + paths_[i] + "' spans bytes " + std::to_string(r->offset) + ".." +
                        std::to_string(r->offset + r->size) + " but the data section has " +
                        std::to_string(blob_.size()));
        }
    }
}

} // namespace stylepatch::asar
