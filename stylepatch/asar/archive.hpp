#pragma once

#include "archive_index.hpp"
#include "asar_format.hpp"

#include <cstdint>
#include <span>
#include <string>
#include <unordered_map>
#include <vector>

namespace stylepatch::asar {

// In-memory ASAR archive: header tree plus the concatenated data section.
// Decoded from and encoded to complete byte buffers; performs no I/O.
class Archive {
public:
    // Empty archive ({"files":{}}, no data).
    Archive();
    ~Archive() = default;

    // Non-copyable, movable.
    Archive(const Archive&) = delete;
    Archive& operator=(const Archive&) = delete;
    Archive(Archive&& other) noexcept;
    Archive& operator=(Archive&& other) noexcept;

    // Parse a complete archive.
    // Throws stylepatch::Error with MalformedHeader, TruncatedData or InvalidEncoding.
    static Archive decode(std::span<const std::uint8_t> bytes);

    // Serialize header and data section back to the on-disk layout. A decoded
    // header keeps its original JSON text, with only changed sizes and offsets
    // rewritten in place.
    std::vector<std::uint8_t> encode() const;

    const ArchiveHeader& header() const { return header_; }
    const std::vector<std::uint8_t>& blob() const { return blob_; }

    // File paths in declaration order (depth first).
    const std::vector<std::string>& paths() const { return paths_; }

    bool has_file(const std::string& path) const;

    // File record by slash-separated path, or nullptr.
    const FileRecord* get_record(const std::string& path) const;

    // Bytes of a packed file.
    // Throws stylepatch::Error(EntryNotFound) if missing or stored outside the archive.
    std::span<const std::uint8_t> file_bytes(const std::string& path) const;

    // Add a file, creating intermediate directories. Packed data is placed so that
    // offsets stay in declaration order.
    // @return false if the path is empty or collides with an existing entry.
    bool add_file(const std::string& path, std::span<const std::uint8_t> data, bool unpacked = false);

    // Replace the bytes of one packed file. Every record that lies after it in
    // the data section is shifted by the size difference; no other bytes change.
    // @return size difference (new - old).
    // Throws stylepatch::Error(EntryNotFound) or (MalformedHeader) on overlapping records.
    std::int64_t replace_entry(const std::string& path, std::vector<std::uint8_t> data);

    // List direct children of a directory ("" for root). Subdirectories end with '/'.
    std::vector<std::string> list_directory(const std::string& dirPath) const;

    std::uint32_t file_count() const { return static_cast<std::uint32_t>(paths_.size()); }

private:
    void rebuild_index();
    void validate_records() const;

    ArchiveHeader header_;
    std::string headerSource_;  // JSON the header was decoded from; empty once the tree is restructured
    std::vector<std::uint8_t> blob_;

    std::vector<std::string> paths_;
    std::vector<FileRecord*> records_;                        // parallel to paths_
    std::unordered_map<std::string, std::size_t> pathIndex_;  // path -> index in paths_
};

// Joins the components of `path` with '/', dropping empty and leading separators.
std::string normalize_path(const std::string& path);

} // namespace stylepatch::asar
