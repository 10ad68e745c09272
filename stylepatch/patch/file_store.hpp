#pragma once

#include <cstdint>
#include <filesystem>
#include <span>
#include <string>
#include <vector>

namespace stylepatch::patch {

// Read a whole file. Throws stylepatch::Error(Io).
std::vector<std::uint8_t> read_file(const std::filesystem::path& path);

// Write `data` to a sibling temp file, flush it to disk, rename it over `path`
// and flush the directory entry. A crash leaves either the old or the new
// contents, never a mix.
// Throws stylepatch::Error(Io); the temp file is removed on failure.
void write_file_atomic(const std::filesystem::path& path, std::span<const std::uint8_t> data);

enum class BackupStatus {
    Created,
    AlreadyExists,  // an earlier backup is kept untouched
};

// Copy `original` to `backup` and flush it. An existing backup is never overwritten,
// so the first (unmodified) copy survives repeated runs.
BackupStatus create_backup(const std::filesystem::path& original, const std::filesystem::path& backup);

// Copy backup bytes back over `original` atomically. The backup itself is kept.
void restore_backup(const std::filesystem::path& backup, const std::filesystem::path& original);

// "<archive><suffix>", e.g. core.asar -> core.asar.backup
std::filesystem::path backup_path_for(const std::filesystem::path& archive, const std::string& suffix);

} // namespace stylepatch::patch
