#pragma once

#include "file_store.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace stylepatch::patch {

struct SemVer {
    std::uint64_t major{0};
    std::uint64_t minor{0};
    std::uint64_t patch{0};
    std::vector<std::string> prerelease;  // dot-separated identifiers after '-'
};

// Parses "MAJOR.MINOR.PATCH[-pre][+build]". Build metadata is dropped.
std::optional<SemVer> parse_semver(std::string_view text);

// Semantic-version precedence: negative, zero or positive.
int compare_semver(const SemVer& a, const SemVer& b);

// Where the host keeps its versioned app directories, core archive and icon.
struct InstallLayout {
    std::string versionPrefix{"app-"};
    std::string coreModulePath{"modules/discord_desktop_core-1/discord_desktop_core"};
    std::string archiveName{"core.asar"};
#if defined(_WIN32)
    std::string iconName{"app.ico"};
#else
    std::string iconName{"discord.png"};
#endif
    std::string iconBackupName{"icon-backup"};
};

// %LOCALAPPDATA%\Discord on Windows, /Library/Application Support/Discord on
// macOS. Empty where installs have no fixed location.
std::filesystem::path default_install_root();

// Highest-versioned subdirectory of `root`. Names are read as versions after
// stripping the layout's prefix; prefixed names rank above bare ones.
// Throws stylepatch::Error(Io) if `root` cannot be listed, (EntryNotFound) if no
// subdirectory carries a version.
std::filesystem::path find_version_dir(const std::filesystem::path& root, const InstallLayout& layout);

// <latest version dir>/<coreModulePath>/<archiveName>
std::filesystem::path core_archive_path(const std::filesystem::path& root, const InstallLayout& layout);

// Backs the icon up to <root>/<iconBackupName> unless a backup exists, then
// writes `icon` over it. Throws stylepatch::Error(Io).
BackupStatus replace_icon(const std::filesystem::path& root,
                          std::span<const std::uint8_t> icon,
                          const InstallLayout& layout);

// Copies the icon backup back. Throws stylepatch::Error(Io) if there is none.
void restore_icon(const std::filesystem::path& root, const InstallLayout& layout);

} // namespace stylepatch::patch
