#include "install_layout.hpp"

#include "../util/error.hpp"
#include "../util/log.hpp"

#include <cstdlib>
#include <system_error>

namespace stylepatch::patch {

namespace fs = std::filesystem;

using util::LogLevel;
using util::logf;

namespace {

bool is_numeric(std::string_view s) {
    if (s.empty()) return false;
    for (char c : s) {
        if (c < '0' || c > '9') return false;
    }
    return true;
}

bool is_identifier(std::string_view s) {
    if (s.empty()) return false;
    for (char c : s) {
        const bool ok = (c >= '0' && c <= '9') || (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '-';
        if (!ok) return false;
    }
    return true;
}

// Digits without a leading zero ("0" itself is fine).
bool parse_component(std::string_view s, std::uint64_t& out) {
    if (!is_numeric(s) || (s.size() > 1 && s[0] == '0') || s.size() > 19) {
        return false;
    }
    out = 0;
    for (char c : s) {
        out = out * 10 + static_cast<std::uint64_t>(c - '0');
    }
    return true;
}

std::vector<std::string_view> split_dots(std::string_view s) {
    std::vector<std::string_view> parts;
    std::size_t start = 0;
    for (;;) {
        const std::size_t dot = s.find('.', start);
        if (dot == std::string_view::npos) {
            parts.push_back(s.substr(start));
            return parts;
        }
        parts.push_back(s.substr(start, dot - start));
        start = dot + 1;
    }
}

int compare_identifier(const std::string& a, const std::string& b) {
    const bool aNum = is_numeric(a);
    const bool bNum = is_numeric(b);
    if (aNum && bNum) {
        if (a.size() != b.size()) return a.size() < b.size() ? -1 : 1;
        return a.compare(b);
    }
    if (aNum != bNum) {
        return aNum ? -1 : 1;
    }
    return a.compare(b);
}

} // namespace

std::optional<SemVer> parse_semver(std::string_view text) {
    const std::size_t plus = text.find('+');
    if (plus != std::string_view::npos) {
        for (std::string_view id : split_dots(text.substr(plus + 1))) {
            if (!is_identifier(id)) return std::nullopt;
        }
        text = text.substr(0, plus);
    }

    std::string_view pre;
    const std::size_t dash = text.find('-');
    if (dash != std::string_view::npos) {
        pre = text.substr(dash + 1);
        text = text.substr(0, dash);
        if (pre.empty()) return std::nullopt;
    }

    const std::vector<std::string_view> core = split_dots(text);
    if (core.size() != 3) return std::nullopt;

    SemVer v;
    if (!parse_component(core[0], v.major) || !parse_component(core[1], v.minor) ||
        !parse_component(core[2], v.patch)) {
        return std::nullopt;
    }

    if (dash != std::string_view::npos) {
        for (std::string_view id : split_dots(pre)) {
            if (!is_identifier(id) || (is_numeric(id) && id.size() > 1 && id[0] == '0')) {
                return std::nullopt;
            }
            v.prerelease.emplace_back(id);
        }
    }

    return v;
}

int compare_semver(const SemVer& a, const SemVer& b) {
    if (a.major != b.major) return a.major < b.major ? -1 : 1;
    if (a.minor != b.minor) return a.minor < b.minor ? -1 : 1;
    if (a.patch != b.patch) return a.patch < b.patch ? -1 : 1;

    // A release ranks above any of its pre-releases.
    if (a.prerelease.empty() || b.prerelease.empty()) {
        if (a.prerelease.empty() == b.prerelease.empty()) return 0;
        return a.prerelease.empty() ? 1 : -1;
    }

    for (std::size_t i = 0; i < a.prerelease.size() && i < b.prerelease.size(); ++i) {
        const int c = compare_identifier(a.prerelease[i], b.prerelease[i]);
        if (c != 0) return c < 0 ? -1 : 1;
    }
    if (a.prerelease.size() == b.prerelease.size()) return 0;
    return a.prerelease.size() < b.prerelease.size() ? -1 : 1;
}

fs::path default_install_root() {
#if defined(_WIN32)
    const char* localAppData = std::getenv("LOCALAPPDATA");
    if (!localAppData || !*localAppData) {
        return {};
    }
    return fs::path(localAppData) / "Discord";
#elif defined(__APPLE__)
    return fs::path("/Library/Application Support/Discord");
#else
    return {};
#endif
}

fs::path find_version_dir(const fs::path& root, const InstallLayout& layout) {
    std::error_code ec;
    fs::directory_iterator it(root, ec);
    if (ec) {
        throw Error(ErrorKind::Io, "cannot list install directory " + root.string() + ": " + ec.message());
    }

    fs::path best;
    SemVer bestVersion;
    bool bestPrefixed = false;

    for (const fs::directory_entry& entry : it) {
        std::error_code typeEc;
        if (!entry.is_directory(typeEc)) {
            continue;
        }

        const std::string name = entry.path().filename().string();
        const bool prefixed = !layout.versionPrefix.empty() && name.starts_with(layout.versionPrefix);
        const auto version = parse_semver(prefixed ? std::string_view(name).substr(layout.versionPrefix.size())
                                                   : std::string_view(name));
        if (!version) {
            logf(LogLevel::Debug, "install", "skipping %s: not a version directory", name.c_str());
            continue;
        }

        const bool better = best.empty() || (prefixed && !bestPrefixed) ||
                            (prefixed == bestPrefixed && compare_semver(*version, bestVersion) > 0);
        if (better) {
            best = entry.path();
            bestVersion = *version;
            bestPrefixed = prefixed;
        }
    }

    if (best.empty()) {
        throw Error(ErrorKind::EntryNotFound, "no version directory found in " + root.string());
    }

    logf(LogLevel::Info, "install", "using version directory %s", best.string().c_str());
    return best;
}

fs::path core_archive_path(const fs::path& root, const InstallLayout& layout) {
    return find_version_dir(root, layout) / fs::path(layout.coreModulePath) / layout.archiveName;
}

BackupStatus replace_icon(const fs::path& root, std::span<const std::uint8_t> icon, const InstallLayout& layout) {
    const fs::path iconPath = root / layout.iconName;

    const BackupStatus status = create_backup(iconPath, root / layout.iconBackupName);
    write_file_atomic(iconPath, icon);

    logf(LogLevel::Info, "install", "replaced icon %s (%zu bytes)", iconPath.string().c_str(), icon.size());
    return status;
}

void restore_icon(const fs::path& root, const InstallLayout& layout) {
    restore_backup(root / layout.iconBackupName, root / layout.iconName);
}

} // namespace stylepatch::patch
