// stylepatch - inject a CSS theme and custom JS into an Electron .asar archive.
//
// Usage:
//   stylepatch <command> [options]
//
// Commands:
//   patch     Insert the theme block into the target script.
//   update    Replace the CSS/JS of an already patched script.
//   unpatch   Remove the theme block.
//   restore   Copy the backup back over the archive.
//   list      Print the archive's files.
//   extract   Write one archived file to disk.
//   pack      Build an archive from a directory.

#include "asar/archive.hpp"
#include "config/config.hpp"
#include "inject/injection_engine.hpp"
#include "patch/file_store.hpp"
#include "patch/install_layout.hpp"
#include "patch/patcher.hpp"
#include "util/error.hpp"
#include "util/log.hpp"

#include <algorithm>
#include <cstdint>
#include <exception>
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

#ifndef STYLEPATCH_VERSION
#define STYLEPATCH_VERSION "0.0.0-dev"
#endif

namespace fs = std::filesystem;

using stylepatch::Error;
using stylepatch::util::LogLevel;
using stylepatch::util::logf;

namespace {

struct Options {
    std::string command;

    fs::path archive;
    fs::path cssFile;
    fs::path jsFile;
    fs::path backup;
    fs::path configFile;
    fs::path inputDir;
    fs::path output;
    fs::path installRoot;
    fs::path iconFile;
    std::string entry;

    std::vector<std::string> excludePatterns;
    std::vector<std::string> unpackPatterns;

    bool noBackup{false};
    bool rawCss{false};
    bool rawJs{false};
    bool verbose{false};
    bool quiet{false};
    bool help{false};
};

void print_usage(const char* program) {
    std::cerr << "stylepatch v" << STYLEPATCH_VERSION << "\n"
              << "\n"
              << "Usage: " << program << " <command> [options]\n"
              << "\n"
              << "Commands:\n"
              << "  patch     --archive <file> --css <file> [--js <file>] [--icon <file>]\n"
              << "  update    --archive <file> --css <file> [--js <file>]\n"
              << "  unpatch   --archive <file>\n"
              << "  restore   --archive <file>\n"
              << "  (--install-root <dir> can stand in for --archive)\n"
              << "  list      --archive <file>\n"
              << "  extract   --archive <file> --entry <path> --output <file>\n"
              << "  pack      --input <dir> --output <file> [--exclude <pattern>] [--unpack <pattern>]\n"
              << "\n"
              << "Options:\n"
              << "  --archive, -a <file>  Archive to read (and rewrite).\n"
              << "  --install-root <dir>  Host install directory; the archive is found in its newest version.\n"
              << "  --icon <file>         Replace the host icon (backed up to icon-backup on first use).\n"
              << "  --css <file>          Theme stylesheet.\n"
              << "  --js <file>           Custom script (overrides [payload] custom_js_file).\n"
              << "  --entry, -e <path>    Script inside the archive (default from config).\n"
              << "  --backup <file>       Backup location (default: <archive><backup_suffix>).\n"
              << "  --no-backup           Do not create a backup before writing.\n"
              << "  --raw-css             CSS is already escaped with escape_css.\n"
              << "  --raw-js              Script is already escaped for a JS template literal.\n"
              << "  --config, -c <file>   Config file (default: stylepatch.ini if present).\n"
              << "  --input, -i <dir>     Source directory for pack.\n"
              << "  --output, -o <file>   Output file for extract and pack.\n"
              << "  --exclude <pattern>   Skip matching files when packing (can be repeated).\n"
              << "  --unpack <pattern>    Mark matching files as unpacked (can be repeated).\n"
              << "  --verbose, -v         Debug logging.\n"
              << "  --quiet, -q           Errors only.\n"
              << "  --help, -h            Show this help message.\n";
}

bool parse_args(int argc, char* argv[], Options& opts) {
    auto need_value = [&](int& i, const std::string& arg, const char* what) -> const char* {
        if (++i >= argc) {
            std::cerr << "Error: " << arg << " requires " << what << ".\n";
            return nullptr;
        }
        return argv[i];
    };

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        const char* v = nullptr;

        if (arg == "--help" || arg == "-h") {
            opts.help = true;
        } else if (arg == "--archive" || arg == "-a") {
            if (!(v = need_value(i, arg, "a file path"))) return false;
            opts.archive = v;
        } else if (arg == "--install-root") {
            if (!(v = need_value(i, arg, "a directory path"))) return false;
            opts.installRoot = v;
        } else if (arg == "--icon") {
            if (!(v = need_value(i, arg, "a file path"))) return false;
            opts.iconFile = v;
        } else if (arg == "--css") {
            if (!(v = need_value(i, arg, "a file path"))) return false;
            opts.cssFile = v;
        } else if (arg == "--js") {
            if (!(v = need_value(i, arg, "a file path"))) return false;
            opts.jsFile = v;
        } else if (arg == "--entry" || arg == "-e") {
            if (!(v = need_value(i, arg, "an archive path"))) return false;
            opts.entry = v;
        } else if (arg == "--backup") {
            if (!(v = need_value(i, arg, "a file path"))) return false;
            opts.backup = v;
        } else if (arg == "--config" || arg == "-c") {
            if (!(v = need_value(i, arg, "a file path"))) return false;
            opts.configFile = v;
        } else if (arg == "--input" || arg == "-i") {
            if (!(v = need_value(i, arg, "a directory path"))) return false;
            opts.inputDir = v;
        } else if (arg == "--output" || arg == "-o") {
            if (!(v = need_value(i, arg, "a file path"))) return false;
            opts.output = v;
        } else if (arg == "--exclude") {
            if (!(v = need_value(i, arg, "a pattern"))) return false;
            opts.excludePatterns.push_back(v);
        } else if (arg == "--unpack") {
            if (!(v = need_value(i, arg, "a pattern"))) return false;
            opts.unpackPatterns.push_back(v);
        } else if (arg == "--no-backup") {
            opts.noBackup = true;
        } else if (arg == "--raw-css") {
            opts.rawCss = true;
        } else if (arg == "--raw-js") {
            opts.rawJs = true;
        } else if (arg == "--verbose" || arg == "-v") {
            opts.verbose = true;
        } else if (arg == "--quiet" || arg == "-q") {
            opts.quiet = true;
        } else if (opts.command.empty() && !arg.empty() && arg[0] != '-') {
            opts.command = arg;
        } else {
            std::cerr << "Error: Unknown option: " << arg << "\n";
            return false;
        }
    }

    if (opts.help) {
        return true;
    }

    if (opts.command.empty()) {
        std::cerr << "Error: no command given.\n";
        return false;
    }

    if ((opts.command == "patch" || opts.command == "update") && opts.cssFile.empty()) {
        std::cerr << "Error: --css is required.\n";
        return false;
    }
    if (opts.command == "extract" && opts.output.empty()) {
        std::cerr << "Error: --output is required.\n";
        return false;
    }
    if (opts.command == "pack" && (opts.inputDir.empty() || opts.output.empty())) {
        std::cerr << "Error: pack requires --input and --output.\n";
        return false;
    }

    return true;
}

bool matches_pattern(const std::string& filename, const std::string& pattern) {
    if (pattern.empty()) {
        return false;
    }

    if (pattern[0] == '*') {
        std::string suffix = pattern.substr(1);
        if (filename.length() >= suffix.length()) {
            return filename.compare(filename.length() - suffix.length(), suffix.length(), suffix) == 0;
        }
        return false;
    }

    return filename == pattern;
}

bool matches_any(const std::string& relativePath, const std::vector<std::string>& patterns) {
    const std::string filename = fs::path(relativePath).filename().string();

    for (const auto& pattern : patterns) {
        if (matches_pattern(filename, pattern) || matches_pattern(relativePath, pattern)) {
            return true;
        }
    }
    return false;
}

std::string read_text(const fs::path& path) {
    const auto bytes = stylepatch::patch::read_file(path);
    return std::string(bytes.begin(), bytes.end());
}

fs::path backup_location(const Options& opts) {
    if (!opts.backup.empty()) {
        return opts.backup;
    }
    return stylepatch::patch::backup_path_for(opts.archive, stylepatch::config::Config::instance().patch().backup_suffix);
}

std::string target_entry(const Options& opts) {
    return opts.entry.empty() ? stylepatch::config::Config::instance().patch().target_entry : opts.entry;
}

// --install-root, then [install] root, then the platform default.
fs::path install_root(const Options& opts) {
    if (!opts.installRoot.empty()) {
        return opts.installRoot;
    }
    const std::string& configured = stylepatch::config::Config::instance().install().root;
    if (!configured.empty()) {
        return configured;
    }
    return stylepatch::patch::default_install_root();
}

// Fills in --archive from the install directory when it was not given.
// @return false if neither is known.
bool resolve_archive(Options& opts) {
    if (!opts.archive.empty() || opts.command == "pack") {
        return true;
    }

    const fs::path root = install_root(opts);
    if (root.empty()) {
        return false;
    }

    opts.archive = stylepatch::patch::core_archive_path(root, stylepatch::config::Config::instance().install().layout);
    logf(LogLevel::Info, "cli", "archive: %s", opts.archive.string().c_str());
    return true;
}

// Replaces the host icon when --icon or [install] replace_icon asks for it.
// The patch is already written, so failures here are warnings.
void swap_icon(const Options& opts) {
    const auto& install = stylepatch::config::Config::instance().install();

    fs::path icon = opts.iconFile;
    if (icon.empty() && install.replace_icon) {
        icon = install.icon_file;
        if (icon.empty()) {
            logf(LogLevel::Warning, "cli", "replace_icon is set but icon_file is empty; icon left unchanged");
            return;
        }
    }
    if (icon.empty()) {
        return;
    }

    const fs::path root = install_root(opts);
    if (root.empty()) {
        logf(LogLevel::Warning, "cli", "no install directory known; icon left unchanged");
        return;
    }

    try {
        stylepatch::patch::replace_icon(root, stylepatch::patch::read_file(icon), install.layout);
    } catch (const Error& e) {
        logf(LogLevel::Warning, "cli", "failed to replace the icon: %s", e.what());
    }
}

// CSS from --css, JS from --js or the configured custom script.
void load_payloads(const Options& opts, std::string& css, std::string& js) {
    css = read_text(opts.cssFile);
    if (!opts.rawCss) {
        css = stylepatch::inject::escape_css(css);
    }

    const std::string& customJs = stylepatch::config::Config::instance().payload().custom_js_file;
    if (!opts.jsFile.empty()) {
        js = read_text(opts.jsFile);
    } else if (!customJs.empty()) {
        js = read_text(customJs);
    }
    if (!opts.rawJs) {
        js = stylepatch::inject::escape_template(js);
    }
}

// Writes `result` over the archive, taking a backup first when configured.
void commit(const Options& opts, const stylepatch::patch::PatchResult& result) {
    const auto& cfg = stylepatch::config::Config::instance();

    if (cfg.patch().make_backup && !opts.noBackup) {
        stylepatch::patch::create_backup(opts.archive, backup_location(opts));
    }

    stylepatch::patch::write_file_atomic(opts.archive, result.archive);
}

int run_patch(const Options& opts) {
    std::string css;
    std::string js;
    load_payloads(opts, css, js);

    const auto archiveBytes = stylepatch::patch::read_file(opts.archive);
    const stylepatch::patch::Patcher patcher(stylepatch::config::Config::instance().inject());
    const std::string entry = target_entry(opts);

    stylepatch::patch::PatchResult result;
    if (opts.command == "patch") {
        result = patcher.patch(archiveBytes, entry, css, js);
    } else {
        result = patcher.update(archiveBytes, entry, css, js);
    }

    if (result.outcome == stylepatch::patch::Outcome::AlreadyPatched) {
        std::cout << entry << " is already patched; use 'update' to replace the theme.\n";
        return 0;
    }
    if (result.outcome == stylepatch::patch::Outcome::NotPatched) {
        std::cerr << "Error: " << entry << " is not patched; use 'patch' first.\n";
        return 1;
    }

    commit(opts, result);
    if (result.outcome == stylepatch::patch::Outcome::Applied) {
        swap_icon(opts);
    }

    std::cout << "Theme " << stylepatch::patch::outcome_name(result.outcome) << " in " << opts.archive.string()
              << ". Restart the application for the change to take effect.\n";
    return 0;
}

int run_unpatch(const Options& opts) {
    const auto archiveBytes = stylepatch::patch::read_file(opts.archive);
    const stylepatch::patch::Patcher patcher(stylepatch::config::Config::instance().inject());
    const std::string entry = target_entry(opts);

    const auto result = patcher.unpatch(archiveBytes, entry);
    if (!result.changed()) {
        std::cout << entry << " has no theme block; nothing to do.\n";
        return 0;
    }

    commit(opts, result);
    std::cout << "Removed theme block from " << entry << ".\n";
    return 0;
}

int run_restore(const Options& opts) {
    const fs::path backup = backup_location(opts);

    std::error_code ec;
    if (!fs::exists(backup, ec)) {
        std::cerr << "Error: backup file " << backup.string()
                  << " doesn't exist; reinstall the application to return to factory defaults.\n";
        return 1;
    }

    stylepatch::patch::restore_backup(backup, opts.archive);
    std::cout << "Restored " << opts.archive.string() << " from " << backup.string() << ".\n";

    const auto& layout = stylepatch::config::Config::instance().install().layout;
    const fs::path root = install_root(opts);
    if (!root.empty() && fs::exists(root / layout.iconBackupName, ec)) {
        try {
            stylepatch::patch::restore_icon(root, layout);
            std::cout << "Restored the icon from " << (root / layout.iconBackupName).string() << ".\n";
        } catch (const Error& e) {
            logf(LogLevel::Warning, "cli", "failed to restore the icon: %s", e.what());
        }
    }
    return 0;
}

int run_list(const Options& opts) {
    const auto archive = stylepatch::asar::Archive::decode(stylepatch::patch::read_file(opts.archive));

    for (const auto& path : archive.paths()) {
        const auto* rec = archive.get_record(path);
        if (rec->unpacked) {
            std::cout << path << "  size=" << rec->size << "  (unpacked)\n";
        } else {
            std::cout << path << "  size=" << rec->size << "  offset=" << rec->offset << "\n";
        }
    }

    std::cout << archive.file_count() << " files, " << archive.blob().size() << " bytes of data\n";
    return 0;
}

int run_extract(const Options& opts) {
    const auto archive = stylepatch::asar::Archive::decode(stylepatch::patch::read_file(opts.archive));
    const std::string entry = target_entry(opts);

    stylepatch::patch::write_file_atomic(opts.output, archive.file_bytes(entry));
    std::cout << "Extracted " << entry << " to " << opts.output.string() << "\n";
    return 0;
}

int run_pack(const Options& opts) {
    std::error_code ec;
    if (!fs::is_directory(opts.inputDir, ec) || ec) {
        std::cerr << "Error: Input directory does not exist: " << opts.inputDir << "\n";
        return 1;
    }

    struct FileEntry {
        fs::path absolutePath;
        std::string archivePath;
    };
    std::vector<FileEntry> files;

    for (const auto& entry : fs::recursive_directory_iterator(opts.inputDir, ec)) {
        if (ec) {
            std::cerr << "Error iterating directory: " << ec.message() << "\n";
            return 1;
        }

        if (!entry.is_regular_file()) {
            continue;
        }

        fs::path relativePath = fs::relative(entry.path(), opts.inputDir, ec);
        if (ec) {
            continue;
        }

        std::string archivePath = relativePath.generic_string();

        if (matches_any(archivePath, opts.excludePatterns)) {
            logf(LogLevel::Debug, "cli", "excluding %s", archivePath.c_str());
            continue;
        }

        files.push_back({entry.path(), archivePath});
    }

    if (files.empty()) {
        std::cerr << "Error: No files to pack.\n";
        return 1;
    }

    std::sort(files.begin(), files.end(),
              [](const FileEntry& a, const FileEntry& b) { return a.archivePath < b.archivePath; });

    stylepatch::asar::Archive archive;
    std::uint64_t totalSize = 0;

    for (const auto& file : files) {
        const auto data = stylepatch::patch::read_file(file.absolutePath);
        const bool unpacked = matches_any(file.archivePath, opts.unpackPatterns);

        if (!archive.add_file(file.archivePath, data, unpacked)) {
            std::cerr << "Error: Failed to add file: " << file.archivePath << "\n";
            return 1;
        }

        totalSize += data.size();
        logf(LogLevel::Debug, "cli", "added %s%s", file.archivePath.c_str(), unpacked ? " (unpacked)" : "");
    }

    const auto bytes = archive.encode();
    stylepatch::patch::write_file_atomic(opts.output, bytes);

    std::cout << "Packed " << archive.file_count() << " files into " << opts.output.string() << "\n";
    std::cout << "  Input size:  " << (totalSize / 1024) << " KB\n";
    std::cout << "  Output size: " << (bytes.size() / 1024) << " KB\n";
    return 0;
}

void print_restore_hint(const char* program, const Options& opts) {
    std::error_code ec;
    if (!opts.archive.empty() && fs::exists(backup_location(opts), ec)) {
        std::cerr << "If the application no longer starts, run '" << program
                  << " restore --archive " << opts.archive.string() << "'.\n";
    }
}

} // namespace

int main(int argc, char* argv[]) {
    Options opts;
    if (!parse_args(argc, argv, opts)) {
        print_usage(argv[0]);
        return 1;
    }

    if (opts.help) {
        print_usage(argv[0]);
        return 0;
    }

    auto& cfg = stylepatch::config::Config::instance();
    if (!opts.configFile.empty()) {
        if (!cfg.load_from_file(opts.configFile.string())) {
            std::cerr << "Error: cannot read config file " << opts.configFile.string() << "\n";
            return 1;
        }
    } else {
        cfg.load_from_file("stylepatch.ini");
    }

    stylepatch::util::LogConfig logCfg = cfg.logging();
    if (opts.verbose) {
        logCfg.level = LogLevel::Debug;
    } else if (opts.quiet) {
        logCfg.level = LogLevel::Error;
    }
    stylepatch::util::log_init(logCfg);

    if (!cfg.loaded_from_path().empty()) {
        logf(LogLevel::Debug, "config", "loaded %s", cfg.loaded_from_path().c_str());
    }

    int rc = 1;
    try {
        if (!resolve_archive(opts)) {
            std::cerr << "Error: --archive or --install-root is required.\n";
            print_usage(argv[0]);
        } else if (opts.command == "patch" || opts.command == "update") {
            rc = run_patch(opts);
        } else if (opts.command == "unpatch") {
            rc = run_unpatch(opts);
        } else if (opts.command == "restore") {
            rc = run_restore(opts);
        } else if (opts.command == "list") {
            rc = run_list(opts);
        } else if (opts.command == "extract") {
            rc = run_extract(opts);
        } else if (opts.command == "pack") {
            rc = run_pack(opts);
        } else {
            std::cerr << "Error: Unknown command: " << opts.command << "\n";
            print_usage(argv[0]);
        }
    } catch (const Error& e) {
        logf(LogLevel::Error, "cli", "%s: %s", stylepatch::error_kind_name(e.kind()), e.what());
        print_restore_hint(argv[0], opts);
        rc = 1;
    } catch (const fs::filesystem_error& e) {
        logf(LogLevel::Error, "cli", "Io: %s", e.what());
        rc = 1;
    } catch (const std::exception& e) {
        logf(LogLevel::Error, "cli", "unexpected failure: %s", e.what());
        print_restore_hint(argv[0], opts);
        rc = 1;
    }

    stylepatch::util::log_shutdown();
    return rc;
}
