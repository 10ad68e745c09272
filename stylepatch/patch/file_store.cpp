#include "file_store.hpp"

#include "../util/error.hpp"
#include "../util/log.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <system_error>

#if defined(_WIN32)
#include <io.h>
#else
#include <fcntl.h>
#include <unistd.h>
#endif

namespace stylepatch::patch {

namespace fs = std::filesystem;

using util::LogLevel;
using util::logf;

namespace {

[[noreturn]] void io_fail(const std::string& what, const fs::path& path) {
    throw Error(ErrorKind::Io, what + " " + path.string() + ": " + std::strerror(errno));
}

bool sync_file(FILE* f) {
    if (std::fflush(f) != 0) {
        return false;
    }
#if defined(_WIN32)
    return _commit(_fileno(f)) == 0;
#else
    return ::fsync(::fileno(f)) == 0;
#endif
}

// Makes a rename inside `dir` durable. Windows commits the rename with the file.
void sync_directory(const fs::path& dir) {
#if defined(_WIN32)
    (void)dir;
#else
    const fs::path target = dir.empty() ? fs::path(".") : dir;
    const int fd = ::open(target.c_str(), O_RDONLY | O_DIRECTORY);
    if (fd < 0) {
        io_fail("cannot open directory", target);
    }

    const int rc = ::fsync(fd);
    const int savedErrno = errno;
    ::close(fd);

    // EINVAL: the filesystem cannot sync directories.
    if (rc != 0 && savedErrno != EINVAL) {
        errno = savedErrno;
        io_fail("cannot sync directory", target);
    }
#endif
}

} // namespace

std::vector<std::uint8_t> read_file(const fs::path& path) {
    const std::string pathStr = path.string();
    FILE* f = std::fopen(pathStr.c_str(), "rb");
    if (!f) {
        io_fail("cannot open", path);
    }

    std::vector<std::uint8_t> data;
    std::uint8_t chunk[64 * 1024];
    for (;;) {
        const std::size_t n = std::fread(chunk, 1, sizeof(chunk), f);
        data.insert(data.end(), chunk, chunk + n);
        if (n < sizeof(chunk)) {
            break;
        }
    }

    const bool failed = std::ferror(f) != 0;
    const int savedErrno = errno;
    std::fclose(f);

    if (failed) {
        errno = savedErrno;
        io_fail("cannot read", path);
    }

    return data;
}

void write_file_atomic(const fs::path& path, std::span<const std::uint8_t> data) {
    fs::path tmpPath = path;
    tmpPath += ".tmp";

    const std::string tmpStr = tmpPath.string();
    FILE* f = std::fopen(tmpStr.c_str(), "wb");
    if (!f) {
        io_fail("cannot create", tmpPath);
    }

    bool ok = true;
    if (!data.empty() && std::fwrite(data.data(), 1, data.size(), f) != data.size()) {
        ok = false;
    }
    if (ok && !sync_file(f)) {
        ok = false;
    }

    const int savedErrno = errno;
    std::fclose(f);

    if (!ok) {
        std::error_code ec;
        fs::remove(tmpPath, ec);
        errno = savedErrno;
        io_fail("cannot write", tmpPath);
    }

    std::error_code ec;
    fs::rename(tmpPath, path, ec);
    if (ec) {
        std::error_code rmEc;
        fs::remove(tmpPath, rmEc);
        throw Error(ErrorKind::Io, "cannot replace " + path.string() + ": " + ec.message());
    }
    sync_directory(path.parent_path());

    logf(LogLevel::Debug, "store", "wrote %zu bytes to %s", data.size(), path.string().c_str());
}

BackupStatus create_backup(const fs::path& original, const fs::path& backup) {
    std::error_code ec;
    if (fs::exists(backup, ec)) {
        logf(LogLevel::Info, "store", "backup %s already exists, keeping it", backup.string().c_str());
        return BackupStatus::AlreadyExists;
    }

    const std::vector<std::uint8_t> bytes = read_file(original);
    write_file_atomic(backup, bytes);

    logf(LogLevel::Info, "store", "backed up %s to %s", original.string().c_str(), backup.string().c_str());
    return BackupStatus::Created;
}

void restore_backup(const fs::path& backup, const fs::path& original) {
    std::error_code ec;
    if (!fs::exists(backup, ec)) {
        throw Error(ErrorKind::Io, "backup " + backup.string() + " does not exist");
    }

    const std::vector<std::uint8_t> bytes = read_file(backup);
    write_file_atomic(original, bytes);

    logf(LogLevel::Info, "store", "restored %s from %s", original.string().c_str(), backup.string().c_str());
}

fs::path backup_path_for(const fs::path& archive, const std::string& suffix) {
    fs::path p = archive;
    p += suffix;
    return p;
}

} // namespace stylepatch::patch
