#include "patcher.hpp"

#include "../util/error.hpp"
#include "../util/log.hpp"
#include "../util/utf8.hpp"

#include <utility>

namespace stylepatch::patch {

using util::LogLevel;
using util::logf;

Patcher::Patcher(inject::InjectionConfig cfg) : engine_(std::move(cfg)) {}

std::string Patcher::entry_text(const asar::Archive& archive, const std::string& targetPath) {
    const auto bytes = archive.file_bytes(targetPath);

    if (!util::is_valid_utf8(bytes)) {
        throw Error(ErrorKind::NonTextEntry, "file '" + targetPath + "' is not UTF-8 text");
    }

    return std::string(reinterpret_cast<const char*>(bytes.data()), bytes.size());
}

PatchResult Patcher::store_text(asar::Archive& archive, const std::string& targetPath,
                                const std::string& text, Outcome outcome) {
    PatchResult result;
    result.outcome = outcome;
    result.sizeDelta = archive.replace_entry(targetPath, std::vector<std::uint8_t>(text.begin(), text.end()));
    result.archive = archive.encode();

    logf(LogLevel::Info, "patch", "%s: %s (%+lld bytes)", targetPath.c_str(), outcome_name(outcome),
         static_cast<long long>(result.sizeDelta));
    return result;
}

PatchResult Patcher::patch(std::span<const std::uint8_t> archiveBytes,
                           const std::string& targetPath,
                           std::string_view css,
                           std::string_view js) const {
    asar::Archive archive = asar::Archive::decode(archiveBytes);
    const std::string text = entry_text(archive, targetPath);

    if (engine_.already_patched(text)) {
        logf(LogLevel::Info, "patch", "%s: already patched, leaving archive unchanged", targetPath.c_str());
        PatchResult result;
        result.outcome = Outcome::AlreadyPatched;
        return result;
    }

    const inject::ByteRange anchor = engine_.find_anchor(text);
    const std::string patched = engine_.inject(text, anchor, css, js);

    return store_text(archive, targetPath, patched, Outcome::Applied);
}

PatchResult Patcher::update(std::span<const std::uint8_t> archiveBytes,
                            const std::string& targetPath,
                            std::string_view css,
                            std::string_view js) const {
    asar::Archive archive = asar::Archive::decode(archiveBytes);
    const std::string text = entry_text(archive, targetPath);

    if (!engine_.already_patched(text)) {
        PatchResult result;
        result.outcome = Outcome::NotPatched;
        return result;
    }

    const std::string updated = engine_.replace_payload(text, css, js);
    return store_text(archive, targetPath, updated, Outcome::Updated);
}

PatchResult Patcher::unpatch(std::span<const std::uint8_t> archiveBytes,
                             const std::string& targetPath) const {
    asar::Archive archive = asar::Archive::decode(archiveBytes);
    const std::string text = entry_text(archive, targetPath);

    if (!engine_.already_patched(text)) {
        PatchResult result;
        result.outcome = Outcome::NotPatched;
        return result;
    }

    const std::string restored = engine_.remove_injection(text);
    return store_text(archive, targetPath, restored, Outcome::Removed);
}

} // namespace stylepatch::patch
