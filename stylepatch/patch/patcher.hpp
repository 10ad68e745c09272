#pragma once

#include "../asar/archive.hpp"
#include "../inject/injection_engine.hpp"

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace stylepatch::patch {

enum class Outcome : std::uint8_t {
    Applied = 0,     // block inserted
    AlreadyPatched,  // guard token present; nothing written
    Updated,         // payload of an existing block rewritten
    Removed,         // block excised
    NotPatched,      // update/unpatch on a script without a block; nothing written
};

inline const char* outcome_name(Outcome outcome) {
    switch (outcome) {
        case Outcome::Applied: return "applied";
        case Outcome::AlreadyPatched: return "already patched";
        case Outcome::Updated: return "updated";
        case Outcome::Removed: return "removed";
        case Outcome::NotPatched: return "not patched";
    }
    return "unknown";
}

struct PatchResult {
    Outcome outcome{Outcome::NotPatched};

    // Complete new archive. Empty when the outcome leaves the archive unchanged.
    std::vector<std::uint8_t> archive;

    // Size change of the target entry in bytes.
    std::int64_t sizeDelta{0};

    bool changed() const { return !archive.empty(); }
};

// Decodes an archive, rewrites one script entry through the injection engine
// and encodes the result. Pure in-memory; the input buffer is never modified.
//
// Errors from the codec and the engine propagate unchanged as stylepatch::Error.
class Patcher {
public:
    explicit Patcher(inject::InjectionConfig cfg = {});

    const inject::InjectionEngine& engine() const { return engine_; }

    // Insert the CSS/JS block into `targetPath`.
    // Returns Outcome::AlreadyPatched without re-inserting if the guard token is present.
    PatchResult patch(std::span<const std::uint8_t> archiveBytes,
                      const std::string& targetPath,
                      std::string_view css,
                      std::string_view js) const;

    // Replace the payload of an existing block. Outcome::NotPatched if there is none.
    PatchResult update(std::span<const std::uint8_t> archiveBytes,
                       const std::string& targetPath,
                       std::string_view css,
                       std::string_view js) const;

    // Remove an existing block. Outcome::NotPatched if there is none.
    PatchResult unpatch(std::span<const std::uint8_t> archiveBytes,
                        const std::string& targetPath) const;

    // UTF-8 text of a packed entry.
    // Throws stylepatch::Error(EntryNotFound) or (NonTextEntry).
    static std::string entry_text(const asar::Archive& archive, const std::string& targetPath);

private:
    static PatchResult store_text(asar::Archive& archive, const std::string& targetPath,
                                  const std::string& text, Outcome outcome);

    inject::InjectionEngine engine_;
};

} // namespace stylepatch::patch
