#include <catch2/catch.hpp>

#include "asar/archive.hpp"
#include "patch/patcher.hpp"
#include "util/error.hpp"

#include "../helpers/asar_fixtures.hpp"

#include <string>
#include <vector>

using stylepatch::Error;
using stylepatch::ErrorKind;
using stylepatch::asar::Archive;
using stylepatch::patch::Outcome;
using stylepatch::patch::Patcher;
using stylepatch::patch::PatchResult;
using test_helpers::host_archive;
using test_helpers::host_script;
using test_helpers::make_archive;

namespace {

const std::string kTarget = "app/mainScreen.js";
const std::string kCss = "body { background: #101010; }";
const std::string kJs = "console.log('themed');";

std::string file_text(const Archive& archive, const std::string& path) {
    const auto bytes = archive.file_bytes(path);
    return std::string(bytes.begin(), bytes.end());
}

std::vector<std::uint8_t> single_script_archive(const std::string& script) {
    return make_archive("{\"files\":{\"app\":{\"files\":{\"mainScreen.js\":{\"size\":" +
                            std::to_string(script.size()) + ",\"offset\":\"0\"}}}}}",
                        script);
}

} // namespace

TEST_CASE("Patcher patch inserts the block and keeps other files intact", "[patch]") {
    const Patcher patcher;
    const auto original = host_archive();

    const PatchResult result = patcher.patch(original, kTarget, kCss, kJs);
    REQUIRE(result.outcome == Outcome::Applied);
    REQUIRE(result.changed());

    const Archive patched = Archive::decode(result.archive);
    const std::string script = host_script();
    const std::string expected = patcher.engine().inject(script, patcher.engine().find_anchor(script), kCss, kJs);

    REQUIRE(file_text(patched, kTarget) == expected);
    REQUIRE(result.sizeDelta == static_cast<std::int64_t>(expected.size() - script.size()));

    SECTION("Other files keep their bytes") {
        REQUIRE(file_text(patched, "app/index.js") == "index");
        REQUIRE(file_text(patched, "app/zzz.bin") == "\x01\x02\x03\x04");
        REQUIRE(file_text(patched, "package.json") == "{}");
    }

    SECTION("Every record lies within the data section") {
        for (const auto& path : patched.paths()) {
            const auto* rec = patched.get_record(path);
            REQUIRE(rec->offset + rec->size <= patched.blob().size());
        }
        REQUIRE(patched.blob().size() == Archive::decode(original).blob().size() + expected.size() - script.size());
    }

    SECTION("Unknown header members survive") {
        const std::string header = stylepatch::asar::header_to_json(patched.header());
        REQUIRE(header.find("\"executable\":true") != std::string::npos);
    }
}

TEST_CASE("Patcher patch is idempotent", "[patch]") {
    const Patcher patcher;
    const PatchResult first = patcher.patch(host_archive(), kTarget, kCss, kJs);
    REQUIRE(first.outcome == Outcome::Applied);

    const PatchResult second = patcher.patch(first.archive, kTarget, "other { }", "");
    REQUIRE(second.outcome == Outcome::AlreadyPatched);
    REQUIRE_FALSE(second.changed());
    REQUIRE(second.sizeDelta == 0);
}

TEST_CASE("Patcher patch failures leave the input untouched", "[patch][errors]") {
    const Patcher patcher;

    auto kind_of = [&](const std::vector<std::uint8_t>& archive, const std::string& target,
                       const std::string& css) {
        const auto before = archive;
        try {
            (void)patcher.patch(archive, target, css, "");
        } catch (const Error& e) {
            REQUIRE(archive == before);
            return e.kind();
        }
        return ErrorKind::Io;
    };

    SECTION("Anchor missing") {
        const auto archive = single_script_archive("console.log('no window here');\n");
        REQUIRE(kind_of(archive, kTarget, kCss) == ErrorKind::AnchorNotFound);
    }

    SECTION("Anchor ambiguous") {
        const auto archive = single_script_archive(host_script() + "mainWindow.webContents.reload();\n");
        REQUIRE(kind_of(archive, kTarget, kCss) == ErrorKind::AmbiguousAnchor);
    }

    SECTION("Target missing") {
        REQUIRE(kind_of(host_archive(), "app/missing.js", kCss) == ErrorKind::EntryNotFound);
    }

    SECTION("Target is binary") {
        REQUIRE(kind_of(single_script_archive("\xff\xfe\xfd"), kTarget, kCss) == ErrorKind::NonTextEntry);
    }

    SECTION("Unescaped CSS") {
        REQUIRE(kind_of(host_archive(), kTarget, "a { content: `x` }") == ErrorKind::PayloadEscapeViolation);
    }

    SECTION("Broken archive") {
        REQUIRE(kind_of(std::vector<std::uint8_t>(8, 0), kTarget, kCss) == ErrorKind::MalformedHeader);
    }
}

TEST_CASE("Patcher update replaces the payload", "[patch][update]") {
    const Patcher patcher;
    const PatchResult first = patcher.patch(host_archive(), kTarget, kCss, kJs);

    const PatchResult updated = patcher.update(first.archive, kTarget, "p { margin: 0; }", "");
    REQUIRE(updated.outcome == Outcome::Updated);

    const PatchResult fresh = patcher.patch(host_archive(), kTarget, "p { margin: 0; }", "");
    REQUIRE(updated.archive == fresh.archive);

    SECTION("Unpatched scripts are reported") {
        const PatchResult none = patcher.update(host_archive(), kTarget, kCss, kJs);
        REQUIRE(none.outcome == Outcome::NotPatched);
        REQUIRE_FALSE(none.changed());
    }
}

TEST_CASE("Patcher unpatch restores the original archive", "[patch][unpatch]") {
    const Patcher patcher;
    const auto original = host_archive();
    const PatchResult patched = patcher.patch(original, kTarget, kCss, kJs);

    const PatchResult removed = patcher.unpatch(patched.archive, kTarget);
    REQUIRE(removed.outcome == Outcome::Removed);
    REQUIRE(removed.archive == original);
    REQUIRE(removed.sizeDelta == -patched.sizeDelta);

    const PatchResult again = patcher.unpatch(original, kTarget);
    REQUIRE(again.outcome == Outcome::NotPatched);
    REQUIRE_FALSE(again.changed());
}

TEST_CASE("Patcher entry_text", "[patch]") {
    const Archive archive = Archive::decode(host_archive());
    REQUIRE(Patcher::entry_text(archive, kTarget) == host_script());

    try {
        (void)Patcher::entry_text(archive, "nope.js");
        FAIL("expected EntryNotFound");
    } catch (const Error& e) {
        REQUIRE(e.kind() == ErrorKind::EntryNotFound);
    }
}
