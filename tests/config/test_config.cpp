#include <catch2/catch.hpp>

#include "config/config.hpp"

#include "../helpers/asar_fixtures.hpp"

#include <string>

using stylepatch::config::Config;
using stylepatch::util::LogLevel;
using test_helpers::TempDir;

TEST_CASE("Config defaults", "[config]") {
    auto& cfg = Config::instance();
    cfg.reset();

    REQUIRE(cfg.patch().target_entry == "app/mainScreen.js");
    REQUIRE(cfg.patch().make_backup);
    REQUIRE(cfg.patch().backup_suffix == ".backup");

    REQUIRE(cfg.inject().anchor == "mainWindow.webContents.");
    REQUIRE(cfg.inject().guardToken == "CSS_INJECTION_USER_CSS");
    REQUIRE(cfg.inject().validatePayloads);

    REQUIRE(cfg.payload().custom_js_file.empty());

    REQUIRE(cfg.install().root.empty());
    REQUIRE(cfg.install().layout.versionPrefix == "app-");
    REQUIRE(cfg.install().layout.archiveName == "core.asar");
    REQUIRE(cfg.install().layout.iconBackupName == "icon-backup");
    REQUIRE_FALSE(cfg.install().replace_icon);

    REQUIRE(cfg.logging().enabled);
    REQUIRE(cfg.logging().level == LogLevel::Info);
    REQUIRE(cfg.loaded_from_path().empty());
}

TEST_CASE("Config loads INI files", "[config]") {
    auto& cfg = Config::instance();
    cfg.reset();

    TempDir dir("config");
    const auto path = dir.write("stylepatch.ini",
                                "# theme settings\n"
                                "[patch]\n"
                                "target_entry = app/index.js\n"
                                "make_backup = no\n"
                                "backup_suffix = \".orig\"\n"
                                "\n"
                                "; injection markers\n"
                                "[Inject]\n"
                                "anchor = 'win.webContents.'\n"
                                "guard = MY_CSS\n"
                                "window_expr = win.webContents\n"
                                "validate_payloads = off\n"
                                "\n"
                                "[payload]\n"
                                "custom_js_file = custom.js\n"
                                "\n"
                                "[install]\n"
                                "root = /opt/host\n"
                                "version_prefix = v\n"
                                "icon_name = host.png\n"
                                "replace_icon = yes\n"
                                "icon_file = classic.png\n"
                                "\n"
                                "[logging]\n"
                                "level = debug\n"
                                "file = stylepatch.log\n"
                                "unknown_key = 1\n"
                                "not a key value line\n");

    REQUIRE(cfg.load_from_file(path.string()));
    REQUIRE(cfg.loaded_from_path() == path.string());

    REQUIRE(cfg.patch().target_entry == "app/index.js");
    REQUIRE_FALSE(cfg.patch().make_backup);
    REQUIRE(cfg.patch().backup_suffix == ".orig");

    REQUIRE(cfg.inject().anchor == "win.webContents.");
    REQUIRE(cfg.inject().guardToken == "MY_CSS");
    REQUIRE(cfg.inject().windowExpr == "win.webContents");
    REQUIRE_FALSE(cfg.inject().validatePayloads);
    REQUIRE(cfg.inject().scriptBegin == "//JS_SCRIPT_BEGIN");

    REQUIRE(cfg.payload().custom_js_file == "custom.js");

    REQUIRE(cfg.install().root == "/opt/host");
    REQUIRE(cfg.install().layout.versionPrefix == "v");
    REQUIRE(cfg.install().layout.iconName == "host.png");
    REQUIRE(cfg.install().layout.coreModulePath == "modules/discord_desktop_core-1/discord_desktop_core");
    REQUIRE(cfg.install().replace_icon);
    REQUIRE(cfg.install().icon_file == "classic.png");

    REQUIRE(cfg.logging().level == LogLevel::Debug);
    REQUIRE(cfg.logging().file == "stylepatch.log");

    cfg.reset();
}

TEST_CASE("Config keeps values it cannot parse", "[config]") {
    auto& cfg = Config::instance();
    cfg.reset();

    TempDir dir("config_bad");
    const auto path = dir.write("bad.ini",
                                "[patch]\n"
                                "make_backup = maybe\n"
                                "[logging]\n"
                                "level = loud\n"
                                "[inject]\n"
                                "anchor = a#b;c\n");

    REQUIRE(cfg.load_from_file(path.string()));
    REQUIRE(cfg.patch().make_backup);
    REQUIRE(cfg.logging().level == LogLevel::Info);
    REQUIRE(cfg.inject().anchor == "a#b;c");

    cfg.reset();
}

TEST_CASE("Config reports a missing file", "[config]") {
    auto& cfg = Config::instance();
    cfg.reset();

    REQUIRE_FALSE(cfg.load_from_file("/nonexistent/stylepatch.ini"));
    REQUIRE(cfg.loaded_from_path().empty());
    REQUIRE(cfg.patch().target_entry == "app/mainScreen.js");
}
