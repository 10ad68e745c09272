#pragma once

#include "../inject/injection_engine.hpp"
#include "../patch/install_layout.hpp"
#include "../util/log.hpp"

#include <string>

namespace stylepatch::config {

struct PatchConfig {
    // Script inside the archive that receives the block.
    std::string target_entry{"app/mainScreen.js"};

    bool make_backup{true};
    std::string backup_suffix{".backup"};
};

struct PayloadConfig {
    // Custom JS appended between the script sentinels; empty for none.
    std::string custom_js_file{};
};

struct InstallConfig {
    // Host install directory; empty for the platform default.
    std::string root{};
    patch::InstallLayout layout{};

    // Swap the host's icon for `icon_file` when patching.
    bool replace_icon{false};
    std::string icon_file{};
};

struct ToolConfig {
    PatchConfig patch{};
    inject::InjectionConfig inject{};
    PayloadConfig payload{};
    InstallConfig install{};
    util::LogConfig logging{};
};

class Config {
public:
    static Config& instance();

    // Applies `key = value` pairs from an INI-style file on top of the current values.
    // @return false if the file cannot be opened (current values are kept).
    bool load_from_file(const std::string& path);

    // Back to built-in defaults.
    void reset();

    const std::string& loaded_from_path() const { return loaded_from_path_; }

    const ToolConfig& get() const { return config_; }

    const PatchConfig& patch() const { return config_.patch; }
    const inject::InjectionConfig& inject() const { return config_.inject; }
    const PayloadConfig& payload() const { return config_.payload; }
    const InstallConfig& install() const { return config_.install; }
    const util::LogConfig& logging() const { return config_.logging; }

private:
    Config() = default;

    ToolConfig config_{};

    std::string loaded_from_path_{};

    static std::string trim(std::string s);
    static std::string to_lower(std::string s);
    static std::string strip_quotes(std::string s);

    static bool parse_bool(const std::string& v, bool default_value);
    static util::LogLevel log_level_from_string(const std::string& v, util::LogLevel default_value);

    void apply_kv(const std::string& section, const std::string& key, const std::string& value);
};

} // namespace stylepatch::config
