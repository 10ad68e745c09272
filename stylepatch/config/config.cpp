#include "config.hpp"

#include <utility>
#include <cctype>
#include <fstream>
#include <unordered_map>

namespace stylepatch::config {

using util::LogLevel;

Config& Config::instance() {
    static Config inst;
    return inst;
}

void Config::reset() {
    config_ = ToolConfig{};
    loaded_from_path_.clear();
}

std::string Config::trim(std::string s) {
    auto is_space = [](unsigned char c) { return std::isspace(c) != 0; };

    while (!s.empty() && is_space(static_cast<unsigned char>(s.front()))) s.erase(s.begin());
    while (!s.empty() && is_space(static_cast<unsigned char>(s.back()))) s.pop_back();

    return s;
}

std::string Config::to_lower(std::string s) {
    for (char& c : s) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return s;
}

std::string Config::strip_quotes(std::string s) {
    s = trim(std::move(s));

    if (s.size() >= 2) {
        const char a = s.front();
        const char b = s.back();
        if ((a == '"' && b == '"') || (a == '\'' && b == '\'')) {
            return s.substr(1, s.size() - 2);
        }
    }
    return s;
}

bool Config::parse_bool(const std::string& v, bool default_value) {
    std::string s = to_lower(trim(v));
    if (s == "1" || s == "true" || s == "yes" || s == "on") return true;
    if (s == "0" || s == "false" || s == "no" || s == "off") return false;
    return default_value;
}

LogLevel Config::log_level_from_string(const std::string& v, LogLevel default_value) {
    std::string s = to_lower(strip_quotes(v));

    static const std::unordered_map<std::string, LogLevel> map = {
        {"trace", LogLevel::Trace},
        {"debug", LogLevel::Debug},
        {"info", LogLevel::Info},
        {"warning", LogLevel::Warning}, {"warn", LogLevel::Warning},
        {"error", LogLevel::Error},
        {"none", LogLevel::None}, {"off", LogLevel::None},
    };

    auto it = map.find(s);
    if (it != map.end()) return it->second;

    return default_value;
}

void Config::apply_kv(const std::string& section, const std::string& key, const std::string& value) {
    const std::string sec = to_lower(trim(section));
    const std::string k = to_lower(trim(key));
    const std::string v = strip_quotes(value);

    if (sec == "patch") {
        if (k == "target_entry") config_.patch.target_entry = v;
        else if (k == "make_backup") config_.patch.make_backup = parse_bool(v, config_.patch.make_backup);
        else if (k == "backup_suffix") config_.patch.backup_suffix = v;
        return;
    }

    if (sec == "inject") {
        if (k == "anchor") config_.inject.anchor = v;
        else if (k == "guard") config_.inject.guardToken = v;
        else if (k == "window_expr") config_.inject.windowExpr = v;
        else if (k == "script_begin") config_.inject.scriptBegin = v;
        else if (k == "script_end") config_.inject.scriptEnd = v;
        else if (k == "validate_payloads") config_.inject.validatePayloads = parse_bool(v, config_.inject.validatePayloads);
        return;
    }

    if (sec == "payload") {
        if (k == "custom_js_file") config_.payload.custom_js_file = v;
        return;
    }

    if (sec == "install") {
        if (k == "root") config_.install.root = v;
        else if (k == "version_prefix") config_.install.layout.versionPrefix = v;
        else if (k == "core_module_path") config_.install.layout.coreModulePath = v;
        else if (k == "archive_name") config_.install.layout.archiveName = v;
        else if (k == "icon_name") config_.install.layout.iconName = v;
        else if (k == "icon_backup_name") config_.install.layout.iconBackupName = v;
        else if (k == "replace_icon") config_.install.replace_icon = parse_bool(v, config_.install.replace_icon);
        else if (k == "icon_file") config_.install.icon_file = v;
        return;
    }

    if (sec == "logging") {
        if (k == "enabled") config_.logging.enabled = parse_bool(v, config_.logging.enabled);
        else if (k == "level") config_.logging.level = log_level_from_string(v, config_.logging.level);
        else if (k == "file") config_.logging.file = v;
        return;
    }
}

bool Config::load_from_file(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        return false;
    }

    std::string section;
    std::string line;

    while (std::getline(in, line)) {
        line = trim(line);

        // Only whole-line comments; values may contain '#' and ';'.
        if (line.empty() || line.front() == '#' || line.front() == ';') continue;

        if (line.front() == '[' && line.back() == ']') {
            section = trim(line.substr(1, line.size() - 2));
            continue;
        }

        auto eq = line.find('=');
        if (eq == std::string::npos) continue;

        std::string key = trim(line.substr(0, eq));
        std::string value = trim(line.substr(eq + 1));
        if (key.empty()) continue;

        apply_kv(section, key, value);
    }

    loaded_from_path_ = path;
    return true;
}

} // namespace stylepatch::config
