#include "ConfigManager.hpp"
#include "../utils/Logger.hpp"
#include "../utils/Util.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>

namespace uiauto {

namespace fs = std::filesystem;

const char* const Configs::DEFAULT_CONFIG = R"(# uiauto configuration
#
# Pressing <AppSelectPrefix>-<key> focuses the application's window when its
# process is running and launches Command otherwise.
# Pressing <WindowManagePrefix>-<key> runs a window operation.

[General]
AppSelectPrefix=Control-Mod1
WindowManagePrefix=Mod4-Mod1

[AppSelect.b]
Command=firefox
ProcessName=firefox
WindowClass=Firefox

[AppSelect.t]
Command=kitty
ProcessName=kitty
WindowClass=kitty

[AppSelect.f]
Command=dolphin
ProcessName=dolphin
WindowClass=dolphin

# Add more applications here, e.g.:
# [AppSelect.c]
# Command=chromium
# ProcessName=chromium
# WindowClass=Chromium

[WindowManage]
m=center

[Debug]
VerboseKeyLogging=false

[Log]
File=true
MaxDays=3
)";

namespace ConfigPaths {
    std::string GetConfigDir() {
        const char* home = std::getenv("HOME");
        if (!home || !*home)
            throw ConfigError("Cannot locate the home directory: HOME is not set");
        return (fs::path(home) / ".config" / "uiauto").string();
    }

    std::string GetDefaultConfigPath() {
        return (fs::path(GetConfigDir()) / CONFIG_FILE).string();
    }
}

bool Configs::EnsureConfigFile(const std::string& configPath) {
    std::error_code ec;
    if (fs::exists(configPath, ec))
        return false;

    fs::path dir = fs::path(configPath).parent_path();
    if (!dir.empty()) {
        fs::create_directories(dir, ec);
        if (ec)
            throw ConfigError("Failed to create config directory " + dir.string() + ": " + ec.message());
        fs::permissions(dir, fs::perms::owner_all | fs::perms::group_read | fs::perms::group_exec |
                        fs::perms::others_read | fs::perms::others_exec, ec);
        if (ec)
            warning("Cannot set permissions on {}: {}", dir.string(), ec.message());
    }

    std::ofstream file(configPath);
    if (!file.is_open())
        throw ConfigError("Failed to create default config file: " + configPath);
    file << DEFAULT_CONFIG;
    file.close();
    if (!file)
        throw ConfigError("Failed to write default config file: " + configPath);
    return true;
}

void Configs::Load(const std::string& configPath) {
    std::ifstream file(configPath);
    if (!file.is_open())
        throw ConfigError("Could not open config file: " + configPath);
    path = configPath;
    Parse(file, configPath);
}

void Configs::Parse(std::istream& in, const std::string& source) {
    settings.clear();
    lineOf.clear();
    origin = source;

    std::string line, currentSection;
    int lineNumber = 0;
    while (std::getline(in, line)) {
        ++lineNumber;
        line = trim(line);
        if (line.empty() || line[0] == '#' || line[0] == ';') continue;

        if (line[0] == '[') {
            if (line.back() != ']')
                throw ConfigError(origin, lineNumber, "unterminated section header");
            currentSection = trim(line.substr(1, line.size() - 2));
            if (currentSection.empty())
                throw ConfigError(origin, lineNumber, "empty section name");
            continue;
        }

        size_t delim = line.find('=');
        if (delim == std::string::npos)
            throw ConfigError(origin, lineNumber, "expected Key=Value, got '" + line + "'");
        if (currentSection.empty())
            throw ConfigError(origin, lineNumber, "key outside of any section");

        std::string name = trim(line.substr(0, delim));
        if (name.empty())
            throw ConfigError(origin, lineNumber, "missing key before '='");

        std::string key = currentSection + "." + name;
        settings[key] = trim(line.substr(delim + 1));
        lineOf[key] = lineNumber;
    }
}

std::string Configs::require(const std::string& key) const {
    auto it = settings.find(key);
    if (it == settings.end() || it->second.empty())
        throw ConfigError(origin + ": missing required setting " + key);
    return it->second;
}

Configuration Configs::BuildConfiguration() const {
    static const std::string appSection = "AppSelect.";
    static const std::string windowSection = "WindowManage.";

    Configuration config;
    config.appSelectPrefix = require("General.AppSelectPrefix");
    config.windowManagePrefix = require("General.WindowManagePrefix");
    config.verboseKeyLogging = GetVerboseKeyLogging();

    for (const auto& [key, value] : settings) {
        if (startsWith(key, appSection)) {
            std::string rest = key.substr(appSection.size());
            size_t dot = rest.rfind('.');
            if (dot == std::string::npos || dot == 0) {
                throw ConfigError(origin, lineOf.at(key),
                                  "applications belong in [AppSelect.<key>] sections");
            }
            std::string trigger = rest.substr(0, dot);
            std::string field = rest.substr(dot + 1);
            AppBinding& app = config.appSelect[trigger];
            if (field == "Command") {
                app.command = value;
            } else if (field == "ProcessName") {
                app.processName = value;
            } else if (field == "WindowClass") {
                app.windowClass = value;
            } else {
                warning("Unknown config key '{}' at {}:{}", key, origin, lineOf.at(key));
            }
        } else if (startsWith(key, windowSection)) {
            std::string trigger = key.substr(windowSection.size());
            if (value.empty())
                throw ConfigError(origin, lineOf.at(key), "no operation given for window key '" + trigger + "'");
            config.windowManage[trigger] = WindowAction{value};
        }
    }

    for (const auto& [trigger, app] : config.appSelect) {
        if (trim(app.command).empty())
            throw ConfigError(origin + ": [AppSelect." + trigger + "] has no Command");
    }
    return config;
}

} // namespace uiauto
