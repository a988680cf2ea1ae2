#pragma once
#include <istream>
#include <map>
#include <sstream>
#include <stdexcept>
#include <string>

#include "Configuration.hpp"

namespace uiauto {

class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& message)
        : std::runtime_error(message) {}
    ConfigError(const std::string& origin, int line, const std::string& message)
        : std::runtime_error(origin + ":" + std::to_string(line) + ": " + message)
        , origin(origin), line(line) {}

    const std::string& getOrigin() const { return origin; }
    int getLine() const { return line; }

private:
    std::string origin;
    int line = 0;
};

namespace ConfigPaths {
    inline constexpr const char* CONFIG_FILE = "uiauto.conf";

    // $HOME/.config/uiauto; throws ConfigError when HOME is unset.
    std::string GetConfigDir();
    std::string GetDefaultConfigPath();
}

// Flat "Section.Key" -> value store over an INI document.
class Configs {
public:
    static const char* const DEFAULT_CONFIG;
    static constexpr int DEFAULT_LOG_MAX_DAYS = 3;

    static Configs& Get() {
        static Configs instance;
        return instance;
    }

    Configs() = default;

    // Writes DEFAULT_CONFIG to path when nothing exists there yet.
    // Returns true when the file was created.
    bool EnsureConfigFile(const std::string& path);

    void Load(const std::string& path);
    void Parse(std::istream& in, const std::string& origin = "<config>");

    const std::string& getPath() const { return path; }

    template<typename T>
    T Get(const std::string& key, T defaultValue) const {
        auto it = settings.find(key);
        if (it == settings.end()) return defaultValue;
        try {
            return Convert<T>(it->second);
        } catch (const std::logic_error&) {
            throw ConfigError("Invalid value for " + key + ": '" + it->second + "'");
        }
    }

    // Typed view used by the hotkey registry. Throws ConfigError.
    Configuration BuildConfiguration() const;

    bool GetVerboseKeyLogging() const { return Get<bool>("Debug.VerboseKeyLogging", false); }
    bool GetLogToFile() const { return Get<bool>("Log.File", true); }
    int GetLogMaxDays() const { return Get<int>("Log.MaxDays", DEFAULT_LOG_MAX_DAYS); }

private:
    std::string require(const std::string& key) const;

    std::map<std::string, std::string> settings;
    std::map<std::string, int> lineOf;
    std::string path;
    std::string origin = "<config>";

    template<typename T>
    static T Convert(const std::string& val) {
        std::istringstream iss(val);
        T result;
        iss >> result;
        return result;
    }
};

template<>
inline std::string Configs::Convert<std::string>(const std::string& val) {
    return val;
}

template<>
inline bool Configs::Convert<bool>(const std::string& val) {
    if (val == "true" || val == "1" || val == "yes") return true;
    if (val == "false" || val == "0" || val == "no") return false;
    throw std::invalid_argument("not a boolean");
}

template<>
inline int Configs::Convert<int>(const std::string& val) {
    size_t used = 0;
    int result = std::stoi(val, &used);
    if (used != val.size()) throw std::invalid_argument("trailing characters");
    return result;
}

} // namespace uiauto
