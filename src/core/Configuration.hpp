#pragma once
#include <map>
#include <string>

namespace uiauto {

// Modifier portion of a combo, e.g. "Control-Mod1".
using HotkeyPrefix = std::string;

// One application reachable from the app-select prefix.
struct AppBinding {
    std::string command;      // executable and whitespace-separated arguments
    std::string processName;  // matched against full command lines; empty = never running
    std::string windowClass;  // matched against WM_CLASS; empty = no focus attempt

    bool operator==(const AppBinding&) const = default;
};

struct WindowAction {
    std::string name;

    bool operator==(const WindowAction&) const = default;
};

inline constexpr const char* kCenterAction = "center";

struct Configuration {
    HotkeyPrefix appSelectPrefix;
    HotkeyPrefix windowManagePrefix;
    std::map<std::string, AppBinding> appSelect;      // trigger key -> app
    std::map<std::string, WindowAction> windowManage; // trigger key -> operation
    bool verboseKeyLogging = false;
};

} // namespace uiauto
