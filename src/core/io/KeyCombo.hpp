#pragma once
#include <stdexcept>
#include <string>

namespace uiauto {

// A combo that cannot be parsed or grabbed.
class BindError : public std::runtime_error {
public:
    explicit BindError(const std::string& message)
        : std::runtime_error(message) {}
};

// X11 modifier masks (X11/X.h), kept here so callers need not include Xlib.
namespace mods {
    constexpr unsigned int Shift   = 1u << 0;
    constexpr unsigned int Lock    = 1u << 1;
    constexpr unsigned int Control = 1u << 2;
    constexpr unsigned int Mod1    = 1u << 3;
    constexpr unsigned int Mod2    = 1u << 4;
    constexpr unsigned int Mod3    = 1u << 5;
    constexpr unsigned int Mod4    = 1u << 6;
    constexpr unsigned int Mod5    = 1u << 7;
    constexpr unsigned int Any     = 1u << 15;
}

// "Mod-Mod-key", e.g. "Control-Mod1-b".
struct KeyCombo {
    unsigned int modifiers = 0;
    std::string key;

    // Canonical spelling: modifiers in mask order with their X names,
    // single letters lowercased. Two spellings of the same chord print the same.
    std::string ToString() const;

    static KeyCombo Parse(const std::string& combo);
    static unsigned int ParseModifier(const std::string& name);
};

inline std::string JoinCombo(const std::string& prefix, const std::string& key) {
    return prefix.empty() ? key : prefix + "-" + key;
}

} // namespace uiauto
