#include "KeyCombo.hpp"
#include "../../utils/Util.hpp"

#include <cctype>
#include <unordered_map>
#include <utility>

namespace uiauto {

namespace {
const std::pair<unsigned int, const char*> kModifierNames[] = {
    {mods::Shift, "Shift"},
    {mods::Lock, "Lock"},
    {mods::Control, "Control"},
    {mods::Mod1, "Mod1"},
    {mods::Mod2, "Mod2"},
    {mods::Mod3, "Mod3"},
    {mods::Mod4, "Mod4"},
    {mods::Mod5, "Mod5"},
};
}

unsigned int KeyCombo::ParseModifier(const std::string& name) {
    static const std::unordered_map<std::string, unsigned int> modifiers = {
        {"shift", mods::Shift},
        {"lock", mods::Lock},
        {"control", mods::Control},
        {"ctrl", mods::Control},
        {"mod1", mods::Mod1},
        {"alt", mods::Mod1},
        {"mod2", mods::Mod2},
        {"mod3", mods::Mod3},
        {"mod4", mods::Mod4},
        {"super", mods::Mod4},
        {"win", mods::Mod4},
        {"mod5", mods::Mod5},
        {"any", mods::Any},
    };
    auto it = modifiers.find(toLower(name));
    if (it == modifiers.end())
        throw BindError("unknown modifier '" + name + "'");
    return it->second;
}

KeyCombo KeyCombo::Parse(const std::string& combo) {
    std::string text = trim(combo);
    if (text.empty())
        throw BindError("empty key combination");

    auto parts = split(text, '-');
    // split() drops a trailing empty field, so "Control-" yields one part.
    if (text.back() == '-')
        throw BindError("key combination '" + combo + "' has no key");

    KeyCombo result;
    for (size_t i = 0; i + 1 < parts.size(); ++i) {
        std::string name = trim(parts[i]);
        if (name.empty())
            throw BindError("empty modifier in '" + combo + "'");
        result.modifiers |= ParseModifier(name);
    }
    // AnyModifier grabs every state, so it cannot be narrowed.
    if ((result.modifiers & mods::Any) && result.modifiers != mods::Any)
        throw BindError("'Any' cannot be combined with other modifiers in '" + combo + "'");

    result.key = trim(parts.back());
    if (result.key.empty())
        throw BindError("key combination '" + combo + "' has no key");
    if (result.key.size() == 1 && std::isalpha(static_cast<unsigned char>(result.key[0])))
        result.key = toLower(result.key);
    return result;
}

std::string KeyCombo::ToString() const {
    std::string out;
    if (modifiers & mods::Any) {
        out = "Any-";
    } else {
        for (const auto& [mask, name] : kModifierNames) {
            if (modifiers & mask) {
                out += name;
                out += '-';
            }
        }
    }
    return out + key;
}

} // namespace uiauto
