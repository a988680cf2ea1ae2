#pragma once
#include <string>

namespace uiauto {

// Installs a global key grab for a combo such as "Control-Mod1-b".
class KeyBinder {
public:
    virtual ~KeyBinder() = default;

    // Returns the canonical combo id that key presses will be reported
    // under. Throws BindError when the combo is malformed or already
    // owned by another client.
    virtual std::string Grab(const std::string& combo) = 0;
};

} // namespace uiauto
