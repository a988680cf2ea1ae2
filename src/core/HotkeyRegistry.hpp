#pragma once
#include <cstddef>
#include <string>
#include <unordered_map>
#include <variant>

#include "Configuration.hpp"
#include "io/KeyBinder.hpp"
#include "../process/ActionResolver.hpp"
#include "../window/WindowOperations.hpp"

namespace uiauto {

struct LaunchOrFocus {
    AppBinding binding;
};

struct WindowOp {
    std::string name;
};

using BoundAction = std::variant<LaunchOrFocus, WindowOp>;

// Canonical combo -> action. Built at startup, read-only afterwards.
using DispatchTable = std::unordered_map<std::string, BoundAction>;

class HotkeyRegistry {
public:
    HotkeyRegistry(KeyBinder& binder, ActionResolver& resolver, WindowOperations& windowOps)
        : binder(binder), resolver(resolver), windowOps(windowOps) {}

    // Takes ownership of the configuration and registers every binding in it.
    // Returns the number of combos that were installed.
    size_t install(Configuration configuration);

    // Both return false when the binder rejected the combo; the failure is
    // logged and the table is left untouched. A combo registered twice
    // keeps its last action.
    bool registerAppBinding(const HotkeyPrefix& prefix, const std::string& key,
                            const AppBinding& binding);
    bool registerWindowAction(const HotkeyPrefix& prefix, const std::string& key,
                              const std::string& actionName);

    // Runs the action bound to a canonical combo. False for unbound combos.
    bool dispatch(const std::string& combo);

    const DispatchTable& table() const { return routes; }
    const Configuration& configuration() const { return config; }

    void setVerboseKeyLogging(bool enabled) { verboseKeyLogging = enabled; }

private:
    bool bind(const std::string& combo, BoundAction action, const std::string& what);

    KeyBinder& binder;
    ActionResolver& resolver;
    WindowOperations& windowOps;

    Configuration config;
    DispatchTable routes;
    bool verboseKeyLogging = false;
};

} // namespace uiauto
