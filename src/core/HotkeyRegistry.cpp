#include "HotkeyRegistry.hpp"
#include "io/KeyCombo.hpp"
#include "../utils/Logger.hpp"

#include <type_traits>
#include <utility>

namespace uiauto {

size_t HotkeyRegistry::install(Configuration configuration) {
    config = std::move(configuration);
    verboseKeyLogging = verboseKeyLogging || config.verboseKeyLogging;

    for (const auto& [key, app] : config.appSelect) {
        registerAppBinding(config.appSelectPrefix, key, app);
    }
    info("Keymaps set. Use {}-[key] to launch or focus applications.", config.appSelectPrefix);

    for (const auto& [key, action] : config.windowManage) {
        if (!WindowOperations::isKnown(action.name)) {
            warning("Window key '{}' is bound to unknown operation '{}'; it will do nothing",
                    key, action.name);
        }
        registerWindowAction(config.windowManagePrefix, key, action.name);
    }
    info("Keymaps set. Use {}-[key] to manage windows.", config.windowManagePrefix);

    return routes.size();
}

bool HotkeyRegistry::registerAppBinding(const HotkeyPrefix& prefix, const std::string& key,
                                        const AppBinding& binding) {
    return bind(JoinCombo(prefix, key), LaunchOrFocus{binding}, binding.command);
}

bool HotkeyRegistry::registerWindowAction(const HotkeyPrefix& prefix, const std::string& key,
                                          const std::string& actionName) {
    return bind(JoinCombo(prefix, key), WindowOp{actionName}, actionName);
}

bool HotkeyRegistry::bind(const std::string& combo, BoundAction action, const std::string& what) {
    std::string id;
    try {
        id = binder.Grab(combo);
    } catch (const BindError& e) {
        error("Error binding key {} for {}: {}", combo, what, e.what());
        return false;
    }

    auto [it, inserted] = routes.insert_or_assign(id, std::move(action));
    if (!inserted) {
        debug("Rebinding {} to {}", id, what);
    } else {
        debug("Bound {} to {}", id, what);
    }
    return true;
}

bool HotkeyRegistry::dispatch(const std::string& combo) {
    auto it = routes.find(combo);
    if (it == routes.end()) {
        debug("No action bound to {}", combo);
        return false;
    }

    if (verboseKeyLogging) {
        info("Hotkey pressed: {}", combo);
    }

    std::visit([this, &combo](const auto& action) {
        using T = std::decay_t<decltype(action)>;
        if constexpr (std::is_same_v<T, LaunchOrFocus>) {
            ResolveOutcome outcome = resolver.resolve(action.binding);
            if (verboseKeyLogging) {
                info("{}: {} {}", combo, action.binding.command, toString(outcome));
            }
        } else {
            windowOps.apply(action.name);
        }
    }, it->second);
    return true;
}

} // namespace uiauto
