#include "WindowOperations.hpp"
#include "../core/Configuration.hpp"
#include "../utils/Logger.hpp"

namespace uiauto {

bool WindowOperations::isKnown(const std::string& name) {
    return name == kCenterAction;
}

bool WindowOperations::apply(const std::string& name) {
    if (name == kCenterAction)
        return center();
    debug("Ignoring unknown window operation '{}'", name);
    return false;
}

bool WindowOperations::center() {
    auto screen = display.primaryDisplay();
    if (!screen) {
        error("Error centering window: screen dimensions unavailable");
        return false;
    }

    auto rect = computeCenteredRect(*screen);
    if (!rect) {
        error("Error centering window: invalid screen size {}x{}", screen->width, screen->height);
        return false;
    }

    if (!windows.moveResizeActive(*rect)) {
        error("Error centering window");
        return false;
    }
    debug("Centered active window at {},{} {}x{}", rect->x, rect->y, rect->width, rect->height);
    return true;
}

} // namespace uiauto
