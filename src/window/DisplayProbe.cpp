#include "DisplayProbe.hpp"
#include "../process/Launcher.hpp"
#include "../utils/Logger.hpp"

namespace uiauto {

std::optional<ScreenGeometry> XrandrDisplayProbe::primaryDisplay() {
    ProcessResult result = Launcher::capture("xrandr");
    if (!result.success) {
        error("Error getting screen dimensions: {}", result.error);
        return std::nullopt;
    }

    auto screen = parseXrandrOutput(result.output);
    if (!screen) {
        error("Error parsing screen dimensions.");
        return std::nullopt;
    }
    debug("Primary display is {}x{}", screen->width, screen->height);
    return screen;
}

} // namespace uiauto
