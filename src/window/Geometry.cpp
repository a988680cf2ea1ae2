#include "Geometry.hpp"

#include <cmath>
#include <regex>
#include <sstream>

namespace uiauto {

std::optional<TargetRect> computeCenteredRect(const ScreenGeometry& screen, double scale) {
    if (screen.width <= 0 || screen.height <= 0 || !(scale > 0.0 && scale <= 1.0))
        return std::nullopt;

    TargetRect rect;
    rect.width = static_cast<int>(std::floor(screen.width * scale));
    rect.height = static_cast<int>(std::floor(screen.height * scale));
    rect.x = (screen.width - rect.width) / 2;
    rect.y = (screen.height - rect.height) / 2;
    return rect;
}

std::optional<ScreenGeometry> parseXrandrOutput(const std::string& output) {
    static const std::regex mode(R"((\d+)x(\d+)(\+\d+\+\d+)?)");

    std::istringstream in(output);
    std::string line;
    while (std::getline(in, line)) {
        if (line.find(" connected") == std::string::npos)
            continue;

        // Only the first connected output counts, even if it has no mode.
        std::smatch match;
        if (!std::regex_search(line, match, mode))
            return std::nullopt;

        ScreenGeometry screen;
        try {
            screen.width = std::stoi(match[1].str());
            screen.height = std::stoi(match[2].str());
        } catch (const std::out_of_range&) {
            return std::nullopt;
        }
        if (screen.width == 0 || screen.height == 0)
            return std::nullopt;
        return screen;
    }
    return std::nullopt;
}

} // namespace uiauto
