#pragma once
#include <optional>
#include <string>

namespace uiauto {

struct ScreenGeometry {
    int width = 0;
    int height = 0;

    bool operator==(const ScreenGeometry&) const = default;
};

struct TargetRect {
    int x = 0;
    int y = 0;
    int width = 0;
    int height = 0;

    bool operator==(const TargetRect&) const = default;
};

inline constexpr double kCenterScale = 0.75;

// floor(scale * each dimension), centered on both axes. nullopt when the
// screen has a non-positive dimension or scale is outside (0, 1].
std::optional<TargetRect> computeCenteredRect(const ScreenGeometry& screen,
                                              double scale = kCenterScale);

// Dimensions of the first " connected" output in xrandr's text. Any +x+y
// offset is dropped. nullopt when no such line or token exists, or a
// dimension is zero.
std::optional<ScreenGeometry> parseXrandrOutput(const std::string& output);

} // namespace uiauto
