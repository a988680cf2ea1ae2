#pragma once
#include <optional>
#include "Geometry.hpp"

namespace uiauto {

// "What size is the primary display right now?" Asked fresh on every call.
class DisplayProbe {
public:
    virtual ~DisplayProbe() = default;
    virtual std::optional<ScreenGeometry> primaryDisplay() = 0;
};

// Runs `xrandr` and reads the first connected output.
class XrandrDisplayProbe : public DisplayProbe {
public:
    std::optional<ScreenGeometry> primaryDisplay() override;
};

} // namespace uiauto
