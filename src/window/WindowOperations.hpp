#pragma once
#include <string>

#include "DisplayProbe.hpp"
#include "WindowControl.hpp"

namespace uiauto {

// Named operations on the active window, bound under the window-manage prefix.
class WindowOperations {
public:
    WindowOperations(DisplayProbe& display, WindowControl& windows)
        : display(display), windows(windows) {}

    // Runs the operation called name. Unknown names do nothing and
    // return false.
    bool apply(const std::string& name);

    static bool isKnown(const std::string& name);

    // Resizes the active window to kCenterScale of the primary display,
    // centered. False when the display could not be measured or the move
    // was refused.
    bool center();

private:
    DisplayProbe& display;
    WindowControl& windows;
};

} // namespace uiauto
