#pragma once
#include <string>
#include "Geometry.hpp"

namespace uiauto {

// Window-system side effects the core asks for.
class WindowControl {
public:
    virtual ~WindowControl() = default;

    // Raises and focuses a window whose class matches. False when no window
    // matched or the request could not be sent.
    virtual bool focusByClass(const std::string& windowClass) = 0;

    virtual bool moveResizeActive(const TargetRect& rect) = 0;
};

} // namespace uiauto
