#pragma once
#include "x11.h"
#include "types.hpp"

namespace uiauto {

// Process-wide X11 connection. Opened lazily, closed at exit.
class DisplayManager {
public:
    static bool Initialize();
    static void Close();

    static Display* GetDisplay();

    // Between these two calls X errors are recorded instead of logged.
    // EndErrorTrap syncs with the server and returns the first error code
    // seen, or 0.
    static void BeginErrorTrap();
    static int EndErrorTrap();

private:
    static int X11ErrorHandler(Display* display, XErrorEvent* event);
    static int X11IOErrorHandler(Display* display);

    static Display* display;
    static bool trapping;
    static int trappedError;

    struct Cleanup {
        ~Cleanup();
    };
};

} // namespace uiauto
