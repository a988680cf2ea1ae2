#include "DisplayManager.hpp"
#include "../utils/Logger.hpp"

#include <cstdlib>

namespace uiauto {

Display* DisplayManager::display = nullptr;
bool DisplayManager::trapping = false;
int DisplayManager::trappedError = 0;

bool DisplayManager::Initialize() {
    if (display)
        return true;

    display = XOpenDisplay(nullptr);
    if (!display) {
        const char* name = std::getenv("DISPLAY");
        error("Error connecting to X server {}", name ? name : "(DISPLAY unset)");
        return false;
    }
    static Cleanup cleanup;
    XSetErrorHandler(X11ErrorHandler);
    XSetIOErrorHandler(X11IOErrorHandler);
    debug("Connected to X server {}", DisplayString(display));
    return true;
}

void DisplayManager::Close() {
    if (display) {
        XCloseDisplay(display);
        display = nullptr;
    }
}

Display* DisplayManager::GetDisplay() {
    Initialize();
    return display;
}

void DisplayManager::BeginErrorTrap() {
    if (display)
        XSync(display, x11::XFalse);
    trappedError = 0;
    trapping = true;
}

int DisplayManager::EndErrorTrap() {
    if (display)
        XSync(display, x11::XFalse);
    trapping = false;
    return trappedError;
}

int DisplayManager::X11ErrorHandler(Display* display, XErrorEvent* event) {
    if (trapping) {
        if (trappedError == 0)
            trappedError = event->error_code;
        return 0;
    }

    char errorText[256];
    XGetErrorText(display, event->error_code, errorText, sizeof(errorText));
    error("X11 Error: {} (code: {}, request: {}, minor: {})", errorText,
          static_cast<int>(event->error_code),
          static_cast<int>(event->request_code),
          static_cast<int>(event->minor_code));
    return 0;
}

int DisplayManager::X11IOErrorHandler(Display*) {
    fatal("X11 I/O Error - Display connection lost");
    std::exit(EXIT_FAILURE);
}

DisplayManager::Cleanup::~Cleanup() {
    DisplayManager::Close();
}

} // namespace uiauto
