#include "WindowManager.hpp"
#include "../core/DisplayManager.hpp"
#include "../utils/Logger.hpp"
#include "../utils/Util.hpp"

namespace uiauto {

namespace {
// EWMH source indication: pagers and other tools that act for the user.
constexpr long kSourcePager = 2;
constexpr long kStateRemove = 0;
constexpr unsigned long kAllDesktops = 0xFFFFFFFF;

std::vector<unsigned long> readLongList(Display* display, ::Window window, Atom property, Atom type) {
    std::vector<unsigned long> values;
    Atom actualType;
    int actualFormat;
    unsigned long nItems, bytesAfter;
    unsigned char* data = nullptr;

    if (XGetWindowProperty(display, window, property, 0, ~0L, x11::XFalse, type,
                           &actualType, &actualFormat, &nItems, &bytesAfter,
                           &data) == x11::XSuccess && data) {
        // Format-32 properties arrive as an array of long.
        if (actualFormat == 32) {
            auto* items = reinterpret_cast<unsigned long*>(data);
            values.assign(items, items + nItems);
        }
        XFree(data);
    }
    return values;
}
}

wID WindowManager::GetActiveWindow() {
    Display* display = DisplayManager::GetDisplay();
    if (!display) return 0;

    Atom activeWindowAtom = XInternAtom(display, "_NET_ACTIVE_WINDOW", x11::XFalse);
    auto active = readLongList(display, DefaultRootWindow(display), activeWindowAtom, XA_WINDOW);
    if (!active.empty() && active.front() != 0)
        return active.front();

    // No EWMH active window: fall back to the focus holder.
    ::Window focused = 0;
    int revert = 0;
    XGetInputFocus(display, &focused, &revert);
    if (focused == x11::XNone || focused == PointerRoot)
        return 0;
    return focused;
}

std::vector<wID> WindowManager::GetClientWindows() {
    Display* display = DisplayManager::GetDisplay();
    if (!display) return {};
    ::Window root = DefaultRootWindow(display);

    Atom clientListAtom = XInternAtom(display, "_NET_CLIENT_LIST", x11::XFalse);
    auto clients = readLongList(display, root, clientListAtom, XA_WINDOW);
    if (!clients.empty())
        return std::vector<wID>(clients.begin(), clients.end());

    // Non-EWMH window manager: top-level windows and their direct children,
    // since reparenting managers put WM_CLASS on the inner client.
    std::vector<wID> windows;
    ::Window rootReturn, parentReturn;
    ::Window* children = nullptr;
    unsigned int count = 0;
    if (!XQueryTree(display, root, &rootReturn, &parentReturn, &children, &count))
        return windows;

    for (unsigned int i = 0; i < count; ++i) {
        windows.push_back(children[i]);
        ::Window* grandchildren = nullptr;
        unsigned int inner = 0;
        if (XQueryTree(display, children[i], &rootReturn, &parentReturn, &grandchildren, &inner)) {
            windows.insert(windows.end(), grandchildren, grandchildren + inner);
            if (grandchildren) XFree(grandchildren);
        }
    }
    if (children) XFree(children);
    return windows;
}

std::string WindowManager::GetWindowClass(wID window) {
    Display* display = DisplayManager::GetDisplay();
    if (!display || window == 0) return "";

    XClassHint classHint;
    if (!XGetClassHint(display, window, &classHint))
        return "";

    std::string result;
    if (classHint.res_name) {
        result = classHint.res_name;
        XFree(classHint.res_name);
    }
    result += '.';
    if (classHint.res_class) {
        result += classHint.res_class;
        XFree(classHint.res_class);
    }
    return result;
}

wID WindowManager::FindByClass(cstr className) {
    if (className.empty()) return 0;

    // Windows can vanish between listing and querying them.
    DisplayManager::BeginErrorTrap();
    wID found = 0;
    for (wID window : GetClientWindows()) {
        if (insens(GetWindowClass(window), className)) {
            found = window;
            break;
        }
    }
    DisplayManager::EndErrorTrap();
    return found;
}

bool WindowManager::IsSupported(cstr atomName) {
    Display* display = DisplayManager::GetDisplay();
    if (!display) return false;

    Atom supportedAtom = XInternAtom(display, "_NET_SUPPORTED", x11::XFalse);
    Atom wanted = XInternAtom(display, atomName.c_str(), x11::XFalse);
    for (unsigned long atom : readLongList(display, DefaultRootWindow(display), supportedAtom, XA_ATOM)) {
        if (atom == wanted) return true;
    }
    return false;
}

std::optional<unsigned long> WindowManager::GetCardinal(wID window, cstr atomName) {
    Display* display = DisplayManager::GetDisplay();
    if (!display) return std::nullopt;

    Atom atom = XInternAtom(display, atomName.c_str(), x11::XFalse);
    auto values = readLongList(display, window, atom, XA_CARDINAL);
    if (values.empty()) return std::nullopt;
    return values.front();
}

bool WindowManager::SendRootMessage(wID window, cstr messageType,
                                    long l0, long l1, long l2, long l3, long l4) {
    Display* display = DisplayManager::GetDisplay();
    if (!display) return false;

    XEvent event = {};
    event.xclient.type = x11::XClientMessage;
    event.xclient.send_event = x11::XTrue;
    event.xclient.display = display;
    event.xclient.window = window;
    event.xclient.message_type = XInternAtom(display, messageType.c_str(), x11::XFalse);
    event.xclient.format = 32;
    event.xclient.data.l[0] = l0;
    event.xclient.data.l[1] = l1;
    event.xclient.data.l[2] = l2;
    event.xclient.data.l[3] = l3;
    event.xclient.data.l[4] = l4;

    return XSendEvent(display, DefaultRootWindow(display), x11::XFalse,
                      SubstructureRedirectMask | SubstructureNotifyMask, &event) != 0;
}

bool WindowManager::ActivateWindow(wID window) {
    Display* display = DisplayManager::GetDisplay();
    if (!display || window == 0) return false;

    if (!IsSupported("_NET_ACTIVE_WINDOW")) {
        XRaiseWindow(display, window);
        XSetInputFocus(display, window, RevertToParent, CurrentTime);
        XFlush(display);
        return true;
    }

    auto desktop = GetCardinal(window, "_NET_WM_DESKTOP");
    auto current = GetCardinal(DefaultRootWindow(display), "_NET_CURRENT_DESKTOP");
    if (desktop && current && *desktop != kAllDesktops && *desktop != *current) {
        if (!SendRootMessage(DefaultRootWindow(display), "_NET_CURRENT_DESKTOP",
                             static_cast<long>(*desktop), CurrentTime)) {
            warning("Failed to switch to desktop {}", *desktop);
        }
    }

    bool sent = SendRootMessage(window, "_NET_ACTIVE_WINDOW", kSourcePager, CurrentTime);
    XMapRaised(display, window);
    XFlush(display);
    return sent;
}

bool WindowManager::Unmaximize(wID window) {
    Display* display = DisplayManager::GetDisplay();
    if (!display || window == 0) return false;

    Atom vert = XInternAtom(display, "_NET_WM_STATE_MAXIMIZED_VERT", x11::XFalse);
    Atom horz = XInternAtom(display, "_NET_WM_STATE_MAXIMIZED_HORZ", x11::XFalse);
    return SendRootMessage(window, "_NET_WM_STATE", kStateRemove,
                           static_cast<long>(vert), static_cast<long>(horz), kSourcePager);
}

bool WindowManager::MoveResize(wID window, int x, int y, int width, int height) {
    Display* display = DisplayManager::GetDisplay();
    if (!display || window == 0) return false;
    if (width <= 0 || height <= 0) {
        error("Refusing to resize window to {}x{}", width, height);
        return false;
    }

    if (IsSupported("_NET_MOVERESIZE_WINDOW")) {
        // Gravity from the window, x/y/width/height present, pager source.
        const long flags = (1L << 8) | (1L << 9) | (1L << 10) | (1L << 11) | (kSourcePager << 12);
        if (!SendRootMessage(window, "_NET_MOVERESIZE_WINDOW", flags, x, y, width, height))
            return false;
    } else {
        XMoveResizeWindow(display, window, x, y,
                          static_cast<unsigned int>(width), static_cast<unsigned int>(height));
    }
    XFlush(display);
    return true;
}

bool WindowManager::focusByClass(const std::string& windowClass) {
    wID window = FindByClass(windowClass);
    if (window == 0) {
        warning("No window with class '{}' found", windowClass);
        return false;
    }
    debug("Focusing window 0x{:x} ({})", window, windowClass);
    return ActivateWindow(window);
}

bool WindowManager::moveResizeActive(const TargetRect& rect) {
    wID window = GetActiveWindow();
    if (window == 0) {
        error("No active window to move");
        return false;
    }
    Unmaximize(window);
    return MoveResize(window, rect.x, rect.y, rect.width, rect.height);
}

} // namespace uiauto
