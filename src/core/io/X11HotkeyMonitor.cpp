#include "X11HotkeyMonitor.hpp"
#include "KeyCombo.hpp"
#include "../DisplayManager.hpp"
#include "../../utils/Logger.hpp"

#include <cerrno>
#include <cstdint>
#include <cstring>
#include <poll.h>
#include <stdexcept>
#include <sys/eventfd.h>
#include <unistd.h>

namespace uiauto {

static_assert(mods::Shift == ShiftMask && mods::Lock == LockMask && mods::Control == ControlMask &&
              mods::Mod1 == Mod1Mask && mods::Mod4 == Mod4Mask && mods::Mod5 == Mod5Mask &&
              mods::Any == AnyModifier, "modifier masks must match X11/X.h");

namespace {
constexpr unsigned int RELEVANT_MODIFIERS =
    ShiftMask | ControlMask | Mod1Mask | Mod2Mask | Mod3Mask | Mod4Mask | Mod5Mask;
}

X11HotkeyMonitor::X11HotkeyMonitor(_XDisplay* disp)
    : display(disp) {
    if (!display) {
        throw std::invalid_argument("X11HotkeyMonitor needs an open display");
    }
    rootWindow = DefaultRootWindow(display);
    XSelectInput(display, rootWindow, KeyPressMask);
    UpdateNumLockMask();

    wakeFd = eventfd(0, EFD_CLOEXEC | EFD_NONBLOCK);
    if (wakeFd < 0) {
        throw std::runtime_error(std::string("eventfd failed: ") + std::strerror(errno));
    }
}

X11HotkeyMonitor::~X11HotkeyMonitor() {
    UngrabAll();
    if (wakeFd >= 0) close(wakeFd);
}

void X11HotkeyMonitor::UpdateNumLockMask() {
    numlockmask = 0;
    XModifierKeymap* modmap = XGetModifierMapping(display);
    if (!modmap) return;

    const KeyCode numlock = XKeysymToKeycode(display, XK_Num_Lock);
    for (unsigned int i = 0; i < 8; i++) {
        for (unsigned int j = 0; j < static_cast<unsigned int>(modmap->max_keypermod); j++) {
            if (numlock != 0 && modmap->modifiermap[i * modmap->max_keypermod + j] == numlock) {
                numlockmask = (1u << i);
            }
        }
    }
    XFreeModifiermap(modmap);
    debug("NumLock mask: 0x{:x}", numlockmask);
}

unsigned int X11HotkeyMonitor::CleanMask(unsigned int mask) const {
    return mask & ~(numlockmask | LockMask) & RELEVANT_MODIFIERS;
}

std::string X11HotkeyMonitor::Grab(const std::string& combo) {
    KeyCombo parsed = KeyCombo::Parse(combo);

    KeySym sym = XStringToKeysym(parsed.key.c_str());
    if (sym == x11::XNoSymbol) {
        throw BindError("unknown key name '" + parsed.key + "'");
    }
    KeyCode keycode = XKeysymToKeycode(display, sym);
    if (keycode == 0) {
        throw BindError("key '" + parsed.key + "' is not on this keyboard");
    }

    const std::string id = parsed.ToString();
    const auto slot = std::make_pair(static_cast<unsigned int>(keycode), parsed.modifiers);

    // Same physical chord already grabbed by us: just retarget it.
    auto existing = grabs.find(slot);
    if (existing != grabs.end()) {
        existing->second = id;
        return id;
    }

    DisplayManager::BeginErrorTrap();
    GrabVariants(keycode, parsed.modifiers);
    int failure = DisplayManager::EndErrorTrap();

    if (failure != 0) {
        DisplayManager::BeginErrorTrap();
        UngrabVariants(keycode, parsed.modifiers);
        DisplayManager::EndErrorTrap();
        if (failure == x11::XBadAccess) {
            throw BindError(id + " is already grabbed by another client");
        }
        char errorText[256];
        XGetErrorText(display, failure, errorText, sizeof(errorText));
        throw BindError("cannot grab " + id + ": " + errorText);
    }

    grabs.emplace(slot, id);
    debug("Grabbed {} (keycode {}, mods 0x{:x})", id, static_cast<unsigned int>(keycode), parsed.modifiers);
    return id;
}

void X11HotkeyMonitor::GrabVariants(unsigned int keycode, unsigned int modifiers) {
    const unsigned int modVariants[] = {0, LockMask, numlockmask, numlockmask | LockMask};
    for (unsigned int variant : modVariants) {
        XGrabKey(display, static_cast<int>(keycode), modifiers | variant, rootWindow, x11::XTrue,
                 GrabModeAsync, GrabModeAsync);
    }
}

void X11HotkeyMonitor::UngrabVariants(unsigned int keycode, unsigned int modifiers) {
    const unsigned int modVariants[] = {0, LockMask, numlockmask, numlockmask | LockMask};
    for (unsigned int variant : modVariants) {
        XUngrabKey(display, static_cast<int>(keycode), modifiers | variant, rootWindow);
    }
}

void X11HotkeyMonitor::UngrabAll() {
    if (grabs.empty()) return;

    DisplayManager::BeginErrorTrap();
    for (const auto& [slot, combo] : grabs) {
        UngrabVariants(slot.first, slot.second);
    }
    DisplayManager::EndErrorTrap();
    grabs.clear();
}

void X11HotkeyMonitor::RefreshModifierMapping() {
    const unsigned int oldMask = numlockmask;
    UpdateNumLockMask();
    if (numlockmask == oldMask || grabs.empty()) return;

    // Drop the variants built from the old mask, then grab with the new one.
    DisplayManager::BeginErrorTrap();
    const unsigned int newMask = numlockmask;
    numlockmask = oldMask;
    for (const auto& [slot, combo] : grabs) {
        UngrabVariants(slot.first, slot.second);
    }
    numlockmask = newMask;
    for (const auto& [slot, combo] : grabs) {
        GrabVariants(slot.first, slot.second);
    }
    int failure = DisplayManager::EndErrorTrap();
    if (failure != 0) {
        warning("Re-grabbing hotkeys after a NumLock change failed (X error {})", failure);
    } else {
        debug("Re-grabbed {} hotkeys for NumLock mask 0x{:x}", grabs.size(), numlockmask);
    }
}

int X11HotkeyMonitor::ConnectionFd() const {
    return ConnectionNumber(display);
}

void X11HotkeyMonitor::Dispatch(unsigned int keycode, unsigned int state) {
    auto it = grabs.find({keycode, CleanMask(state)});
    if (it == grabs.end()) {
        it = grabs.find({keycode, static_cast<unsigned int>(AnyModifier)});
    }
    if (it == grabs.end() || !dispatcher) {
        return;
    }

    // Copy: the dispatcher may re-grab and invalidate the iterator.
    const std::string combo = it->second;
    try {
        dispatcher(combo);
    } catch (const std::exception& e) {
        error("Error handling hotkey {}: {}", combo, e.what());
    }
}

void X11HotkeyMonitor::ProcessPendingEvents() {
    XEvent event;
    while (XPending(display) > 0) {
        XNextEvent(display, &event);
        switch (event.type) {
            case x11::XKeyPress:
                Dispatch(event.xkey.keycode, event.xkey.state);
                break;
            case x11::XMappingNotify:
                XRefreshKeyboardMapping(&event.xmapping);
                if (event.xmapping.request == MappingModifier) {
                    RefreshModifierMapping();
                }
                break;
            default:
                break;
        }
    }
}

void X11HotkeyMonitor::Run() {
    if (stopRequested.load()) {
        debug("Stop requested before the monitoring loop started");
        return;
    }
    info("X11 hotkey monitoring loop started");

    pollfd fds[2] = {
        {ConnectionFd(), POLLIN, 0},
        {wakeFd, POLLIN, 0},
    };

    ProcessPendingEvents();
    while (!stopRequested.load()) {
        int ready = poll(fds, 2, -1);
        if (ready < 0) {
            if (errno == EINTR) continue;
            error("poll failed: {}", std::strerror(errno));
            break;
        }
        if (fds[1].revents & POLLIN) {
            uint64_t value;
            ssize_t ignored = read(wakeFd, &value, sizeof(value));
            (void)ignored;
        }
        if (fds[0].revents & (POLLHUP | POLLERR)) {
            error("X11 connection closed");
            break;
        }
        if (!stopRequested.load()) {
            ProcessPendingEvents();
        }
    }

    info("X11 hotkey monitoring loop stopped");
}

void X11HotkeyMonitor::Stop() {
    stopRequested = true;
    uint64_t one = 1;
    ssize_t ignored = write(wakeFd, &one, sizeof(one));
    (void)ignored;
}

} // namespace uiauto
