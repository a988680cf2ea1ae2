#pragma once

#include <atomic>
#include <functional>
#include <map>
#include <string>
#include <utility>

#include "KeyBinder.hpp"

// Xlib is kept out of this header so Qt code can include it.
struct _XDisplay;

namespace uiauto {

/**
 * X11HotkeyMonitor - global key grabs on the root window
 *
 * Grab() installs a passive grab for a combo (in all four NumLock/CapsLock
 * variants) and remembers which canonical combo it belongs to. Key presses
 * are handed to the dispatcher on the thread that pumps events, either
 * Run() or a caller watching ConnectionFd().
 */
class X11HotkeyMonitor : public KeyBinder {
public:
    using Dispatcher = std::function<void(const std::string& combo)>;

    explicit X11HotkeyMonitor(_XDisplay* display);
    ~X11HotkeyMonitor() override;

    X11HotkeyMonitor(const X11HotkeyMonitor&) = delete;
    X11HotkeyMonitor& operator=(const X11HotkeyMonitor&) = delete;

    std::string Grab(const std::string& combo) override;
    void UngrabAll();

    void SetDispatcher(Dispatcher fn) { dispatcher = std::move(fn); }

    int ConnectionFd() const;

    // Drains every queued X event. Safe to call when nothing is pending.
    void ProcessPendingEvents();

    // Blocks pumping events until Stop() or the connection breaks. Returns
    // at once if Stop() was already called.
    void Run();

    // Thread-safe and sticky; wakes Run().
    void Stop();

    // Re-reads the NumLock modifier and re-grabs every combo with the new
    // lock variants. Called on MappingNotify.
    void RefreshModifierMapping();

private:
    void UpdateNumLockMask();
    unsigned int CleanMask(unsigned int mask) const;
    void GrabVariants(unsigned int keycode, unsigned int modifiers);
    void UngrabVariants(unsigned int keycode, unsigned int modifiers);
    void Dispatch(unsigned int keycode, unsigned int state);

    _XDisplay* display = nullptr;
    unsigned long rootWindow = 0;
    unsigned int numlockmask = 0;
    int wakeFd = -1;
    std::atomic<bool> stopRequested{false};

    // (keycode, modifiers) -> canonical combo
    std::map<std::pair<unsigned int, unsigned int>, std::string> grabs;
    Dispatcher dispatcher;
};

} // namespace uiauto
