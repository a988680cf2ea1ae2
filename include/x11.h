#pragma once
// Include this instead of the raw Xlib headers. The X11 macros that collide
// with Qt and the standard library are undefined below; use the x11::
// constants in their place.
namespace x11 {
    using XStatus = int;
    using XBool = int;
    constexpr unsigned long XNone = 0L;
    constexpr int XTrue = 1;
    constexpr int XFalse = 0;
    constexpr int XSuccess = 0;
    constexpr int XBadWindow = 3;
    constexpr int XBadAccess = 10;

    // Event types
    constexpr int XKeyPress = 2;
    constexpr int XKeyRelease = 3;
    constexpr int XClientMessage = 33;
    constexpr int XMappingNotify = 34;

    constexpr unsigned long XNoSymbol = 0L;
}

#include <X11/Xlib.h>
#include <X11/Xutil.h>
#include <X11/Xatom.h>
#include <X11/Xproto.h>
#include <X11/keysym.h>

#undef None
#undef True
#undef False
#undef Success
#undef Status
#undef Bool
#undef Always
#undef BadRequest
#undef BadValue
#undef BadWindow
#undef BadPixmap
#undef BadAtom
#undef BadMatch
#undef BadAccess
#undef BadAlloc
#undef BadName
#undef BadLength
#undef BadImplementation
#undef KeyPress
#undef KeyRelease
#undef ButtonPress
#undef ButtonRelease
#undef MotionNotify
#undef FocusIn
#undef FocusOut
#undef Expose
#undef CreateNotify
#undef DestroyNotify
#undef UnmapNotify
#undef MapNotify
#undef PropertyNotify
#undef ClientMessage
#undef MappingNotify
#undef GenericEvent
#undef LASTEvent
#undef InputOutput
#undef InputOnly
#undef CursorShape
#undef FontChange
#undef Unsorted
#undef GrayScale

namespace x11 {
    using Display = ::Display;
    using Window = ::Window;
    using XEvent = ::XEvent;
    using KeyCode = ::KeyCode;
    using KeySym = ::KeySym;
    using Atom = ::Atom;
    using XWindowAttributes = ::XWindowAttributes;
    using XClassHint = ::XClassHint;
    using XKeyEvent = ::XKeyEvent;
    using XClientMessageEvent = ::XClientMessageEvent;
    using XMappingEvent = ::XMappingEvent;
    using XErrorEvent = ::XErrorEvent;
}
