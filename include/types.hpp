#ifndef UIAUTO_TYPES_H
#define UIAUTO_TYPES_H

#include <string>
#include <cstdlib>

#if defined(__linux__)
    #include <sys/types.h>
    using wID = unsigned long; // X11 Window
    using pID = pid_t;
#else
    #error "uiauto drives an X11 session and builds on Linux only"
#endif

using str = std::string;
using cstr = const str&;

namespace uiauto {
    enum class DisplayServer {
        X11,
        Wayland,
        Unknown
    };

    inline DisplayServer DetectDisplayServer() {
        const char* session = getenv("XDG_SESSION_TYPE");
        if (session && std::string(session) == "wayland")
            return DisplayServer::Wayland;
        if (getenv("DISPLAY"))
            return DisplayServer::X11;
        if (getenv("WAYLAND_DISPLAY"))
            return DisplayServer::Wayland;
        return DisplayServer::Unknown;
    }
}
#endif // UIAUTO_TYPES_H
