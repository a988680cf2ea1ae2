#pragma once
#include <optional>
#include <string>
#include <vector>

#include "types.hpp"
#include "WindowControl.hpp"

namespace uiauto {

// EWMH window control on the shared DisplayManager connection.
class WindowManager : public WindowControl {
public:
    WindowManager() = default;

    bool focusByClass(const std::string& windowClass) override;
    bool moveResizeActive(const TargetRect& rect) override;

    static wID GetActiveWindow();
    // First managed window whose "res_name.res_class" contains className,
    // compared case-insensitively. 0 when none.
    static wID FindByClass(cstr className);
    static std::string GetWindowClass(wID window);
    static std::vector<wID> GetClientWindows();

    static bool ActivateWindow(wID window);
    static bool MoveResize(wID window, int x, int y, int width, int height);
    static bool Unmaximize(wID window);

    static bool IsSupported(cstr atomName);

private:
    static std::optional<unsigned long> GetCardinal(wID window, cstr atomName);
    static bool SendRootMessage(wID window, cstr messageType,
                                long l0, long l1 = 0, long l2 = 0, long l3 = 0, long l4 = 0);
};

} // namespace uiauto
