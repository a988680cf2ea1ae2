#pragma once
#include <optional>
#include <string>

#include "Launcher.hpp"
#include "../core/Configuration.hpp"
#include "../core/process/ProcessManager.hpp"
#include "../window/WindowControl.hpp"

namespace uiauto {

enum class ResolveOutcome {
    Focused,   // app was running, its window was asked to come forward
    Launched,  // app was not running, command started
    Skipped,   // app was running but has no window class to focus
    Failed     // query, focus or launch failed; already logged
};

const char* toString(ResolveOutcome outcome);

// Focus-or-launch for one AppBinding.
class ActionResolver {
public:
    ActionResolver(ProcessTable& processes, WindowControl& windows, ProcessLauncher& launcher)
        : processes(processes), windows(windows), launcher(launcher) {}

    ResolveOutcome resolve(const AppBinding& binding);

private:
    // nullopt when the process table could not be queried.
    std::optional<bool> isRunning(const std::string& processName);
    ResolveOutcome focus(const AppBinding& binding);
    ResolveOutcome launch(const AppBinding& binding);

    ProcessTable& processes;
    WindowControl& windows;
    ProcessLauncher& launcher;
};

} // namespace uiauto
