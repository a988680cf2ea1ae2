#include "ActionResolver.hpp"
#include "../utils/Logger.hpp"

namespace uiauto {

const char* toString(ResolveOutcome outcome) {
    switch (outcome) {
        case ResolveOutcome::Focused: return "focused";
        case ResolveOutcome::Launched: return "launched";
        case ResolveOutcome::Skipped: return "skipped";
        case ResolveOutcome::Failed: return "failed";
    }
    return "unknown";
}

ResolveOutcome ActionResolver::resolve(const AppBinding& binding) {
    auto running = isRunning(binding.processName);
    if (!running) {
        error("Error checking if {} is running", binding.processName);
        return ResolveOutcome::Failed;
    }
    return *running ? focus(binding) : launch(binding);
}

std::optional<bool> ActionResolver::isRunning(const std::string& processName) {
    // An app without a process name is always started fresh.
    if (processName.empty())
        return false;

    auto pids = processes.findByCommandLine(processName);
    if (!pids)
        return std::nullopt;
    return !pids->empty();
}

ResolveOutcome ActionResolver::focus(const AppBinding& binding) {
    if (binding.windowClass.empty()) {
        info("{} is running and has no window class to focus", binding.processName);
        return ResolveOutcome::Skipped;
    }
    if (!windows.focusByClass(binding.windowClass)) {
        error("Error focusing window for {}", binding.windowClass);
        return ResolveOutcome::Failed;
    }
    return ResolveOutcome::Focused;
}

ResolveOutcome ActionResolver::launch(const AppBinding& binding) {
    auto argv = Launcher::parseCommandLine(binding.command);
    if (argv.empty()) {
        error("Error starting application: empty command");
        return ResolveOutcome::Failed;
    }

    std::string executable = argv.front();
    argv.erase(argv.begin());
    ProcessResult result = launcher.spawn(executable, argv);
    if (!result.success) {
        error("Error starting {}: {}", binding.command, result.error);
        return ResolveOutcome::Failed;
    }
    info("Launched {} (pid {})", binding.command, result.pid);
    return ResolveOutcome::Launched;
}

} // namespace uiauto
