#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace uiauto {

struct ProcessResult {
    int64_t pid = -1;
    int32_t exitCode = -1;
    bool success = false;
    std::string error;
    std::string output;           // captured stdout, capture() only
};

// Starts programs on behalf of the action resolver.
class ProcessLauncher {
public:
    virtual ~ProcessLauncher() = default;

    // Fire-and-forget start. success is true once the program has been
    // exec'd; the child is never waited on.
    virtual ProcessResult spawn(const std::string& executable,
                                const std::vector<std::string>& args) = 0;
};

class Launcher : public ProcessLauncher {
public:
    ProcessResult spawn(const std::string& executable,
                        const std::vector<std::string>& args) override {
        return runDetached(executable, args);
    }

    // Double fork + setsid: the program is reparented to init and never
    // becomes our zombie.
    static ProcessResult runDetached(const std::string& executable,
                                     const std::vector<std::string>& args = {});

    // Runs to completion and collects stdout. Blocks without a timeout.
    static ProcessResult capture(const std::string& executable,
                                 const std::vector<std::string>& args = {});

    // Whitespace split, no quoting or escapes. First token is the executable.
    static std::vector<std::string> parseCommandLine(const std::string& cmdLine);

    static bool kill(int64_t pid, bool force = false);
    static bool isRunning(int64_t pid);
};

} // namespace uiauto
