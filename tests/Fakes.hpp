#pragma once
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "core/io/KeyBinder.hpp"
#include "core/io/KeyCombo.hpp"
#include "core/process/ProcessManager.hpp"
#include "process/Launcher.hpp"
#include "window/DisplayProbe.hpp"
#include "window/WindowControl.hpp"

namespace uiauto::fakes {

// Canonicalizes like the X11 binder; combos listed in `rejected` fail as if
// another client owned them.
class FakeKeyBinder : public KeyBinder {
public:
    std::string Grab(const std::string& combo) override {
        KeyCombo parsed = KeyCombo::Parse(combo);
        std::string id = parsed.ToString();
        if (rejected.count(id)) {
            throw BindError(id + " is already grabbed by another client");
        }
        grabbed.push_back(id);
        return id;
    }

    std::set<std::string> rejected;
    std::vector<std::string> grabbed;
};

class FakeProcessTable : public ProcessTable {
public:
    std::optional<std::vector<pID>> findByCommandLine(const std::string& substring) override {
        queries.push_back(substring);
        if (failing) return std::nullopt;
        std::vector<pID> pids;
        for (const auto& [pid, command] : processes) {
            if (command.find(substring) != std::string::npos) pids.push_back(pid);
        }
        return pids;
    }

    std::map<pID, std::string> processes;
    std::vector<std::string> queries;
    bool failing = false;
};

class FakeWindowControl : public WindowControl {
public:
    bool focusByClass(const std::string& windowClass) override {
        focused.push_back(windowClass);
        return focusSucceeds;
    }

    bool moveResizeActive(const TargetRect& rect) override {
        moves.push_back(rect);
        return moveSucceeds;
    }

    std::vector<std::string> focused;
    std::vector<TargetRect> moves;
    bool focusSucceeds = true;
    bool moveSucceeds = true;
};

struct SpawnCall {
    std::string executable;
    std::vector<std::string> args;
};

// Optionally registers every successful spawn in a process table, so the
// next lookup sees the new instance.
class FakeLauncher : public ProcessLauncher {
public:
    explicit FakeLauncher(FakeProcessTable* table = nullptr) : table(table) {}

    ProcessResult spawn(const std::string& executable, const std::vector<std::string>& args) override {
        calls.push_back({executable, args});
        ProcessResult result;
        if (!succeeds) {
            result.error = "failed to start " + executable + ": No such file or directory";
            return result;
        }
        result.success = true;
        result.pid = nextPid;
        if (table) {
            std::string command = executable;
            for (const auto& arg : args) command += " " + arg;
            table->processes[nextPid] = command;
        }
        ++nextPid;
        return result;
    }

    std::vector<SpawnCall> calls;
    bool succeeds = true;
    pID nextPid = 4000;

private:
    FakeProcessTable* table;
};

class FakeDisplayProbe : public DisplayProbe {
public:
    std::optional<ScreenGeometry> primaryDisplay() override {
        ++probes;
        return screen;
    }

    std::optional<ScreenGeometry> screen = ScreenGeometry{1920, 1080};
    int probes = 0;
};

} // namespace uiauto::fakes
