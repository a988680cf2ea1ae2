#include "ProcessManager.hpp"
#include "../../utils/Logger.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <dirent.h>
#include <fstream>
#include <iterator>
#include <memory>

namespace uiauto {

std::optional<std::vector<int32_t>> ProcessManager::listPids() {
    std::unique_ptr<DIR, int (*)(DIR*)> dir(opendir("/proc"), closedir);
    if (!dir) {
        error("Cannot open /proc: {}", std::strerror(errno));
        return std::nullopt;
    }

    std::vector<int32_t> pids;
    struct dirent* entry;
    while ((entry = readdir(dir.get())) != nullptr) {
        if (entry->d_type != DT_DIR && entry->d_type != DT_UNKNOWN) {
            continue;
        }
        char* endptr;
        long pid = strtol(entry->d_name, &endptr, 10);
        if (*endptr != '\0' || pid <= 0) {
            continue;
        }
        pids.push_back(static_cast<int32_t>(pid));
    }
    return pids;
}

std::optional<std::vector<ProcessManager::ProcessInfo>> ProcessManager::listProcesses() {
    auto pids = listPids();
    if (!pids) return std::nullopt;

    std::vector<ProcessInfo> processes;
    processes.reserve(pids->size());
    for (int32_t pid : *pids) {
        // Kernel threads and processes that exited mid-scan have no cmdline.
        std::string command = getProcessCommand(pid);
        if (!command.empty())
            processes.push_back({pid, std::move(command)});
    }
    return processes;
}

std::string ProcessManager::getProcessCommand(int32_t pid) {
    std::string cmdline = readFile("/proc/" + std::to_string(pid) + "/cmdline");
    for (char& c : cmdline) {
        if (c == '\0') {
            c = ' ';
        }
    }
    while (!cmdline.empty() && cmdline.back() == ' ') {
        cmdline.pop_back();
    }
    return cmdline;
}

std::string ProcessManager::readFile(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) return "";
    return std::string(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
}

std::optional<std::vector<pID>> ProcFsProcessTable::findByCommandLine(const std::string& substring) {
    auto processes = ProcessManager::listProcesses();
    if (!processes) return std::nullopt;

    const int32_t self = ProcessManager::getCurrentPid();
    std::vector<pID> matches;
    for (const auto& process : *processes) {
        if (process.pid == self) continue;
        if (process.command.find(substring) != std::string::npos)
            matches.push_back(process.pid);
    }
    return matches;
}

} // namespace uiauto
