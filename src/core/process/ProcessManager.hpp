#pragma once
#include <sys/types.h>
#include <unistd.h>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "types.hpp"

namespace uiauto {

// "Is anything running whose command line contains X?"
class ProcessTable {
public:
    virtual ~ProcessTable() = default;

    // PIDs whose full command line contains the substring. nullopt when
    // the table itself could not be read.
    virtual std::optional<std::vector<pID>> findByCommandLine(const std::string& substring) = 0;
};

class ProcessManager {
public:
    struct ProcessInfo {
        int32_t pid = 0;
        std::string command;  // argv joined with spaces
    };

    // nullopt when /proc cannot be opened.
    static std::optional<std::vector<int32_t>> listPids();
    static std::optional<std::vector<ProcessInfo>> listProcesses();
    static std::string getProcessCommand(int32_t pid);

    static int32_t getCurrentPid() { return getpid(); }

private:
    static std::string readFile(const std::string& path);
};

// Scans /proc/<pid>/cmdline, skipping our own process.
class ProcFsProcessTable : public ProcessTable {
public:
    std::optional<std::vector<pID>> findByCommandLine(const std::string& substring) override;
};

} // namespace uiauto
