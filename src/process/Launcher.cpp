#include "Launcher.hpp"
#include "../utils/Logger.hpp"
#include "../utils/Util.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

namespace uiauto {

namespace {

std::string errnoMessage(int err) {
    return std::strerror(err);
}

// argv must be built before fork(); the child may not allocate.
std::vector<char*> buildArgv(const std::string& executable, const std::vector<std::string>& args) {
    std::vector<char*> argv;
    argv.reserve(args.size() + 2);
    argv.push_back(const_cast<char*>(executable.c_str()));
    for (const auto& arg : args)
        argv.push_back(const_cast<char*>(arg.c_str()));
    argv.push_back(nullptr);
    return argv;
}

void closePair(int fds[2]) {
    if (fds[0] >= 0) close(fds[0]);
    if (fds[1] >= 0) close(fds[1]);
    fds[0] = fds[1] = -1;
}

bool readFully(int fd, void* buffer, size_t size) {
    auto* out = static_cast<char*>(buffer);
    size_t done = 0;
    while (done < size) {
        ssize_t n = read(fd, out + done, size - done);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) return false;
        done += static_cast<size_t>(n);
    }
    return true;
}

void writeErrno(int fd, int err) {
    ssize_t ignored = write(fd, &err, sizeof(err));
    (void)ignored;
}

// Child side only: async-signal-safe calls from here on.
void resetChildState(int keepFd) {
    sigset_t none;
    sigemptyset(&none);
    sigprocmask(SIG_SETMASK, &none, nullptr);

    int devnull = open("/dev/null", O_RDWR);
    if (devnull >= 0) {
        dup2(devnull, STDIN_FILENO);
        if (devnull > STDERR_FILENO) close(devnull);
    }
    for (int fd = 3; fd < 256; ++fd) {
        if (fd != keepFd) close(fd);
    }
}

[[noreturn]] void execOrReport(char* const argv[], int errFd) {
    execvp(argv[0], argv);
    writeErrno(errFd, errno);
    _exit(127);
}

pid_t waitChild(pid_t pid, int& status) {
    pid_t r;
    do {
        r = waitpid(pid, &status, 0);
    } while (r < 0 && errno == EINTR);
    return r;
}

} // namespace

ProcessResult Launcher::runDetached(const std::string& executable, const std::vector<std::string>& args) {
    ProcessResult result;

    int errPipe[2] = {-1, -1};
    int pidPipe[2] = {-1, -1};
    if (pipe2(errPipe, O_CLOEXEC) < 0 || pipe2(pidPipe, O_CLOEXEC) < 0) {
        result.error = "pipe failed: " + errnoMessage(errno);
        closePair(errPipe);
        closePair(pidPipe);
        return result;
    }

    auto argv = buildArgv(executable, args);
    pid_t child = fork();
    if (child < 0) {
        result.error = "fork failed: " + errnoMessage(errno);
        closePair(errPipe);
        closePair(pidPipe);
        return result;
    }

    if (child == 0) {
        close(errPipe[0]);
        close(pidPipe[0]);
        if (setsid() < 0) {
            writeErrno(errPipe[1], errno);
            _exit(127);
        }
        pid_t grandchild = fork();
        if (grandchild < 0) {
            writeErrno(errPipe[1], errno);
            _exit(127);
        }
        if (grandchild > 0) {
            int32_t reported = grandchild;
            ssize_t ignored = write(pidPipe[1], &reported, sizeof(reported));
            (void)ignored;
            _exit(0);
        }
        close(pidPipe[1]);
        int devnull = open("/dev/null", O_WRONLY);
        if (devnull >= 0) {
            dup2(devnull, STDOUT_FILENO);
            dup2(devnull, STDERR_FILENO);
            close(devnull);
        }
        resetChildState(errPipe[1]);
        execOrReport(argv.data(), errPipe[1]);
    }

    close(errPipe[1]);
    close(pidPipe[1]);

    int status = 0;
    waitChild(child, status);

    int32_t grandchild = -1;
    bool havePid = readFully(pidPipe[0], &grandchild, sizeof(grandchild));
    close(pidPipe[0]);

    // EOF without data means exec succeeded and closed the pipe.
    int err = 0;
    bool failed = readFully(errPipe[0], &err, sizeof(err));
    close(errPipe[0]);


    if (failed) {
        result.error = "failed to start " + executable + ": " + errnoMessage(err);
        return result;
    }
    if (!havePid) {
        result.error = "failed to start " + executable + ": launcher exited early";
        return result;
    }
    result.pid = grandchild;
    result.success = true;
    debug("Started {} (pid {})", executable, grandchild);
    return result;
}

ProcessResult Launcher::capture(const std::string& executable, const std::vector<std::string>& args) {
    ProcessResult result;

    int outPipe[2] = {-1, -1};
    int errPipe[2] = {-1, -1};
    if (pipe2(outPipe, O_CLOEXEC) < 0 || pipe2(errPipe, O_CLOEXEC) < 0) {
        result.error = "pipe failed: " + errnoMessage(errno);
        closePair(outPipe);
        closePair(errPipe);
        return result;
    }

    auto argv = buildArgv(executable, args);
    pid_t child = fork();
    if (child < 0) {
        result.error = "fork failed: " + errnoMessage(errno);
        closePair(outPipe);
        closePair(errPipe);
        return result;
    }

    if (child == 0) {
        close(outPipe[0]);
        close(errPipe[0]);
        dup2(outPipe[1], STDOUT_FILENO);
        resetChildState(errPipe[1]);
        execOrReport(argv.data(), errPipe[1]);
    }

    close(outPipe[1]);
    close(errPipe[1]);

    char buffer[4096];
    for (;;) {
        ssize_t n = read(outPipe[0], buffer, sizeof(buffer));
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) break;
        result.output.append(buffer, static_cast<size_t>(n));
    }
    close(outPipe[0]);

    int status = 0;
    if (waitChild(child, status) < 0) {
        result.error = "waitpid failed: " + errnoMessage(errno);
        close(errPipe[0]);
        return result;
    }

    int err = 0;
    bool failed = readFully(errPipe[0], &err, sizeof(err));
    close(errPipe[0]);

    result.pid = child;

    if (failed) {
        result.error = "failed to start " + executable + ": " + errnoMessage(err);
        return result;
    }
    if (WIFEXITED(status)) {
        result.exitCode = WEXITSTATUS(status);
        result.success = result.exitCode == 0;
        if (!result.success)
            result.error = executable + " exited with status " + std::to_string(result.exitCode);
    } else if (WIFSIGNALED(status)) {
        result.error = executable + " killed by signal " + std::to_string(WTERMSIG(status));
    }
    return result;
}

std::vector<std::string> Launcher::parseCommandLine(const std::string& cmdLine) {
    return splitWhitespace(cmdLine);
}

bool Launcher::kill(int64_t pid, bool force) {
    if (pid <= 0) return false;
    return ::kill(static_cast<pid_t>(pid), force ? SIGKILL : SIGTERM) == 0;
}

bool Launcher::isRunning(int64_t pid) {
    if (pid <= 0) return false;
    return ::kill(static_cast<pid_t>(pid), 0) == 0 || errno == EPERM;
}

} // namespace uiauto
