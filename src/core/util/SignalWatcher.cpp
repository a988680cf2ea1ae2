#include "SignalWatcher.hpp"
#include "../../utils/Logger.hpp"

#include <cstring>
#include <pthread.h>
#include <stdexcept>
#include <system_error>

namespace uiauto::util {

void SignalWatcher::logSignal(int sig) {
    const char* signame = "Unknown";
    switch (sig) {
        case SIGINT:  signame = "SIGINT"; break;
        case SIGTERM: signame = "SIGTERM"; break;
        case SIGHUP:  signame = "SIGHUP"; break;
        case SIGQUIT: signame = "SIGQUIT"; break;
    }
    info("Received signal: {} ({})", signame, sig);
}

void SignalWatcher::setExitCallback(std::function<void()> callback) {
    std::unique_lock<std::mutex> lock(callbackMutex);
    exitCallback = std::move(callback);
    if (!shouldExit.load() || !exitCallback) {
        return;
    }
    auto pending = exitCallback;
    lock.unlock();
    pending();
}

void SignalWatcher::requestExit() {
    std::function<void()> callback;
    {
        std::lock_guard<std::mutex> lock(callbackMutex);
        shouldExit.store(true);
        callback = exitCallback;
    }
    if (callback) {
        callback();
    }
}

SignalWatcher::~SignalWatcher() {
    stop();
}

void SignalWatcher::start() {
    if (watcherThread.joinable()) {
        throw std::runtime_error("SignalWatcher already running");
    }

    watcherThread = std::thread([this]() {
        sigset_t set;
        sigemptyset(&set);
        sigaddset(&set, SIGINT);
        sigaddset(&set, SIGTERM);
        sigaddset(&set, SIGHUP);
        sigaddset(&set, SIGQUIT);

        int sig;
        while (!shouldExit.load(std::memory_order_relaxed)) {
            int result = sigwait(&set, &sig);
            if (result != 0) {
                if (result == EINTR) continue;
                error("sigwait failed: {}", std::strerror(result));
                break;
            }
            // stop() wakes us with SIGTERM; that is not a shutdown request.
            if (stopping.load()) {
                break;
            }
            logSignal(sig);
            if (sig == SIGINT || sig == SIGTERM || sig == SIGQUIT) {
                requestExit();
                break;
            }
        }
    });
}

void SignalWatcher::stop() {
    if (watcherThread.joinable()) {
        stopping = true;
        if (!shouldExit.load()) {
            pthread_kill(watcherThread.native_handle(), SIGTERM);
        }
        watcherThread.join();
    }
}

void blockTerminationSignals() {
    blockSignals({SIGINT, SIGTERM, SIGHUP, SIGQUIT});
}

void blockSignals(const std::initializer_list<int>& signals) {
    sigset_t set;
    sigemptyset(&set);
    for (int sig : signals) {
        sigaddset(&set, sig);
    }
    int result = pthread_sigmask(SIG_BLOCK, &set, nullptr);
    if (result != 0) {
        throw std::system_error(result, std::system_category(), "Failed to block signals");
    }
}

} // namespace uiauto::util
