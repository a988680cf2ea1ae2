#pragma once

#include <csignal>
#include <thread>
#include <atomic>
#include <functional>
#include <initializer_list>
#include <mutex>

namespace uiauto::util {

// Waits for termination signals on a dedicated thread. The signals must be
// blocked in every other thread (see blockTerminationSignals) before start().
class SignalWatcher {
private:
    std::atomic<bool> shouldExit{false};
    std::atomic<bool> stopping{false};
    std::thread watcherThread;
    std::mutex callbackMutex;
    std::function<void()> exitCallback;

    static void logSignal(int sig);
    void requestExit();

public:
    SignalWatcher() = default;
    ~SignalWatcher();

    SignalWatcher(const SignalWatcher&) = delete;
    SignalWatcher& operator=(const SignalWatcher&) = delete;
    SignalWatcher(SignalWatcher&&) = delete;
    SignalWatcher& operator=(SignalWatcher&&) = delete;

    void start();
    void stop();

    // Runs on the watcher thread after SIGINT, SIGTERM or SIGQUIT. If one of
    // those already arrived, runs right away on the calling thread instead.
    void setExitCallback(std::function<void()> callback);

    bool shouldExitNow() const {
        return shouldExit.load(std::memory_order_relaxed);
    }
};

// Blocks SIGINT, SIGTERM, SIGHUP and SIGQUIT in the calling thread; threads
// started afterwards inherit the mask.
void blockTerminationSignals();

void blockSignals(const std::initializer_list<int>& signalsToBlock);

} // namespace uiauto::util
