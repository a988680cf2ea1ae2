#include <gtest/gtest.h>

#include <csignal>
#include <memory>
#include <pthread.h>
#include <string>
#include <unistd.h>

#include "core/io/X11HotkeyMonitor.hpp"
#include "core/util/SignalWatcher.hpp"
#include "core/DisplayManager.hpp"

using namespace uiauto;

// Needs a reachable X server (Xvfb works); skipped otherwise.
class X11HotkeyMonitorTest : public ::testing::Test {
protected:
    void SetUp() override {
        if (!DisplayManager::Initialize()) {
            GTEST_SKIP() << "no X display";
        }
        monitor = std::make_unique<X11HotkeyMonitor>(DisplayManager::GetDisplay());
    }

    std::unique_ptr<X11HotkeyMonitor> monitor;
};

TEST_F(X11HotkeyMonitorTest, StopBeforeRunIsKept) {
    monitor->Stop();
    monitor->Run();
    SUCCEED();
}

TEST_F(X11HotkeyMonitorTest, SignalBeforeRunStopsLoop) {
    sigset_t savedMask;
    sigset_t none;
    sigemptyset(&none);
    ASSERT_EQ(pthread_sigmask(SIG_BLOCK, &none, &savedMask), 0);
    util::blockTerminationSignals();

    {
        util::SignalWatcher watcher;
        X11HotkeyMonitor& loop = *monitor;
        watcher.setExitCallback([&loop]() { loop.Stop(); });
        watcher.start();
        ASSERT_EQ(kill(getpid(), SIGINT), 0);
        while (!watcher.shouldExitNow()) {
            usleep(1000);
        }
        monitor->Run();
    }

    pthread_sigmask(SIG_SETMASK, &savedMask, nullptr);
}

TEST_F(X11HotkeyMonitorTest, ModifierRefreshKeepsGrabs) {
    std::string id;
    ASSERT_NO_THROW(id = monitor->Grab("Control-Mod1-Mod4-F12"));
    EXPECT_EQ(id, "Control-Mod1-Mod4-F12");

    EXPECT_NO_THROW(monitor->RefreshModifierMapping());
    // Still ours: a second grab of the same chord retargets instead of
    // failing with BadAccess.
    EXPECT_EQ(monitor->Grab("ctrl-alt-super-F12"), "Control-Mod1-Mod4-F12");
    monitor->UngrabAll();
}
