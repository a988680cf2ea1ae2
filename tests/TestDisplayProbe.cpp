#include <gtest/gtest.h>

#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <memory>
#include <string>
#include <unistd.h>

#include <spdlog/sinks/ringbuffer_sink.h>

#include "utils/Logger.hpp"
#include "window/DisplayProbe.hpp"

using namespace uiauto;
namespace fs = std::filesystem;

// Puts a scratch directory first on PATH so a shell script can stand in
// for the xrandr binary.
class XrandrDisplayProbeTest : public ::testing::Test {
protected:
    void SetUp() override {
        char pattern[] = "/tmp/uiauto-xrandr-XXXXXX";
        char* dir = mkdtemp(pattern);
        ASSERT_NE(dir, nullptr);
        binDir = dir;

        const char* path = std::getenv("PATH");
        hadPath = path != nullptr;
        if (hadPath) savedPath = path;
        setenv("PATH", (binDir.string() + ":" + savedPath).c_str(), 1);

        logSink = std::make_shared<spdlog::sinks::ringbuffer_sink_mt>(32);
        logSink->set_pattern("%v");
        Logger::getInstance().addSink(logSink);
    }

    void TearDown() override {
        Logger::getInstance().removeSink(logSink);
        if (hadPath) {
            setenv("PATH", savedPath.c_str(), 1);
        } else {
            unsetenv("PATH");
        }
        std::error_code ec;
        fs::remove_all(binDir, ec);
    }

    void installXrandr(const std::string& body) {
        fs::path script = binDir / "xrandr";
        {
            std::ofstream out(script);
            out << "#!/bin/sh\n" << body << "\n";
        }
        fs::permissions(script, fs::perms::owner_all | fs::perms::group_read |
                                fs::perms::group_exec | fs::perms::others_read |
                                fs::perms::others_exec);
    }

    bool logged(const std::string& fragment) const {
        auto lines = logSink->last_formatted();
        return std::any_of(lines.begin(), lines.end(), [&](const std::string& line) {
            return line.find(fragment) != std::string::npos;
        });
    }

    fs::path binDir;
    std::string savedPath;
    bool hadPath = false;
    std::shared_ptr<spdlog::sinks::ringbuffer_sink_mt> logSink;
    XrandrDisplayProbe probe;
};

TEST_F(XrandrDisplayProbeTest, ReadsFirstConnectedOutput) {
    installXrandr(
        "echo 'Screen 0: minimum 320 x 200, current 2560 x 1440, maximum 16384 x 16384'\n"
        "echo 'eDP-1 disconnected (normal left inverted right x axis y axis)'\n"
        "echo 'HDMI-1 connected primary 2560x1440+0+0 (normal left inverted right) 597mm x 336mm'\n"
        "echo '   2560x1440     59.95*+'");

    auto screen = probe.primaryDisplay();
    ASSERT_TRUE(screen.has_value());
    EXPECT_EQ(*screen, (ScreenGeometry{2560, 1440}));
}

TEST_F(XrandrDisplayProbeTest, FailingToolIsReported) {
    installXrandr("echo \"Can't open display\" >&2\nexit 1");

    EXPECT_FALSE(probe.primaryDisplay().has_value());
    EXPECT_TRUE(logged("Error getting screen dimensions"));
    EXPECT_TRUE(logged("xrandr exited with status 1"));
}

TEST_F(XrandrDisplayProbeTest, MissingToolIsReported) {
    setenv("PATH", binDir.string().c_str(), 1);

    EXPECT_FALSE(probe.primaryDisplay().has_value());
    EXPECT_TRUE(logged("Error getting screen dimensions"));
    EXPECT_TRUE(logged("failed to start xrandr"));
}

TEST_F(XrandrDisplayProbeTest, UnparsableOutputIsReported) {
    installXrandr("echo 'Screen 0: minimum 320 x 200'\necho 'VIRTUAL1 disconnected'");

    EXPECT_FALSE(probe.primaryDisplay().has_value());
    EXPECT_TRUE(logged("Error parsing screen dimensions."));
}
