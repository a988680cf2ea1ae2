#include <gtest/gtest.h>

#include <algorithm>
#include <memory>
#include <spdlog/sinks/ringbuffer_sink.h>

#include "Fakes.hpp"
#include "core/HotkeyRegistry.hpp"
#include "utils/Logger.hpp"

using namespace uiauto;
using namespace uiauto::fakes;

class HotkeyRegistryTest : public ::testing::Test {
protected:
    void SetUp() override {
        logSink = std::make_shared<spdlog::sinks::ringbuffer_sink_mt>(64);
        logSink->set_pattern("%l %v");
        Logger::getInstance().addSink(logSink);
    }

    void TearDown() override {
        Logger::getInstance().removeSink(logSink);
    }

    bool logged(const std::string& fragment) const {
        auto lines = logSink->last_formatted();
        return std::any_of(lines.begin(), lines.end(), [&](const std::string& line) {
            return line.find(fragment) != std::string::npos;
        });
    }

    static Configuration sampleConfiguration() {
        Configuration config;
        config.appSelectPrefix = "Control-Mod1";
        config.windowManagePrefix = "Mod4-Mod1";
        config.appSelect["b"] = {"firefox", "firefox", "Firefox"};
        config.appSelect["t"] = {"kitty --hold", "kitty", "kitty"};
        config.windowManage["m"] = {"center"};
        return config;
    }

    std::shared_ptr<spdlog::sinks::ringbuffer_sink_mt> logSink;

    FakeKeyBinder binder;
    FakeProcessTable processes;
    FakeWindowControl windows;
    FakeLauncher launcher{&processes};
    FakeDisplayProbe display;
    ActionResolver resolver{processes, windows, launcher};
    WindowOperations windowOps{display, windows};
    HotkeyRegistry registry{binder, resolver, windowOps};
};

TEST_F(HotkeyRegistryTest, InstallBindsEveryEntry) {
    EXPECT_EQ(registry.install(sampleConfiguration()), 3u);

    const auto& table = registry.table();
    ASSERT_EQ(table.size(), 3u);
    ASSERT_TRUE(table.count("Control-Mod1-b"));
    ASSERT_TRUE(table.count("Control-Mod1-t"));
    ASSERT_TRUE(table.count("Mod1-Mod4-m"));

    const auto* firefox = std::get_if<LaunchOrFocus>(&table.at("Control-Mod1-b"));
    ASSERT_NE(firefox, nullptr);
    EXPECT_EQ(firefox->binding.windowClass, "Firefox");

    const auto* center = std::get_if<WindowOp>(&table.at("Mod1-Mod4-m"));
    ASSERT_NE(center, nullptr);
    EXPECT_EQ(center->name, "center");

    EXPECT_EQ(registry.configuration().appSelect.size(), 2u);
    EXPECT_TRUE(logged("Keymaps set. Use Control-Mod1-[key] to launch or focus applications."));
    EXPECT_TRUE(logged("Keymaps set. Use Mod4-Mod1-[key] to manage windows."));
}

TEST_F(HotkeyRegistryTest, LastRegistrationWins) {
    EXPECT_TRUE(registry.registerAppBinding("Control-Mod1", "b", {"firefox", "firefox", "Firefox"}));
    EXPECT_TRUE(registry.registerAppBinding("Control-Mod1", "b", {"chromium", "chromium", "Chromium"}));
    EXPECT_EQ(registry.table().size(), 1u);

    EXPECT_TRUE(registry.dispatch("Control-Mod1-b"));
    ASSERT_EQ(launcher.calls.size(), 1u);
    EXPECT_EQ(launcher.calls[0].executable, "chromium");
}

TEST_F(HotkeyRegistryTest, DifferentSpellingsOfOneChordShareARoute) {
    registry.registerAppBinding("Control-Mod1", "b", {"firefox", "firefox", "Firefox"});
    registry.registerWindowAction("ctrl-alt", "B", "center");

    ASSERT_EQ(registry.table().size(), 1u);
    EXPECT_TRUE(std::holds_alternative<WindowOp>(registry.table().at("Control-Mod1-b")));
}

TEST_F(HotkeyRegistryTest, RejectedComboIsLoggedAndSkipped) {
    binder.rejected.insert("Control-Mod1-t");

    EXPECT_EQ(registry.install(sampleConfiguration()), 2u);
    EXPECT_FALSE(registry.table().count("Control-Mod1-t"));
    EXPECT_TRUE(registry.table().count("Control-Mod1-b"));
    EXPECT_TRUE(registry.table().count("Mod1-Mod4-m"));
    EXPECT_TRUE(logged("Error binding key Control-Mod1-t for kitty --hold"));
}

TEST_F(HotkeyRegistryTest, InvalidComboIsRejected) {
    EXPECT_FALSE(registry.registerWindowAction("Hyper", "m", "center"));
    EXPECT_TRUE(registry.table().empty());
    EXPECT_TRUE(logged("unknown modifier 'Hyper'"));
}

TEST_F(HotkeyRegistryTest, AppComboRunsResolver) {
    registry.install(sampleConfiguration());
    processes.processes[42] = "/usr/bin/kitty";

    EXPECT_TRUE(registry.dispatch("Control-Mod1-t"));
    ASSERT_EQ(windows.focused.size(), 1u);
    EXPECT_EQ(windows.focused[0], "kitty");
    EXPECT_TRUE(launcher.calls.empty());
}

TEST_F(HotkeyRegistryTest, CenterMovesActiveWindow) {
    registry.install(sampleConfiguration());

    EXPECT_TRUE(registry.dispatch("Mod1-Mod4-m"));
    EXPECT_EQ(display.probes, 1);
    ASSERT_EQ(windows.moves.size(), 1u);
    EXPECT_EQ(windows.moves[0], (TargetRect{240, 135, 1440, 810}));
}

TEST_F(HotkeyRegistryTest, CenterMeasuresDisplayEveryTime) {
    registry.install(sampleConfiguration());

    registry.dispatch("Mod1-Mod4-m");
    display.screen = ScreenGeometry{2560, 1440};
    registry.dispatch("Mod1-Mod4-m");

    ASSERT_EQ(windows.moves.size(), 2u);
    EXPECT_EQ(windows.moves[1], (TargetRect{320, 180, 1920, 1080}));
}

TEST_F(HotkeyRegistryTest, CenterWithoutDisplayIsAbandoned) {
    registry.install(sampleConfiguration());
    display.screen.reset();

    EXPECT_TRUE(registry.dispatch("Mod1-Mod4-m"));
    EXPECT_TRUE(windows.moves.empty());
    EXPECT_TRUE(logged("Error centering window"));
}

TEST_F(HotkeyRegistryTest, UnknownWindowActionIsNoOp) {
    EXPECT_TRUE(registry.registerWindowAction("Mod4-Mod1", "s", "snap-left"));

    EXPECT_TRUE(registry.dispatch("Mod1-Mod4-s"));
    EXPECT_EQ(display.probes, 0);
    EXPECT_TRUE(windows.moves.empty());
    EXPECT_TRUE(launcher.calls.empty());
}

TEST_F(HotkeyRegistryTest, UnboundComboIsIgnored) {
    registry.install(sampleConfiguration());

    EXPECT_FALSE(registry.dispatch("Control-Mod1-z"));
    EXPECT_TRUE(launcher.calls.empty());
    EXPECT_TRUE(windows.focused.empty());
    EXPECT_TRUE(windows.moves.empty());
}
