#include <gtest/gtest.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <unistd.h>

#include "core/ConfigManager.hpp"

using namespace uiauto;
namespace fs = std::filesystem;

namespace {
Configuration parse(const std::string& text) {
    Configs configs;
    std::istringstream in(text);
    configs.Parse(in, "test.conf");
    return configs.BuildConfiguration();
}
}

class ConfigFileTest : public ::testing::Test {
protected:
    void SetUp() override {
        char pattern[] = "/tmp/uiauto-config-XXXXXX";
        char* dir = mkdtemp(pattern);
        ASSERT_NE(dir, nullptr);
        root = dir;
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(root, ec);
    }

    fs::path root;
};

TEST(Configs, BuildsTypedConfiguration) {
    Configuration config = parse(R"(
# comment
[General]
AppSelectPrefix = Control-Mod1
WindowManagePrefix=Mod4-Mod1

[AppSelect.b]
Command=firefox --new-window
ProcessName=firefox
WindowClass=Firefox

; another comment
[AppSelect.t]
Command=kitty --hold

[WindowManage]
m=center
c = cascade
)");

    EXPECT_EQ(config.appSelectPrefix, "Control-Mod1");
    EXPECT_EQ(config.windowManagePrefix, "Mod4-Mod1");
    ASSERT_EQ(config.appSelect.size(), 2u);
    EXPECT_EQ(config.appSelect.at("b"), (AppBinding{"firefox --new-window", "firefox", "Firefox"}));
    EXPECT_EQ(config.appSelect.at("t"), (AppBinding{"kitty --hold", "", ""}));
    ASSERT_EQ(config.windowManage.size(), 2u);
    EXPECT_EQ(config.windowManage.at("m").name, "center");
    EXPECT_EQ(config.windowManage.at("c").name, "cascade");
    EXPECT_FALSE(config.verboseKeyLogging);
}

TEST(Configs, DefaultDocumentParses) {
    Configuration config = parse(Configs::DEFAULT_CONFIG);
    EXPECT_EQ(config.appSelectPrefix, "Control-Mod1");
    EXPECT_EQ(config.windowManagePrefix, "Mod4-Mod1");
    ASSERT_EQ(config.appSelect.size(), 3u);
    EXPECT_EQ(config.appSelect.at("b"), (AppBinding{"firefox", "firefox", "Firefox"}));
    EXPECT_EQ(config.appSelect.at("t"), (AppBinding{"kitty", "kitty", "kitty"}));
    EXPECT_EQ(config.appSelect.at("f"), (AppBinding{"dolphin", "dolphin", "dolphin"}));
    ASSERT_EQ(config.windowManage.size(), 1u);
    EXPECT_EQ(config.windowManage.at("m").name, "center");
}

TEST(Configs, TypedGetters) {
    Configs configs;
    std::istringstream in("[Debug]\nVerboseKeyLogging=yes\n[Log]\nFile=false\nMaxDays=7\n");
    configs.Parse(in);
    EXPECT_TRUE(configs.GetVerboseKeyLogging());
    EXPECT_FALSE(configs.GetLogToFile());
    EXPECT_EQ(configs.GetLogMaxDays(), 7);
    EXPECT_EQ(configs.Get<std::string>("Log.Missing", "fallback"), "fallback");
}

TEST(Configs, InvalidTypedValueIsConfigError) {
    Configs configs;
    std::istringstream in("[Log]\nMaxDays=three\nFile=maybe\n");
    configs.Parse(in);
    EXPECT_THROW(configs.GetLogMaxDays(), ConfigError);
    EXPECT_THROW(configs.GetLogToFile(), ConfigError);
}

TEST(Configs, MissingPrefixIsFatal) {
    EXPECT_THROW(parse("[General]\nAppSelectPrefix=Control-Mod1\n"), ConfigError);
    EXPECT_THROW(parse("[General]\nAppSelectPrefix=\nWindowManagePrefix=Mod4\n"), ConfigError);
}

TEST(Configs, AppWithoutCommandIsFatal) {
    EXPECT_THROW(parse("[General]\nAppSelectPrefix=A\nWindowManagePrefix=B\n"
                       "[AppSelect.x]\nProcessName=x\n"), ConfigError);
}

TEST(Configs, MalformedLinesReportLineNumber) {
    Configs configs;
    std::istringstream in("[General]\nAppSelectPrefix=Control-Mod1\nthis is not a setting\n");
    try {
        configs.Parse(in, "broken.conf");
        FAIL() << "expected ConfigError";
    } catch (const ConfigError& e) {
        EXPECT_EQ(e.getOrigin(), "broken.conf");
        EXPECT_EQ(e.getLine(), 3);
    }

    std::istringstream header("[General\n");
    EXPECT_THROW(configs.Parse(header), ConfigError);

    std::istringstream orphan("Key=Value\n");
    EXPECT_THROW(configs.Parse(orphan), ConfigError);
}

TEST(Configs, BareAppSelectSectionIsFatal) {
    EXPECT_THROW(parse("[General]\nAppSelectPrefix=A\nWindowManagePrefix=B\n"
                       "[AppSelect]\nb=firefox\n"), ConfigError);
}

TEST_F(ConfigFileTest, EnsureConfigFileWritesDefaultsOnce) {
    fs::path path = root / "nested" / "uiauto" / "uiauto.conf";

    Configs configs;
    EXPECT_TRUE(configs.EnsureConfigFile(path.string()));
    ASSERT_TRUE(fs::exists(path));

    auto perms = fs::status(path.parent_path()).permissions();
    EXPECT_EQ(perms & fs::perms::all,
              fs::perms::owner_all | fs::perms::group_read | fs::perms::group_exec |
              fs::perms::others_read | fs::perms::others_exec);

    {
        std::ofstream out(path, std::ios::app);
        out << "\n[AppSelect.e]\nCommand=emacs\n";
    }
    EXPECT_FALSE(configs.EnsureConfigFile(path.string()));

    configs.Load(path.string());
    EXPECT_EQ(configs.getPath(), path.string());
    Configuration config = configs.BuildConfiguration();
    EXPECT_EQ(config.appSelect.size(), 4u);
    EXPECT_EQ(config.appSelect.at("e").command, "emacs");
}

TEST_F(ConfigFileTest, LoadMissingFileIsConfigError) {
    Configs configs;
    EXPECT_THROW(configs.Load((root / "absent.conf").string()), ConfigError);
}

TEST_F(ConfigFileTest, DefaultPathFollowsHome) {
    const char* saved = std::getenv("HOME");
    std::string previous = saved ? saved : "";

    setenv("HOME", root.c_str(), 1);
    EXPECT_EQ(ConfigPaths::GetDefaultConfigPath(), (root / ".config" / "uiauto" / "uiauto.conf").string());

    unsetenv("HOME");
    EXPECT_THROW(ConfigPaths::GetDefaultConfigPath(), ConfigError);

    if (saved) setenv("HOME", previous.c_str(), 1);
}
