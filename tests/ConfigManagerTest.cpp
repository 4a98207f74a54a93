#include <gtest/gtest.h>

#include <ConfigManager.hpp>
#include <Env.hpp>
#include <initializer_list>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

class ConfigManagerTest : public ::testing::Test {
   protected:
    void SetUp() override {
        savedHome = Env{}["HOME"].get();
        // No config file in the test's home.
        Env{}["HOME"] = ::testing::TempDir();
        Env{}["LOG_FILE"].clear();
        Env{}["LOG_LEVEL"].clear();
    }
    void TearDown() override {
        if (savedHome) {
            Env{}["HOME"] = *savedHome;
        } else {
            Env{}["HOME"].clear();
        }
        Env{}["LOG_FILE"].clear();
        Env{}["LOG_LEVEL"].clear();
    }

    ConfigManager makeManager(std::initializer_list<std::string> args) {
        strings.assign({"AssistantBot"});
        strings.insert(strings.end(), args.begin(), args.end());
        c_strings.clear();
        for (auto& s : strings) {
            c_strings.emplace_back(s.data());
        }
        c_strings.emplace_back(nullptr);
        return ConfigManager(
            CommandLine(static_cast<int>(strings.size()), c_strings.data()));
    }

    std::optional<std::string> savedHome;
    std::vector<std::string> strings;
    std::vector<char*> c_strings;
};

TEST_F(ConfigManagerTest, NothingSet) {
    const auto manager = makeManager({});
    EXPECT_FALSE(manager.get(ConfigManager::Configs::LOG_FILE).has_value());
    EXPECT_FALSE(manager.get(ConfigManager::Configs::LOG_LEVEL).has_value());
    EXPECT_FALSE(manager.get(ConfigManager::Configs::HELP).has_value());
}

TEST_F(ConfigManagerTest, GetVariableCmdline) {
    const auto manager = makeManager({"--LOG_LEVEL", "debug"});
    const auto it = manager.get(ConfigManager::Configs::LOG_LEVEL);
    ASSERT_TRUE(it.has_value());
    EXPECT_EQ(it.value(), "debug");
}

TEST_F(ConfigManagerTest, GetVariableCmdlineAlias) {
    const auto manager = makeManager({"-f", "/tmp/assistantbot.log"});
    const auto it = manager.get(ConfigManager::Configs::LOG_FILE);
    ASSERT_TRUE(it.has_value());
    EXPECT_EQ(it.value(), "/tmp/assistantbot.log");
}

TEST_F(ConfigManagerTest, GetVariableEnv) {
    Env{}["LOG_FILE"] = "VAR_VALUE";
    const auto manager = makeManager({});
    const auto it = manager.get(ConfigManager::Configs::LOG_FILE);
    ASSERT_TRUE(it.has_value());
    EXPECT_EQ(it.value(), "VAR_VALUE");
}

TEST_F(ConfigManagerTest, CmdlineWinsOverEnv) {
    Env{}["LOG_LEVEL"] = "info";
    const auto manager = makeManager({"-l", "error"});
    EXPECT_EQ(manager.get(ConfigManager::Configs::LOG_LEVEL), "error");
}

TEST_F(ConfigManagerTest, HelpSwitch) {
    const auto manager = makeManager({"-h"});
    EXPECT_TRUE(manager.get(ConfigManager::Configs::HELP).has_value());
}

TEST_F(ConfigManagerTest, UnknownOptionFallsBackToEnv) {
    Env{}["LOG_LEVEL"] = "warn";
    const auto manager = makeManager({"--no-such-option"});
    EXPECT_EQ(manager.get(ConfigManager::Configs::LOG_LEVEL), "warn");
}

TEST_F(ConfigManagerTest, HelpTextListsOptions) {
    std::ostringstream out;
    ConfigManager::serializeHelpToOStream(out);
    EXPECT_NE(out.str().find("LOG_FILE"), std::string::npos);
    EXPECT_NE(out.str().find("LOG_LEVEL"), std::string::npos);
    EXPECT_NE(out.str().find("HELP"), std::string::npos);
}
