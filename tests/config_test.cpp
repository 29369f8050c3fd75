#include <gtest/gtest.h>
#include "liveline/common/config.hpp"
#include "liveline/common/errors.hpp"
#include "liveline/progress/progress.hpp"
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <unistd.h>

using namespace liveline::common;

class ConfigTest : public ::testing::Test {
protected:
    std::filesystem::path dir;
    
    void SetUp() override {
        dir = std::filesystem::temp_directory_path() /
              ("liveline_config_test_" + std::to_string(::getpid()));
        std::filesystem::create_directories(dir);
        setenv("XDG_CONFIG_HOME", dir.c_str(), 1);
        unsetenv("LIVELINE_CONFIG");
        Config::instance().reset();
    }
    
    void TearDown() override {
        Config::instance().reset();
        std::error_code ec;
        std::filesystem::remove_all(dir, ec);
    }
    
    std::string writeFile(const std::string& name, const std::string& content) {
        auto path = dir / name;
        std::ofstream file(path);
        file << content;
        return path.string();
    }
};

TEST_F(ConfigTest, DefaultsWithoutFile) {
    auto& config = Config::instance();
    EXPECT_TRUE(config.load());
    
    const auto& global = config.global();
    EXPECT_EQ(global.display.title, "Progress Tool");
    EXPECT_EQ(global.display.text_color, "default");
    EXPECT_TRUE(global.display.unicode_supported);
    EXPECT_EQ(global.display.bar_width, 30u);
    EXPECT_EQ(global.display.style, "bar");
    EXPECT_EQ(global.timing.awaiting_interval_ms, 10);
    EXPECT_EQ(global.timing.awaiting_timeout_ms, 0);
    EXPECT_EQ(global.timing.relay_interval_ms, 1000);
    EXPECT_EQ(global.logging.level, LogLevel::WARN);
    EXPECT_EQ(global.logging.format, LogFormat::TEXT);
    EXPECT_EQ(config.getConfigPath(), (dir / "liveline" / "liveline.toml").string());
}

TEST_F(ConfigTest, LoadsExplicitFile) {
    auto path = writeFile("custom.toml",
        "[display]\n"
        "title = \"Builds\"\n"
        "bar_width = 40\n"
        "style = \"loading\"\n"
        "\n"
        "[timing]\n"
        "relay_interval_ms = 250\n"
        "\n"
        "[logging]\n"
        "level = \"DEBUG\"\n"
        "format = \"json\"\n");
    
    auto& config = Config::instance();
    ASSERT_TRUE(config.load(path));
    
    const auto& global = config.global();
    EXPECT_EQ(global.display.title, "Builds");
    EXPECT_EQ(global.display.bar_width, 40u);
    EXPECT_EQ(global.display.style, "loading");
    EXPECT_EQ(global.display.text_color, "default");
    EXPECT_EQ(global.timing.relay_interval_ms, 250);
    EXPECT_EQ(global.logging.level, LogLevel::DEBUG);
    EXPECT_EQ(global.logging.format, LogFormat::JSON);
    EXPECT_EQ(config.getConfigPath(), path);
}

TEST_F(ConfigTest, EnvironmentPathIsSearched) {
    auto path = writeFile("env.toml", "[display]\ntitle = \"From env\"\n");
    setenv("LIVELINE_CONFIG", path.c_str(), 1);
    
    auto& config = Config::instance();
    ASSERT_TRUE(config.load());
    EXPECT_EQ(config.global().display.title, "From env");
    EXPECT_EQ(config.findBestConfig().value_or(""), path);
}

TEST_F(ConfigTest, MalformedFileFailsToLoad) {
    auto path = writeFile("broken.toml", "[display\ntitle = ");
    EXPECT_FALSE(Config::instance().load(path));
}

TEST_F(ConfigTest, SaveRoundTripsThroughDisk) {
    auto& config = Config::instance();
    config.setValue("display.bar_width", "12");
    config.setValue("display.unicode_supported", "false");
    config.setValue("timing.awaiting_timeout_ms", "500");
    config.setValue("logging.level", "ERROR");
    
    auto path = (dir / "nested" / "saved.toml").string();
    ASSERT_TRUE(config.save(path));
    
    config.reset();
    ASSERT_TRUE(config.load(path));
    EXPECT_EQ(config.getValue("display.bar_width").value_or(""), "12");
    EXPECT_EQ(config.getValue("display.unicode_supported").value_or(""), "false");
    EXPECT_EQ(config.getValue("timing.awaiting_timeout_ms").value_or(""), "500");
    EXPECT_EQ(config.getValue("logging.level").value_or(""), "ERROR");
}

TEST_F(ConfigTest, EveryKeyIsReadable) {
    auto& config = Config::instance();
    EXPECT_EQ(Config::keys().size(), 13u);
    for (const auto& key : Config::keys()) {
        EXPECT_TRUE(config.getValue(key).has_value()) << key;
    }
    EXPECT_FALSE(config.getValue("display.missing").has_value());
}

TEST_F(ConfigTest, SetValueRejectsBadInput) {
    auto& config = Config::instance();
    EXPECT_THROW(config.setValue("display.missing", "1"), InvalidArgument);
    EXPECT_THROW(config.setValue("display.bar_width", "wide"), InvalidArgument);
    EXPECT_THROW(config.setValue("display.bar_width", "-4"), InvalidArgument);
    EXPECT_THROW(config.setValue("display.unicode_supported", "maybe"), InvalidArgument);
    EXPECT_THROW(config.setValue("logging.level", "LOUD"), InvalidArgument);
    EXPECT_THROW(config.setValue("logging.format", "xml"), InvalidArgument);
    
    EXPECT_EQ(config.global().display.bar_width, 30u);
}

TEST_F(ConfigTest, LogLevelNames) {
    EXPECT_EQ(logLevelToString(LogLevel::INFO), "INFO");
    EXPECT_EQ(parseLogLevel("DEBUG").value_or(LogLevel::ERROR), LogLevel::DEBUG);
    EXPECT_FALSE(parseLogLevel("debug").has_value());
}

TEST_F(ConfigTest, ProgressOptionsFollowConfiguration) {
    auto& config = Config::instance();
    config.setValue("display.style", "loading");
    config.setValue("display.bar_width", "50");
    config.setValue("timing.awaiting_interval_ms", "25");
    config.setValue("timing.relay_interval_ms", "300");
    
    auto options = liveline::progress::ProgressOptions::fromConfig(config.global());
    EXPECT_EQ(options.style, "loading");
    EXPECT_EQ(options.bar_width, 50u);
    EXPECT_EQ(options.awaiting_interval.count(), 25);
    EXPECT_EQ(options.relay_interval.count(), 300);
    EXPECT_FALSE(options.awaiting_timeout.has_value());
    
    config.setValue("timing.awaiting_timeout_ms", "40");
    options = liveline::progress::ProgressOptions::fromConfig(config.global());
    ASSERT_TRUE(options.awaiting_timeout.has_value());
    EXPECT_EQ(options.awaiting_timeout->count(), 40);
}

TEST_F(ConfigTest, ProgressOptionsIgnoreNonPositiveIntervals) {
    GlobalConfig config = Config::instance().global();
    config.timing.awaiting_interval_ms = 0;
    config.timing.relay_interval_ms = -20;
    
    auto options = liveline::progress::ProgressOptions::fromConfig(config);
    EXPECT_EQ(options.awaiting_interval.count(), liveline::constants::config_defaults::AWAITING_INTERVAL_MS);
    EXPECT_EQ(options.relay_interval.count(), liveline::constants::config_defaults::RELAY_INTERVAL_MS);
}
