// =============================================================================
// Configuration Tests
// =============================================================================

#include <gtest/gtest.h>
#include "signspace/config.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <unistd.h>

using namespace signspace;

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        Config::getInstance().clear();
        path = std::filesystem::temp_directory_path() /
               ("signspace_config_test_" + std::to_string(::getpid()) + ".env");
    }

    void TearDown() override {
        Config::getInstance().clear();
        std::filesystem::remove(path);
        ::unsetenv("SIGNSPACE_CACHE_L1_MAX_SIZE");
    }

    void write_file(const std::string& content) {
        std::ofstream out(path);
        out << content;
    }

    std::filesystem::path path;
};

TEST_F(ConfigTest, TypedGetters) {
    Config& config = Config::getInstance();
    config.set("int", "42");
    config.set("double", "0.25");
    config.set("flag", "Yes");
    config.set("text", "hello");

    EXPECT_EQ(config.get<int>("int"), 42);
    EXPECT_EQ(config.get<size_t>("int"), 42u);
    EXPECT_DOUBLE_EQ(config.get<double>("double"), 0.25);
    EXPECT_TRUE(config.get<bool>("flag"));
    EXPECT_EQ(config.get<std::string>("text"), "hello");
    EXPECT_EQ(config.get<int>("missing", 7), 7);
}

TEST_F(ConfigTest, UnparsableValueFallsBackToDefault) {
    Config& config = Config::getInstance();
    config.set("cache.l1.max_size", "lots");
    EXPECT_EQ(config.get<size_t>("cache.l1.max_size", 100), 100u);
}

TEST_F(ConfigTest, LoadsFileWithComments) {
    write_file("# comment\n"
               "; another comment\n"
               "\n"
               "  cache.l1.max_size = 12  \n"
               "cache.l2.policy=fifo\n"
               "not a pair\n"
               "log.level = WARNING\n");

    Config& config = Config::getInstance();
    ASSERT_TRUE(config.load(path.string()));

    EXPECT_EQ(config.get<size_t>("cache.l1.max_size"), 12u);
    EXPECT_EQ(config.get<std::string>("cache.l2.policy"), "fifo");
    EXPECT_EQ(config.get<std::string>("log.level"), "warn");
    EXPECT_FALSE(config.has("not a pair"));
}

TEST_F(ConfigTest, EnvironmentOverridesDefaults) {
    ::setenv("SIGNSPACE_CACHE_L1_MAX_SIZE", "3", 1);

    Config& config = Config::getInstance();
    ASSERT_TRUE(config.load());
    EXPECT_EQ(config.get<size_t>("cache.l1.max_size"), 3u);
}

TEST_F(ConfigTest, FileOverridesEnvironment) {
    ::setenv("SIGNSPACE_CACHE_L1_MAX_SIZE", "3", 1);
    write_file("cache.l1.max_size=9\n");

    Config& config = Config::getInstance();
    ASSERT_TRUE(config.load(path.string()));
    EXPECT_EQ(config.get<size_t>("cache.l1.max_size"), 9u);
}

TEST_F(ConfigTest, InvalidThresholdFailsValidation) {
    write_file("validator.threshold=1.5\n");
    EXPECT_FALSE(Config::getInstance().load(path.string()));
}

TEST_F(ConfigTest, UnknownLogLevelNormalized) {
    write_file("log.level=chatty\n");
    ASSERT_TRUE(Config::getInstance().load(path.string()));
    EXPECT_EQ(Config::getInstance().get<std::string>("log.level"), "info");
}

TEST_F(ConfigTest, CacheConfigFromKeys) {
    Config& config = Config::getInstance();
    config.set("cache.l1.max_size", "10");
    config.set("cache.l1.ttl_ms", "250");
    config.set("cache.l1.policy", "LFU");
    config.set("cache.predictive.max_size", "0");
    config.set("cache.predictive.preload", "hybrid");

    const CacheConfig cache = cache_config_from(config);
    const CacheConfig defaults;

    EXPECT_EQ(cache.l1.max_size, 10u);
    EXPECT_EQ(cache.l1.ttl.count(), 250);
    EXPECT_EQ(cache.l1.policy, EvictionPolicy::LFU);
    EXPECT_EQ(cache.l2.max_size, defaults.l2.max_size);
    EXPECT_EQ(cache.l2.policy, defaults.l2.policy);
    EXPECT_EQ(cache.predictive.max_size, 0u);
    EXPECT_EQ(cache.preload, PreloadStrategy::Hybrid);
}

TEST_F(ConfigTest, AnalyzerAndValidatorSettings) {
    Config& config = Config::getInstance();
    config.set("analyzer.time_limit_ms", "1500");
    config.set("validator.threshold", "0.6");

    EXPECT_DOUBLE_EQ(analyzer_config_from(config).processing_time_limit_ms, 1500.0);
    EXPECT_DOUBLE_EQ(validation_threshold_from(config), 0.6);

    config.clear();
    EXPECT_DOUBLE_EQ(validation_threshold_from(config), SpatialValidator::DEFAULT_THRESHOLD);
}

TEST_F(ConfigTest, PolicyParsing) {
    EXPECT_EQ(parse_eviction_policy("adaptive", EvictionPolicy::LRU), EvictionPolicy::ADAPTIVE);
    EXPECT_EQ(parse_eviction_policy("Fifo", EvictionPolicy::LRU), EvictionPolicy::FIFO);
    EXPECT_EQ(parse_eviction_policy("random", EvictionPolicy::LFU), EvictionPolicy::LFU);
    EXPECT_EQ(parse_preload_strategy("adjacent", PreloadStrategy::None), PreloadStrategy::Adjacent);
    EXPECT_EQ(parse_preload_strategy("", PreloadStrategy::Pattern), PreloadStrategy::Pattern);
}

TEST_F(ConfigTest, LogLevelParsing) {
    EXPECT_EQ(parse_log_level("debug"), LogLevel::DEBUG);
    EXPECT_EQ(parse_log_level("ERROR"), LogLevel::ERROR);
    EXPECT_EQ(parse_log_level("warning"), LogLevel::WARN);
    EXPECT_EQ(parse_log_level("nonsense"), LogLevel::INFO);
}

TEST_F(ConfigTest, LoggerFiltersByLevel) {
    std::ostringstream captured;
    set_log_output(captured);
    set_log_level(LogLevel::WARN);

    LOG_INFO("dropped ", 1);
    LOG_WARN("zone ", "actant-left", " moved ", 2, " times");

    set_log_level(LogLevel::INFO);
    set_log_output(std::clog);

    const std::string text = captured.str();
    EXPECT_EQ(text.find("dropped"), std::string::npos);
    EXPECT_NE(text.find("WARN"), std::string::npos);
    EXPECT_NE(text.find("test_config.cpp:"), std::string::npos);
    EXPECT_NE(text.find("zone actant-left moved 2 times"), std::string::npos);
    EXPECT_FALSE(Logger::getInstance().enabled(LogLevel::DEBUG));
    EXPECT_EQ(std::string(log_level_name(LogLevel::ERROR)), "ERROR");
}
