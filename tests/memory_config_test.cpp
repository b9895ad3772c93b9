#include <gtest/gtest.h>
#include "MemoryConfig.hpp"
#include "test_helpers.hpp"
#include <cstdlib>
#include <filesystem>

using namespace memory_core;
using namespace memory_core::testing_support;

class MemoryConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = make_temp_dir("config");
        clear_env();
    }

    void TearDown() override {
        clear_env();
        std::error_code ec;
        std::filesystem::remove_all(dir_, ec);
    }

    static void clear_env() {
        for (const char* name : {"MEMORY_DIR", "EMBEDDING_CACHE_DIR", "LOG_LEVEL", "WORKING_MEMORY_SIZE",
                                 "MAX_EPISODIC_MEMORY", "EMBEDDING_CACHE_MAX_SIZE", "MEMORY_SERVER_PORT"}) {
            unsetenv(name);
        }
    }

    std::filesystem::path dir_;
};

TEST_F(MemoryConfigTest, DefaultsWhenFileMissing) {
    auto cfg = MemoryConfig::load((dir_ / "absent.json").string());
    EXPECT_EQ(cfg.memory_dir, "data/memory");
    EXPECT_EQ(cfg.working_size, 10u);
    EXPECT_EQ(cfg.max_episodic, 1000u);
    EXPECT_EQ(cfg.cache_dir, "data");
    EXPECT_EQ(cfg.cache_max_size, 10000u);
    EXPECT_EQ(cfg.port, 5003);
    EXPECT_TRUE(cfg.save_on_exit);
}

TEST_F(MemoryConfigTest, ReadsExplicitFile) {
    auto path = dir_ / "memory_config.json";
    write_text(path, R"({
        "memory_dir": "/tmp/mem",
        "working_size": 4,
        "max_episodic": 50,
        "cache_max_size": 20,
        "port": 6000,
        "save_on_exit": false,
        "unknown_key": "ignored"
    })");

    auto cfg = MemoryConfig::load(path.string());
    EXPECT_EQ(cfg.memory_dir, "/tmp/mem");
    EXPECT_EQ(cfg.working_size, 4u);
    EXPECT_EQ(cfg.max_episodic, 50u);
    EXPECT_EQ(cfg.cache_max_size, 20u);
    EXPECT_EQ(cfg.port, 6000);
    EXPECT_FALSE(cfg.save_on_exit);
}

TEST_F(MemoryConfigTest, WrongTypesKeepDefaults) {
    MemoryConfig cfg;
    cfg.apply_json(nlohmann::json::parse(R"({
        "working_size": -3,
        "max_episodic": "many",
        "save_on_exit": 1,
        "memory_dir": 42,
        "cache_max_size": 2.5
    })"));
    EXPECT_EQ(cfg.working_size, 10u);
    EXPECT_EQ(cfg.max_episodic, 1000u);
    EXPECT_TRUE(cfg.save_on_exit);
    EXPECT_EQ(cfg.memory_dir, "data/memory");
    EXPECT_EQ(cfg.cache_max_size, 10000u);
}

TEST_F(MemoryConfigTest, NonObjectRootIsIgnored) {
    MemoryConfig cfg;
    cfg.apply_json(nlohmann::json::array({1, 2}));
    EXPECT_EQ(cfg.working_size, 10u);
}

TEST_F(MemoryConfigTest, MalformedFileFallsBackToDefaults) {
    auto path = dir_ / "broken.json";
    write_text(path, "{ working_size: ");
    auto cfg = MemoryConfig::load(path.string());
    EXPECT_EQ(cfg.working_size, 10u);
}

TEST_F(MemoryConfigTest, EnvironmentOverridesFile) {
    auto path = dir_ / "memory_config.json";
    write_text(path, R"({"memory_dir": "from-file", "working_size": 4})");

    setenv("MEMORY_DIR", "from-env", 1);
    setenv("WORKING_MEMORY_SIZE", "7", 1);
    setenv("MAX_EPISODIC_MEMORY", "300", 1);
    setenv("EMBEDDING_CACHE_MAX_SIZE", "55", 1);
    setenv("EMBEDDING_CACHE_DIR", "cache-env", 1);
    setenv("MEMORY_SERVER_PORT", "7007", 1);

    auto cfg = MemoryConfig::load(path.string());
    EXPECT_EQ(cfg.memory_dir, "from-env");
    EXPECT_EQ(cfg.working_size, 7u);
    EXPECT_EQ(cfg.max_episodic, 300u);
    EXPECT_EQ(cfg.cache_max_size, 55u);
    EXPECT_EQ(cfg.cache_dir, "cache-env");
    EXPECT_EQ(cfg.port, 7007);
}

TEST_F(MemoryConfigTest, InvalidEnvNumbersAreIgnored) {
    setenv("WORKING_MEMORY_SIZE", "lots", 1);
    setenv("MAX_EPISODIC_MEMORY", "-5", 1);
    setenv("EMBEDDING_CACHE_MAX_SIZE", "12abc", 1);

    MemoryConfig cfg;
    cfg.apply_env();
    EXPECT_EQ(cfg.working_size, 10u);
    EXPECT_EQ(cfg.max_episodic, 1000u);
    EXPECT_EQ(cfg.cache_max_size, 10000u);
}

TEST_F(MemoryConfigTest, ToJsonReflectsValues) {
    MemoryConfig cfg;
    cfg.working_size = 3;
    auto j = cfg.to_json();
    EXPECT_EQ(j["working_size"], 3);
    EXPECT_EQ(j["memory_dir"], "data/memory");
    EXPECT_EQ(j["save_on_exit"], true);
}
