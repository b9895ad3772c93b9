#include <gtest/gtest.h>
#include "LogManager.hpp"
#include <string>
#include <thread>
#include <vector>

using namespace memory_core;

class LogManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        LogManager::instance().clear();
    }

    void TearDown() override {
        LogManager::instance().clear();
    }
};

TEST_F(LogManagerTest, NewestEventComesFirst) {
    auto& log = LogManager::instance();
    log.record("memory", "save", "2 episodes", 1.5);
    log.record("cache", "evict", "10 entries");

    auto events = log.get_logs_json();
    ASSERT_EQ(events.size(), 2u);
    EXPECT_EQ(events[0]["component"], "cache");
    EXPECT_EQ(events[0]["action"], "evict");
    EXPECT_EQ(events[1]["detail"], "2 episodes");
    EXPECT_DOUBLE_EQ(events[1]["duration_ms"].get<double>(), 1.5);
    EXPECT_GT(events[1]["timestamp"].get<long long>(), 0);
}

TEST_F(LogManagerTest, KeepsOnlyTheLatestEvents) {
    auto& log = LogManager::instance();
    for (size_t i = 0; i < LogManager::MAX_EVENTS + 20; ++i) {
        log.record("memory", "load", std::to_string(i));
    }
    EXPECT_EQ(log.size(), LogManager::MAX_EVENTS);
    EXPECT_EQ(log.get_logs_json()[0]["detail"], std::to_string(LogManager::MAX_EVENTS + 19));
}

TEST_F(LogManagerTest, ConcurrentRecording) {
    std::vector<std::thread> workers;
    for (int t = 0; t < 4; ++t) {
        workers.emplace_back([]() {
            for (int i = 0; i < 100; ++i) {
                LogManager::instance().record("cache", "save", "x");
            }
        });
    }
    for (auto& w : workers) w.join();
    EXPECT_EQ(LogManager::instance().size(), LogManager::MAX_EVENTS);
}
