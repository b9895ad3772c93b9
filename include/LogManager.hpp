#pragma once
#include <chrono>
#include <deque>
#include <mutex>
#include <string>
#include <nlohmann/json.hpp>

namespace memory_core {

using json = nlohmann::json;

struct MemoryEvent {
    long long timestamp;     // unix seconds
    std::string component;   // "memory" | "cache"
    std::string action;      // "save", "load", "evict", ...
    std::string detail;
    double duration_ms;
};

// Keeps the last few maintenance events (saves, loads, evictions) for the admin endpoint
class LogManager {
public:
    static constexpr size_t MAX_EVENTS = 50;

    // Singleton access
    static LogManager& instance() {
        static LogManager instance;
        return instance;
    }

    void add_event(MemoryEvent event) {
        std::lock_guard<std::mutex> lock(mtx_);
        events_.push_back(std::move(event));
        if (events_.size() > MAX_EVENTS) {
            events_.pop_front();
        }
    }

    void record(const std::string& component, const std::string& action,
                const std::string& detail, double duration_ms = 0.0) {
        auto now = std::chrono::system_clock::now();
        add_event({
            std::chrono::duration_cast<std::chrono::seconds>(now.time_since_epoch()).count(),
            component, action, detail, duration_ms
        });
    }

    json get_logs_json() const {
        std::lock_guard<std::mutex> lock(mtx_);
        json j_list = json::array();
        // Newest first
        for (auto it = events_.rbegin(); it != events_.rend(); ++it) {
            j_list.push_back({
                {"timestamp", it->timestamp},
                {"component", it->component},
                {"action", it->action},
                {"detail", it->detail},
                {"duration_ms", it->duration_ms}
            });
        }
        return j_list;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mtx_);
        return events_.size();
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mtx_);
        events_.clear();
    }

private:
    LogManager() {}
    std::deque<MemoryEvent> events_;
    mutable std::mutex mtx_;
};

} // namespace memory_core
