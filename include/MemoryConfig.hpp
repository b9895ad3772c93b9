#pragma once
#include <cstdlib>
#include <fstream>
#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <vector>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace memory_core {

struct MemoryConfig {
    std::string memory_dir = "data/memory";
    size_t working_size = 10;
    size_t max_episodic = 1000;
    std::string cache_dir = "data";
    size_t cache_max_size = 10000;
    std::string log_level = "info";
    std::string host = "127.0.0.1";
    int port = 5003;
    bool save_on_exit = true;

    static constexpr const char* DEFAULT_FILE = "memory_config.json";

    // Explicit path if given, otherwise the first memory_config.json found in
    // the usual places. Environment overrides are applied last.
    static MemoryConfig load(const std::string& explicit_path = "") {
        MemoryConfig cfg;

        std::vector<std::string> search_paths;
        if (!explicit_path.empty()) {
            search_paths.push_back(explicit_path);
        } else {
            search_paths = {
                DEFAULT_FILE,                          // 1. Current Working Directory
                std::string("../") + DEFAULT_FILE,     // 2. Parent Directory (build/)
                std::string("config/") + DEFAULT_FILE  // 3. config/
            };
        }

        for (const auto& path : search_paths) {
            std::ifstream f(path);
            if (!f.is_open()) continue;
            try {
                cfg.apply_json(nlohmann::json::parse(f));
                spdlog::info("⚙️ Memory config loaded from {}", path);
            } catch (const std::exception& e) {
                spdlog::error("💥 Failed to parse memory config {}: {}", path, e.what());
            }
            break;
        }

        cfg.apply_env();
        return cfg;
    }

    // Unknown keys are ignored; keys with the wrong type keep their default
    void apply_json(const nlohmann::json& j) {
        if (!j.is_object()) {
            spdlog::warn("⚠️ Memory config root is not an object, using defaults");
            return;
        }
        read_key(j, "memory_dir", memory_dir);
        read_key(j, "working_size", working_size);
        read_key(j, "max_episodic", max_episodic);
        read_key(j, "cache_dir", cache_dir);
        read_key(j, "cache_max_size", cache_max_size);
        read_key(j, "log_level", log_level);
        read_key(j, "host", host);
        read_key(j, "port", port);
        read_key(j, "save_on_exit", save_on_exit);
    }

    void apply_env() {
        if (auto v = env("MEMORY_DIR")) memory_dir = *v;
        if (auto v = env("EMBEDDING_CACHE_DIR")) cache_dir = *v;
        if (auto v = env("LOG_LEVEL")) log_level = *v;
        env_number("WORKING_MEMORY_SIZE", working_size);
        env_number("MAX_EPISODIC_MEMORY", max_episodic);
        env_number("EMBEDDING_CACHE_MAX_SIZE", cache_max_size);

        size_t env_port = 0;
        if (env_number("MEMORY_SERVER_PORT", env_port)) port = static_cast<int>(env_port);
    }

    nlohmann::json to_json() const {
        return {
            {"memory_dir", memory_dir},
            {"working_size", working_size},
            {"max_episodic", max_episodic},
            {"cache_dir", cache_dir},
            {"cache_max_size", cache_max_size},
            {"log_level", log_level},
            {"host", host},
            {"port", port},
            {"save_on_exit", save_on_exit}
        };
    }

private:
    template<typename T>
    static void read_key(const nlohmann::json& j, const char* key, T& target) {
        if (!j.contains(key)) return;
        try {
            const auto& value = j.at(key);
            if constexpr (std::is_same_v<T, bool>) {
                if (!value.is_boolean()) throw std::invalid_argument("expected a boolean");
            } else if constexpr (std::is_unsigned_v<T>) {
                if (!value.is_number_unsigned()) throw std::invalid_argument("expected a non-negative integer");
            } else if constexpr (std::is_integral_v<T>) {
                if (!value.is_number_integer()) throw std::invalid_argument("expected an integer");
            }
            target = value.get<T>();
        } catch (const std::exception& e) {
            spdlog::warn("⚠️ Memory config key '{}' ignored: {}", key, e.what());
        }
    }

    static std::optional<std::string> env(const char* name) {
        const char* raw = std::getenv(name);
        if (!raw || !*raw) return std::nullopt;
        return std::string(raw);
    }

    static bool env_number(const char* name, size_t& target) {
        auto raw = env(name);
        if (!raw) return false;
        try {
            size_t consumed = 0;
            unsigned long long parsed = std::stoull(*raw, &consumed);
            if (consumed != raw->size() || raw->front() == '-') throw std::invalid_argument("trailing characters");
            target = static_cast<size_t>(parsed);
            return true;
        } catch (const std::exception&) {
            spdlog::warn("⚠️ Ignoring {}='{}': not a number", name, *raw);
            return false;
        }
    }
};

} // namespace memory_core
