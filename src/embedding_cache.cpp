#include "embedding_cache.hpp"
#include "LogManager.hpp"
#include "storage/AtomicJournal.hpp"
#include "text_utils.hpp"
#include <algorithm>
#include <chrono>
#include <fstream>
#include <mutex>
#include <unordered_map>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace memory_core {

namespace fs = std::filesystem;
using json = nlohmann::json;

EmbeddingCache::EmbeddingCache(const std::string& cache_dir, size_t max_size)
    : max_size_(max_size), cache_path_(fs::path(cache_dir) / CACHE_FILE)
{
    std::error_code ec;
    fs::create_directories(cache_dir, ec);
    if (ec) {
        spdlog::warn("⚠️ Embedding cache: cannot create {} ({}), running in-memory only", cache_dir, ec.message());
    }
    load();
}

std::string EmbeddingCache::cache_key(const std::string& text) {
    return hex64(hash64(text));
}

std::optional<std::vector<float>> EmbeddingCache::get(const std::string& text) {
    std::string key = cache_key(text);
    std::shared_lock lock(maintenance_mutex_);

    std::vector<float> found;
    {
        VectorMap::const_accessor acc;
        if (!vectors_.find(acc, key)) {
            misses_.fetch_add(1, std::memory_order_relaxed);
            return std::nullopt;
        }
        found = acc->second;
    }

    {
        CountMap::accessor count;
        if (access_counts_.insert(count, key)) {
            count->second = 0;
        }
        ++count->second;
    }
    hits_.fetch_add(1, std::memory_order_relaxed);
    return found;
}

void EmbeddingCache::put(const std::string& text, std::vector<float> embedding) {
    std::string key = cache_key(text);

    if (size() >= max_size_) {
        evict();
    }

    std::shared_lock lock(maintenance_mutex_);
    {
        VectorMap::accessor acc;
        vectors_.insert(acc, key);
        acc->second = std::move(embedding);
    }
    CountMap::accessor count;
    access_counts_.insert(count, key);
    count->second = 1;
}

bool EmbeddingCache::contains(const std::string& text) const {
    std::string key = cache_key(text);
    std::shared_lock lock(maintenance_mutex_);
    return vectors_.count(key) > 0;
}

size_t EmbeddingCache::size() const {
    std::shared_lock lock(maintenance_mutex_);
    return vectors_.size();
}

CacheStats EmbeddingCache::stats() const {
    std::shared_lock lock(maintenance_mutex_);
    return {
        vectors_.size(),
        hits_.load(std::memory_order_relaxed),
        misses_.load(std::memory_order_relaxed)
    };
}

void EmbeddingCache::clear() {
    std::unique_lock lock(maintenance_mutex_);
    vectors_.clear();
    access_counts_.clear();
    hits_.store(0, std::memory_order_relaxed);
    misses_.store(0, std::memory_order_relaxed);
}

void EmbeddingCache::evict() {
    std::unique_lock lock(maintenance_mutex_);
    evict_locked();
}

void EmbeddingCache::evict_locked() {
    size_t evict_count = std::max<size_t>(1, max_size_ / 10);

    std::vector<std::pair<std::string, uint64_t>> entries;
    entries.reserve(access_counts_.size());
    for (const auto& [key, count] : access_counts_) {
        entries.emplace_back(key, count);
    }
    std::stable_sort(entries.begin(), entries.end(), [](const auto& a, const auto& b) {
        return a.second < b.second;
    });

    size_t removed = 0;
    for (size_t i = 0; i < entries.size() && i < evict_count; ++i) {
        vectors_.erase(entries[i].first);
        access_counts_.erase(entries[i].first);
        removed++;
    }

    spdlog::debug("Embedding cache: evicted {} entries, {} remain", removed, vectors_.size());
    LogManager::instance().record("cache", "evict", std::to_string(removed) + " entries");
}

void EmbeddingCache::save() const {
    auto start = std::chrono::high_resolution_clock::now();
    json snapshot = json::object();
    {
        std::unique_lock lock(maintenance_mutex_);
        for (const auto& [key, vec] : vectors_) {
            snapshot[key] = vec;
        }
    }

    try {
        if (!AtomicJournal::write_snapshot(cache_path_, snapshot.dump())) {
            spdlog::warn("⚠️ Embedding cache: could not write {}", cache_path_.string());
            return;
        }
    } catch (const std::exception& e) {
        spdlog::warn("⚠️ Embedding cache: save failed: {}", e.what());
        return;
    }

    double duration = std::chrono::duration<double, std::milli>(
        std::chrono::high_resolution_clock::now() - start).count();
    spdlog::info("💾 Embedding cache: saved {} vectors to {}", snapshot.size(), cache_path_.string());
    LogManager::instance().record("cache", "save", std::to_string(snapshot.size()) + " vectors", duration);
}

void EmbeddingCache::load() {
    std::error_code ec;
    if (!fs::exists(cache_path_, ec)) return;

    auto start = std::chrono::high_resolution_clock::now();
    std::unordered_map<std::string, std::vector<float>> loaded;
    try {
        std::ifstream in(cache_path_);
        if (!in.is_open()) {
            spdlog::warn("⚠️ Embedding cache: cannot open {}", cache_path_.string());
            return;
        }
        loaded = json::parse(in).get<std::unordered_map<std::string, std::vector<float>>>();
    } catch (const std::exception& e) {
        spdlog::warn("⚠️ Embedding cache: ignoring unreadable {}: {}", cache_path_.string(), e.what());
        return;
    }

    {
        std::unique_lock lock(maintenance_mutex_);
        for (auto& [key, vec] : loaded) {
            {
                VectorMap::accessor acc;
                vectors_.insert(acc, key);
                acc->second = std::move(vec);
            }
            CountMap::accessor count;
            access_counts_.insert(count, key);
            count->second = 0;
        }
    }

    double duration = std::chrono::duration<double, std::milli>(
        std::chrono::high_resolution_clock::now() - start).count();
    spdlog::info("📂 Embedding cache: loaded {} vectors from {}", loaded.size(), cache_path_.string());
    LogManager::instance().record("cache", "load", std::to_string(loaded.size()) + " vectors", duration);
}

} // namespace memory_core
