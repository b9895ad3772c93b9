#pragma once

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>
#include <tbb/concurrent_hash_map.h>

namespace memory_core {

struct CacheStats {
    size_t size = 0;
    uint64_t hits = 0;
    uint64_t misses = 0;
};

class IEmbeddingCache {
public:
    virtual ~IEmbeddingCache() = default;

    virtual std::optional<std::vector<float>> get(const std::string& text) = 0;
    virtual void put(const std::string& text, std::vector<float> embedding) = 0;
    virtual bool contains(const std::string& text) const = 0;
    virtual size_t size() const = 0;
    virtual CacheStats stats() const = 0;
    virtual void clear() = 0;

    virtual void save() const = 0;
    virtual void load() = 0;
};

// Content-addressed embedding store.
//
// Keys are the hex FNV-1a hash of the text. Vectors and access counts live in
// two TBB concurrent maps, so get/put on different keys never contend. Eviction
// drops the 10% least-accessed entries; it ranks by hit count, not recency.
//
// Whole-map work (evict, clear, save, load) holds `maintenance_mutex_`
// exclusively; per-key operations hold it shared.
class EmbeddingCache : public IEmbeddingCache {
public:
    static constexpr size_t DEFAULT_MAX_SIZE = 10000;
    static constexpr const char* CACHE_FILE = "embedding_cache.json";

    explicit EmbeddingCache(const std::string& cache_dir, size_t max_size = DEFAULT_MAX_SIZE);

    std::optional<std::vector<float>> get(const std::string& text) override;

    // Evicts first when the cache is already at capacity. Concurrent puts may
    // overshoot `max_size` by the number of racing writers.
    void put(const std::string& text, std::vector<float> embedding) override;

    bool contains(const std::string& text) const override;
    size_t size() const override;
    CacheStats stats() const override;
    void clear() override;

    // Best effort: failures are logged, never thrown
    void save() const override;
    // Loaded entries start with an access count of 0
    void load() override;

    void evict();

    size_t max_size() const { return max_size_; }
    const std::filesystem::path& cache_path() const { return cache_path_; }

    static std::string cache_key(const std::string& text);

private:
    using VectorMap = tbb::concurrent_hash_map<std::string, std::vector<float>>;
    using CountMap = tbb::concurrent_hash_map<std::string, uint64_t>;

    void evict_locked();

    VectorMap vectors_;
    CountMap access_counts_;
    size_t max_size_;
    std::filesystem::path cache_path_;
    std::atomic<uint64_t> hits_{0};
    std::atomic<uint64_t> misses_{0};
    mutable std::shared_mutex maintenance_mutex_;
};

} // namespace memory_core
