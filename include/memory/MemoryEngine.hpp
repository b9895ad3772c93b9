// include/memory/MemoryEngine.hpp
#pragma once
#include <chrono>
#include <deque>
#include <filesystem>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>
#include <tbb/concurrent_hash_map.h>
#include "memory/KeywordIndex.hpp"
#include "memory/MemoryTypes.hpp"

namespace memory_core {

class IMemoryEngine {
public:
    virtual ~IMemoryEngine() = default;

    // Working memory
    virtual void add_to_working(const std::string& role, const std::string& content) = 0;
    virtual std::vector<WorkingEntry> get_working_memory() const = 0;
    virtual void clear_working() = 0;

    // Episodic memory
    virtual void add_episode(const std::string& user_input, const std::string& response,
                             const std::string& emotion, int importance = 1) = 0;
    virtual std::vector<ContextHit> get_relevant_context(const std::string& query,
                                                         size_t max_items = 3) const = 0;

    // Semantic memory
    virtual void add_semantic(const std::string& key, const std::string& value) = 0;
    virtual std::optional<std::string> get_semantic(const std::string& key) const = 0;

    virtual void save() const = 0;
    virtual void load() = 0;
    virtual MemoryStats get_stats() const = 0;
};

// Three-tier conversational memory.
//
//  - working:  FIFO of the last `working_size` turns, never persisted
//  - episodic: up to `max_episodic` interactions, keyword-indexed, evicted by
//              importance / age; persisted to episodic.json
//  - semantic: key -> value facts; persisted to semantic.json
//
// Lock layout: `working_mutex_` guards the working deque; `episodic_mutex_`
// guards the episodes AND the keyword index together, so a reader never sees
// the two out of step. Semantic facts sit in a TBB concurrent map; only
// whole-map snapshots (save/load) take `semantic_mutex_` exclusively.
class MemoryEngine : public IMemoryEngine {
public:
    static constexpr size_t DEFAULT_WORKING_SIZE = 10;
    static constexpr size_t DEFAULT_MAX_EPISODIC = 1000;
    static constexpr const char* EPISODIC_FILE = "episodic.json";
    static constexpr const char* SEMANTIC_FILE = "semantic.json";

    explicit MemoryEngine(const std::string& memory_dir,
                          size_t working_size = DEFAULT_WORKING_SIZE,
                          size_t max_episodic = DEFAULT_MAX_EPISODIC);

    void add_to_working(const std::string& role, const std::string& content) override;
    std::vector<WorkingEntry> get_working_memory() const override;
    void clear_working() override;

    void add_episode(const std::string& user_input, const std::string& response,
                     const std::string& emotion, int importance = 1) override;
    std::vector<ContextHit> get_relevant_context(const std::string& query,
                                                 size_t max_items = 3) const override;

    void add_semantic(const std::string& key, const std::string& value) override;
    std::optional<std::string> get_semantic(const std::string& key) const override;

    void save() const override;
    void load() override;
    MemoryStats get_stats() const override;

    // Drops the lowest importance/age scores; returns how many were removed
    size_t evict_episodes();

    std::vector<Episode> get_episodes() const;
    // Positions the keyword index holds for a word (lowercased before lookup)
    std::vector<size_t> find_episodes(const std::string& word) const;

    const std::filesystem::path& memory_dir() const { return dir_; }
    size_t working_size() const { return working_size_; }
    size_t max_episodic() const { return max_episodic_; }

    static double eviction_score(const Episode& episode,
                                 std::chrono::system_clock::time_point now);

private:
    using SemanticMap = tbb::concurrent_hash_map<std::string, std::string>;

    size_t evict_episodes_locked();
    void load_episodic();
    void load_semantic();

    std::filesystem::path dir_;
    size_t working_size_;
    size_t max_episodic_;

    std::deque<WorkingEntry> working_;
    mutable std::shared_mutex working_mutex_;

    std::vector<Episode> episodes_;
    KeywordIndex keyword_index_;
    mutable std::shared_mutex episodic_mutex_;

    SemanticMap semantic_;
    mutable std::shared_mutex semantic_mutex_;
};

} // namespace memory_core
