#include "memory/MemoryEngine.hpp"
#include "LogManager.hpp"
#include "storage/AtomicJournal.hpp"
#include "text_utils.hpp"
#include <algorithm>
#include <fstream>
#include <functional>
#include <map>
#include <mutex>
#include <unordered_map>
#include <spdlog/spdlog.h>

namespace memory_core {

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

// Persisted text may carry invalid UTF-8; replace it instead of failing the snapshot
std::string dump_pretty(const json& j) {
    return j.dump(2, ' ', false, json::error_handler_t::replace);
}

bool write_file(const fs::path& path, const std::string& content) {
    try {
        return AtomicJournal::write_snapshot(path, content);
    } catch (const std::exception& e) {
        spdlog::warn("⚠️ Memory Engine: writing {} failed: {}", path.string(), e.what());
        return false;
    }
}

double elapsed_ms(std::chrono::high_resolution_clock::time_point start) {
    return std::chrono::duration<double, std::milli>(
        std::chrono::high_resolution_clock::now() - start).count();
}

} // namespace

MemoryEngine::MemoryEngine(const std::string& memory_dir, size_t working_size, size_t max_episodic)
    : dir_(memory_dir), working_size_(working_size), max_episodic_(max_episodic)
{
    std::error_code ec;
    fs::create_directories(dir_, ec);
    if (ec) {
        spdlog::warn("⚠️ Memory Engine: cannot create {} ({}), persistence disabled", dir_.string(), ec.message());
    }
    load();
}

// --- WORKING MEMORY ---

void MemoryEngine::add_to_working(const std::string& role, const std::string& content) {
    WorkingEntry entry{role, content, current_timestamp()};

    std::unique_lock lock(working_mutex_);
    working_.push_back(std::move(entry));
    while (working_.size() > working_size_) {
        working_.pop_front();
    }
}

std::vector<WorkingEntry> MemoryEngine::get_working_memory() const {
    std::shared_lock lock(working_mutex_);
    return std::vector<WorkingEntry>(working_.begin(), working_.end());
}

void MemoryEngine::clear_working() {
    std::unique_lock lock(working_mutex_);
    working_.clear();
}

// --- EPISODIC MEMORY ---

void MemoryEngine::add_episode(const std::string& user_input, const std::string& response,
                               const std::string& emotion, int importance) {
    Episode episode;
    episode.timestamp = current_timestamp();
    episode.user_input = user_input;
    episode.response = response;
    episode.emotion = emotion;
    episode.importance = importance;
    episode.keywords = extract_keywords(user_input);

    std::unique_lock lock(episodic_mutex_);
    size_t position = episodes_.size();
    episodes_.push_back(std::move(episode));
    keyword_index_.index_episode(position, episodes_.back());

    if (episodes_.size() > max_episodic_) {
        evict_episodes_locked();
    }
}

std::vector<ContextHit> MemoryEngine::get_relevant_context(const std::string& query, size_t max_items) const {
    std::shared_lock lock(episodic_mutex_);

    auto hits = keyword_index_.score_query(query);

    // Walk positions in order so equal scores keep the older episode first
    std::map<size_t, int> ordered(hits.begin(), hits.end());

    std::vector<ContextHit> results;
    results.reserve(ordered.size());
    for (const auto& [position, keyword_hits] : ordered) {
        if (position >= episodes_.size()) continue;
        const Episode& ep = episodes_[position];
        results.push_back({ep.timestamp, utf8_prefix(ep.user_input, PREVIEW_CHARS),
                           static_cast<int64_t>(keyword_hits) * ep.importance});
    }

    std::stable_sort(results.begin(), results.end(), [](const ContextHit& a, const ContextHit& b) {
        return a.score > b.score;
    });
    if (results.size() > max_items) {
        results.resize(max_items);
    }
    return results;
}

double MemoryEngine::eviction_score(const Episode& episode, std::chrono::system_clock::time_point now) {
    double age_hours = 1.0;
    if (auto ts = parse_rfc3339(episode.timestamp)) {
        age_hours = std::chrono::duration<double>(now - *ts).count() / 3600.0;
    }
    return static_cast<double>(episode.importance) / std::max(age_hours, 1.0);
}

size_t MemoryEngine::evict_episodes() {
    std::unique_lock lock(episodic_mutex_);
    return evict_episodes_locked();
}

size_t MemoryEngine::evict_episodes_locked() {
    if (episodes_.empty()) return 0;

    auto start = std::chrono::high_resolution_clock::now();
    size_t remove_count = std::max<size_t>(1, max_episodic_ / 10);
    auto now = std::chrono::system_clock::now();

    std::vector<std::pair<size_t, double>> scored;
    scored.reserve(episodes_.size());
    for (size_t i = 0; i < episodes_.size(); ++i) {
        scored.emplace_back(i, eviction_score(episodes_[i], now));
    }
    std::stable_sort(scored.begin(), scored.end(), [](const auto& a, const auto& b) {
        return a.second < b.second;
    });

    std::vector<size_t> victims;
    for (size_t i = 0; i < scored.size() && i < remove_count; ++i) {
        victims.push_back(scored[i].first);
    }
    // Highest position first so earlier erasures don't shift pending victims
    std::sort(victims.begin(), victims.end(), std::greater<size_t>());
    for (size_t position : victims) {
        episodes_.erase(episodes_.begin() + static_cast<std::ptrdiff_t>(position));
    }

    keyword_index_.rebuild(episodes_);

    spdlog::info("🧹 Memory Engine: evicted {} episodes, {} remain", victims.size(), episodes_.size());
    LogManager::instance().record("memory", "evict", std::to_string(victims.size()) + " episodes", elapsed_ms(start));
    return victims.size();
}

std::vector<Episode> MemoryEngine::get_episodes() const {
    std::shared_lock lock(episodic_mutex_);
    return episodes_;
}

std::vector<size_t> MemoryEngine::find_episodes(const std::string& word) const {
    std::shared_lock lock(episodic_mutex_);
    return keyword_index_.lookup(utf8_lower(word));
}

// --- SEMANTIC MEMORY ---

void MemoryEngine::add_semantic(const std::string& key, const std::string& value) {
    std::shared_lock lock(semantic_mutex_);
    SemanticMap::accessor acc;
    semantic_.insert(acc, key);
    acc->second = value;
}

std::optional<std::string> MemoryEngine::get_semantic(const std::string& key) const {
    std::shared_lock lock(semantic_mutex_);
    SemanticMap::const_accessor acc;
    if (!semantic_.find(acc, key)) return std::nullopt;
    return acc->second;
}

// --- PERSISTENCE ---

void MemoryEngine::save() const {
    auto start = std::chrono::high_resolution_clock::now();

    json episodic = json::array();
    {
        std::shared_lock lock(episodic_mutex_);
        for (const auto& ep : episodes_) {
            episodic.push_back(ep.to_json());
        }
    }

    json semantic = json::object();
    {
        std::unique_lock lock(semantic_mutex_);
        for (const auto& [key, value] : semantic_) {
            semantic[key] = value;
        }
    }

    // The two files are independent: one failing does not skip the other
    bool episodic_ok = write_file(dir_ / EPISODIC_FILE, dump_pretty(episodic));
    bool semantic_ok = write_file(dir_ / SEMANTIC_FILE, dump_pretty(semantic));

    if (!episodic_ok) spdlog::warn("⚠️ Memory Engine: episodic snapshot skipped ({})", (dir_ / EPISODIC_FILE).string());
    if (!semantic_ok) spdlog::warn("⚠️ Memory Engine: semantic snapshot skipped ({})", (dir_ / SEMANTIC_FILE).string());

    std::string detail = (episodic_ok ? std::to_string(episodic.size()) + " episodes" : std::string("episodes FAILED")) +
                         ", " +
                         (semantic_ok ? std::to_string(semantic.size()) + " facts" : std::string("facts FAILED"));
    if (episodic_ok || semantic_ok) {
        spdlog::info("💾 Memory Engine: saved {} to {}", detail, dir_.string());
    }
    LogManager::instance().record("memory", (episodic_ok && semantic_ok) ? "save" : "save_failed",
                                  detail, elapsed_ms(start));
}

void MemoryEngine::load() {
    auto start = std::chrono::high_resolution_clock::now();
    load_episodic();
    load_semantic();
    auto stats = get_stats();
    LogManager::instance().record("memory", "load",
        std::to_string(stats.episodic) + " episodes, " + std::to_string(stats.semantic) + " facts",
        elapsed_ms(start));
}

void MemoryEngine::load_episodic() {
    fs::path path = dir_ / EPISODIC_FILE;
    std::error_code ec;
    if (!fs::exists(path, ec)) return;

    std::vector<Episode> loaded;
    try {
        std::ifstream in(path);
        if (!in.is_open()) {
            spdlog::warn("⚠️ Memory Engine: cannot open {}", path.string());
            return;
        }
        json j = json::parse(in);
        if (!j.is_array()) {
            spdlog::warn("⚠️ Memory Engine: {} is not an array, starting empty", path.string());
            return;
        }
        loaded.reserve(j.size());
        for (const auto& item : j) {
            loaded.push_back(Episode::from_json(item));
        }
    } catch (const std::exception& e) {
        spdlog::warn("⚠️ Memory Engine: ignoring unreadable {}: {}", path.string(), e.what());
        return;
    }

    std::unique_lock lock(episodic_mutex_);
    episodes_ = std::move(loaded);
    keyword_index_.rebuild(episodes_);
    spdlog::info("📂 Memory Engine: loaded {} episodes ({} indexed terms)", episodes_.size(), keyword_index_.term_count());
}

void MemoryEngine::load_semantic() {
    fs::path path = dir_ / SEMANTIC_FILE;
    std::error_code ec;
    if (!fs::exists(path, ec)) return;

    std::unordered_map<std::string, std::string> loaded;
    try {
        std::ifstream in(path);
        if (!in.is_open()) {
            spdlog::warn("⚠️ Memory Engine: cannot open {}", path.string());
            return;
        }
        loaded = json::parse(in).get<std::unordered_map<std::string, std::string>>();
    } catch (const std::exception& e) {
        spdlog::warn("⚠️ Memory Engine: ignoring unreadable {}: {}", path.string(), e.what());
        return;
    }

    std::unique_lock lock(semantic_mutex_);
    semantic_.clear();
    for (auto& [key, value] : loaded) {
        semantic_.insert({key, std::move(value)});
    }
    spdlog::info("📂 Memory Engine: loaded {} semantic facts", loaded.size());
}

MemoryStats MemoryEngine::get_stats() const {
    MemoryStats stats;
    {
        std::shared_lock lock(working_mutex_);
        stats.working = working_.size();
    }
    {
        std::shared_lock lock(episodic_mutex_);
        stats.episodic = episodes_.size();
    }
    {
        std::shared_lock lock(semantic_mutex_);
        stats.semantic = semantic_.size();
    }
    return stats;
}

} // namespace memory_core
