#include "api/MemoryApi.hpp"
#include "LogManager.hpp"
#include "similarity.hpp"
#include <cstdint>

namespace memory_core {

namespace {

void require_object(const json& body) {
    if (!body.is_object()) throw ApiError(400, "Request body must be a JSON object");
}

std::string require_string(const json& body, const char* key) {
    require_object(body);
    if (!body.contains(key) || !body[key].is_string()) {
        throw ApiError(400, std::string("Missing or non-string field '") + key + "'");
    }
    return body[key].get<std::string>();
}

std::string optional_string(const json& body, const char* key, const std::string& fallback) {
    if (!body.contains(key) || body[key].is_null()) return fallback;
    if (!body[key].is_string()) throw ApiError(400, std::string("Field '") + key + "' must be a string");
    return body[key].get<std::string>();
}

long long optional_integer(const json& body, const char* key, long long fallback) {
    if (!body.contains(key) || body[key].is_null()) return fallback;
    if (!body[key].is_number_integer()) throw ApiError(400, std::string("Field '") + key + "' must be an integer");
    return body[key].get<long long>();
}

size_t optional_count(const json& body, const char* key, size_t fallback) {
    long long value = optional_integer(body, key, static_cast<long long>(fallback));
    if (value < 0) throw ApiError(400, std::string("Field '") + key + "' must not be negative");
    return static_cast<size_t>(value);
}

std::vector<float> require_vector(const json& value, const std::string& what) {
    if (!value.is_array()) throw ApiError(400, what + " must be an array of numbers");
    std::vector<float> out;
    out.reserve(value.size());
    for (const auto& x : value) {
        if (!x.is_number()) throw ApiError(400, what + " must contain only numbers");
        out.push_back(x.get<float>());
    }
    return out;
}

std::vector<float> require_vector_field(const json& body, const char* key) {
    require_object(body);
    if (!body.contains(key)) throw ApiError(400, std::string("Missing field '") + key + "'");
    return require_vector(body[key], std::string("Field '") + key + "'");
}

} // namespace

MemoryApi::MemoryApi(std::shared_ptr<IMemoryEngine> memory, std::shared_ptr<IEmbeddingCache> cache)
    : memory_(std::move(memory)), cache_(std::move(cache)) {}

json MemoryApi::parse_body(const std::string& raw) {
    try {
        return json::parse(raw);
    } catch (const json::parse_error& e) {
        throw ApiError(400, std::string("Malformed JSON: ") + e.what());
    }
}

// --- MEMORY ---

json MemoryApi::add_working(const json& body) {
    memory_->add_to_working(require_string(body, "role"), require_string(body, "content"));
    return {{"success", true}, {"working", memory_->get_stats().working}};
}

json MemoryApi::get_working() const {
    json entries = json::array();
    for (const auto& entry : memory_->get_working_memory()) {
        entries.push_back(entry.to_json());
    }
    return {{"working", entries}};
}

json MemoryApi::clear_working() {
    memory_->clear_working();
    return {{"success", true}};
}

json MemoryApi::add_episode(const json& body) {
    std::string user_input = require_string(body, "user_input");
    std::string response = require_string(body, "response");
    std::string emotion = optional_string(body, "emotion", "neutral");
    long long importance = optional_integer(body, "importance", 1);
    if (importance < INT32_MIN || importance > INT32_MAX) {
        throw ApiError(400, "Field 'importance' is out of range");
    }

    memory_->add_episode(user_input, response, emotion, static_cast<int>(importance));
    return {{"success", true}, {"episodic", memory_->get_stats().episodic}};
}

json MemoryApi::relevant_context(const json& body) const {
    std::string query = require_string(body, "query");
    size_t max_items = optional_count(body, "max_items", 3);

    json items = json::array();
    for (const auto& hit : memory_->get_relevant_context(query, max_items)) {
        items.push_back({
            {"timestamp", hit.timestamp},
            {"preview", hit.preview},
            {"score", hit.score}
        });
    }
    return {{"context", items}};
}

json MemoryApi::add_semantic(const json& body) {
    memory_->add_semantic(require_string(body, "key"), require_string(body, "value"));
    return {{"success", true}};
}

json MemoryApi::get_semantic(const std::string& key) const {
    auto value = memory_->get_semantic(key);
    if (!value) throw ApiError(404, "No semantic fact for key '" + key + "'");
    return {{"key", key}, {"value", *value}};
}

json MemoryApi::memory_stats() const {
    auto stats = memory_->get_stats();
    return {
        {"working", stats.working},
        {"episodic", stats.episodic},
        {"semantic", stats.semantic}
    };
}

json MemoryApi::save_memory() const {
    memory_->save();
    return {{"success", true}};
}

json MemoryApi::load_memory() {
    memory_->load();
    return memory_stats();
}

// --- EMBEDDING CACHE ---

json MemoryApi::cache_get(const json& body) {
    auto vec = cache_->get(require_string(body, "text"));
    if (!vec) return {{"found", false}};
    return {{"found", true}, {"embedding", *vec}};
}

json MemoryApi::cache_put(const json& body) {
    std::string text = require_string(body, "text");
    cache_->put(text, require_vector_field(body, "embedding"));
    return {{"success", true}, {"size", cache_->size()}};
}

json MemoryApi::cache_contains(const json& body) const {
    return {{"contains", cache_->contains(require_string(body, "text"))}};
}

json MemoryApi::cache_stats() const {
    auto stats = cache_->stats();
    return {
        {"size", stats.size},
        {"hits", stats.hits},
        {"misses", stats.misses}
    };
}

json MemoryApi::cache_clear() {
    cache_->clear();
    return {{"success", true}};
}

json MemoryApi::cache_save() const {
    cache_->save();
    return {{"success", true}};
}

// --- SIMILARITY ---

json MemoryApi::cosine(const json& body) const {
    auto a = require_vector_field(body, "a");
    auto b = require_vector_field(body, "b");
    return {{"similarity", cosine_similarity(a, b)}};
}

json MemoryApi::batch_similarity(const json& body) const {
    auto query = require_vector_field(body, "query");
    if (!body.contains("documents") || !body["documents"].is_array()) {
        throw ApiError(400, "Field 'documents' must be an array of vectors");
    }
    std::vector<std::vector<float>> documents;
    documents.reserve(body["documents"].size());
    for (const auto& doc : body["documents"]) {
        documents.push_back(require_vector(doc, "Each document"));
    }
    size_t top_k = optional_count(body, "top_k", 5);

    json results = json::array();
    for (const auto& hit : batch_cosine_similarity(query, documents, top_k)) {
        results.push_back({{"index", hit.index}, {"similarity", hit.similarity}});
    }
    return {{"results", results}};
}

json MemoryApi::events() const {
    return {{"events", LogManager::instance().get_logs_json()}};
}

} // namespace memory_core
