#pragma once
#include <memory>
#include <stdexcept>
#include <string>
#include <nlohmann/json.hpp>
#include "embedding_cache.hpp"
#include "memory/MemoryEngine.hpp"

namespace memory_core {

using json = nlohmann::json;

// Request validation failure; carries the HTTP status to answer with
class ApiError : public std::runtime_error {
public:
    ApiError(int status, const std::string& message)
        : std::runtime_error(message), status_(status) {}
    int status() const { return status_; }
private:
    int status_;
};

// JSON request/response layer over the memory engine, the embedding cache and
// the similarity functions. The HTTP server only routes bodies in and out.
class MemoryApi {
public:
    MemoryApi(std::shared_ptr<IMemoryEngine> memory, std::shared_ptr<IEmbeddingCache> cache);

    static json parse_body(const std::string& raw);

    // --- memory ---
    json add_working(const json& body);
    json get_working() const;
    json clear_working();
    json add_episode(const json& body);
    json relevant_context(const json& body) const;
    json add_semantic(const json& body);
    json get_semantic(const std::string& key) const;
    json memory_stats() const;
    json save_memory() const;
    json load_memory();

    // --- embedding cache ---
    json cache_get(const json& body);
    json cache_put(const json& body);
    json cache_contains(const json& body) const;
    json cache_stats() const;
    json cache_clear();
    json cache_save() const;

    // --- similarity ---
    json cosine(const json& body) const;
    json batch_similarity(const json& body) const;

    json events() const;

private:
    std::shared_ptr<IMemoryEngine> memory_;
    std::shared_ptr<IEmbeddingCache> cache_;
};

} // namespace memory_core
