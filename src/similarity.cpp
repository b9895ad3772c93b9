#include "similarity.hpp"
#include <tbb/parallel_for.h>
#include <tbb/blocked_range.h>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>
#include <optional>

namespace memory_core {

namespace {

// Shared by the sequential and the parallel path so both produce bit-identical scores
std::optional<SimilarityHit> score_document(
    const std::vector<float>& query,
    double query_norm,
    const std::vector<float>& doc,
    size_t index)
{
    if (doc.size() != query.size()) return std::nullopt;

    double dot = 0.0;
    double doc_norm = 0.0;
    for (size_t j = 0; j < query.size(); ++j) {
        double q = query[j];
        double d = doc[j];
        dot += q * d;
        doc_norm += d * d;
    }
    doc_norm = std::sqrt(doc_norm);
    if (doc_norm < MIN_NORM) return std::nullopt;

    float sim = static_cast<float>(dot / (query_norm * doc_norm));
    // NaN/Inf inputs would break the ordering used by the selection step
    if (!std::isfinite(sim)) return std::nullopt;
    return SimilarityHit{index, sim};
}

bool by_similarity_desc(const SimilarityHit& a, const SimilarityHit& b) {
    return a.similarity > b.similarity;
}

} // namespace

float cosine_similarity(const std::vector<float>& a, const std::vector<float>& b) {
    if (a.size() != b.size() || a.empty()) return 0.0f;

    double dot = 0.0;
    double norm_a = 0.0;
    double norm_b = 0.0;
    for (size_t i = 0; i < a.size(); ++i) {
        double x = a[i];
        double y = b[i];
        dot += x * y;
        norm_a += x * x;
        norm_b += y * y;
    }

    norm_a = std::sqrt(norm_a);
    norm_b = std::sqrt(norm_b);
    if (norm_a < MIN_NORM || norm_b < MIN_NORM) return 0.0f;

    return static_cast<float>(dot / (norm_a * norm_b));
}

std::vector<SimilarityHit> batch_cosine_similarity(
    const std::vector<float>& query,
    const std::vector<std::vector<float>>& documents,
    size_t top_k)
{
    if (query.empty() || documents.empty()) return {};

    // Query norm is computed once and reused for every document
    double query_norm = 0.0;
    for (float q : query) query_norm += static_cast<double>(q) * q;
    query_norm = std::sqrt(query_norm);
    if (query_norm < MIN_NORM) return {};

    std::vector<std::optional<SimilarityHit>> slots(documents.size());

    if (documents.size() >= PARALLEL_THRESHOLD) {
        // Each task writes only its own slots
        tbb::parallel_for(tbb::blocked_range<size_t>(0, documents.size()),
            [&](const tbb::blocked_range<size_t>& range) {
                for (size_t i = range.begin(); i != range.end(); ++i) {
                    slots[i] = score_document(query, query_norm, documents[i], i);
                }
            });
    } else {
        for (size_t i = 0; i < documents.size(); ++i) {
            slots[i] = score_document(query, query_norm, documents[i], i);
        }
    }

    std::vector<SimilarityHit> results;
    results.reserve(documents.size());
    for (const auto& slot : slots) {
        if (slot) results.push_back(*slot);
    }

    // O(n) partition around the k-th best, then order only the survivors
    if (results.size() > top_k) {
        std::nth_element(results.begin(), results.begin() + top_k, results.end(), by_similarity_desc);
        results.resize(top_k);
    }
    std::sort(results.begin(), results.end(), by_similarity_desc);

    spdlog::debug("Batch similarity: {} documents, {} ranked", documents.size(), results.size());
    return results;
}

} // namespace memory_core
