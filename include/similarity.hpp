#pragma once
#include <cstddef>
#include <vector>

namespace memory_core {

struct SimilarityHit {
    size_t index;
    float similarity;
};

// Document count at which batch scoring fans out across TBB workers
constexpr size_t PARALLEL_THRESHOLD = 32;

// Norms below this are treated as zero vectors
constexpr double MIN_NORM = 1e-8;

// 0.0 for mismatched lengths, empty input or a (near) zero vector.
// Accumulates in double even though the inputs are float.
float cosine_similarity(const std::vector<float>& a, const std::vector<float>& b);

// Top-k documents by cosine similarity to `query`, best first.
// Documents with the wrong dimension or a zero norm are skipped. The top-k
// selection is not stable: documents with equal scores come back in no
// particular order.
std::vector<SimilarityHit> batch_cosine_similarity(
    const std::vector<float>& query,
    const std::vector<std::vector<float>>& documents,
    size_t top_k = 5
);

} // namespace memory_core
