#pragma once
#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>
#include "memory/MemoryTypes.hpp"

namespace memory_core {

// Inverted index: hash(lowercased word) -> positions of the episodes that contain it.
//
// Positions refer to the episodic vector, so any removal from that vector
// invalidates the index: call rebuild(), never patch entries in place.
// Not synchronised; the owner guards it together with the episodes.
class KeywordIndex {
public:
    // Words of this many characters or fewer are not indexed
    static constexpr size_t MAX_SKIPPED_CHARS = 2;

    // Appends `position` once per indexable word occurrence in `text`
    void index_text(size_t position, const std::string& text);

    void index_episode(size_t position, const Episode& episode);

    void rebuild(const std::vector<Episode>& episodes);

    // Positions for an already lowercased word; empty when unknown
    const std::vector<size_t>& lookup(const std::string& lowered_word) const;
    const std::vector<size_t>& lookup_hash(uint64_t word_hash) const;

    // Hit count per episode position for a free-text query
    std::unordered_map<size_t, int> score_query(const std::string& query) const;

    void clear() { index_.clear(); }
    size_t term_count() const { return index_.size(); }

    static bool is_indexable(const std::string& lowered_word);

private:
    std::unordered_map<uint64_t, std::vector<size_t>> index_;
};

} // namespace memory_core
