#include "memory/KeywordIndex.hpp"
#include "text_utils.hpp"

namespace memory_core {

namespace {
const std::vector<size_t> EMPTY_POSTINGS;
}

bool KeywordIndex::is_indexable(const std::string& lowered_word) {
    return utf8_length(lowered_word) > MAX_SKIPPED_CHARS;
}

void KeywordIndex::index_text(size_t position, const std::string& text) {
    for (const auto& word : split_whitespace(text)) {
        std::string lower = utf8_lower(word);
        if (is_indexable(lower)) {
            index_[hash64(lower)].push_back(position);
        }
    }
}

void KeywordIndex::index_episode(size_t position, const Episode& episode) {
    // Recall covers the response too, unlike the stored keywords
    index_text(position, episode.user_input + " " + episode.response);
}

void KeywordIndex::rebuild(const std::vector<Episode>& episodes) {
    index_.clear();
    for (size_t i = 0; i < episodes.size(); ++i) {
        index_episode(i, episodes[i]);
    }
}

const std::vector<size_t>& KeywordIndex::lookup(const std::string& lowered_word) const {
    return lookup_hash(hash64(lowered_word));
}

const std::vector<size_t>& KeywordIndex::lookup_hash(uint64_t word_hash) const {
    auto it = index_.find(word_hash);
    if (it == index_.end()) return EMPTY_POSTINGS;
    return it->second;
}

std::unordered_map<size_t, int> KeywordIndex::score_query(const std::string& query) const {
    std::unordered_map<size_t, int> hits;
    for (const auto& word : split_whitespace(query)) {
        std::string lower = utf8_lower(word);
        if (!is_indexable(lower)) continue;
        for (size_t position : lookup(lower)) {
            hits[position]++;
        }
    }
    return hits;
}

} // namespace memory_core
