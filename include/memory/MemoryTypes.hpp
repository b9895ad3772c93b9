#pragma once
#include <cstdint>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace memory_core {

struct WorkingEntry {
    std::string role;
    std::string content;
    std::string timestamp;

    nlohmann::json to_json() const;
};

struct Episode {
    std::string timestamp;
    std::string user_input;
    std::string response;
    std::string emotion;
    int importance = 1;
    std::vector<std::string> keywords; // from user_input only, at most MAX_KEYWORDS

    nlohmann::json to_json() const;
    // Strict: throws when a field is missing or mistyped, or importance is not a 32-bit integer
    static Episode from_json(const nlohmann::json& j);
};

struct ContextHit {
    std::string timestamp;
    std::string preview;  // first PREVIEW_CHARS characters of user_input
    int64_t score;        // keyword hits * importance
};

struct MemoryStats {
    size_t working = 0;
    size_t episodic = 0;
    size_t semantic = 0;
};

constexpr size_t MAX_KEYWORDS = 10;
constexpr size_t MIN_KEYWORD_CHARS = 4;
constexpr size_t PREVIEW_CHARS = 80;

// Lowercased tokens of at least MIN_KEYWORD_CHARS characters that are not stop
// words, in order of appearance, capped at MAX_KEYWORDS.
std::vector<std::string> extract_keywords(const std::string& text);

bool is_stop_word(const std::string& lowered);

} // namespace memory_core
