#include "memory/MemoryTypes.hpp"
#include "text_utils.hpp"
#include <algorithm>
#include <array>
#include <cstdint>
#include <limits>
#include <stdexcept>

namespace memory_core {

using json = nlohmann::json;

namespace {

// RU + EN
const std::array<const char*, 30> STOP_WORDS = {
    "я", "ты", "он", "она", "мы", "вы", "они", "в", "на", "и",
    "с", "по", "для", "от", "к", "не", "что", "это", "как", "но",
    "the", "is", "are", "a", "an", "in", "on", "for", "to", "of",
};

} // namespace

json WorkingEntry::to_json() const {
    return json{
        {"role", role},
        {"content", content},
        {"timestamp", timestamp}
    };
}

json Episode::to_json() const {
    return json{
        {"timestamp", timestamp},
        {"user_input", user_input},
        {"response", response},
        {"emotion", emotion},
        {"importance", importance},
        {"keywords", keywords}
    };
}

Episode Episode::from_json(const json& j) {
    Episode ep;
    j.at("timestamp").get_to(ep.timestamp);
    j.at("user_input").get_to(ep.user_input);
    j.at("response").get_to(ep.response);
    j.at("emotion").get_to(ep.emotion);
    // get_to would truncate 1.5 or a 64-bit value without complaint
    const auto& importance = j.at("importance");
    if (!importance.is_number_integer()) {
        throw std::invalid_argument("episode importance must be an integer");
    }
    bool fits = importance.is_number_unsigned()
        ? importance.get<uint64_t>() <= static_cast<uint64_t>(std::numeric_limits<int>::max())
        : importance.get<int64_t>() >= std::numeric_limits<int>::min() &&
          importance.get<int64_t>() <= std::numeric_limits<int>::max();
    if (!fits) throw std::out_of_range("episode importance does not fit in an int");
    ep.importance = importance.get<int>();
    j.at("keywords").get_to(ep.keywords);
    return ep;
}

bool is_stop_word(const std::string& lowered) {
    return std::any_of(STOP_WORDS.begin(), STOP_WORDS.end(),
                       [&](const char* w) { return lowered == w; });
}

std::vector<std::string> extract_keywords(const std::string& text) {
    std::vector<std::string> keywords;
    for (const auto& token : split_whitespace(text)) {
        std::string lower = utf8_lower(token);
        if (utf8_length(lower) >= MIN_KEYWORD_CHARS && !is_stop_word(lower)) {
            keywords.push_back(std::move(lower));
            if (keywords.size() == MAX_KEYWORDS) break;
        }
    }
    return keywords;
}

} // namespace memory_core
