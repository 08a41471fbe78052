/**
 * @file fuzzy_match.cpp
 * @brief Реализация нечёткого сравнения
 */

#include "fuzzy_match.hpp"
#include "io/text_utils.hpp"
#include <algorithm>
#include <cctype>
#include <string>

namespace adrkit::core {

namespace {

bool isWordStart(const std::string& text, size_t pos) {
    if (pos == 0) {
        return true;
    }
    auto prev = static_cast<unsigned char>(text[pos - 1]);
    return std::isspace(prev) || prev == '-' || prev == '_' || prev == '/' || prev == '.';
}

/// Остаток шаблона с позиции from помещается в text начиная с start
bool restFits(const std::string& text, const std::string& pattern, size_t from, size_t start) {
    for (size_t k = from; k < pattern.size(); ++k) {
        start = text.find(pattern[k], start);
        if (start == std::string::npos) {
            return false;
        }
        ++start;
    }
    return true;
}

} // namespace

std::optional<int> fuzzyScore(std::string_view candidate, std::string_view query) {
    auto pattern = io::utf8ToLower(io::trimView(query));
    if (pattern.empty()) {
        return std::nullopt;
    }
    auto text = io::utf8ToLower(candidate);

    // Жадный поиск с предпочтением ближайшего начала слова
    int score = 0;
    size_t pos = 0;
    std::optional<size_t> last_match;

    for (size_t i = 0; i < pattern.size(); ++i) {
        char pc = pattern[i];
        auto found = text.find(pc, pos);
        if (found == std::string::npos) {
            return std::nullopt;
        }

        bool continues_run = last_match.has_value() && found == *last_match + 1;
        if (!continues_run && !isWordStart(text, found)) {
            auto word_pos = text.find(pc, found + 1);
            while (word_pos != std::string::npos && !isWordStart(text, word_pos)) {
                word_pos = text.find(pc, word_pos + 1);
            }
            if (word_pos != std::string::npos && restFits(text, pattern, i + 1, word_pos + 1)) {
                found = word_pos;
            }
        }

        score += fuzzy_weights::kMatch;
        if (last_match.has_value()) {
            if (found == *last_match + 1) {
                score += fuzzy_weights::kConsecutive;
            } else {
                score -= fuzzy_weights::kGapPenalty * static_cast<int>(found - *last_match - 1);
            }
        }
        if (isWordStart(text, found)) {
            score += fuzzy_weights::kWordStart;
        }
        if (found == 0) {
            score += fuzzy_weights::kFirstChar;
        }

        last_match = found;
        pos = found + 1;
    }

    return std::max(score, 1);
}

} // namespace adrkit::core
