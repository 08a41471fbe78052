/**
 * @file fuzzy_match.hpp
 * @brief Нечёткое сравнение запроса с заголовками записей
 */

#pragma once

#include <optional>
#include <string_view>

namespace adrkit::core {

/**
 * @brief Оценка совпадения запроса с заголовком
 *
 * Запрос должен входить в заголовок как подпоследовательность символов
 * (без учёта регистра). Подряд идущие совпадения и совпадения в начале
 * слова оцениваются выше, пропуски между совпадениями штрафуются.
 *
 * @return std::nullopt, если запрос не является подпоследовательностью;
 *         иначе положительная оценка (больше - лучше)
 */
[[nodiscard]] std::optional<int> fuzzyScore(std::string_view candidate, std::string_view query);

namespace fuzzy_weights {
    constexpr int kMatch = 16;          ///< За каждый совпавший символ
    constexpr int kConsecutive = 12;    ///< Символ сразу после предыдущего совпадения
    constexpr int kWordStart = 12;      ///< Совпадение в начале слова
    constexpr int kFirstChar = 8;       ///< Совпадение с первым символом заголовка
    constexpr int kGapPenalty = 1;      ///< За каждый пропущенный символ между совпадениями
}

} // namespace adrkit::core
