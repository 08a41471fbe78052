/**
 * @file text_utils.hpp
 * @brief Утилиты для разбора текста записей
 */

#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace adrkit::io {

/**
 * @brief Обрезка пробельных символов (ASCII) с обоих концов
 */
[[nodiscard]] std::string_view trimView(std::string_view input) noexcept;

[[nodiscard]] std::string trim(std::string_view input);

/**
 * @brief Нижний регистр только для ASCII, не зависит от локали
 */
[[nodiscard]] std::string asciiToLower(std::string_view input);

/**
 * @brief Перевод строки в нижний регистр (ASCII + базовая кириллица)
 */
[[nodiscard]] std::string utf8ToLower(std::string_view input);

[[nodiscard]] bool startsWith(std::string_view input, std::string_view prefix) noexcept;

[[nodiscard]] bool endsWith(std::string_view input, std::string_view suffix) noexcept;

/**
 * @brief Разбиение на строки по '\n' с удалением завершающего '\r'
 */
[[nodiscard]] std::vector<std::string_view> splitLines(std::string_view input);

[[nodiscard]] bool isAsciiDigits(std::string_view input) noexcept;

} // namespace adrkit::io
