/**
 * @file parser.hpp
 * @brief Разбор текста записи в двух форматах
 *
 * Structured: документ начинается с блока метаданных YAML между строками "---".
 * Legacy: формат adr-tools, заголовок "# N. Title" и разделы "## ...".
 * Форматы разбираются независимыми функциями, общий у них только Record.
 */

#pragma once

#include "model/record.hpp"
#include <filesystem>
#include <optional>
#include <string_view>

namespace adrkit::core {

using namespace adrkit::model;

/// Строка-разделитель блока метаданных
constexpr const char* METADATA_DELIMITER = "---";

enum class DocumentFormat {
    Structured,
    Legacy
};

/**
 * @brief Определить формат по первой строке документа
 */
[[nodiscard]] DocumentFormat detectDocumentFormat(std::string_view text) noexcept;

/**
 * @brief Номер записи из десятичной строки
 *
 * Допускаются только ASCII-цифры; знак и значения вне диапазона RecordNumber дают nullopt.
 */
[[nodiscard]] std::optional<RecordNumber> parseRecordNumber(std::string_view digits) noexcept;

/**
 * @brief Сохранится ли статус при записи без блока метаданных
 *
 * В разделе Status статус задаёт только первое слово строки, и только если это
 * слово статуса. Прочие значения при повторном чтении становятся Proposed.
 */
[[nodiscard]] bool statusSurvivesLegacy(const Status& status);

/**
 * @brief Номер записи из имени файла ("0007-use-rust.md" -> 7)
 *
 * Требуется не менее 4 цифр в начале имени и '-' после них.
 */
[[nodiscard]] std::optional<RecordNumber> numberFromFilename(std::string_view filename) noexcept;

/**
 * @brief Подходит ли имя файла для коллекции (начинается с цифры, расширение .md)
 */
[[nodiscard]] bool isRecordFilename(const std::filesystem::path& path);

class Parser {
public:
    /**
     * @brief Разбор текста записи
     *
     * Если номер не найден в тексте, number остаётся 0.
     *
     * @throws FormatError Блок метаданных не закрыт или некорректен
     */
    [[nodiscard]] Record parse(std::string_view text) const;

    /**
     * @brief Разбор файла записи
     *
     * Номер, не найденный в тексте, берётся из имени файла.
     * Заполняет source_path.
     *
     * @throws IoError Файл не читается
     * @throws FormatError Текст некорректен или номер не удалось определить
     */
    [[nodiscard]] Record parseFile(const std::filesystem::path& path) const;
};

} // namespace adrkit::core
