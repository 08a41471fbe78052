/**
 * @file toc_writer.hpp
 * @brief Оглавление коллекции в markdown
 */

#pragma once

#include "model/record.hpp"
#include <optional>
#include <string>
#include <vector>

namespace adrkit::io {

/**
 * @brief Опции оглавления
 */
struct TocOptions {
    bool ordered = false;                  ///< Нумерованный список вместо "*"
    std::string link_prefix;               ///< Префикс перед именем файла в ссылке
    std::optional<std::string> intro;      ///< Текст перед списком
    std::optional<std::string> outro;      ///< Текст после списка
};

/**
 * @brief Оглавление: по строке "* [N. Title](prefix + файл)" на запись
 *
 * Записи выводятся в переданном порядке. Имя файла берётся из source_path,
 * для записей без файла выводится производное имя.
 */
[[nodiscard]] std::string renderToc(const std::vector<model::Record>& records, const TocOptions& options = {});

} // namespace adrkit::io
