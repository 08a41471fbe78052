/**
 * @file record_renderer.hpp
 * @brief Формирование текста записи по шаблону Nygard
 */

#pragma once

#include "model/config.hpp"
#include "model/record.hpp"
#include <map>
#include <string>
#include <vector>

namespace adrkit::io {

/**
 * @brief Сведения о цели связи для строки в разделе Status
 */
struct LinkTarget {
    std::string title;
    std::string filename;
};

using LinkTargets = std::map<model::RecordNumber, LinkTarget>;

/// Цели связей по набору записей коллекции
[[nodiscard]] LinkTargets collectLinkTargets(const std::vector<model::Record>& records);

/**
 * @brief Текст записи
 *
 * Compatible: заголовок "# N. Title", строка Date, разделы Status, Context,
 * Decision, Consequences. NextGen: тот же текст после блока метаданных YAML.
 * Пустые разделы заполняются подсказками шаблона.
 *
 * Цели, отсутствующие в targets, выводятся как "[T. ...](NNNN-....md)".
 */
[[nodiscard]] std::string renderRecord(
    const model::Record& record,
    model::SerializationMode mode,
    const LinkTargets& targets = {}
);

/// Блок метаданных с разделителями "---" (без тела)
[[nodiscard]] std::string renderMetadataBlock(const model::Record& record);

} // namespace adrkit::io
