/**
 * @file doctor.hpp
 * @brief Проверка согласованности коллекции записей
 */

#pragma once

#include "repository.hpp"
#include "model/diagnostics.hpp"
#include <vector>

namespace adrkit::core {

/// Больше стольких пропусков в сообщении выводятся только первые
constexpr size_t GAP_LIST_LIMIT = 5;

/// Сколько пропусков выводится в сокращённом сообщении
constexpr size_t GAP_LIST_HEAD = 3;

/**
 * @brief Проверить коллекцию
 *
 * Правила: повторяющиеся номера, имена файлов, пустой статус, битые связи,
 * пропуски в нумерации, Superseded без обратной связи, неразобранные файлы.
 *
 * @throws NotFoundError Каталог записей не существует
 */
[[nodiscard]] model::DoctorReport check(const Repository& repository);

/**
 * @brief Проверить готовый набор записей
 *
 * Диагностики упорядочены по убыванию важности, внутри уровня - по правилам.
 */
[[nodiscard]] model::DoctorReport checkRecords(
    const std::vector<model::Record>& records,
    const std::vector<SkippedFile>& skipped = {}
);

} // namespace adrkit::core
