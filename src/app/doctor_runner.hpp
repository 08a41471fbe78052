/**
 * @file doctor_runner.hpp
 * @brief Запуск проверки коллекции из CLI
 */

#pragma once

#include "core/repository.hpp"
#include "model/diagnostics.hpp"
#include <filesystem>
#include <optional>
#include <ostream>

namespace adrkit::app {

struct DoctorCommandResult {
    int exit_code = 1;
    std::optional<std::filesystem::path> output_dir;
    adrkit::model::DoctorSummary summary;
    adrkit::model::DoctorReport report;
};

/**
 * @brief Проверить коллекцию и при необходимости сохранить отчёты.
 * @param output_dir Каталог для report.md/json; без него отчёт только печатается
 * @param out Поток для построчного вывода диагностики
 */
DoctorCommandResult runDoctorCommand(
    const core::Repository& repository,
    const std::optional<std::filesystem::path>& output_dir,
    std::ostream& out
);

} // namespace adrkit::app
